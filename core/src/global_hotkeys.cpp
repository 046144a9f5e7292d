// Shaderlay - Global Hotkeys Implementation

#include <shaderlay/global_hotkeys.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#if defined(SHADERLAY_HAS_X11)
#include <X11/Xlib.h>
#include <X11/keysym.h>
#endif

#include <iostream>

namespace shaderlay {

namespace {

int glfwKeyFor(const std::string& key) {
    if (key.size() == 1) {
        char c = key[0];
        if (c >= 'a' && c <= 'z') return GLFW_KEY_A + (c - 'a');
        if (c >= '0' && c <= '9') return GLFW_KEY_0 + (c - '0');
        switch (c) {
            case '`': return GLFW_KEY_GRAVE_ACCENT;
            case '-': return GLFW_KEY_MINUS;
            case '=': return GLFW_KEY_EQUAL;
            case '[': return GLFW_KEY_LEFT_BRACKET;
            case ']': return GLFW_KEY_RIGHT_BRACKET;
            case ';': return GLFW_KEY_SEMICOLON;
            case '\'': return GLFW_KEY_APOSTROPHE;
            case ',': return GLFW_KEY_COMMA;
            case '.': return GLFW_KEY_PERIOD;
            case '/': return GLFW_KEY_SLASH;
            case '\\': return GLFW_KEY_BACKSLASH;
        }
        return GLFW_KEY_UNKNOWN;
    }
    if (key == "space") return GLFW_KEY_SPACE;
    if (key == "escape") return GLFW_KEY_ESCAPE;
    if (key == "tab") return GLFW_KEY_TAB;
    if (key[0] == 'f') return GLFW_KEY_F1 + (std::stoi(key.substr(1)) - 1);
    return GLFW_KEY_UNKNOWN;
}

unsigned modifiersFromGlfw(int mods) {
    unsigned result = 0;
    if (mods & GLFW_MOD_CONTROL) result |= MOD_CTRL;
    if (mods & GLFW_MOD_SHIFT) result |= MOD_SHIFT;
    if (mods & GLFW_MOD_ALT) result |= MOD_ALT;
    if (mods & GLFW_MOD_SUPER) result |= MOD_SUPER;
    return result;
}

#if defined(SHADERLAY_HAS_X11)
KeySym keysymFor(const std::string& key) {
    if (key.size() == 1) {
        char c = key[0];
        if (c >= 'a' && c <= 'z') return XK_a + (c - 'a');
        if (c >= '0' && c <= '9') return XK_0 + (c - '0');
        switch (c) {
            case '`': return XK_grave;
            case '-': return XK_minus;
            case '=': return XK_equal;
            case '[': return XK_bracketleft;
            case ']': return XK_bracketright;
            case ';': return XK_semicolon;
            case '\'': return XK_apostrophe;
            case ',': return XK_comma;
            case '.': return XK_period;
            case '/': return XK_slash;
            case '\\': return XK_backslash;
        }
        return NoSymbol;
    }
    if (key == "space") return XK_space;
    if (key == "escape") return XK_Escape;
    if (key == "tab") return XK_Tab;
    if (key[0] == 'f') return XK_F1 + (std::stoi(key.substr(1)) - 1);
    return NoSymbol;
}

unsigned x11Modifiers(unsigned modifiers) {
    unsigned mask = 0;
    if (modifiers & MOD_CTRL) mask |= ControlMask;
    if (modifiers & MOD_SHIFT) mask |= ShiftMask;
    if (modifiers & MOD_ALT) mask |= Mod1Mask;
    if (modifiers & MOD_SUPER) mask |= Mod4Mask;
    return mask;
}

// Grab regardless of CapsLock/NumLock state
const unsigned LOCK_VARIANTS[] = {0, LockMask, Mod2Mask, LockMask | Mod2Mask};

bool g_grabFailed = false;

int onGrabError(Display*, XErrorEvent* event) {
    if (event->error_code == BadAccess) {
        g_grabFailed = true;
    }
    return 0;
}
#endif

} // namespace

#if defined(SHADERLAY_HAS_X11)
struct GlobalHotkeys::Native {
    Display* display = nullptr;
    Window root = 0;
};
#else
struct GlobalHotkeys::Native {};
#endif

GlobalHotkeys::GlobalHotkeys() {
#if defined(SHADERLAY_HAS_X11)
    // Own connection, so grabbed key events don't go through GLFW
    Display* display = XOpenDisplay(nullptr);
    if (display) {
        m_native = new Native;
        m_native->display = display;
        m_native->root = DefaultRootWindow(display);
    } else {
        std::cerr << "[Hotkeys] No X display, hotkeys work only while the overlay has focus" << std::endl;
    }
#endif
}

GlobalHotkeys::~GlobalHotkeys() {
    clear();
#if defined(SHADERLAY_HAS_X11)
    if (m_native) {
        XCloseDisplay(m_native->display);
    }
#endif
    delete m_native;
}

bool GlobalHotkeys::isGlobal() const {
    return m_native != nullptr;
}

bool GlobalHotkeys::add(const KeyChord& chord, Action action) {
    Binding binding{chord, std::move(action), 0};
    bool grabbed = false;

#if defined(SHADERLAY_HAS_X11)
    if (m_native) {
        KeySym sym = keysymFor(chord.key);
        KeyCode keycode = sym != NoSymbol ? XKeysymToKeycode(m_native->display, sym) : 0;
        if (keycode != 0) {
            g_grabFailed = false;
            XErrorHandler previous = XSetErrorHandler(onGrabError);
            unsigned mods = x11Modifiers(chord.modifiers);
            for (unsigned variant : LOCK_VARIANTS) {
                XGrabKey(m_native->display, keycode, mods | variant, m_native->root,
                         False, GrabModeAsync, GrabModeAsync);
            }
            XSync(m_native->display, False);
            XSetErrorHandler(previous);

            if (g_grabFailed) {
                binding.keycode = keycode;
                ungrab(binding);
                binding.keycode = 0;
            } else {
                binding.keycode = keycode;
                grabbed = true;
            }
        }
    }
#endif

    if (grabbed) {
        std::cout << "[Hotkeys] Registered " << acceleratorToString(chord) << std::endl;
    } else {
        std::cerr << "[Hotkeys] Global registration failed for " << acceleratorToString(chord)
                  << ", available while focused" << std::endl;
    }
    m_bindings.push_back(std::move(binding));
    return grabbed;
}

void GlobalHotkeys::ungrab(const Binding& binding) {
#if defined(SHADERLAY_HAS_X11)
    if (!m_native || binding.keycode == 0) {
        return;
    }
    unsigned mods = x11Modifiers(binding.chord.modifiers);
    for (unsigned variant : LOCK_VARIANTS) {
        XUngrabKey(m_native->display, binding.keycode, mods | variant, m_native->root);
    }
    XFlush(m_native->display);
#endif
}

void GlobalHotkeys::clear() {
    for (const auto& binding : m_bindings) {
        ungrab(binding);
    }
    m_bindings.clear();
}

void GlobalHotkeys::poll() {
#if defined(SHADERLAY_HAS_X11)
    if (!m_native) {
        return;
    }

    const unsigned relevant = ControlMask | ShiftMask | Mod1Mask | Mod4Mask;
    while (XPending(m_native->display)) {
        XEvent event;
        XNextEvent(m_native->display, &event);
        if (event.type != KeyPress) {
            continue;
        }

        for (const auto& binding : m_bindings) {
            if (binding.keycode == event.xkey.keycode &&
                x11Modifiers(binding.chord.modifiers) == (event.xkey.state & relevant)) {
                binding.action();
                break;
            }
        }
    }
#endif
}

bool GlobalHotkeys::handleWindowKey(int key, int mods) {
    unsigned modifiers = modifiersFromGlfw(mods);
    for (const auto& binding : m_bindings) {
        // Grabbed chords already arrive through poll()
        if (binding.keycode != 0) continue;
        if (glfwKeyFor(binding.chord.key) == key && binding.chord.modifiers == modifiers) {
            binding.action();
            return true;
        }
    }
    return false;
}

} // namespace shaderlay
