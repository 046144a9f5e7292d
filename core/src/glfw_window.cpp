// Shaderlay - GLFW Host Window Implementation

#include <shaderlay/glfw_window.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#if defined(SHADERLAY_HAS_X11)
#define GLFW_EXPOSE_NATIVE_X11
#include <GLFW/glfw3native.h>
#include <X11/Xatom.h>
#endif

#include <iostream>

namespace shaderlay {

namespace {

#if defined(SHADERLAY_HAS_X11)
// Keep an unmapped window out of the taskbar and pager. Appends so the
// _NET_WM_STATE_ABOVE that GLFW_FLOATING sets is kept.
void setSkipTaskbar(GLFWwindow* window) {
    Display* display = glfwGetX11Display();
    Window x11Window = glfwGetX11Window(window);
    if (!display || !x11Window) {
        return;
    }

    Atom atomState = XInternAtom(display, "_NET_WM_STATE", False);
    Atom atoms[2];
    atoms[0] = XInternAtom(display, "_NET_WM_STATE_SKIP_TASKBAR", False);
    atoms[1] = XInternAtom(display, "_NET_WM_STATE_SKIP_PAGER", False);
    XChangeProperty(display, x11Window, atomState, XA_ATOM, 32, PropModeAppend,
                    reinterpret_cast<unsigned char*>(atoms), 2);
    XFlush(display);
}
#endif

GlfwHostWindow* fromHandle(GLFWwindow* window) {
    return static_cast<GlfwHostWindow*>(glfwGetWindowUserPointer(window));
}

} // namespace

GlfwHostWindow::GlfwHostWindow(GLFWwindow* window)
    : m_window(window) {
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, onFramebufferSize);
    glfwSetWindowFocusCallback(m_window, onFocus);
    glfwSetWindowCloseCallback(m_window, onClose);
    glfwSetWindowIconifyCallback(m_window, onIconify);
    glfwSetKeyCallback(m_window, onKey);
    m_ignoreInput = glfwGetWindowAttrib(m_window, GLFW_MOUSE_PASSTHROUGH) == GLFW_TRUE;
}

GlfwHostWindow::~GlfwHostWindow() {
    if (m_window) {
        glfwSetWindowUserPointer(m_window, nullptr);
        glfwDestroyWindow(m_window);
    }
}

void GlfwHostWindow::show() {
    glfwShowWindow(m_window);
}

void GlfwHostWindow::hide() {
    glfwHideWindow(m_window);
}

void GlfwHostWindow::focus() {
    glfwFocusWindow(m_window);
}

void GlfwHostWindow::blur() {
#if defined(SHADERLAY_HAS_X11)
    // Hand focus back to whatever is under the pointer
    Display* display = glfwGetX11Display();
    if (display && glfwGetWindowAttrib(m_window, GLFW_FOCUSED)) {
        XSetInputFocus(display, PointerRoot, RevertToPointerRoot, CurrentTime);
        XFlush(display);
    }
#endif
}

void GlfwHostWindow::setIgnoreInput(bool ignore) {
    m_ignoreInput = ignore;
    glfwSetWindowAttrib(m_window, GLFW_MOUSE_PASSTHROUGH, ignore ? GLFW_TRUE : GLFW_FALSE);
}

void GlfwHostWindow::setOpacity(float opacity) {
    glfwSetWindowOpacity(m_window, opacity);
}

void GlfwHostWindow::setAlwaysOnTop(bool onTop) {
    glfwSetWindowAttrib(m_window, GLFW_FLOATING, onTop ? GLFW_TRUE : GLFW_FALSE);
}

bool GlfwHostWindow::isVisible() const {
    return glfwGetWindowAttrib(m_window, GLFW_VISIBLE) == GLFW_TRUE;
}

float GlfwHostWindow::opacity() const {
    return glfwGetWindowOpacity(m_window);
}

glm::ivec2 GlfwHostWindow::getSize() const {
    glm::ivec2 size(0);
    glfwGetFramebufferSize(m_window, &size.x, &size.y);
    return size;
}

void GlfwHostWindow::onFramebufferSize(GLFWwindow* window, int width, int height) {
    auto* self = fromHandle(window);
    if (self && self->m_events.onResize) {
        self->m_events.onResize(width, height);
    }
}

void GlfwHostWindow::onFocus(GLFWwindow* window, int focused) {
    auto* self = fromHandle(window);
    if (!self) return;
    if (focused && self->m_events.onFocus) {
        self->m_events.onFocus();
    } else if (!focused && self->m_events.onBlur) {
        self->m_events.onBlur();
    }
}

void GlfwHostWindow::onClose(GLFWwindow* window) {
    // Closing is decided by the session, not by GLFW
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    auto* self = fromHandle(window);
    if (self && self->m_events.onClose) {
        self->m_events.onClose();
    }
}

void GlfwHostWindow::onIconify(GLFWwindow* window, int iconified) {
    auto* self = fromHandle(window);
    if (iconified && self && self->m_events.onMinimize) {
        glfwRestoreWindow(window);
        self->m_events.onMinimize();
    }
}

void GlfwHostWindow::onKey(GLFWwindow* window, int key, int scancode, int action, int mods) {
    auto* self = fromHandle(window);
    if (action == GLFW_PRESS && self && self->m_keyHandler) {
        self->m_keyHandler(key, mods);
    }
}

std::unique_ptr<HostWindow> GlfwWindowFactory::create(const WindowOptions& options) {
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, GLFW_TRUE);
    glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
    glfwWindowHint(GLFW_FLOATING, GLFW_TRUE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_FOCUS_ON_SHOW, GLFW_FALSE);
    glfwWindowHint(GLFW_MOUSE_PASSTHROUGH, GLFW_TRUE);

    int x = 0, y = 0, width = 1280, height = 720;
    if (GLFWmonitor* monitor = glfwGetPrimaryMonitor()) {
        glfwGetMonitorWorkarea(monitor, &x, &y, &width, &height);
    }

    GLFWwindow* window = glfwCreateWindow(width, height, "Shaderlay", nullptr, nullptr);
    if (!window) {
        const char* description = nullptr;
        glfwGetError(&description);
        std::cerr << "[Overlay] glfwCreateWindow failed: "
                  << (description ? description : "unknown error") << std::endl;
        return nullptr;
    }
    glfwSetWindowPos(window, x, y);

    if (!glfwGetWindowAttrib(window, GLFW_TRANSPARENT_FRAMEBUFFER)) {
        std::cerr << "[Overlay] Transparent framebuffer unavailable (no compositor?)" << std::endl;
    }

#if defined(SHADERLAY_HAS_X11)
    if (!options.showInTaskbar && glfwGetPlatform() == GLFW_PLATFORM_X11) {
        setSkipTaskbar(window);
    }
#endif

    std::cout << "[Overlay] Window " << width << "x" << height
              << (options.showInTaskbar ? " (in taskbar)" : "") << std::endl;
    return std::make_unique<GlfwHostWindow>(window);
}

} // namespace shaderlay
