#pragma once

// Shaderlay - Global Hotkeys
// System-wide key grabs on X11; elsewhere the chords only work while the
// overlay window has focus

#include <shaderlay/accelerator.h>
#include <functional>
#include <vector>

namespace shaderlay {

class GlobalHotkeys {
public:
    using Action = std::function<void()>;

    GlobalHotkeys();
    ~GlobalHotkeys();

    // Non-copyable
    GlobalHotkeys(const GlobalHotkeys&) = delete;
    GlobalHotkeys& operator=(const GlobalHotkeys&) = delete;

    // Returns false if the chord could not be grabbed system-wide; it is
    // still honored through handleWindowKey()
    bool add(const KeyChord& chord, Action action);

    // Dispatch pending global key presses (call in main loop)
    void poll();

    // Key press delivered to the focused overlay window (GLFW key/mods).
    // Returns true if it matched a hotkey.
    bool handleWindowKey(int key, int mods);

    void clear();

    bool isGlobal() const;

private:
    struct Binding {
        KeyChord chord;
        Action action;
        unsigned keycode = 0;  // X11 keycode, 0 if not grabbed
    };

    void ungrab(const Binding& binding);

    struct Native;
    Native* m_native = nullptr;
    std::vector<Binding> m_bindings;
};

} // namespace shaderlay
