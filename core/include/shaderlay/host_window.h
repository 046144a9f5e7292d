#pragma once

// Shaderlay - Host Window
// The native overlay window, behind an interface so the overlay state
// machine can be driven without a display

#include <glm/glm.hpp>
#include <functional>
#include <memory>

namespace shaderlay {

struct WindowOptions {
    bool showInTaskbar = false;  // Participate in the task switcher
};

struct WindowEvents {
    std::function<void(int width, int height)> onResize;
    std::function<void()> onFocus;
    std::function<void()> onBlur;
    std::function<void()> onClose;
    std::function<void()> onMinimize;
};

class HostWindow {
public:
    virtual ~HostWindow() = default;

    virtual void show() = 0;
    virtual void hide() = 0;
    virtual void focus() = 0;
    virtual void blur() = 0;

    // true: pointer and keyboard go to whatever is beneath the window
    virtual void setIgnoreInput(bool ignore) = 0;
    virtual void setOpacity(float opacity) = 0;
    virtual void setAlwaysOnTop(bool onTop) = 0;

    virtual bool isVisible() const = 0;
    virtual bool ignoresInput() const = 0;
    virtual float opacity() const = 0;
    virtual glm::ivec2 getSize() const = 0;

    virtual void setEvents(WindowEvents events) = 0;
};

class HostWindowFactory {
public:
    virtual ~HostWindowFactory() = default;

    // Returns null if the window could not be created.
    // Destroying the window is releasing the pointer.
    virtual std::unique_ptr<HostWindow> create(const WindowOptions& options) = 0;
};

} // namespace shaderlay
