#pragma once

// Shaderlay - GLFW Host Window
// Undecorated, floating, transparent window covering the primary work area

#include <shaderlay/host_window.h>
#include <functional>

struct GLFWwindow;

namespace shaderlay {

class GlfwHostWindow : public HostWindow {
public:
    using KeyHandler = std::function<void(int key, int mods)>;

    explicit GlfwHostWindow(GLFWwindow* window);
    ~GlfwHostWindow() override;

    // Non-copyable
    GlfwHostWindow(const GlfwHostWindow&) = delete;
    GlfwHostWindow& operator=(const GlfwHostWindow&) = delete;

    void show() override;
    void hide() override;
    void focus() override;
    void blur() override;

    void setIgnoreInput(bool ignore) override;
    void setOpacity(float opacity) override;
    void setAlwaysOnTop(bool onTop) override;

    bool isVisible() const override;
    bool ignoresInput() const override { return m_ignoreInput; }
    float opacity() const override;
    glm::ivec2 getSize() const override;

    void setEvents(WindowEvents events) override { m_events = std::move(events); }

    // Key presses while the window has focus
    void setKeyHandler(KeyHandler handler) { m_keyHandler = std::move(handler); }

    GLFWwindow* handle() const { return m_window; }

private:
    static void onFramebufferSize(GLFWwindow* window, int width, int height);
    static void onFocus(GLFWwindow* window, int focused);
    static void onClose(GLFWwindow* window);
    static void onIconify(GLFWwindow* window, int iconified);
    static void onKey(GLFWwindow* window, int key, int scancode, int action, int mods);

    GLFWwindow* m_window = nullptr;
    WindowEvents m_events;
    KeyHandler m_keyHandler;
    bool m_ignoreInput = false;
};

class GlfwWindowFactory : public HostWindowFactory {
public:
    std::unique_ptr<HostWindow> create(const WindowOptions& options) override;
};

} // namespace shaderlay
