#pragma once

// Shaderlay Control Panel
// ImGui window shown while the overlay is interactive, plus the startup hint

#include <string>

namespace shaderlay {
class OverlaySession;
class RenderLoop;
class ShaderDirectory;
class ShaderLibrary;
class TaskQueue;
}

namespace shaderlay::imgui {

class ControlPanel {
public:
    // Seconds the startup hint stays on screen
    static constexpr double HINT_DURATION = 5.0;

    ControlPanel(ShaderLibrary& library, ShaderDirectory& directory, OverlaySession& session,
                 RenderLoop& renderLoop, TaskQueue& queue);

    // Non-copyable
    ControlPanel(const ControlPanel&) = delete;
    ControlPanel& operator=(const ControlPanel&) = delete;

    // Call between imgui::beginFrame() and imgui::render()
    void draw(double now);

    void setStartTime(double now) { m_startTime = now; }

    // Message line under the shader list
    void setStatus(const std::string& message, bool isError);

private:
    void drawHint(double now);
    void drawShaderList();
    void drawLoaders();
    void drawSettings();
    void drawErrors();
    void drawActions();

    ShaderLibrary& m_library;
    ShaderDirectory& m_directory;
    OverlaySession& m_session;
    RenderLoop& m_renderLoop;
    TaskQueue& m_queue;

    double m_startTime = 0.0;

    char m_urlBuffer[512] = {};
    char m_pathBuffer[1024] = {};
    int m_opacityEdit = -1;  // Slider value while dragging, -1 when idle

    std::string m_status;
    bool m_statusIsError = false;
};

} // namespace shaderlay::imgui
