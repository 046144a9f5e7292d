// Shaderlay Control Panel Implementation

#include "control_panel.h"
#include <shaderlay/overlay_session.h>
#include <shaderlay/render_loop.h>
#include <shaderlay/shader_directory.h>
#include <shaderlay/shader_library.h>
#include <shaderlay/task_queue.h>
#include <imgui.h>
#include <cfloat>

namespace shaderlay::imgui {

namespace {
const ImVec4 ERROR_COLOR(1.0f, 0.45f, 0.4f, 1.0f);
const ImVec4 OK_COLOR(0.55f, 0.85f, 0.55f, 1.0f);
const ImVec4 DIM_COLOR(0.6f, 0.6f, 0.6f, 1.0f);
}

ControlPanel::ControlPanel(ShaderLibrary& library, ShaderDirectory& directory,
                           OverlaySession& session, RenderLoop& renderLoop, TaskQueue& queue)
    : m_library(library)
    , m_directory(directory)
    , m_session(session)
    , m_renderLoop(renderLoop)
    , m_queue(queue) {
}

void ControlPanel::setStatus(const std::string& message, bool isError) {
    m_status = message;
    m_statusIsError = isError;
}

void ControlPanel::draw(double now) {
    drawHint(now);

    if (!m_session.isInteractive()) {
        return;
    }

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x + 40.0f, viewport->WorkPos.y + 40.0f),
                            ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(440.0f, 560.0f), ImGuiCond_FirstUseEver);

    if (ImGui::Begin("Shaderlay", nullptr, ImGuiWindowFlags_NoCollapse)) {
        drawShaderList();
        ImGui::Separator();
        drawLoaders();
        ImGui::Separator();
        drawSettings();
        drawErrors();
        ImGui::Separator();
        drawActions();
    }
    ImGui::End();
}

void ControlPanel::drawHint(double now) {
    if (now - m_startTime >= HINT_DURATION || m_session.isInteractive()) {
        return;
    }

    const char* text = "Press Ctrl+` to open overlay";
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImVec2 size = ImGui::CalcTextSize(text);
    ImVec2 pos(viewport->WorkPos.x + (viewport->WorkSize.x - size.x) * 0.5f,
               viewport->WorkPos.y + viewport->WorkSize.y * 0.1f);

    ImDrawList* drawList = ImGui::GetForegroundDrawList();
    drawList->AddRectFilled(ImVec2(pos.x - 12.0f, pos.y - 8.0f),
                            ImVec2(pos.x + size.x + 12.0f, pos.y + size.y + 8.0f),
                            IM_COL32(0, 0, 0, 170), 6.0f);
    drawList->AddText(pos, IM_COL32(255, 255, 255, 230), text);
}

void ControlPanel::drawShaderList() {
    ImGui::TextUnformatted("Shaders");

    std::optional<std::string> currentId = m_library.getCurrentId();
    if (ImGui::BeginListBox("##shaders", ImVec2(-FLT_MIN, 8 * ImGui::GetTextLineHeightWithSpacing()))) {
        for (const auto& info : m_library.getShaderList()) {
            bool selected = currentId && *currentId == info.id;
            ImGui::PushID(info.id.c_str());
            if (ImGui::Selectable(info.displayName.c_str(), selected) && !selected) {
                std::string id = info.id;
                m_queue.post([this, id]() { m_library.selectShader(id); });
            }
            if (ImGui::IsItemHovered()) {
                const ShaderSource* source = m_library.catalog().find(info.id);
                if (source && !source->path.empty()) {
                    ImGui::SetTooltip("%s", source->path.c_str());
                }
            }
            ImGui::PopID();
        }
        ImGui::EndListBox();
    }

    const ShaderSource* current = m_library.catalog().currentSource();
    ImGui::BeginDisabled(current == nullptr);
    if (ImGui::Button("Save to library")) {
        m_queue.post([this]() {
            const ShaderSource* source = m_library.catalog().currentSource();
            if (!source) return;
            if (m_directory.saveShaderFile(source->bodyText, source->displayName)) {
                setStatus("Saved " + sanitizeShaderFileName(source->displayName), false);
            } else {
                setStatus("Could not save " + source->displayName, true);
            }
        });
    }
    ImGui::EndDisabled();

    if (current && current->origin == ShaderOrigin::DirectoryScan) {
        ImGui::SameLine();
        if (ImGui::Button("Delete file")) {
            std::string path = current->path;
            m_queue.post([this, path]() {
                if (!m_directory.deleteShaderFile(path)) {
                    setStatus("Could not delete " + path, true);
                }
            });
        }
    }

    if (!m_status.empty()) {
        ImGui::TextColored(m_statusIsError ? ERROR_COLOR : OK_COLOR, "%s", m_status.c_str());
    }
}

void ControlPanel::drawLoaders() {
    ImGui::TextUnformatted("Shadertoy URL");
    ImGui::SetNextItemWidth(-80.0f);
    ImGui::InputTextWithHint("##url", "https://www.shadertoy.com/view/...", m_urlBuffer, sizeof(m_urlBuffer));
    ImGui::SameLine();
    if (ImGui::Button("Load##url") && m_urlBuffer[0] != '\0') {
        std::string url = m_urlBuffer;
        setStatus("Fetching...", false);
        m_queue.post([this, url]() {
            m_library.loadFromURL(url, [this](const LoadResult& result) {
                if (result.ok) {
                    setStatus("Loaded " + result.id, false);
                } else {
                    setStatus(result.error, true);
                }
            });
        });
    }

    ImGui::TextUnformatted("Shader file");
    ImGui::SetNextItemWidth(-80.0f);
    ImGui::InputTextWithHint("##path", "/path/to/shader.glsl", m_pathBuffer, sizeof(m_pathBuffer));
    ImGui::SameLine();
    if (ImGui::Button("Load##path") && m_pathBuffer[0] != '\0') {
        std::string path = m_pathBuffer;
        m_queue.post([this, path]() {
            LoadResult result = m_library.loadFromFile(path);
            if (result.ok) {
                setStatus("Loaded " + path, false);
            } else {
                setStatus(result.error, true);
            }
        });
    }
}

void ControlPanel::drawSettings() {
    const OverlayState& state = m_session.state();

    int opacity = m_opacityEdit >= 0 ? m_opacityEdit : state.opacityPercent;
    if (ImGui::SliderInt("Opacity", &opacity, 0, 100, "%d%%")) {
        m_opacityEdit = opacity;
        // Live preview; persisted on release
        m_renderLoop.setOpacity(opacity / 100.0f);
    }
    if (ImGui::IsItemDeactivatedAfterEdit()) {
        int value = m_opacityEdit;
        m_opacityEdit = -1;
        m_queue.post([this, value]() { m_session.setOpacity(value); });
    }

    bool taskbar = state.taskbarVisible;
    if (ImGui::Checkbox("Show window in taskbar", &taskbar)) {
        m_queue.post([this, taskbar]() { m_session.setShowWindowInTaskbar(taskbar); });
    }

    bool settingsOnFocus = m_session.showSettingsOnWindowFocused();
    ImGui::BeginDisabled(!taskbar);
    if (ImGui::Checkbox("Show settings when focused", &settingsOnFocus)) {
        m_queue.post([this, settingsOnFocus]() { m_session.setShowSettingsOnWindowFocused(settingsOnFocus); });
    }
    ImGui::EndDisabled();
}

void ControlPanel::drawErrors() {
    if (!m_renderLoop.hasError()) {
        return;
    }

    ImGui::Separator();
    ImGui::TextColored(ERROR_COLOR, "Compile error");
    ImGui::PushStyleColor(ImGuiCol_Text, DIM_COLOR);
    ImGui::BeginChild("##error", ImVec2(0.0f, 140.0f), true, ImGuiWindowFlags_HorizontalScrollbar);
    ImGui::TextUnformatted(m_renderLoop.lastError().c_str());
    ImGui::EndChild();
    ImGui::PopStyleColor();
}

void ControlPanel::drawActions() {
    if (ImGui::Button("Hide panel")) {
        m_queue.post([this]() { m_session.setInteractive(false); });
    }
    ImGui::SameLine();
    if (ImGui::Button("Hide overlay")) {
        m_queue.post([this]() { m_session.hideWindow(); });
    }
    ImGui::SameLine();
    if (ImGui::Button("Exit")) {
        m_queue.post([this]() { m_session.requestQuit(); });
    }
    ImGui::TextColored(DIM_COLOR, "Ctrl+` toggles this panel");
}

} // namespace shaderlay::imgui
