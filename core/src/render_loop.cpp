// Shaderlay - Render Loop Implementation

#include <shaderlay/render_loop.h>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace shaderlay {

namespace {

// Numbered lines of `body` around `line` (or the first few if unknown)
std::string excerpt(const std::string& body, int line) {
    const int context = 3;
    int first = line > 0 ? std::max(1, line - context) : 1;
    int last = line > 0 ? line + context : 20;

    std::istringstream stream(body);
    std::ostringstream out;
    std::string text;
    int n = 0;
    while (std::getline(stream, text)) {
        n++;
        if (n < first) continue;
        if (n > last) break;
        out << (n == line ? ">" : " ") << std::setw(4) << n << " | " << text << "\n";
    }
    return out.str();
}

} // namespace

RenderLoop::RenderLoop(ProgramBuilder& builder, FrameRenderer& renderer)
    : m_builder(builder)
    , m_renderer(renderer) {
    updateResolution();
}

bool RenderLoop::start(const std::string& initialBody, double now) {
    if (!rebuild(initialBody)) {
        std::cerr << "[Renderer] Initial shader failed to compile" << std::endl;
        return false;
    }
    m_clock.start(now);
    m_uniforms.frame = 0;
    m_running = true;
    return true;
}

void RenderLoop::requestBuild(const std::string& body) {
    m_pendingBody = body;
}

bool RenderLoop::tick(double now) {
    if (!m_running) {
        return false;
    }

    // Apply a pending rebuild before drawing; on failure the current
    // program keeps rendering
    if (m_pendingBody) {
        std::string body = std::move(*m_pendingBody);
        m_pendingBody.reset();
        rebuild(body);
    }

    FrameTime t = m_clock.tick(now);
    m_uniforms.time = t.time;
    m_uniforms.timeDelta = t.delta;
    m_uniforms.pointer = glm::vec4(0.0f);

    if (m_program) {
        m_renderer.renderFrame(*m_program, m_uniforms, m_opacity);
        m_uniforms.frame++;
    }
    return true;
}

void RenderLoop::resize(int width, int height) {
    m_width = std::max(1, width);
    m_height = std::max(1, height);
    updateResolution();
    m_renderer.resize(m_width, m_height);
}

void RenderLoop::updateResolution() {
    m_uniforms.resolution = glm::vec3(m_width, m_height, 1.0f);
    // Channels report the viewport size, not the placeholder's
    for (auto& res : m_uniforms.channelResolution) {
        res = glm::vec4(m_width, m_height, 1.0f, 0.0f);
    }
}

void RenderLoop::setOpacity(float opacity) {
    m_opacity = std::clamp(opacity, 0.0f, 1.0f);
}

bool RenderLoop::rebuild(const std::string& body) {
    BuildResult result = m_builder.build(body);
    if (!result.ok()) {
        m_lastCompileError = result.error;
        m_lastError = result.error.describe();
        std::cerr << "[Renderer] Shader build failed, keeping previous program\n"
                  << "[Renderer] " << m_lastError << "\n"
                  << excerpt(body, result.error.line) << std::flush;
        return false;
    }

    // Old program is destroyed here, only after the new one exists
    m_program = std::move(result.program);
    m_lastError.clear();
    m_lastCompileError = CompileError{};
    std::cout << "[Renderer] Shader program built (" << body.size() << " chars)" << std::endl;
    return true;
}

} // namespace shaderlay
