#pragma once

// Shaderlay - Render Loop
// Owns the active compiled program and drives one frame per tick

#include <shaderlay/frame_clock.h>
#include <shaderlay/program_builder.h>
#include <shaderlay/shader_wrapper.h>
#include <memory>
#include <optional>
#include <string>

namespace shaderlay {

// Draws a frame with a compiled program onto the host surface
class FrameRenderer {
public:
    virtual ~FrameRenderer() = default;

    virtual void resize(int width, int height) = 0;

    // `opacity` (0..1) scales the rendered shader as a whole when it is
    // composited; it never reaches the shader itself.
    virtual void renderFrame(const CompiledProgram& program, const ShaderUniforms& uniforms,
                             float opacity) = 0;
};

class RenderLoop {
public:
    RenderLoop(ProgramBuilder& builder, FrameRenderer& renderer);

    // Non-copyable
    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    // Build the initial program synchronously and start the clock.
    // Returns false (and stays stopped) if it does not compile.
    bool start(const std::string& initialBody, double now);
    void stop() { m_running = false; }
    bool isRunning() const { return m_running; }

    // Queue a rebuild; it happens at the start of the next tick.
    // A later request replaces an earlier one that has not run yet.
    void requestBuild(const std::string& body);
    bool hasPendingBuild() const { return m_pendingBody.has_value(); }

    // Run one frame. Returns false if the loop is not running.
    bool tick(double now);

    void resize(int width, int height);
    int width() const { return m_width; }
    int height() const { return m_height; }

    // Compositing multiplier, 0..1
    void setOpacity(float opacity);
    float opacity() const { return m_opacity; }

    void setTimeScale(double scale) { m_clock.setTimeScale(scale); }

    const CompiledProgram* program() const { return m_program.get(); }
    const ShaderUniforms& uniforms() const { return m_uniforms; }
    const FrameClock& clock() const { return m_clock; }

    // Error from the most recent failed build, cleared by a successful one
    const std::string& lastError() const { return m_lastError; }
    bool hasError() const { return !m_lastError.empty(); }
    const CompileError& lastCompileError() const { return m_lastCompileError; }

private:
    bool rebuild(const std::string& body);
    void updateResolution();

    ProgramBuilder& m_builder;
    FrameRenderer& m_renderer;

    FrameClock m_clock;
    ShaderUniforms m_uniforms;
    std::unique_ptr<CompiledProgram> m_program;
    std::optional<std::string> m_pendingBody;

    int m_width = 1;
    int m_height = 1;
    float m_opacity = 1.0f;
    bool m_running = false;

    std::string m_lastError;
    CompileError m_lastCompileError;
};

} // namespace shaderlay
