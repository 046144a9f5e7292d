#pragma once

// Shaderlay - WebGPU Program Builder
// GLSL fragment (via the wgpu-native GLSL front end) + fixed WGSL vertex
// stage, linked into a render pipeline

#include <shaderlay/program_builder.h>
#include <webgpu/webgpu.h>
#include <optional>
#include <string>

namespace shaderlay {

// Pipelines render into this format; the compositor converts to the surface
constexpr WGPUTextureFormat PROGRAM_TARGET_FORMAT = WGPUTextureFormat_RGBA8Unorm;

class WebGpuProgram : public CompiledProgram {
public:
    WebGpuProgram(std::string body, WGPURenderPipeline pipeline);
    ~WebGpuProgram() override;

    WGPURenderPipeline pipeline() const { return m_pipeline; }

private:
    WGPURenderPipeline m_pipeline = nullptr;
};

class WebGpuProgramBuilder : public ProgramBuilder {
public:
    // `layout` is the shared group 0 layout (uniforms, channels, sampler)
    WebGpuProgramBuilder(WGPUDevice device, WGPUBindGroupLayout layout);
    ~WebGpuProgramBuilder() override = default;

    // Non-copyable
    WebGpuProgramBuilder(const WebGpuProgramBuilder&) = delete;
    WebGpuProgramBuilder& operator=(const WebGpuProgramBuilder&) = delete;

    BuildResult build(const std::string& body) override;

private:
    void pushErrorScope();
    // Validation error raised since pushErrorScope(), if any
    std::optional<std::string> popErrorScope();

    WGPUShaderModule createVertexModule();
    WGPUShaderModule createFragmentModule(const std::string& source);

    WGPUDevice m_device;
    WGPUBindGroupLayout m_layout;
};

} // namespace shaderlay
