#pragma once

// Shaderlay - WebGPU Renderer
// Draws the active program into an offscreen target, then composites it
// onto the window surface at the overlay opacity

#include <shaderlay/render_loop.h>
#include <webgpu/webgpu.h>
#include <functional>

namespace shaderlay {

class GpuContext;

// Draws on top of the composited shader (the control surface)
using OverlayDrawCallback = std::function<void(WGPURenderPassEncoder pass)>;

class WebGpuRenderer : public FrameRenderer {
public:
    explicit WebGpuRenderer(GpuContext& gpu);
    ~WebGpuRenderer() override;

    // Non-copyable
    WebGpuRenderer(const WebGpuRenderer&) = delete;
    WebGpuRenderer& operator=(const WebGpuRenderer&) = delete;

    // Shared program resources: layout, uniform buffer, placeholder channel
    bool init();

    // Take ownership of a window surface and configure it
    bool attachSurface(WGPUSurface surface, int width, int height);
    // Release the surface before its window goes away
    void detachSurface();
    bool hasSurface() const { return m_surface != nullptr; }

    void resize(int width, int height) override;
    void renderFrame(const CompiledProgram& program, const ShaderUniforms& uniforms,
                     float opacity) override;

    void setOverlayCallback(OverlayDrawCallback callback) { m_overlayCallback = std::move(callback); }

    WGPUBindGroupLayout bindGroupLayout() const { return m_bindGroupLayout; }
    WGPUTextureFormat surfaceFormat() const { return m_surfaceFormat; }

private:
    bool createPlaceholderChannel();
    bool createCompositorPipeline();
    bool createTarget();
    void releaseTarget();
    void releaseCompositor();
    void configureSurface();

    GpuContext& m_gpu;

    // Program resources (group 0 of every compiled program)
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBuffer m_uniformBuffer = nullptr;
    WGPUTexture m_placeholderTexture = nullptr;
    WGPUTextureView m_placeholderView = nullptr;
    WGPUSampler m_channelSampler = nullptr;
    WGPUBindGroup m_programBindGroup = nullptr;

    // Offscreen target the program renders into
    WGPUTexture m_target = nullptr;
    WGPUTextureView m_targetView = nullptr;

    // Compositor
    WGPURenderPipeline m_compositePipeline = nullptr;
    WGPUBindGroupLayout m_compositeLayout = nullptr;
    WGPUBindGroup m_compositeBindGroup = nullptr;
    WGPUSampler m_compositeSampler = nullptr;
    WGPUTextureFormat m_compositeFormat = WGPUTextureFormat_Undefined;

    // Surface
    WGPUSurface m_surface = nullptr;
    WGPUSurfaceConfiguration m_config = {};
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8Unorm;

    int m_width = 1;
    int m_height = 1;

    OverlayDrawCallback m_overlayCallback;
};

} // namespace shaderlay
