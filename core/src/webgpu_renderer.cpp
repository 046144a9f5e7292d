// Shaderlay - WebGPU Renderer Implementation

#include <shaderlay/webgpu_renderer.h>
#include <shaderlay/gpu_context.h>
#include <shaderlay/webgpu_program_builder.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <algorithm>
#include <iostream>

namespace shaderlay {

// Helper to create WGPUStringView from C string
static inline WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

// Copies the offscreen target (premultiplied) onto the surface
static const char* COMPOSITE_SHADER = R"(
@group(0) @binding(0) var srcSampler: sampler;
@group(0) @binding(1) var srcTexture: texture_2d<f32>;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
}

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    let uv = vec2f(f32((vertexIndex << 1u) & 2u), f32(vertexIndex & 2u));
    var out: VertexOutput;
    out.position = vec4f(uv * 2.0 - 1.0, 0.0, 1.0);
    out.uv = vec2f(uv.x, 1.0 - uv.y);
    return out;
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    return textureSample(srcTexture, srcSampler, in.uv);
}
)";

WebGpuRenderer::WebGpuRenderer(GpuContext& gpu)
    : m_gpu(gpu) {
}

WebGpuRenderer::~WebGpuRenderer() {
    detachSurface();
    releaseTarget();
    releaseCompositor();

    if (m_programBindGroup) wgpuBindGroupRelease(m_programBindGroup);
    if (m_channelSampler) wgpuSamplerRelease(m_channelSampler);
    if (m_placeholderView) wgpuTextureViewRelease(m_placeholderView);
    if (m_placeholderTexture) wgpuTextureRelease(m_placeholderTexture);
    if (m_uniformBuffer) wgpuBufferRelease(m_uniformBuffer);
    if (m_bindGroupLayout) wgpuBindGroupLayoutRelease(m_bindGroupLayout);
    if (m_compositeSampler) wgpuSamplerRelease(m_compositeSampler);
    if (m_compositeLayout) wgpuBindGroupLayoutRelease(m_compositeLayout);
}

bool WebGpuRenderer::init() {
    WGPUDevice device = m_gpu.device();

    // Group 0 layout shared by all user programs
    WGPUBindGroupLayoutEntry entries[2 + CHANNEL_COUNT] = {};

    entries[0].binding = UNIFORM_BINDING;
    entries[0].visibility = WGPUShaderStage_Fragment;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = sizeof(ShaderUniforms);

    for (int i = 0; i < CHANNEL_COUNT; i++) {
        WGPUBindGroupLayoutEntry& e = entries[1 + i];
        e.binding = CHANNEL_BINDING_BASE + i;
        e.visibility = WGPUShaderStage_Fragment;
        e.texture.sampleType = WGPUTextureSampleType_Float;
        e.texture.viewDimension = WGPUTextureViewDimension_2D;
        e.texture.multisampled = false;
    }

    entries[1 + CHANNEL_COUNT].binding = SAMPLER_BINDING;
    entries[1 + CHANNEL_COUNT].visibility = WGPUShaderStage_Fragment;
    entries[1 + CHANNEL_COUNT].sampler.type = WGPUSamplerBindingType_Filtering;

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = toStringView("Shadertoy Bind Group Layout");
    layoutDesc.entryCount = 2 + CHANNEL_COUNT;
    layoutDesc.entries = entries;
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(device, &layoutDesc);
    if (!m_bindGroupLayout) {
        std::cerr << "[Renderer] Failed to create bind group layout" << std::endl;
        return false;
    }

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView("Shadertoy Uniforms");
    bufferDesc.size = sizeof(ShaderUniforms);
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    m_uniformBuffer = wgpuDeviceCreateBuffer(device, &bufferDesc);
    if (!m_uniformBuffer) {
        std::cerr << "[Renderer] Failed to create uniform buffer" << std::endl;
        return false;
    }

    if (!createPlaceholderChannel()) {
        return false;
    }

    WGPUBindGroupEntry groupEntries[2 + CHANNEL_COUNT] = {};
    groupEntries[0].binding = UNIFORM_BINDING;
    groupEntries[0].buffer = m_uniformBuffer;
    groupEntries[0].offset = 0;
    groupEntries[0].size = sizeof(ShaderUniforms);
    for (int i = 0; i < CHANNEL_COUNT; i++) {
        groupEntries[1 + i].binding = CHANNEL_BINDING_BASE + i;
        groupEntries[1 + i].textureView = m_placeholderView;
    }
    groupEntries[1 + CHANNEL_COUNT].binding = SAMPLER_BINDING;
    groupEntries[1 + CHANNEL_COUNT].sampler = m_channelSampler;

    WGPUBindGroupDescriptor groupDesc = {};
    groupDesc.layout = m_bindGroupLayout;
    groupDesc.entryCount = 2 + CHANNEL_COUNT;
    groupDesc.entries = groupEntries;
    m_programBindGroup = wgpuDeviceCreateBindGroup(device, &groupDesc);
    if (!m_programBindGroup) {
        std::cerr << "[Renderer] Failed to create bind group" << std::endl;
        return false;
    }

    // Compositor layout and sampler; the pipeline waits for a surface format
    WGPUBindGroupLayoutEntry compositeEntries[2] = {};
    compositeEntries[0].binding = 0;
    compositeEntries[0].visibility = WGPUShaderStage_Fragment;
    compositeEntries[0].sampler.type = WGPUSamplerBindingType_Filtering;
    compositeEntries[1].binding = 1;
    compositeEntries[1].visibility = WGPUShaderStage_Fragment;
    compositeEntries[1].texture.sampleType = WGPUTextureSampleType_Float;
    compositeEntries[1].texture.viewDimension = WGPUTextureViewDimension_2D;

    WGPUBindGroupLayoutDescriptor compositeLayoutDesc = {};
    compositeLayoutDesc.label = toStringView("Composite Bind Group Layout");
    compositeLayoutDesc.entryCount = 2;
    compositeLayoutDesc.entries = compositeEntries;
    m_compositeLayout = wgpuDeviceCreateBindGroupLayout(device, &compositeLayoutDesc);

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Nearest;
    samplerDesc.minFilter = WGPUFilterMode_Nearest;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    m_compositeSampler = wgpuDeviceCreateSampler(device, &samplerDesc);

    return m_compositeLayout && m_compositeSampler;
}

bool WebGpuRenderer::createPlaceholderChannel() {
    WGPUDevice device = m_gpu.device();

    // 1x1 opaque black bound to every channel
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView("Channel Placeholder");
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {1, 1, 1};
    texDesc.format = WGPUTextureFormat_RGBA8Unorm;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    m_placeholderTexture = wgpuDeviceCreateTexture(device, &texDesc);
    if (!m_placeholderTexture) {
        std::cerr << "[Renderer] Failed to create placeholder texture" << std::endl;
        return false;
    }

    uint8_t black[4] = {0, 0, 0, 255};
    WGPUTexelCopyTextureInfo dest = {};
    dest.texture = m_placeholderTexture;
    dest.aspect = WGPUTextureAspect_All;
    WGPUTexelCopyBufferLayout layout = {};
    layout.bytesPerRow = 4;
    layout.rowsPerImage = 1;
    WGPUExtent3D size = {1, 1, 1};
    wgpuQueueWriteTexture(m_gpu.queue(), &dest, black, 4, &layout, &size);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_RGBA8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    m_placeholderView = wgpuTextureCreateView(m_placeholderTexture, &viewDesc);

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = WGPUAddressMode_Repeat;
    samplerDesc.addressModeV = WGPUAddressMode_Repeat;
    samplerDesc.addressModeW = WGPUAddressMode_Repeat;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    m_channelSampler = wgpuDeviceCreateSampler(device, &samplerDesc);

    return m_placeholderView && m_channelSampler;
}

bool WebGpuRenderer::attachSurface(WGPUSurface surface, int width, int height) {
    detachSurface();
    if (!surface) {
        return false;
    }
    m_surface = surface;
    m_width = std::max(1, width);
    m_height = std::max(1, height);

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_gpu.adapter(), &capabilities);

    // The offscreen target holds raw (non-sRGB) values, so prefer a
    // non-sRGB surface format to avoid encoding them twice
    m_surfaceFormat = capabilities.formatCount > 0 ? capabilities.formats[0] : WGPUTextureFormat_BGRA8Unorm;
    for (size_t i = 0; i < capabilities.formatCount; i++) {
        if (capabilities.formats[i] == WGPUTextureFormat_BGRA8Unorm ||
            capabilities.formats[i] == WGPUTextureFormat_RGBA8Unorm) {
            m_surfaceFormat = capabilities.formats[i];
            break;
        }
    }

    WGPUCompositeAlphaMode alphaMode = WGPUCompositeAlphaMode_Auto;
    for (size_t i = 0; i < capabilities.alphaModeCount; i++) {
        if (capabilities.alphaModes[i] == WGPUCompositeAlphaMode_Premultiplied) {
            alphaMode = WGPUCompositeAlphaMode_Premultiplied;
            break;
        }
    }
    if (alphaMode != WGPUCompositeAlphaMode_Premultiplied) {
        std::cerr << "[Renderer] Surface has no premultiplied alpha mode, "
                  << "the overlay may not be transparent" << std::endl;
    }

    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    m_config = {};
    m_config.device = m_gpu.device();
    m_config.format = m_surfaceFormat;
    m_config.presentMode = WGPUPresentMode_Fifo;
    m_config.alphaMode = alphaMode;
    m_config.usage = WGPUTextureUsage_RenderAttachment;
    configureSurface();

    if (m_compositeFormat != m_surfaceFormat) {
        if (!createCompositorPipeline()) {
            return false;
        }
    }

    releaseTarget();
    return createTarget();
}

void WebGpuRenderer::detachSurface() {
    if (!m_surface) {
        return;
    }
    wgpuSurfaceUnconfigure(m_surface);
    wgpuSurfaceRelease(m_surface);
    m_surface = nullptr;
}

void WebGpuRenderer::configureSurface() {
    if (!m_surface) {
        return;
    }
    m_config.width = static_cast<uint32_t>(m_width);
    m_config.height = static_cast<uint32_t>(m_height);
    wgpuSurfaceConfigure(m_surface, &m_config);
}

void WebGpuRenderer::resize(int width, int height) {
    width = std::max(1, width);
    height = std::max(1, height);
    if (width == m_width && height == m_height && m_target) {
        return;
    }
    m_width = width;
    m_height = height;

    configureSurface();
    releaseTarget();
    createTarget();
}

bool WebGpuRenderer::createCompositorPipeline() {
    WGPUDevice device = m_gpu.device();
    if (m_compositePipeline) {
        wgpuRenderPipelineRelease(m_compositePipeline);
        m_compositePipeline = nullptr;
    }

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(COMPOSITE_SHADER);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView("Composite Shader");
    WGPUShaderModule shaderModule = wgpuDeviceCreateShaderModule(device, &shaderDesc);
    if (!shaderModule) {
        std::cerr << "[Renderer] Failed to create composite shader module" << std::endl;
        return false;
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.label = toStringView("Composite Pipeline Layout");
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_compositeLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(device, &pipelineLayoutDesc);

    // The target is premultiplied; the blend constant carries the opacity
    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_Constant;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_Constant;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_surfaceFormat;
    colorTarget.blend = &blendState;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = shaderModule;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView("Composite Pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 0;
    pipelineDesc.fragment = &fragmentState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;

    m_compositePipeline = wgpuDeviceCreateRenderPipeline(device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    if (!m_compositePipeline) {
        std::cerr << "[Renderer] Failed to create composite pipeline" << std::endl;
        return false;
    }
    m_compositeFormat = m_surfaceFormat;
    return true;
}

bool WebGpuRenderer::createTarget() {
    WGPUDevice device = m_gpu.device();

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView("Shader Target");
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {static_cast<uint32_t>(m_width), static_cast<uint32_t>(m_height), 1};
    texDesc.format = PROGRAM_TARGET_FORMAT;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    m_target = wgpuDeviceCreateTexture(device, &texDesc);
    if (!m_target) {
        std::cerr << "[Renderer] Failed to create target " << m_width << "x" << m_height << std::endl;
        return false;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = PROGRAM_TARGET_FORMAT;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    m_targetView = wgpuTextureCreateView(m_target, &viewDesc);

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].sampler = m_compositeSampler;
    entries[1].binding = 1;
    entries[1].textureView = m_targetView;

    WGPUBindGroupDescriptor groupDesc = {};
    groupDesc.layout = m_compositeLayout;
    groupDesc.entryCount = 2;
    groupDesc.entries = entries;
    m_compositeBindGroup = wgpuDeviceCreateBindGroup(device, &groupDesc);

    return m_targetView && m_compositeBindGroup;
}

void WebGpuRenderer::releaseTarget() {
    if (m_compositeBindGroup) {
        wgpuBindGroupRelease(m_compositeBindGroup);
        m_compositeBindGroup = nullptr;
    }
    if (m_targetView) {
        wgpuTextureViewRelease(m_targetView);
        m_targetView = nullptr;
    }
    if (m_target) {
        wgpuTextureRelease(m_target);
        m_target = nullptr;
    }
}

void WebGpuRenderer::releaseCompositor() {
    if (m_compositePipeline) {
        wgpuRenderPipelineRelease(m_compositePipeline);
        m_compositePipeline = nullptr;
    }
    m_compositeFormat = WGPUTextureFormat_Undefined;
}

void WebGpuRenderer::renderFrame(const CompiledProgram& program, const ShaderUniforms& uniforms,
                                 float opacity) {
    // No surface while the window is being recreated
    if (!m_surface || !m_compositePipeline || !m_compositeBindGroup) {
        return;
    }

    WGPUSurfaceTexture surfaceTexture;
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        if (surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Outdated ||
            surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Lost) {
            configureSurface();
        }
        return;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

    wgpuQueueWriteBuffer(m_gpu.queue(), m_uniformBuffer, 0, &uniforms, sizeof(ShaderUniforms));

    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_gpu.device(), &encoderDesc);

    // Program pass: fullscreen draw into the target, cleared transparent
    {
        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = m_targetView;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        colorAttachment.loadOp = WGPULoadOp_Clear;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.clearValue = {0.0, 0.0, 0.0, 0.0};

        WGPURenderPassDescriptor renderPassDesc = {};
        renderPassDesc.colorAttachmentCount = 1;
        renderPassDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
        const auto& gpuProgram = static_cast<const WebGpuProgram&>(program);
        wgpuRenderPassEncoderSetPipeline(pass, gpuProgram.pipeline());
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_programBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
    }

    // Composite pass: target at `opacity`, then the control surface
    {
        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = view;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        colorAttachment.loadOp = WGPULoadOp_Clear;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.clearValue = {0.0, 0.0, 0.0, 0.0};

        WGPURenderPassDescriptor renderPassDesc = {};
        renderPassDesc.colorAttachmentCount = 1;
        renderPassDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);

        WGPUColor blendConstant = {opacity, opacity, opacity, opacity};
        wgpuRenderPassEncoderSetPipeline(pass, m_compositePipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_compositeBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetBlendConstant(pass, &blendConstant);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);

        if (m_overlayCallback) {
            m_overlayCallback(pass);
        }

        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
    }

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuQueueSubmit(m_gpu.queue(), 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    wgpuSurfacePresent(m_surface);
    wgpuDevicePoll(m_gpu.device(), false, nullptr);

    // wgpu-native: release the surface texture after presenting
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfaceTexture.texture);
}

} // namespace shaderlay
