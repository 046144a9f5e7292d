// Shaderlay - WebGPU Program Builder Implementation

#include <shaderlay/webgpu_program_builder.h>
#include <shaderlay/shader_wrapper.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (GLSL source, wgpuDevicePoll)
#include <cstring>
#include <iostream>

namespace shaderlay {

// Helper to create WGPUStringView from C string
static inline WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

static std::string fromStringView(WGPUStringView sv) {
    if (!sv.data) return {};
    size_t len = sv.length == WGPU_STRLEN ? strlen(sv.data) : sv.length;
    return std::string(sv.data, len);
}

namespace {

struct ErrorScopeResult {
    bool done = false;
    bool failed = false;
    std::string message;
};

void onErrorScopePopped(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                        WGPUStringView message, void* userdata1, void* userdata2) {
    auto* result = static_cast<ErrorScopeResult*>(userdata1);
    if (status == WGPUPopErrorScopeStatus_Success && type != WGPUErrorType_NoError) {
        result->failed = true;
        result->message = fromStringView(message);
    }
    result->done = true;
}

} // namespace

// -----------------------------------------------------------------------------
// WebGpuProgram
// -----------------------------------------------------------------------------

WebGpuProgram::WebGpuProgram(std::string body, WGPURenderPipeline pipeline)
    : CompiledProgram(std::move(body))
    , m_pipeline(pipeline) {
}

WebGpuProgram::~WebGpuProgram() {
    if (m_pipeline) {
        wgpuRenderPipelineRelease(m_pipeline);
    }
}

// -----------------------------------------------------------------------------
// WebGpuProgramBuilder
// -----------------------------------------------------------------------------

WebGpuProgramBuilder::WebGpuProgramBuilder(WGPUDevice device, WGPUBindGroupLayout layout)
    : m_device(device)
    , m_layout(layout) {
}

void WebGpuProgramBuilder::pushErrorScope() {
    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);
}

std::optional<std::string> WebGpuProgramBuilder::popErrorScope() {
    ErrorScopeResult result;
    WGPUPopErrorScopeCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    callbackInfo.callback = onErrorScopePopped;
    callbackInfo.userdata1 = &result;

    wgpuDevicePopErrorScope(m_device, callbackInfo);
    while (!result.done) {
        wgpuDevicePoll(m_device, true, nullptr);
    }

    if (!result.failed) {
        return std::nullopt;
    }
    return result.message.empty() ? std::string("validation error") : result.message;
}

WGPUShaderModule WebGpuProgramBuilder::createVertexModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(fullscreenVertexSource());

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView("Fullscreen Vertex");
    return wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
}

WGPUShaderModule WebGpuProgramBuilder::createFragmentModule(const std::string& source) {
    WGPUShaderSourceGLSL glslDesc = {};
    glslDesc.chain.sType = static_cast<WGPUSType>(WGPUSType_ShaderSourceGLSL);
    glslDesc.stage = WGPUShaderStage_Fragment;
    glslDesc.code = toStringView(source.c_str());
    glslDesc.defineCount = 0;
    glslDesc.defines = nullptr;

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &glslDesc.chain;
    shaderDesc.label = toStringView("Shadertoy Fragment");
    return wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
}

BuildResult WebGpuProgramBuilder::build(const std::string& body) {
    BuildResult result;

    // Vertex stage
    pushErrorScope();
    WGPUShaderModule vertexModule = createVertexModule();
    if (auto error = popErrorScope(); error || !vertexModule) {
        result.error = parseCompileDiagnostic(CompileError::Stage::Vertex,
                                              error.value_or("failed to create module"), body);
        if (vertexModule) wgpuShaderModuleRelease(vertexModule);
        std::cerr << "[ProgramBuilder] " << result.error.describe() << std::endl;
        return result;
    }

    // Fragment stage
    const std::string source = composeFragmentSource(body);
    pushErrorScope();
    WGPUShaderModule fragmentModule = createFragmentModule(source);
    if (auto error = popErrorScope(); error || !fragmentModule) {
        result.error = parseCompileDiagnostic(CompileError::Stage::Fragment,
                                              error.value_or("failed to create module"), body);
        if (fragmentModule) wgpuShaderModuleRelease(fragmentModule);
        wgpuShaderModuleRelease(vertexModule);
        std::cerr << "[ProgramBuilder] " << result.error.describe() << std::endl;
        return result;
    }

    // Link
    pushErrorScope();

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.label = toStringView("Shadertoy Pipeline Layout");
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_layout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);

    // Source-over onto a target cleared to transparent
    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = PROGRAM_TARGET_FORMAT;
    colorTarget.blend = &blendState;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = fragmentModule;
    fragmentState.entryPoint = toStringView("main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView("Shadertoy Pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = vertexModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 0;
    pipelineDesc.fragment = &fragmentState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;

    WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    std::optional<std::string> linkError = popErrorScope();

    // Intermediates are no longer needed either way
    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(fragmentModule);
    wgpuShaderModuleRelease(vertexModule);

    if (linkError || !pipeline) {
        result.error = parseCompileDiagnostic(CompileError::Stage::Link,
                                              linkError.value_or("failed to create pipeline"), body);
        if (pipeline) wgpuRenderPipelineRelease(pipeline);
        std::cerr << "[ProgramBuilder] " << result.error.describe() << std::endl;
        return result;
    }

    result.program = std::make_unique<WebGpuProgram>(body, pipeline);
    return result;
}

} // namespace shaderlay
