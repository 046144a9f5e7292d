// Shaderlay - Shader Wrapper Implementation

#include <shaderlay/shader_wrapper.h>
#include <algorithm>

namespace shaderlay {

namespace {

// Channels are separate texture/sampler bindings combined at the call
// site, which is what the GLSL front end of wgpu accepts.
const char* FRAGMENT_PREFIX = R"(#version 450

layout(set = 0, binding = 0) uniform ShaderlayInputs {
    vec3 sl_resolution;
    float sl_time;
    vec4 sl_pointer;
    float sl_time_delta;
    int sl_frame;
    float sl_pad0;
    float sl_pad1;
    vec4 sl_channel_resolution[4];
};

layout(set = 0, binding = 1) uniform texture2D sl_channel0;
layout(set = 0, binding = 2) uniform texture2D sl_channel1;
layout(set = 0, binding = 3) uniform texture2D sl_channel2;
layout(set = 0, binding = 4) uniform texture2D sl_channel3;
layout(set = 0, binding = 5) uniform sampler sl_channel_sampler;

layout(location = 0) out vec4 sl_frag_color;

#define iResolution sl_resolution
#define iTime sl_time
#define iTimeDelta sl_time_delta
#define iFrame sl_frame
#define iMouse sl_pointer
#define iChannelResolution sl_channel_resolution
#define iChannel0 sampler2D(sl_channel0, sl_channel_sampler)
#define iChannel1 sampler2D(sl_channel1, sl_channel_sampler)
#define iChannel2 sampler2D(sl_channel2, sl_channel_sampler)
#define iChannel3 sampler2D(sl_channel3, sl_channel_sampler)

)";

// WebGPU puts the framebuffer origin top-left; mainImage expects bottom-left.
// Alpha is written as-is, opacity is applied when compositing.
const char* FRAGMENT_SUFFIX = R"(

void main() {
    vec4 color = vec4(0.0, 0.0, 0.0, 1.0);
    mainImage(color, vec2(gl_FragCoord.x, sl_resolution.y - gl_FragCoord.y));
    sl_frag_color = color;
}
)";

const char* FULLSCREEN_VERTEX = R"(
@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> @builtin(position) vec4f {
    // One triangle covering the viewport
    let x = f32((vertexIndex << 1u) & 2u) * 2.0 - 1.0;
    let y = f32(vertexIndex & 2u) * 2.0 - 1.0;
    return vec4f(x, y, 0.0, 1.0);
}
)";

int countLines(const std::string& text) {
    if (text.empty()) return 0;
    int lines = static_cast<int>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') lines++;
    return lines;
}

} // namespace

std::string composeFragmentSource(const std::string& body) {
    std::string source;
    source.reserve(body.size() + 2048);
    source += FRAGMENT_PREFIX;
    source += body;
    source += FRAGMENT_SUFFIX;
    return source;
}

int wrapperPrefixLineCount() {
    static const int count = [] {
        std::string prefix(FRAGMENT_PREFIX);
        return static_cast<int>(std::count(prefix.begin(), prefix.end(), '\n'));
    }();
    return count;
}

int mapToBodyLine(int composedLine, const std::string& body) {
    int bodyLine = composedLine - wrapperPrefixLineCount();
    if (bodyLine < 1 || bodyLine > countLines(body)) {
        return 0;
    }
    return bodyLine;
}

const std::vector<std::string>& reservedIdentifiers() {
    static const std::vector<std::string> names = {
        "main", "ShaderlayInputs",
        "iResolution", "iTime", "iTimeDelta", "iFrame", "iMouse", "iChannelResolution",
        "iChannel0", "iChannel1", "iChannel2", "iChannel3",
        "sl_resolution", "sl_time", "sl_pointer", "sl_time_delta", "sl_frame",
        "sl_pad0", "sl_pad1", "sl_channel_resolution",
        "sl_channel0", "sl_channel1", "sl_channel2", "sl_channel3",
        "sl_channel_sampler", "sl_frag_color",
    };
    return names;
}

const char* fullscreenVertexSource() {
    return FULLSCREEN_VERTEX;
}

} // namespace shaderlay
