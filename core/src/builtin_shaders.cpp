// Shaderlay - Builtin Shaders

#include <shaderlay/builtin_shaders.h>

namespace shaderlay {

namespace {

const char* RAINBOW = R"(void mainImage(out vec4 fragColor, in vec2 fragCoord) {
    vec2 uv = fragCoord / iResolution.xy;
    vec3 col = 0.5 + 0.5 * cos(iTime + uv.xyx + vec3(0, 2, 4));
    fragColor = vec4(col, 1.0);
}
)";

const char* PLASMA = R"(void mainImage(out vec4 fragColor, in vec2 fragCoord) {
    vec2 uv = (fragCoord * 2.0 - iResolution.xy) / iResolution.y;
    float d = length(uv);
    float col = sin(d * 8.0 - iTime * 2.0) * 0.5 + 0.5;
    col += sin(atan(uv.y, uv.x) * 5.0 + iTime) * 0.3;
    fragColor = vec4(col * 0.5, col * 0.7, col, 1.0);
}
)";

} // namespace

const std::vector<ShaderSource>& builtinShaders() {
    static const std::vector<ShaderSource> shaders = {
        {DEFAULT_SHADER_ID, "Default Rainbow", RAINBOW, ShaderOrigin::Builtin, {}},
        {"plasma", "Plasma", PLASMA, ShaderOrigin::Builtin, {}},
    };
    return shaders;
}

} // namespace shaderlay
