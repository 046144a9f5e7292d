#pragma once

// Shaderlay - Builtin Shaders

#include <shaderlay/shader_source.h>
#include <vector>

namespace shaderlay {

constexpr const char* DEFAULT_SHADER_ID = "default";

// In registration order; the first one is selected at startup
const std::vector<ShaderSource>& builtinShaders();

} // namespace shaderlay
