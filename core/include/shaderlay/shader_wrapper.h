#pragma once

// Shaderlay - Shader Wrapper
// Turns a Shadertoy-style mainImage() body into a complete GLSL 450
// fragment program bound to the fixed uniform contract below

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace shaderlay {

constexpr int CHANNEL_COUNT = 4;

// Bind group 0 layout shared by every compiled program
constexpr uint32_t UNIFORM_BINDING = 0;
constexpr uint32_t CHANNEL_BINDING_BASE = 1;   // Bindings 1..4
constexpr uint32_t SAMPLER_BINDING = 5;

// Uniform buffer contents (std140, matches the block in the wrapper)
struct ShaderUniforms {
    glm::vec3 resolution{0.0f, 0.0f, 1.0f};  // iResolution
    float time = 0.0f;                       // iTime
    glm::vec4 pointer{0.0f};                 // iMouse, always zero
    float timeDelta = 0.0f;                  // iTimeDelta
    int32_t frame = 0;                       // iFrame
    float _pad0 = 0.0f;
    float _pad1 = 0.0f;
    glm::vec4 channelResolution[CHANNEL_COUNT] = {  // iChannelResolution
        glm::vec4(0.0f), glm::vec4(0.0f), glm::vec4(0.0f), glm::vec4(0.0f)};
};
static_assert(sizeof(ShaderUniforms) == 112, "ShaderUniforms must match the std140 block");

// Complete fragment program for a user body
std::string composeFragmentSource(const std::string& body);

// Number of wrapper lines before the first line of the body
int wrapperPrefixLineCount();

// Map a 1-based line of the composed program back to the body.
// Returns 0 when the line falls inside the wrapper.
int mapToBodyLine(int composedLine, const std::string& body);

// Identifiers the wrapper declares; a body redeclaring one fails to compile
const std::vector<std::string>& reservedIdentifiers();

// Fixed fullscreen-triangle vertex stage (WGSL)
const char* fullscreenVertexSource();

} // namespace shaderlay
