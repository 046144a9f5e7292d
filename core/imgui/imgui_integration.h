#pragma once

// Shaderlay ImGui Integration
// Dear ImGui drawn into the compositor's render pass, with GLFW input

#include <webgpu/webgpu.h>

struct GLFWwindow;

namespace shaderlay::imgui {

// Create the ImGui context and WebGPU backend. Calling again with a
// different format rebuilds the backend.
bool init(WGPUDevice device, WGPUTextureFormat format);

// Hook GLFW input for a (re)created window
void attachWindow(GLFWwindow* window);
// Unhook before the window is destroyed
void detachWindow();

void shutdown();

// Start a frame; widget calls go between beginFrame() and render()
bool beginFrame();
void render(WGPURenderPassEncoder pass);

// Drop a frame begun with beginFrame() without drawing it
void discardFrame();

bool isInitialized();
bool wantsKeyboard();

} // namespace shaderlay::imgui
