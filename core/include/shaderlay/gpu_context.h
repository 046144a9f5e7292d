#pragma once

// Shaderlay - GPU Context
// WebGPU instance, adapter, device and queue; outlives window recreation

#include <webgpu/webgpu.h>

struct GLFWwindow;

namespace shaderlay {

class GpuContext {
public:
    GpuContext() = default;
    ~GpuContext();

    // Non-copyable
    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    bool createInstance();

    // Surface for a window; caller owns it
    WGPUSurface createSurface(GLFWwindow* window);

    // Request adapter and device able to present to `compatibleSurface`
    bool requestDevice(WGPUSurface compatibleSurface);

    WGPUInstance instance() const { return m_instance; }
    WGPUAdapter adapter() const { return m_adapter; }
    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }

    bool isValid() const { return m_device != nullptr; }

private:
    WGPUInstance m_instance = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
};

} // namespace shaderlay
