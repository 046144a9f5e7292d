// Shaderlay - GPU Context Implementation

#include <shaderlay/gpu_context.h>
#include <webgpu/wgpu.h>
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <cstring>
#include <iostream>
#include <string>

namespace shaderlay {

// Helper to create WGPUStringView from C string
static inline WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

static std::string fromStringView(WGPUStringView sv) {
    if (!sv.data) return "unknown";
    return std::string(sv.data, sv.length == WGPU_STRLEN ? strlen(sv.data) : sv.length);
}

namespace {

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "[GPU] Failed to request adapter: " << fromStringView(message) << std::endl;
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "[GPU] Failed to request device: " << fromStringView(message) << std::endl;
    }
    data->done = true;
}

void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                  WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[GPU] Device lost: " << fromStringView(message) << std::endl;
}

void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                   WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[GPU] Error: " << fromStringView(message) << std::endl;
}

} // namespace

GpuContext::~GpuContext() {
    if (m_queue) wgpuQueueRelease(m_queue);
    if (m_device) wgpuDeviceRelease(m_device);
    if (m_adapter) wgpuAdapterRelease(m_adapter);
    if (m_instance) wgpuInstanceRelease(m_instance);
}

bool GpuContext::createInstance() {
    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        std::cerr << "[GPU] Failed to create WebGPU instance" << std::endl;
        return false;
    }
    return true;
}

WGPUSurface GpuContext::createSurface(GLFWwindow* window) {
    WGPUSurface surface = glfwCreateWindowWGPUSurface(m_instance, window);
    if (!surface) {
        std::cerr << "[GPU] Failed to create surface" << std::endl;
    }
    return surface;
}

bool GpuContext::requestDevice(WGPUSurface compatibleSurface) {
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = compatibleSurface;
    adapterOpts.powerPreference = WGPUPowerPreference_LowPower;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;

    wgpuInstanceRequestAdapter(m_instance, &adapterOpts, adapterCallback);

    // wgpu-native completes the request before returning
    while (!adapterData.done) {
    }

    if (!adapterData.adapter) {
        return false;
    }
    m_adapter = adapterData.adapter;

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    std::cout << "[GPU] Adapter: " << fromStringView(info.device) << std::endl;
    wgpuAdapterInfoFreeMembers(info);

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("Shaderlay Device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
    }

    if (!deviceData.device) {
        return false;
    }
    m_device = deviceData.device;
    m_queue = wgpuDeviceGetQueue(m_device);
    return true;
}

} // namespace shaderlay
