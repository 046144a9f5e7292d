// Shaderlay ImGui Integration Implementation

#include "imgui_integration.h"
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_wgpu.h>
#include <iostream>

namespace shaderlay::imgui {

namespace {

bool g_initialized = false;
bool g_backendReady = false;
bool g_frameStarted = false;
GLFWwindow* g_window = nullptr;
WGPUDevice g_device = nullptr;
WGPUTextureFormat g_format = WGPUTextureFormat_Undefined;

bool initBackend() {
    ImGui_ImplWGPU_InitInfo initInfo = {};
    initInfo.Device = g_device;
    initInfo.NumFramesInFlight = 1;
    initInfo.RenderTargetFormat = g_format;
    initInfo.DepthStencilFormat = WGPUTextureFormat_Undefined;

    g_backendReady = ImGui_ImplWGPU_Init(&initInfo);
    if (!g_backendReady) {
        std::cerr << "[ImGui] Failed to initialize WebGPU backend" << std::endl;
    }
    return g_backendReady;
}

} // anonymous namespace

bool init(WGPUDevice device, WGPUTextureFormat format) {
    if (g_initialized) {
        if (device == g_device && format == g_format) {
            return g_backendReady;
        }
        if (g_backendReady) {
            ImGui_ImplWGPU_Shutdown();
        }
        g_device = device;
        g_format = format;
        return initBackend();
    }

    if (!device) {
        std::cerr << "[ImGui] Invalid WebGPU device" << std::endl;
        return false;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 6.0f;
    style.FrameRounding = 3.0f;
    style.Colors[ImGuiCol_WindowBg].w = 0.92f;

    g_device = device;
    g_format = format;
    g_initialized = true;

    if (!initBackend()) {
        return false;
    }

    std::cout << "[ImGui] Initialized" << std::endl;
    return true;
}

void attachWindow(GLFWwindow* window) {
    if (!g_initialized || !window) return;
    detachWindow();

    ImGui_ImplGlfw_InitForOther(window, true);
    g_window = window;
}

void detachWindow() {
    if (!g_window) return;

    discardFrame();
    ImGui_ImplGlfw_Shutdown();
    g_window = nullptr;
}

void shutdown() {
    if (!g_initialized) return;

    detachWindow();
    if (g_backendReady) {
        ImGui_ImplWGPU_Shutdown();
    }
    ImGui::DestroyContext();

    g_initialized = false;
    g_backendReady = false;
    g_device = nullptr;
    std::cout << "[ImGui] Shutdown" << std::endl;
}

bool beginFrame() {
    if (!g_backendReady || !g_window) return false;

    ImGui_ImplWGPU_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
    g_frameStarted = true;
    return true;
}

void render(WGPURenderPassEncoder pass) {
    if (!g_frameStarted) return;

    ImGui::Render();
    ImGui_ImplWGPU_RenderDrawData(ImGui::GetDrawData(), pass);
    g_frameStarted = false;
}

void discardFrame() {
    if (!g_frameStarted) return;

    ImGui::EndFrame();
    g_frameStarted = false;
}

bool isInitialized() {
    return g_initialized;
}

bool wantsKeyboard() {
    if (!g_initialized) return false;
    return ImGui::GetIO().WantCaptureKeyboard;
}

} // namespace shaderlay::imgui
