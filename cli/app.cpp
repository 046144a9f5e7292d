// Shaderlay Application Implementation
// Window/GPU wiring, startup sequence and the main loop

#include "app.h"

#include <shaderlay/accelerator.h>
#include <shaderlay/config.h>
#include <shaderlay/glfw_window.h>
#include <shaderlay/global_hotkeys.h>
#include <shaderlay/gpu_context.h>
#include <shaderlay/http_fetcher.h>
#include <shaderlay/overlay_session.h>
#include <shaderlay/paths.h>
#include <shaderlay/render_loop.h>
#include <shaderlay/shader_catalog.h>
#include <shaderlay/shader_directory.h>
#include <shaderlay/shader_library.h>
#include <shaderlay/task_queue.h>
#include <shaderlay/webgpu_program_builder.h>
#include <shaderlay/webgpu_renderer.h>
#include "imgui/control_panel.h"
#include "imgui/imgui_integration.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <algorithm>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace shaderlay {

namespace {

const char* TOGGLE_OVERLAY_ACCELERATOR = "Ctrl+`";
const char* TOGGLE_CLICKTHROUGH_ACCELERATOR = "Ctrl+Shift+D";

// Poll interval while the overlay is hidden
const double HIDDEN_POLL_INTERVAL = 0.05;

void onGlfwError(int code, const char* description) {
    std::cerr << "[App] GLFW error " << code << ": " << (description ? description : "") << std::endl;
}

} // anonymous namespace

struct Application::Impl {
    LaunchOptions options;

    TaskQueue queue;
    std::unique_ptr<ConfigStore> config;

    ShaderCatalog catalog;
    std::unique_ptr<ShaderDirectory> directory;
    std::unique_ptr<IxHttpFetcher> fetcher;
    std::unique_ptr<ShaderLibrary> library;

    GpuContext gpu;
    std::unique_ptr<WebGpuRenderer> renderer;
    std::unique_ptr<WebGpuProgramBuilder> builder;
    std::unique_ptr<RenderLoop> renderLoop;

    GlfwWindowFactory windowFactory;
    std::unique_ptr<OverlaySession> session;
    std::unique_ptr<GlobalHotkeys> hotkeys;
    std::unique_ptr<imgui::ControlPanel> panel;

    bool glfwReady = false;
    bool quit = false;
    double lastFrame = 0.0;

    bool initGpu(WGPUSurface surface);
    void attachWindow(HostWindow& window);
    void detachWindow();
    bool startRendering();
    void registerHotkeys();
    void drawFrame(double now);
};

bool Application::Impl::initGpu(WGPUSurface surface) {
    if (!gpu.requestDevice(surface)) {
        return false;
    }

    renderer = std::make_unique<WebGpuRenderer>(gpu);
    if (!renderer->init()) {
        std::cerr << "[App] Renderer initialization failed" << std::endl;
        return false;
    }

    builder = std::make_unique<WebGpuProgramBuilder>(gpu.device(), renderer->bindGroupLayout());
    renderLoop = std::make_unique<RenderLoop>(*builder, *renderer);
    renderLoop->setOpacity(session->compositeOpacity());
    renderLoop->setTimeScale(config->config().timeScale);

    renderer->setOverlayCallback([](WGPURenderPassEncoder pass) {
        imgui::render(pass);
    });
    return true;
}

void Application::Impl::attachWindow(HostWindow& window) {
    auto& glfwWindow = static_cast<GlfwHostWindow&>(window);

    WGPUSurface surface = gpu.createSurface(glfwWindow.handle());
    if (!surface) {
        return;
    }
    if (!gpu.isValid() && !initGpu(surface)) {
        wgpuSurfaceRelease(surface);
        quit = true;
        return;
    }

    glm::ivec2 size = window.getSize();
    if (!renderer->attachSurface(surface, size.x, size.y)) {
        std::cerr << "[App] Could not attach window surface" << std::endl;
        return;
    }
    renderLoop->resize(size.x, size.y);

    if (imgui::init(gpu.device(), renderer->surfaceFormat())) {
        imgui::attachWindow(glfwWindow.handle());
    }

    glfwWindow.setKeyHandler([this](int key, int mods) {
        if (hotkeys) hotkeys->handleWindowKey(key, mods);
    });
}

void Application::Impl::detachWindow() {
    imgui::detachWindow();
    if (renderer) {
        renderer->detachSurface();
    }
}

bool Application::Impl::startRendering() {
    const ShaderSource* current = catalog.currentSource();
    if (current && renderLoop->start(current->bodyText, glfwGetTime())) {
        return true;
    }

    // A broken startup shader falls back to the default
    if (current && current->id != "default" && library->selectShader("default")) {
        std::cerr << "[App] Falling back to the default shader" << std::endl;
        current = catalog.currentSource();
        return current && renderLoop->start(current->bodyText, glfwGetTime());
    }
    return false;
}

void Application::Impl::registerHotkeys() {
    hotkeys = std::make_unique<GlobalHotkeys>();

    if (auto chord = parseAccelerator(TOGGLE_OVERLAY_ACCELERATOR)) {
        hotkeys->add(*chord, [this]() {
            queue.post([this]() { session->toggleInteractive(); });
        });
    }
    if (auto chord = parseAccelerator(TOGGLE_CLICKTHROUGH_ACCELERATOR)) {
        hotkeys->add(*chord, [this]() {
            queue.post([this]() { session->toggleClickthrough(); });
        });
    }
}

void Application::Impl::drawFrame(double now) {
    if (!renderer || !renderer->hasSurface() || !session->state().visible) {
        return;
    }

    if (imgui::beginFrame()) {
        panel->draw(now);
    }
    renderLoop->tick(now);
    // No-op if the frame reached the surface
    imgui::discardFrame();
}

Application::~Application() {
    shutdown();
}

int Application::init(const LaunchOptions& options) {
    if (m_initialized) {
        return 0;
    }

    m_impl = new Impl;
    Impl& app = *m_impl;
    app.options = options;

    fs::path configDir = options.configDir.empty() ? defaultConfigDir() : options.configDir;
    fs::path exeDir = executableDir();

    app.config = std::make_unique<ConfigStore>(configDir / "config.json", exeDir / "config.default.json");
    app.config->load();

    fs::path shadersDir = options.shadersDir.empty() ? configDir / "shaders" : options.shadersDir;
    prepareShaderDir(shadersDir, exeDir / "shaders");

    app.directory = std::make_unique<ShaderDirectory>(shadersDir.string());
    app.fetcher = std::make_unique<IxHttpFetcher>(app.queue);
    app.library = std::make_unique<ShaderLibrary>(app.catalog, *app.directory, *app.fetcher);

    // Catalog before any window: builtins, the watched folder, then --shader
    app.library->registerBuiltins();
    app.library->refreshFromDirectory();
    if (!options.shaderPath.empty()) {
        LoadResult result = app.library->loadFromFile(options.shaderPath);
        if (!result.ok) {
            std::cerr << "[App] Could not load " << options.shaderPath << ": " << result.error << std::endl;
        }
    }

    glfwSetErrorCallback(onGlfwError);
    if (!glfwInit()) {
        std::cerr << "[App] Failed to initialize GLFW" << std::endl;
        return 1;
    }
    app.glfwReady = true;

    if (!app.gpu.createInstance()) {
        return 1;
    }

    app.session = std::make_unique<OverlaySession>(app.windowFactory, *app.config, app.queue);

    SessionCallbacks callbacks;
    callbacks.windowCreated = [&app](HostWindow& window) { app.attachWindow(window); };
    callbacks.windowDestroying = [&app](HostWindow&) { app.detachWindow(); };
    callbacks.resized = [&app](int width, int height) {
        if (app.renderLoop) app.renderLoop->resize(width, height);
    };
    callbacks.opacityChanged = [&app](float opacity) {
        if (app.renderLoop) app.renderLoop->setOpacity(opacity);
    };
    callbacks.quitRequested = [&app]() { app.quit = true; };
    app.session->setCallbacks(std::move(callbacks));

    if (!app.session->start() || !app.gpu.isValid() || app.quit) {
        std::cerr << "[App] Could not create the overlay window" << std::endl;
        return 1;
    }

    if (!app.startRendering()) {
        std::cerr << "[App] No shader could be compiled" << std::endl;
        return 1;
    }

    // Selection drives rebuilds from here on
    app.catalog.setSelectionCallback([&app](const ShaderSource& source) {
        std::cout << "[App] Selected " << source.displayName << std::endl;
        app.renderLoop->requestBuild(source.bodyText);
    });
    app.catalog.setListChangedCallback([&app]() {
        std::cout << "[Catalog] " << app.catalog.size() << " shaders" << std::endl;
    });

    app.panel = std::make_unique<imgui::ControlPanel>(*app.library, *app.directory, *app.session,
                                                      *app.renderLoop, app.queue);
    app.panel->setStartTime(glfwGetTime());

    app.directory->watch(app.queue, [&app]() { app.library->refreshFromDirectory(); });
    app.registerHotkeys();

    std::cout << "[App] Press " << TOGGLE_OVERLAY_ACCELERATOR << " to open the overlay" << std::endl;
    m_initialized = true;
    return 0;
}

int Application::run() {
    if (!m_initialized || !m_impl) {
        return 1;
    }

    Impl& app = *m_impl;
    while (!app.quit) {
        const AppConfig& config = app.config->config();
        bool visible = app.session->state().visible && app.renderer->hasSurface();

        if (!visible) {
            glfwWaitEventsTimeout(HIDDEN_POLL_INTERVAL);
        } else if (config.frameRate) {
            // Cap the tick rate; events still wake us early
            double interval = 1.0 / *config.frameRate;
            double remaining = app.lastFrame + interval - glfwGetTime();
            if (remaining > 0.0) {
                glfwWaitEventsTimeout(remaining);
            } else {
                glfwPollEvents();
            }
        } else {
            glfwPollEvents();
        }

        app.hotkeys->poll();

        double now = glfwGetTime();
        app.queue.drain(now);
        if (app.quit) break;

        if (config.frameRate && now - app.lastFrame < 1.0 / *config.frameRate) {
            continue;
        }
        app.lastFrame = now;
        app.drawFrame(now);
    }

    std::cout << "[App] Exiting" << std::endl;
    return 0;
}

void Application::shutdown() {
    if (!m_impl) {
        return;
    }

    Impl& app = *m_impl;
    if (app.directory) {
        app.directory->stopWatching();
    }
    app.hotkeys.reset();
    app.panel.reset();

    // Window and surface go before the device
    app.session.reset();
    imgui::shutdown();
    app.renderLoop.reset();
    app.builder.reset();
    app.renderer.reset();

    app.library.reset();
    app.fetcher.reset();

    if (app.glfwReady) {
        glfwTerminate();
    }

    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace shaderlay
