// Shaderlay Application
// Owns the GPU context, overlay window and main loop

#pragma once

#include <filesystem>
#include <string>

namespace shaderlay {

// Options from the command line
struct LaunchOptions {
    std::filesystem::path configDir;   // Empty: $XDG_CONFIG_HOME/shaderlay
    std::filesystem::path shadersDir;  // Empty: <configDir>/shaders
    std::string shaderPath;            // Loaded and selected at startup
};

class Application {
public:
    Application() = default;
    ~Application();

    // Returns 0 on success, non-zero on error
    int init(const LaunchOptions& options);

    // Runs until quit is requested. Returns the exit code.
    int run();

    // Called by the destructor, can be called explicitly
    void shutdown();

private:
    struct Impl;
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace shaderlay
