// Shaderlay - Entry Point
// Parses command-line arguments and runs the application

#include "app.h"
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

#ifndef SHADERLAY_VERSION
#define SHADERLAY_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    CLI::App cli{"Shaderlay - Shadertoy shaders as a desktop overlay"};
    cli.set_version_flag("--version", std::string(SHADERLAY_VERSION));

    std::string shaderPath;
    std::string configDir;
    std::string shadersDir;
    cli.add_option("-s,--shader", shaderPath, "Shader file to load and select at startup");
    cli.add_option("--config", configDir, "Configuration directory");
    cli.add_option("--shaders-dir", shadersDir, "Watched shader directory");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    std::cout << "Shaderlay " << SHADERLAY_VERSION << " - Starting..." << std::endl;

    shaderlay::LaunchOptions options;
    options.shaderPath = shaderPath;
    options.configDir = configDir;
    options.shadersDir = shadersDir;

    shaderlay::Application app;
    int result = app.init(options);
    if (result != 0) {
        std::cerr << "Failed to initialize application" << std::endl;
        return result;
    }

    result = app.run();
    app.shutdown();
    return result;
}
