#pragma once

// Shaderlay - Paths
// Locations of the config directory, the executable and the shader folder

#include <filesystem>

namespace shaderlay {

// $XDG_CONFIG_HOME/shaderlay, else ~/.config/shaderlay
std::filesystem::path defaultConfigDir();

// Directory containing the running executable (current dir if unknown)
std::filesystem::path executableDir();

// Create `dir` if missing, copying shader files from `seedDir` into it
// the first time. Returns false if the directory could not be created.
bool prepareShaderDir(const std::filesystem::path& dir, const std::filesystem::path& seedDir);

} // namespace shaderlay
