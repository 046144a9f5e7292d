// Shaderlay - Paths Implementation

#include <shaderlay/paths.h>
#include <shaderlay/shader_directory.h>
#include <cstdlib>
#include <iostream>

namespace fs = std::filesystem;

namespace shaderlay {

fs::path defaultConfigDir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return fs::path(xdg) / "shaderlay";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config" / "shaderlay";
    }
    return fs::current_path() / ".shaderlay";
}

fs::path executableDir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return fs::current_path(ec);
    }
    return exe.parent_path();
}

bool prepareShaderDir(const fs::path& dir, const fs::path& seedDir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }

    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[Config] Failed to create " << dir.string() << ": " << ec.message() << std::endl;
        return false;
    }

    if (seedDir.empty() || !fs::is_directory(seedDir, ec)) {
        return true;
    }

    int copied = 0;
    for (fs::directory_iterator it(seedDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || !isShaderFileName(it->path().filename().string())) {
            continue;
        }
        std::error_code copyError;
        fs::copy_file(it->path(), dir / it->path().filename(), copyError);
        if (copyError) {
            std::cerr << "[Config] Could not copy " << it->path().string() << ": "
                      << copyError.message() << std::endl;
        } else {
            copied++;
        }
    }
    std::cout << "[Config] Seeded " << dir.string() << " with " << copied << " shaders" << std::endl;
    return true;
}

} // namespace shaderlay
