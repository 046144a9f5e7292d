#pragma once

// Shaderlay - Shader Library
// The operations the control surface and CLI use to manage shaders:
// builtins, local files, the watched directory and remote pages

#include <shaderlay/remote_shader.h>
#include <shaderlay/shader_catalog.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shaderlay {

struct LoadResult {
    bool ok = false;
    std::string id;
    std::string error;

    static LoadResult success(std::string id) { return {true, std::move(id), {}}; }
    static LoadResult failure(std::string error) { return {false, {}, std::move(error)}; }
};

struct FileReadResult {
    bool ok = false;
    std::string text;
    std::string error;
};

// Filesystem side of the watched shader directory
class ShaderFileSource {
public:
    virtual ~ShaderFileSource() = default;

    // Absolute paths of the shader files currently in the directory
    virtual std::vector<std::string> listShaderFiles() = 0;
    virtual FileReadResult readFile(const std::string& path) = 0;
};

class ShaderLibrary {
public:
    using LoadCallback = std::function<void(const LoadResult& result)>;

    ShaderLibrary(ShaderCatalog& catalog, ShaderFileSource& files, HttpFetcher& fetcher);

    // Non-copyable
    ShaderLibrary(const ShaderLibrary&) = delete;
    ShaderLibrary& operator=(const ShaderLibrary&) = delete;

    // Add the builtin shaders and select the first one
    void registerBuiltins();

    std::vector<ShaderInfo> getShaderList() const { return m_catalog.list(); }
    std::optional<std::string> getCurrentId() const { return m_catalog.current(); }
    bool selectShader(const std::string& id) { return m_catalog.select(id); }

    // Add a body under a fresh id and select it
    std::string loadFromText(const std::string& text, const std::string& name);

    // Read a file and add it as a local-file entry, selecting it
    LoadResult loadFromFile(const std::string& path);

    // Fetch a Shadertoy page and add its shader, selecting it. A URL that
    // doesn't match fails immediately without touching the network.
    // `done` always runs, possibly before this returns.
    void loadFromURL(const std::string& url, LoadCallback done);

    // Reconcile directory-scan entries with the watched directory
    void refreshFromDirectory();

    ShaderCatalog& catalog() { return m_catalog; }

private:
    ShaderCatalog& m_catalog;
    ShaderFileSource& m_files;
    HttpFetcher& m_fetcher;
    int m_textCounter = 0;
};

} // namespace shaderlay
