// Shaderlay - Shader Library Implementation

#include <shaderlay/shader_library.h>
#include <shaderlay/builtin_shaders.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace shaderlay {

ShaderLibrary::ShaderLibrary(ShaderCatalog& catalog, ShaderFileSource& files, HttpFetcher& fetcher)
    : m_catalog(catalog)
    , m_files(files)
    , m_fetcher(fetcher) {
}

void ShaderLibrary::registerBuiltins() {
    for (const auto& source : builtinShaders()) {
        m_catalog.add(source);
    }
    if (!builtinShaders().empty()) {
        m_catalog.select(builtinShaders().front().id);
    }
}

std::string ShaderLibrary::loadFromText(const std::string& text, const std::string& name) {
    std::string id = "text-" + std::to_string(++m_textCounter);
    m_catalog.add({id, name.empty() ? "Custom Shader" : name, text, ShaderOrigin::LocalFile, {}});
    m_catalog.select(id);
    return id;
}

LoadResult ShaderLibrary::loadFromFile(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    std::string resolved = ec ? path : absolute.lexically_normal().string();

    FileReadResult file = m_files.readFile(resolved);
    if (!file.ok) {
        std::cerr << "[Catalog] Failed to load " << resolved << ": " << file.error << std::endl;
        return LoadResult::failure(file.error);
    }

    std::string id = ShaderCatalog::idForPath(resolved);
    m_catalog.add({id, ShaderCatalog::nameForPath(resolved), std::move(file.text),
                   ShaderOrigin::LocalFile, resolved});
    m_catalog.select(id);
    std::cout << "[Catalog] Loaded shader file " << resolved << std::endl;
    return LoadResult::success(id);
}

void ShaderLibrary::loadFromURL(const std::string& url, LoadCallback done) {
    std::optional<std::string> token = extractShaderToken(url);
    if (!token) {
        std::string error = "Invalid Shadertoy URL format. Expected: https://www.shadertoy.com/view/XXXXXX";
        std::cerr << "[Remote] " << error << std::endl;
        if (done) done(LoadResult::failure(error));
        return;
    }

    std::cout << "[Remote] Fetching shader " << *token << std::endl;

    // A completion that arrives after a newer request still lands in the
    // catalog; the last one to finish wins.
    m_fetcher.fetch(shaderPageUrl(*token), [this, shaderToken = *token, done](const HttpResponse& response) {
        if (!response.ok()) {
            std::string error = response.error.empty()
                ? "Failed to fetch shader: HTTP " + std::to_string(response.status)
                : "Failed to fetch shader: " + response.error;
            std::cerr << "[Remote] " << error << std::endl;
            if (done) done(LoadResult::failure(error));
            return;
        }

        RemoteExtraction extraction = extractRemoteShader(response.body, shaderToken);
        if (!extraction.ok) {
            std::cerr << "[Remote] " << extraction.error << std::endl;
            if (done) done(LoadResult::failure(extraction.error));
            return;
        }

        std::cout << "[Remote] Extracted '" << extraction.shader.name << "' via "
                  << extraction.strategy << std::endl;

        std::string id = remoteShaderId(shaderToken);
        m_catalog.add({id, extraction.shader.name, std::move(extraction.shader.body),
                       ShaderOrigin::Remote, {}});
        m_catalog.select(id);
        if (done) done(LoadResult::success(id));
    });
}

void ShaderLibrary::refreshFromDirectory() {
    m_catalog.reconcile(m_files.listShaderFiles(),
                        [this](const std::string& path, std::string& error) -> std::optional<std::string> {
                            FileReadResult file = m_files.readFile(path);
                            if (!file.ok) {
                                error = file.error;
                                return std::nullopt;
                            }
                            return std::move(file.text);
                        });
}

} // namespace shaderlay
