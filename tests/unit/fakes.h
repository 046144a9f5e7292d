/**
 * @file fakes.h
 * @brief In-memory stand-ins for the window, GPU, filesystem and network seams
 */

#pragma once

#include <shaderlay/host_window.h>
#include <shaderlay/remote_shader.h>
#include <shaderlay/render_loop.h>
#include <shaderlay/shader_library.h>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace shaderlay::test {

class FakeWindow : public HostWindow {
public:
    void show() override { visible = true; showCount++; }
    void hide() override { visible = false; }
    void focus() override { focused = true; }
    void blur() override { focused = false; }

    void setIgnoreInput(bool ignore) override { ignoring = ignore; }
    void setOpacity(float value) override { windowOpacity = value; }
    void setAlwaysOnTop(bool onTop) override { alwaysOnTop = onTop; }

    bool isVisible() const override { return visible; }
    bool ignoresInput() const override { return ignoring; }
    float opacity() const override { return windowOpacity; }
    glm::ivec2 getSize() const override { return size; }

    void setEvents(WindowEvents e) override { events = std::move(e); }

    bool visible = false;
    bool focused = false;
    bool ignoring = false;
    bool alwaysOnTop = false;
    float windowOpacity = 1.0f;
    int showCount = 0;
    glm::ivec2 size{800, 600};
    WindowEvents events;
};

// Hands out FakeWindows and remembers the last one it created
class FakeWindowFactory : public HostWindowFactory {
public:
    std::unique_ptr<HostWindow> create(const WindowOptions& options) override {
        createCount++;
        lastOptions = options;
        if (failNext) {
            failNext = false;
            last = nullptr;
            return nullptr;
        }
        auto window = std::make_unique<FakeWindow>();
        last = window.get();
        return window;
    }

    int createCount = 0;
    bool failNext = false;
    WindowOptions lastOptions;
    FakeWindow* last = nullptr;
};

class FakeProgram : public CompiledProgram {
public:
    explicit FakeProgram(std::string body) : CompiledProgram(std::move(body)) {}
};

// Accepts any body that doesn't contain "ERROR"
class FakeBuilder : public ProgramBuilder {
public:
    BuildResult build(const std::string& body) override {
        builds.push_back(body);
        BuildResult result;
        if (body.find("ERROR") != std::string::npos) {
            result.error.stage = CompileError::Stage::Fragment;
            result.error.line = 1;
            result.error.message = "syntax error";
            return result;
        }
        result.program = std::make_unique<FakeProgram>(body);
        return result;
    }

    std::vector<std::string> builds;
};

class FakeRenderer : public FrameRenderer {
public:
    void resize(int w, int h) override { width = w; height = h; }

    void renderFrame(const CompiledProgram& program, const ShaderUniforms& u, float o) override {
        frames++;
        lastBody = program.body();
        uniforms = u;
        opacity = o;
    }

    int frames = 0;
    int width = 0;
    int height = 0;
    float opacity = -1.0f;
    std::string lastBody;
    ShaderUniforms uniforms;
};

// Directory contents as a path -> text map
class FakeFileSource : public ShaderFileSource {
public:
    std::vector<std::string> listShaderFiles() override {
        std::vector<std::string> paths;
        for (const auto& [path, text] : files) {
            if (!hidden.count(path)) paths.push_back(path);
        }
        return paths;
    }

    FileReadResult readFile(const std::string& path) override {
        reads++;
        auto it = files.find(path);
        if (it == files.end()) {
            return {false, {}, "No such file: " + path};
        }
        return {true, it->second, {}};
    }

    std::map<std::string, std::string> files;
    std::map<std::string, bool> hidden;  // Readable but not listed
    int reads = 0;
};

// Records requests; the test decides when and how they complete
class FakeFetcher : public HttpFetcher {
public:
    void fetch(const std::string& url, FetchCallback done) override {
        requests.push_back({url, std::move(done)});
    }

    void respond(size_t index, int status, const std::string& body) {
        HttpResponse response;
        response.status = status;
        response.body = body;
        requests.at(index).done(response);
    }

    void fail(size_t index, const std::string& error) {
        HttpResponse response;
        response.error = error;
        requests.at(index).done(response);
    }

    struct Request {
        std::string url;
        FetchCallback done;
    };
    std::vector<Request> requests;
};

// Fresh empty directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 ("shaderlay-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace shaderlay::test
