// Shaderlay - Shader Directory Implementation

#include <shaderlay/shader_directory.h>
#include <efsw/efsw.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace shaderlay {

namespace {

const char* SHADER_EXTENSIONS[] = {".glsl", ".frag", ".fragment"};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool isShaderFileName(const std::string& filename) {
    std::string ext = lowercase(fs::path(filename).extension().string());
    for (const char* candidate : SHADER_EXTENSIONS) {
        if (ext == candidate) return true;
    }
    return false;
}

std::string sanitizeShaderFileName(const std::string& name) {
    std::string result;
    result.reserve(name.size() + 5);
    for (char c : name) {
        bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        result += allowed ? c : '_';
    }
    if (result.empty()) {
        result = "shader";
    }
    if (!isShaderFileName(result)) {
        result += ".glsl";
    }
    return result;
}

// Runs on efsw's thread; only flags and posts
class ShaderDirectory::Listener : public efsw::FileWatchListener {
public:
    explicit Listener(ShaderDirectory& owner) : m_owner(owner) {}

    void handleFileAction(efsw::WatchID, const std::string&, const std::string& filename,
                          efsw::Action action, std::string oldFilename) override {
        bool relevant = isShaderFileName(filename) ||
                        (action == efsw::Actions::Moved && isShaderFileName(oldFilename));
        if (relevant) {
            m_owner.notifyChanged();
        }
    }

private:
    ShaderDirectory& m_owner;
};

ShaderDirectory::ShaderDirectory(std::string directory)
    : m_directory(std::move(directory)) {
}

ShaderDirectory::~ShaderDirectory() {
    stopWatching();
}

bool ShaderDirectory::ensureDirectory() {
    std::error_code ec;
    if (fs::is_directory(m_directory, ec)) {
        return true;
    }
    fs::create_directories(m_directory, ec);
    if (ec) {
        std::cerr << "[Watcher] Failed to create " << m_directory << ": " << ec.message() << std::endl;
        return false;
    }
    std::cout << "[Watcher] Created shader directory " << m_directory << std::endl;
    return true;
}

std::vector<std::string> ShaderDirectory::listShaderFiles() {
    std::vector<std::string> paths;
    if (!ensureDirectory()) {
        return paths;
    }

    std::error_code ec;
    for (fs::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        if (!isShaderFileName(it->path().filename().string())) continue;
        paths.push_back(fs::absolute(it->path(), ec).lexically_normal().string());
    }
    if (ec) {
        std::cerr << "[Watcher] Failed to list " << m_directory << ": " << ec.message() << std::endl;
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

FileReadResult ShaderDirectory::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {false, {}, "Cannot open " + path};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return {false, {}, "Error reading " + path};
    }
    return {true, buffer.str(), {}};
}

bool ShaderDirectory::saveShaderFile(const std::string& code, const std::string& name) {
    if (!ensureDirectory()) {
        return false;
    }

    fs::path target = fs::path(m_directory) / sanitizeShaderFileName(name);
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::cerr << "[Watcher] Cannot write " << target.string() << std::endl;
        return false;
    }
    file << code;
    file.close();
    if (!file) {
        std::cerr << "[Watcher] Error writing " << target.string() << std::endl;
        return false;
    }

    std::cout << "[Watcher] Saved " << target.string() << std::endl;
    return true;
}

bool ShaderDirectory::deleteShaderFile(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec || !removed) {
        std::cerr << "[Watcher] Failed to delete " << path
                  << (ec ? ": " + ec.message() : std::string()) << std::endl;
        return false;
    }
    std::cout << "[Watcher] Deleted " << path << std::endl;
    return true;
}

bool ShaderDirectory::watch(TaskQueue& queue, std::function<void()> onChange) {
    stopWatching();
    if (!ensureDirectory()) {
        return false;
    }

    m_changes = std::make_unique<ChangeCoalescer>(queue, std::move(onChange));

    m_watcher = std::make_unique<efsw::FileWatcher>();
    m_listener = std::make_unique<Listener>(*this);

    efsw::WatchID watchId = m_watcher->addWatch(m_directory, m_listener.get(), false);
    if (watchId < 0) {
        std::cerr << "[Watcher] Failed to watch " << m_directory
                  << ": " << efsw::Errors::Log::getLastErrorLog() << std::endl;
        m_watcher.reset();
        m_listener.reset();
        return false;
    }

    // Background thread
    m_watcher->watch();

    std::cout << "[Watcher] Watching " << m_directory << std::endl;
    return true;
}

void ShaderDirectory::stopWatching() {
    if (m_watcher) {
        m_watcher->removeWatch(m_directory);
        m_watcher.reset();
        m_listener.reset();
        std::cout << "[Watcher] Stopped watching" << std::endl;
    }
    m_changes.reset();
}

void ShaderDirectory::notifyChanged() {
    if (m_changes) {
        m_changes->notify();
    }
}

ChangeCoalescer::ChangeCoalescer(TaskQueue& queue, std::function<void()> onChange)
    : m_queue(queue)
    , m_onChange(std::move(onChange))
    , m_state(std::make_shared<State>()) {
}

void ChangeCoalescer::notify() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->pending) {
            return;
        }
        m_state->pending = true;
    }

    std::shared_ptr<State> state = m_state;
    std::function<void()> onChange = m_onChange;
    m_queue.post([state, onChange]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->pending = false;
        }
        if (onChange) onChange();
    });
}

bool ChangeCoalescer::isPending() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->pending;
}

} // namespace shaderlay
