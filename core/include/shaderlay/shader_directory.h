#pragma once

// Shaderlay - Shader Directory
// The watched shader folder: listing, reading, saving and deleting
// shader files, plus a change watcher that posts onto the main loop

#include <shaderlay/shader_library.h>
#include <shaderlay/task_queue.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace efsw {
class FileWatcher;
}

namespace shaderlay {

// True for .glsl, .frag and .fragment (case-insensitive)
bool isShaderFileName(const std::string& filename);

// Replace characters outside [A-Za-z0-9._-] with '_' and append .glsl
// if the name has no shader extension
std::string sanitizeShaderFileName(const std::string& name);

// Collapses change events into at most one queued notification.
// notify() may be called from any thread.
class ChangeCoalescer {
public:
    ChangeCoalescer(TaskQueue& queue, std::function<void()> onChange);

    // Non-copyable
    ChangeCoalescer(const ChangeCoalescer&) = delete;
    ChangeCoalescer& operator=(const ChangeCoalescer&) = delete;

    void notify();
    bool isPending() const;

private:
    // Shared with the queued task, which may outlive the coalescer
    struct State {
        std::mutex mutex;
        bool pending = false;
    };

    TaskQueue& m_queue;
    std::function<void()> m_onChange;
    std::shared_ptr<State> m_state;
};

class ShaderDirectory : public ShaderFileSource {
public:
    explicit ShaderDirectory(std::string directory);
    ~ShaderDirectory() override;

    // Non-copyable
    ShaderDirectory(const ShaderDirectory&) = delete;
    ShaderDirectory& operator=(const ShaderDirectory&) = delete;

    std::vector<std::string> listShaderFiles() override;
    FileReadResult readFile(const std::string& path) override;

    bool saveShaderFile(const std::string& code, const std::string& name);
    bool deleteShaderFile(const std::string& path);

    // Post `onChange` to `queue` whenever a shader file in the directory
    // is added, modified, removed or renamed. Bursts collapse into one
    // pending notification.
    bool watch(TaskQueue& queue, std::function<void()> onChange);
    void stopWatching();
    bool isWatching() const { return m_watcher != nullptr; }

    const std::string& directory() const { return m_directory; }

private:
    class Listener;

    bool ensureDirectory();
    void notifyChanged();

    std::string m_directory;
    std::unique_ptr<efsw::FileWatcher> m_watcher;
    std::unique_ptr<Listener> m_listener;
    std::unique_ptr<ChangeCoalescer> m_changes;
};

} // namespace shaderlay
