#pragma once

// Shaderlay - Overlay Session
// Owns the host window and arbitrates passthrough vs. interactive input,
// focus handling and taskbar reconfiguration

#include <shaderlay/host_window.h>
#include <functional>
#include <memory>

namespace shaderlay {

class ConfigStore;
class TaskQueue;

enum class OverlayMode {
    Passthrough,
    Interactive
};

struct OverlayState {
    OverlayMode mode = OverlayMode::Passthrough;
    bool visible = true;
    bool clickthrough = true;
    int opacityPercent = 10;      // Persisted
    bool taskbarVisible = false;  // Persisted
};

// Hooks for the parts of the app that hang off the window
struct SessionCallbacks {
    std::function<void(HostWindow& window)> windowCreated;
    std::function<void(HostWindow& window)> windowDestroying;
    std::function<void(int width, int height)> resized;
    std::function<void(float opacity)> opacityChanged;  // 0..1
    std::function<void()> quitRequested;
};

class OverlaySession {
public:
    // Delay before state is restored onto a recreated window
    static constexpr double SETTLE_DELAY = 0.1;
    // Times a restore is re-deferred while the window is still missing
    static constexpr int MAX_RESTORE_ATTEMPTS = 10;

    OverlaySession(HostWindowFactory& factory, ConfigStore& config, TaskQueue& queue);
    ~OverlaySession();

    // Non-copyable
    OverlaySession(const OverlaySession&) = delete;
    OverlaySession& operator=(const OverlaySession&) = delete;

    void setCallbacks(SessionCallbacks callbacks) { m_callbacks = std::move(callbacks); }

    // Create the initial window in passthrough mode
    bool start();

    // Interactive/passthrough
    void toggleInteractive();
    void setInteractive(bool interactive);
    bool isInteractive() const { return m_state.mode == OverlayMode::Interactive; }

    // Flip input passthrough directly, regardless of mode
    void toggleClickthrough();

    void showWindow();
    void hideWindow();

    // Shader opacity in percent, clamped to 0..100 and persisted
    void setOpacity(int percent);
    float compositeOpacity() const { return m_state.opacityPercent / 100.0f; }

    // Destroys and recreates the window. State is captured now and
    // restored after SETTLE_DELAY once the new window exists.
    void setShowWindowInTaskbar(bool show);
    void setShowSettingsOnWindowFocused(bool show);
    bool showSettingsOnWindowFocused() const;

    // Window events
    void handleFocus();
    void handleBlur();
    void handleClose();
    void handleMinimize();

    void requestQuit();

    const OverlayState& state() const { return m_state; }
    HostWindow* window() const { return m_window.get(); }

private:
    struct Snapshot {
        OverlayMode mode;
        bool clickthrough;
        bool visible;
        int opacityPercent;
    };

    bool createWindow();
    void destroyWindow();
    void scheduleRestore(Snapshot snapshot, unsigned generation, int attempt);
    void restore(const Snapshot& snapshot);
    void applyMode();

    HostWindowFactory& m_factory;
    ConfigStore& m_config;
    TaskQueue& m_queue;
    SessionCallbacks m_callbacks;

    std::unique_ptr<HostWindow> m_window;
    OverlayState m_state;
    unsigned m_generation = 0;  // Bumped on every recreation
};

} // namespace shaderlay
