// Shaderlay - Overlay Session Implementation

#include <shaderlay/overlay_session.h>
#include <shaderlay/config.h>
#include <shaderlay/task_queue.h>
#include <algorithm>
#include <iostream>

namespace shaderlay {

OverlaySession::OverlaySession(HostWindowFactory& factory, ConfigStore& config, TaskQueue& queue)
    : m_factory(factory)
    , m_config(config)
    , m_queue(queue) {
    m_state.opacityPercent = config.config().opacityPercent;
    m_state.taskbarVisible = config.config().showWindowInTaskbar;
}

OverlaySession::~OverlaySession() {
    destroyWindow();
}

bool OverlaySession::start() {
    if (!createWindow()) {
        return false;
    }
    m_state.mode = OverlayMode::Passthrough;
    m_state.clickthrough = true;
    m_state.visible = true;
    m_window->show();
    applyMode();

    if (m_callbacks.opacityChanged) {
        m_callbacks.opacityChanged(compositeOpacity());
    }
    return true;
}

bool OverlaySession::createWindow() {
    WindowOptions options;
    options.showInTaskbar = m_state.taskbarVisible;

    m_window = m_factory.create(options);
    if (!m_window) {
        std::cerr << "[Overlay] Failed to create window" << std::endl;
        return false;
    }

    WindowEvents events;
    events.onResize = [this](int width, int height) {
        if (m_callbacks.resized) m_callbacks.resized(width, height);
    };
    events.onFocus = [this]() { handleFocus(); };
    events.onBlur = [this]() { handleBlur(); };
    events.onClose = [this]() { handleClose(); };
    events.onMinimize = [this]() { handleMinimize(); };
    m_window->setEvents(std::move(events));

    if (m_callbacks.windowCreated) {
        m_callbacks.windowCreated(*m_window);
    }
    return true;
}

void OverlaySession::destroyWindow() {
    if (!m_window) {
        return;
    }
    if (m_callbacks.windowDestroying) {
        m_callbacks.windowDestroying(*m_window);
    }
    m_window.reset();
}

void OverlaySession::toggleInteractive() {
    setInteractive(!isInteractive());
}

void OverlaySession::setInteractive(bool interactive) {
    m_state.mode = interactive ? OverlayMode::Interactive : OverlayMode::Passthrough;
    m_state.clickthrough = !interactive;
    std::cout << "[Overlay] " << (interactive ? "Interactive" : "Passthrough") << std::endl;

    if (!m_window) {
        return;
    }
    if (interactive && !m_window->isVisible()) {
        m_window->show();
        m_state.visible = true;
    }
    applyMode();
}

void OverlaySession::applyMode() {
    if (!m_window) {
        return;
    }

    // Control chrome is always fully opaque; shader opacity is applied
    // when compositing
    m_window->setOpacity(1.0f);
    m_window->setIgnoreInput(m_state.clickthrough);

    if (isInteractive()) {
        m_window->focus();
    } else {
        m_window->blur();
    }
}

void OverlaySession::toggleClickthrough() {
    m_state.clickthrough = !m_state.clickthrough;
    std::cout << "[Overlay] Clickthrough " << (m_state.clickthrough ? "on" : "off") << std::endl;
    if (m_window) {
        m_window->setIgnoreInput(m_state.clickthrough);
    }
}

void OverlaySession::showWindow() {
    m_state.visible = true;
    if (m_window) m_window->show();
}

void OverlaySession::hideWindow() {
    m_state.visible = false;
    if (m_window) m_window->hide();
}

void OverlaySession::setOpacity(int percent) {
    m_state.opacityPercent = std::clamp(percent, 0, 100);

    ConfigUpdate update;
    update.opacityPercent = m_state.opacityPercent;
    m_config.save(update);

    if (m_callbacks.opacityChanged) {
        m_callbacks.opacityChanged(compositeOpacity());
    }
}

void OverlaySession::setShowSettingsOnWindowFocused(bool show) {
    ConfigUpdate update;
    update.showSettingsOnWindowFocused = show;
    m_config.save(update);
}

bool OverlaySession::showSettingsOnWindowFocused() const {
    return m_config.config().showSettingsOnWindowFocused;
}

void OverlaySession::setShowWindowInTaskbar(bool show) {
    if (show == m_state.taskbarVisible) {
        return;
    }

    // Capture before anything is torn down
    Snapshot snapshot{m_state.mode, m_state.clickthrough, m_state.visible, m_state.opacityPercent};

    m_state.taskbarVisible = show;
    ConfigUpdate update;
    update.showWindowInTaskbar = show;
    m_config.save(update);

    std::cout << "[Overlay] Recreating window (taskbar " << (show ? "on" : "off") << ")" << std::endl;

    unsigned generation = ++m_generation;
    destroyWindow();

    m_queue.post([this, generation]() {
        if (generation != m_generation || m_window) {
            return;
        }
        createWindow();
    });
    scheduleRestore(snapshot, generation, 0);
}

void OverlaySession::scheduleRestore(Snapshot snapshot, unsigned generation, int attempt) {
    m_queue.postDelayed(SETTLE_DELAY, [this, snapshot, generation, attempt]() {
        if (generation != m_generation) {
            return;  // A newer recreation owns the window now
        }
        if (!m_window) {
            if (attempt + 1 < MAX_RESTORE_ATTEMPTS) {
                scheduleRestore(snapshot, generation, attempt + 1);
            } else {
                std::cerr << "[Overlay] Window was not recreated, state not restored" << std::endl;
            }
            return;
        }
        restore(snapshot);
    });
}

void OverlaySession::restore(const Snapshot& snapshot) {
    m_state.mode = snapshot.mode;
    m_state.clickthrough = snapshot.clickthrough;
    m_state.visible = snapshot.visible;
    m_state.opacityPercent = snapshot.opacityPercent;

    if (m_state.visible) {
        m_window->show();
    } else {
        m_window->hide();
    }
    applyMode();

    if (m_callbacks.opacityChanged) {
        m_callbacks.opacityChanged(compositeOpacity());
    }
    std::cout << "[Overlay] Restored window state" << std::endl;
}

void OverlaySession::handleFocus() {
    if (isInteractive() || !m_window) {
        return;
    }

    if (!m_state.taskbarVisible) {
        // Out of the task switcher: never keep focus while passthrough
        m_queue.post([this]() {
            if (m_window && !isInteractive()) {
                m_window->blur();
            }
        });
        return;
    }

    // In the task switcher: accept input so system shortcuts keep working
    m_state.clickthrough = false;
    m_window->setIgnoreInput(false);

    if (m_config.config().showSettingsOnWindowFocused) {
        setInteractive(true);
    }
}

void OverlaySession::handleBlur() {
    if (!m_window) {
        return;
    }
    m_window->setAlwaysOnTop(true);

    if (!isInteractive()) {
        m_state.clickthrough = true;
        m_window->setIgnoreInput(true);
    }
}

void OverlaySession::handleClose() {
    if (m_state.taskbarVisible) {
        requestQuit();
    } else {
        hideWindow();
    }
}

void OverlaySession::handleMinimize() {
    showWindow();
}

void OverlaySession::requestQuit() {
    std::cout << "[Overlay] Quit requested" << std::endl;
    if (m_callbacks.quitRequested) {
        m_callbacks.quitRequested();
    }
}

} // namespace shaderlay
