/**
 * @file test_overlay_session.cpp
 * @brief Unit tests for the overlay mode state machine and window recreation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <shaderlay/config.h>
#include <shaderlay/overlay_session.h>
#include <shaderlay/task_queue.h>
#include "fakes.h"

using namespace shaderlay;
using namespace shaderlay::test;
using Catch::Matchers::WithinAbs;

namespace {

struct SessionFixture {
    TempDir dir;
    ConfigStore config{dir.path() / "config.json"};
    TaskQueue queue;
    FakeWindowFactory factory;
    OverlaySession session{factory, config, queue};

    int created = 0;
    int destroying = 0;
    int quits = 0;
    float lastOpacity = -1.0f;
    double now = 1.0;

    SessionFixture() {
        config.load();
        queue.drain(now);

        SessionCallbacks callbacks;
        callbacks.windowCreated = [this](HostWindow&) { created++; };
        callbacks.windowDestroying = [this](HostWindow&) { destroying++; };
        callbacks.opacityChanged = [this](float o) { lastOpacity = o; };
        callbacks.quitRequested = [this]() { quits++; };
        session.setCallbacks(std::move(callbacks));
    }

    FakeWindow* window() { return static_cast<FakeWindow*>(session.window()); }

    void advance(double seconds) {
        now += seconds;
        queue.drain(now);
    }
};

} // namespace

TEST_CASE("OverlaySession starts in passthrough", "[overlay]") {
    SessionFixture f;
    REQUIRE(f.session.start());

    REQUIRE(f.created == 1);
    REQUIRE(f.window() != nullptr);
    REQUIRE(f.window()->visible);
    REQUIRE(f.window()->ignoring);
    REQUIRE_FALSE(f.window()->focused);
    REQUIRE(f.window()->windowOpacity == 1.0f);
    REQUIRE_FALSE(f.session.isInteractive());
    REQUIRE(f.session.state().clickthrough);
    REQUIRE_FALSE(f.factory.lastOptions.showInTaskbar);
    REQUIRE_THAT(f.lastOpacity, WithinAbs(0.1f, 1e-6f));
}

TEST_CASE("OverlaySession start fails without a window", "[overlay]") {
    SessionFixture f;
    f.factory.failNext = true;
    REQUIRE_FALSE(f.session.start());
    REQUIRE(f.session.window() == nullptr);
}

TEST_CASE("OverlaySession interactive toggle", "[overlay]") {
    SessionFixture f;
    f.session.start();

    SECTION("toggle once accepts input and focuses") {
        f.session.toggleInteractive();
        REQUIRE(f.session.isInteractive());
        REQUIRE_FALSE(f.window()->ignoring);
        REQUIRE(f.window()->focused);
        REQUIRE_FALSE(f.session.state().clickthrough);
    }

    SECTION("toggle twice returns to passthrough") {
        f.session.toggleInteractive();
        f.session.toggleInteractive();
        REQUIRE_FALSE(f.session.isInteractive());
        REQUIRE(f.window()->ignoring);
        REQUIRE_FALSE(f.window()->focused);
    }

    SECTION("going interactive re-shows a hidden window") {
        f.session.hideWindow();
        REQUIRE_FALSE(f.window()->visible);
        f.session.setInteractive(true);
        REQUIRE(f.window()->visible);
        REQUIRE(f.session.state().visible);
    }

    SECTION("opacity of the window itself stays at 1") {
        f.session.setOpacity(40);
        f.session.toggleInteractive();
        REQUIRE(f.window()->windowOpacity == 1.0f);
    }
}

TEST_CASE("OverlaySession clickthrough toggle", "[overlay]") {
    SessionFixture f;
    f.session.start();

    f.session.toggleClickthrough();
    REQUIRE_FALSE(f.window()->ignoring);
    REQUIRE_FALSE(f.session.isInteractive());

    f.session.toggleClickthrough();
    REQUIRE(f.window()->ignoring);
}

TEST_CASE("OverlaySession opacity", "[overlay]") {
    SessionFixture f;
    f.session.start();

    f.session.setOpacity(37);
    REQUIRE(f.session.state().opacityPercent == 37);
    REQUIRE(f.config.config().opacityPercent == 37);
    REQUIRE_THAT(f.lastOpacity, WithinAbs(0.37f, 1e-6f));

    f.session.setOpacity(150);
    REQUIRE(f.session.state().opacityPercent == 100);
    REQUIRE_THAT(f.session.compositeOpacity(), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("OverlaySession focus handling", "[overlay]") {
    SessionFixture f;
    f.session.start();

    SECTION("focus outside the task switcher is given back while passthrough") {
        f.window()->focused = true;
        f.window()->events.onFocus();
        REQUIRE(f.window()->focused);

        f.advance(0.016);
        REQUIRE_FALSE(f.window()->focused);
        REQUIRE(f.window()->ignoring);
    }

    SECTION("focus while interactive is kept") {
        f.session.setInteractive(true);
        f.window()->events.onFocus();
        f.advance(0.016);
        REQUIRE(f.window()->focused);
    }

    SECTION("blur re-asserts always-on-top and passthrough") {
        f.session.toggleClickthrough();
        f.window()->alwaysOnTop = false;
        f.window()->events.onBlur();
        REQUIRE(f.window()->alwaysOnTop);
        REQUIRE(f.window()->ignoring);
        REQUIRE(f.session.state().clickthrough);
    }

    SECTION("blur keeps input while interactive") {
        f.session.setInteractive(true);
        f.window()->events.onBlur();
        REQUIRE_FALSE(f.window()->ignoring);
    }
}

TEST_CASE("OverlaySession close and minimize", "[overlay]") {
    SessionFixture f;
    f.session.start();

    SECTION("close hides outside the task switcher") {
        f.window()->events.onClose();
        REQUIRE_FALSE(f.window()->visible);
        REQUIRE(f.quits == 0);
    }

    SECTION("minimize re-shows") {
        f.session.hideWindow();
        f.window()->events.onMinimize();
        REQUIRE(f.window()->visible);
    }
}

TEST_CASE("OverlaySession taskbar recreation", "[overlay][taskbar]") {
    SessionFixture f;
    f.session.start();
    f.session.setInteractive(true);
    f.session.setOpacity(55);

    f.session.setShowWindowInTaskbar(true);

    REQUIRE(f.destroying == 1);
    REQUIRE(f.session.window() == nullptr);
    REQUIRE(f.config.config().showWindowInTaskbar);
    REQUIRE(f.session.state().taskbarVisible);

    // Window is created on the next drain, state restored after settling
    f.advance(0.0);
    REQUIRE(f.factory.createCount == 2);
    REQUIRE(f.factory.lastOptions.showInTaskbar);
    REQUIRE(f.window() != nullptr);
    REQUIRE_FALSE(f.window()->visible);

    f.advance(OverlaySession::SETTLE_DELAY);
    REQUIRE(f.window()->visible);
    REQUIRE(f.session.isInteractive());
    REQUIRE(f.window()->focused);
    REQUIRE_FALSE(f.window()->ignoring);
    REQUIRE(f.session.state().opacityPercent == 55);
    REQUIRE_THAT(f.lastOpacity, WithinAbs(0.55f, 1e-6f));
    REQUIRE(f.queue.pending() == 0);

    SECTION("setting the same value does nothing") {
        f.session.setShowWindowInTaskbar(true);
        REQUIRE(f.destroying == 1);
    }

    SECTION("close in the task switcher quits") {
        f.window()->events.onClose();
        REQUIRE(f.quits == 1);
    }

    SECTION("focus in the task switcher accepts input") {
        f.session.setInteractive(false);
        f.window()->events.onFocus();
        REQUIRE_FALSE(f.window()->ignoring);
        REQUIRE_FALSE(f.session.isInteractive());
    }

    SECTION("focus opens the panel when configured") {
        f.session.setInteractive(false);
        f.session.setShowSettingsOnWindowFocused(true);
        REQUIRE(f.session.showSettingsOnWindowFocused());
        f.window()->events.onFocus();
        REQUIRE(f.session.isInteractive());
    }
}

TEST_CASE("OverlaySession restores a hidden window as hidden", "[overlay][taskbar]") {
    SessionFixture f;
    f.session.start();
    f.session.hideWindow();

    f.session.setShowWindowInTaskbar(true);
    f.advance(0.0);
    f.advance(OverlaySession::SETTLE_DELAY);

    REQUIRE_FALSE(f.window()->visible);
    REQUIRE_FALSE(f.session.state().visible);
    REQUIRE_FALSE(f.session.isInteractive());
    REQUIRE(f.window()->ignoring);
}

TEST_CASE("OverlaySession restores a direct clickthrough change", "[overlay][taskbar]") {
    SessionFixture f;
    f.session.start();
    f.session.toggleClickthrough();
    REQUIRE_FALSE(f.window()->ignoring);

    f.session.setShowWindowInTaskbar(true);
    f.advance(0.0);
    f.advance(OverlaySession::SETTLE_DELAY);

    REQUIRE_FALSE(f.session.isInteractive());
    REQUIRE_FALSE(f.session.state().clickthrough);
    REQUIRE_FALSE(f.window()->ignoring);
}

TEST_CASE("OverlaySession tolerates a missing window during restore", "[overlay][taskbar]") {
    SessionFixture f;
    f.session.start();

    f.factory.failNext = true;
    f.session.setShowWindowInTaskbar(true);

    for (int i = 0; i <= OverlaySession::MAX_RESTORE_ATTEMPTS + 1; i++) {
        f.advance(OverlaySession::SETTLE_DELAY);
    }

    REQUIRE(f.session.window() == nullptr);
    REQUIRE(f.queue.pending() == 0);

    // Session keeps working without a window
    f.session.toggleInteractive();
    f.session.setOpacity(20);
    REQUIRE(f.session.isInteractive());
}

TEST_CASE("OverlaySession rapid taskbar changes create one window", "[overlay][taskbar]") {
    SessionFixture f;
    f.session.start();

    f.session.setShowWindowInTaskbar(true);
    f.session.setShowWindowInTaskbar(false);

    f.advance(0.0);
    f.advance(OverlaySession::SETTLE_DELAY);

    REQUIRE(f.factory.createCount == 2);
    REQUIRE_FALSE(f.factory.lastOptions.showInTaskbar);
    REQUIRE(f.window() != nullptr);
    REQUIRE(f.window()->visible);
    REQUIRE_FALSE(f.config.config().showWindowInTaskbar);
}
