/**
 * @file test_accelerator.cpp
 * @brief Unit tests for hotkey string parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <shaderlay/accelerator.h>

using namespace shaderlay;

TEST_CASE("parseAccelerator", "[hotkeys]") {
    SECTION("overlay toggle") {
        auto chord = parseAccelerator("Ctrl+`");
        REQUIRE(chord.has_value());
        REQUIRE(chord->modifiers == MOD_CTRL);
        REQUIRE(chord->key == "`");
    }

    SECTION("clickthrough toggle") {
        auto chord = parseAccelerator("Ctrl+Shift+D");
        REQUIRE(chord.has_value());
        REQUIRE(chord->modifiers == (MOD_CTRL | MOD_SHIFT));
        REQUIRE(chord->key == "d");
    }

    SECTION("modifier aliases are case-insensitive") {
        auto chord = parseAccelerator("commandorcontrol+ALT+f5");
        REQUIRE(chord.has_value());
        REQUIRE(chord->modifiers == (MOD_CTRL | MOD_ALT));
        REQUIRE(chord->key == "f5");
    }

    SECTION("named keys") {
        REQUIRE(parseAccelerator("Super+Space")->key == "space");
        REQUIRE(parseAccelerator("Escape")->modifiers == 0);
    }

    SECTION("rejects malformed input") {
        REQUIRE_FALSE(parseAccelerator("").has_value());
        REQUIRE_FALSE(parseAccelerator("Ctrl+").has_value());
        REQUIRE_FALSE(parseAccelerator("Hyper+A").has_value());
        REQUIRE_FALSE(parseAccelerator("Ctrl+F13").has_value());
        REQUIRE_FALSE(parseAccelerator("Ctrl+Enterprise").has_value());
    }
}

TEST_CASE("acceleratorToString", "[hotkeys]") {
    REQUIRE(acceleratorToString(*parseAccelerator("shift+ctrl+d")) == "Ctrl+Shift+D");
    REQUIRE(acceleratorToString(*parseAccelerator("Ctrl+`")) == "Ctrl+`");
    REQUIRE(acceleratorToString(*parseAccelerator("Alt+f2")) == "Alt+f2");
}
