#pragma once

// Shaderlay - Accelerators
// Parsing of hotkey strings such as "Ctrl+`" or "Ctrl+Shift+D"

#include <optional>
#include <string>

namespace shaderlay {

enum KeyModifier : unsigned {
    MOD_CTRL = 1u << 0,
    MOD_SHIFT = 1u << 1,
    MOD_ALT = 1u << 2,
    MOD_SUPER = 1u << 3,
};

struct KeyChord {
    unsigned modifiers = 0;
    // Lowercase: a single printable character ("d", "`", "1") or a named
    // key ("f1".."f12", "space", "escape")
    std::string key;

    bool operator==(const KeyChord& other) const {
        return modifiers == other.modifiers && key == other.key;
    }
};

// Modifier names are case-insensitive; "CommandOrControl" and "Cmd" map to
// Ctrl. Returns nullopt for an unknown key or modifier, or a chord without a key.
std::optional<KeyChord> parseAccelerator(const std::string& text);

std::string acceleratorToString(const KeyChord& chord);

} // namespace shaderlay
