// Shaderlay - Accelerator Parsing

#include <shaderlay/accelerator.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace shaderlay {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isNamedKey(const std::string& key) {
    if (key == "space" || key == "escape" || key == "tab") {
        return true;
    }
    if (key.size() >= 2 && key.size() <= 3 && key[0] == 'f') {
        int n = 0;
        for (size_t i = 1; i < key.size(); i++) {
            if (!std::isdigit(static_cast<unsigned char>(key[i]))) return false;
            n = n * 10 + (key[i] - '0');
        }
        return n >= 1 && n <= 12;
    }
    return false;
}

} // namespace

std::optional<KeyChord> parseAccelerator(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (std::getline(stream, part, '+')) {
        parts.push_back(part);
    }
    if (parts.empty()) {
        return std::nullopt;
    }

    KeyChord chord;
    for (size_t i = 0; i + 1 < parts.size(); i++) {
        std::string mod = lower(parts[i]);
        if (mod == "ctrl" || mod == "control" || mod == "commandorcontrol" ||
            mod == "cmdorctrl" || mod == "command" || mod == "cmd") {
            chord.modifiers |= MOD_CTRL;
        } else if (mod == "shift") {
            chord.modifiers |= MOD_SHIFT;
        } else if (mod == "alt" || mod == "option") {
            chord.modifiers |= MOD_ALT;
        } else if (mod == "super" || mod == "meta") {
            chord.modifiers |= MOD_SUPER;
        } else {
            return std::nullopt;
        }
    }

    std::string key = lower(parts.back());
    bool printable = key.size() == 1 && std::isgraph(static_cast<unsigned char>(key[0]));
    if (!printable && !isNamedKey(key)) {
        return std::nullopt;
    }
    chord.key = key;
    return chord;
}

std::string acceleratorToString(const KeyChord& chord) {
    std::string out;
    if (chord.modifiers & MOD_CTRL) out += "Ctrl+";
    if (chord.modifiers & MOD_SHIFT) out += "Shift+";
    if (chord.modifiers & MOD_ALT) out += "Alt+";
    if (chord.modifiers & MOD_SUPER) out += "Super+";
    if (chord.key.size() == 1) {
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(chord.key[0])));
    } else {
        out += chord.key;
    }
    return out;
}

} // namespace shaderlay
