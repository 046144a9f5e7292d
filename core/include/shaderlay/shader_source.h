#pragma once

// Shaderlay - Shader Source
// Immutable description of one fragment body the catalog knows about

#include <string>

namespace shaderlay {

enum class ShaderOrigin {
    Builtin,
    LocalFile,
    DirectoryScan,
    Remote
};

struct ShaderSource {
    std::string id;
    std::string displayName;
    std::string bodyText;   // Defines mainImage() only, no wrapper
    ShaderOrigin origin = ShaderOrigin::Builtin;
    std::string path;       // Backing file for LocalFile/DirectoryScan entries
};

// Entry returned by list(), without the body
struct ShaderInfo {
    std::string id;
    std::string displayName;
    ShaderOrigin origin = ShaderOrigin::Builtin;
};

inline const char* originName(ShaderOrigin origin) {
    switch (origin) {
        case ShaderOrigin::Builtin:       return "builtin";
        case ShaderOrigin::LocalFile:     return "local-file";
        case ShaderOrigin::DirectoryScan: return "directory-scan";
        case ShaderOrigin::Remote:        return "remote";
    }
    return "unknown";
}

} // namespace shaderlay
