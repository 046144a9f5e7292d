// Shaderlay - Remote Shader Extraction Implementation

#include <shaderlay/remote_shader.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <regex>

using json = nlohmann::json;

namespace shaderlay {

namespace {

// Raw contents of the string literal whose opening quote ends at `start`.
// Stops at the first unescaped quote; nullopt if the literal never closes.
std::optional<std::string> scanStringLiteral(const std::string& document, size_t start) {
    for (size_t i = start; i < document.size(); i++) {
        if (document[i] == '\\') {
            i++;
        } else if (document[i] == '"') {
            return document.substr(start, i - start);
        }
    }
    return std::nullopt;
}

// Literal following the first match of `keyPattern` (which must end at an
// opening quote)
std::optional<std::string> literalAfter(const std::string& document, const std::regex& keyPattern) {
    std::smatch match;
    if (!std::regex_search(document, match, keyPattern)) {
        return std::nullopt;
    }
    size_t start = static_cast<size_t>(match.position(0) + match.length(0));
    return scanStringLiteral(document, start);
}

} // namespace

std::optional<std::string> extractShaderToken(const std::string& url) {
    static const std::regex tokenRegex(R"(shadertoy\.com/view/([A-Za-z0-9]+))");
    std::smatch match;
    if (!std::regex_search(url, match, tokenRegex)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::string shaderPageUrl(const std::string& token) {
    return "https://www.shadertoy.com/view/" + token;
}

std::string remoteShaderId(const std::string& token) {
    return "shadertoy-" + token;
}

std::string defaultRemoteName(const std::string& token) {
    return "Shadertoy " + token;
}

std::string unescapeStringLiteral(const std::string& raw) {
    try {
        return json::parse("\"" + raw + "\"").get<std::string>();
    } catch (const json::exception&) {
        // Not valid JSON escaping, decode the common escapes by hand
    }

    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        if (raw[i] != '\\' || i + 1 >= raw.size()) {
            out += raw[i];
            continue;
        }
        char c = raw[++i];
        switch (c) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            default: out += '\\'; out += c; break;
        }
    }
    return out;
}

std::optional<ExtractedShader> extractFromJsonData(const std::string& document) {
    size_t idPos = document.find("id=\"jsonData\"");
    if (idPos == std::string::npos) {
        return std::nullopt;
    }
    size_t tagStart = document.rfind("<script", idPos);
    size_t tagEnd = document.find('>', idPos);
    if (tagStart == std::string::npos || tagEnd == std::string::npos) {
        return std::nullopt;
    }
    size_t blockEnd = document.find("</script>", tagEnd);
    if (blockEnd == std::string::npos) {
        return std::nullopt;
    }

    json data = json::parse(document.substr(tagEnd + 1, blockEnd - tagEnd - 1), nullptr, false);
    if (data.is_discarded()) {
        std::cerr << "[Remote] jsonData block is not valid JSON" << std::endl;
        return std::nullopt;
    }
    if (data.is_array() && !data.empty()) {
        data = data[0];
    }
    if (!data.is_object() || !data.contains("Shader")) {
        return std::nullopt;
    }

    const json& shader = data["Shader"];
    if (!shader.contains("renderpass") || !shader["renderpass"].is_array() ||
        shader["renderpass"].empty()) {
        return std::nullopt;
    }
    const json& pass = shader["renderpass"][0];
    if (!pass.contains("code") || !pass["code"].is_string()) {
        return std::nullopt;
    }

    ExtractedShader result;
    result.body = pass["code"].get<std::string>();
    if (shader.contains("info") && shader["info"].is_object()) {
        result.name = shader["info"].value("name", "");
    }
    return result;
}

std::optional<ExtractedShader> extractFromCodeField(const std::string& document) {
    static const std::regex key(R"("code"\s*:\s*")");
    auto raw = literalAfter(document, key);
    if (!raw) {
        return std::nullopt;
    }
    return ExtractedShader{unescapeStringLiteral(*raw), {}};
}

std::optional<ExtractedShader> extractFromLooseCodeField(const std::string& document) {
    static const std::regex key(R"(code["\s]*:["\s]*")");
    auto raw = literalAfter(document, key);
    if (!raw) {
        return std::nullopt;
    }
    return ExtractedShader{unescapeStringLiteral(*raw), {}};
}

std::optional<std::string> extractShaderName(const std::string& document) {
    static const std::regex nameRegex(R"xx("name"\s*:\s*"([^"]+)")xx");
    std::smatch match;
    if (!std::regex_search(document, match, nameRegex)) {
        return std::nullopt;
    }
    return unescapeStringLiteral(match[1].str());
}

const std::vector<NamedStrategy>& extractionStrategies() {
    static const std::vector<NamedStrategy> strategies = {
        {"jsonData", &extractFromJsonData},
        {"code-field", &extractFromCodeField},
        {"loose-code-field", &extractFromLooseCodeField},
    };
    return strategies;
}

RemoteExtraction extractRemoteShader(const std::string& document, const std::string& token) {
    RemoteExtraction result;

    for (const auto& strategy : extractionStrategies()) {
        auto extracted = strategy.extract(document);
        if (!extracted || extracted->body.empty()) {
            continue;
        }

        result.ok = true;
        result.shader = std::move(*extracted);
        result.strategy = strategy.name;
        break;
    }

    if (!result.ok) {
        result.error = "Could not extract shader code from Shadertoy page. "
                       "The page structure may have changed or the shader may be private.";
        return result;
    }

    if (result.shader.name.empty()) {
        result.shader.name = extractShaderName(document).value_or(defaultRemoteName(token));
    }
    return result;
}

} // namespace shaderlay
