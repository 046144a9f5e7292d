#pragma once

// Shaderlay - Remote Shader Extraction
// Pulls a mainImage() body out of a Shadertoy page. The page format is not
// under our control, so each strategy is an independent pure function and
// they are tried in a fixed order.

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shaderlay {

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string error;  // Transport failure, empty otherwise

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

using FetchCallback = std::function<void(const HttpResponse& response)>;

// Asynchronous HTTP GET. The callback runs on the main thread.
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;
    virtual void fetch(const std::string& url, FetchCallback done) = 0;
};

struct ExtractedShader {
    std::string body;
    std::string name;  // Empty if the strategy found none
};

using ExtractionStrategy = std::optional<ExtractedShader> (*)(const std::string& document);

struct NamedStrategy {
    const char* name;
    ExtractionStrategy extract;
};

// Shader token from a .../view/<token> URL, nullopt if it doesn't match
std::optional<std::string> extractShaderToken(const std::string& url);

std::string shaderPageUrl(const std::string& token);
std::string remoteShaderId(const std::string& token);
std::string defaultRemoteName(const std::string& token);

// <script id="jsonData"> block parsed as JSON
std::optional<ExtractedShader> extractFromJsonData(const std::string& document);

// First "code": "..." string literal
std::optional<ExtractedShader> extractFromCodeField(const std::string& document);

// Looser code: "..." match, tolerating odd quoting around the key
std::optional<ExtractedShader> extractFromLooseCodeField(const std::string& document);

// First "name": "..." string literal
std::optional<std::string> extractShaderName(const std::string& document);

// Strategies in priority order
const std::vector<NamedStrategy>& extractionStrategies();

// Decode JSON string-literal escapes (\n, \", \\, \uXXXX, ...)
std::string unescapeStringLiteral(const std::string& raw);

struct RemoteExtraction {
    bool ok = false;
    ExtractedShader shader;
    std::string strategy;  // Name of the strategy that matched
    std::string error;
};

// Run the strategies against `document`. The name falls back to
// extractShaderName(), then to defaultRemoteName(token).
RemoteExtraction extractRemoteShader(const std::string& document, const std::string& token);

} // namespace shaderlay
