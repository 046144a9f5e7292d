/**
 * @file test_remote_shader.cpp
 * @brief Unit tests for Shadertoy URL parsing and page extraction
 */

#include <catch2/catch_test_macros.hpp>
#include <shaderlay/remote_shader.h>

using namespace shaderlay;

TEST_CASE("extractShaderToken", "[remote]") {
    SECTION("standard view URL") {
        REQUIRE(extractShaderToken("https://www.shadertoy.com/view/XsXXDn") ==
                std::optional<std::string>("XsXXDn"));
    }

    SECTION("trailing path and query are ignored") {
        REQUIRE(extractShaderToken("https://shadertoy.com/view/Ms2SD1?foo=1") ==
                std::optional<std::string>("Ms2SD1"));
    }

    SECTION("non-matching URLs") {
        REQUIRE_FALSE(extractShaderToken("https://example.com/view/abc").has_value());
        REQUIRE_FALSE(extractShaderToken("https://www.shadertoy.com/results").has_value());
        REQUIRE_FALSE(extractShaderToken("").has_value());
    }
}

TEST_CASE("remote naming helpers", "[remote]") {
    REQUIRE(shaderPageUrl("abc123") == "https://www.shadertoy.com/view/abc123");
    REQUIRE(remoteShaderId("abc123") == "shadertoy-abc123");
    REQUIRE(defaultRemoteName("abc123") == "Shadertoy abc123");
}

TEST_CASE("unescapeStringLiteral", "[remote]") {
    REQUIRE(unescapeStringLiteral(R"(a\nb)") == "a\nb");
    REQUIRE(unescapeStringLiteral(R"(say \"hi\")") == "say \"hi\"");
    REQUIRE(unescapeStringLiteral(R"(back\\slash)") == "back\\slash");
    REQUIRE(unescapeStringLiteral(R"(\u0041)") == "A");
    REQUIRE(unescapeStringLiteral("plain") == "plain");
}

TEST_CASE("extractFromJsonData", "[remote]") {
    std::string page =
        "<html><body>"
        "<script id=\"jsonData\" type=\"application/json\">"
        R"([{"Shader":{"info":{"name":"Seascape"},"renderpass":[{"code":"void mainImage(out vec4 c, in vec2 p) {\n c = vec4(1.0);\n}"}]}}])"
        "</script></body></html>";

    auto extracted = extractFromJsonData(page);
    REQUIRE(extracted.has_value());
    REQUIRE(extracted->name == "Seascape");
    REQUIRE(extracted->body == "void mainImage(out vec4 c, in vec2 p) {\n c = vec4(1.0);\n}");

    SECTION("missing block") {
        REQUIRE_FALSE(extractFromJsonData("<html></html>").has_value());
    }

    SECTION("invalid JSON in the block") {
        REQUIRE_FALSE(extractFromJsonData("<script id=\"jsonData\">{nope</script>").has_value());
    }
}

TEST_CASE("extractFromCodeField", "[remote]") {
    std::string page = R"(var x = {"code": "void mainImage() {\n\tfoo(\"q\");\n}", "other": 1};)";

    auto extracted = extractFromCodeField(page);
    REQUIRE(extracted.has_value());
    REQUIRE(extracted->body == "void mainImage() {\n\tfoo(\"q\");\n}");
    REQUIRE(extracted->name.empty());

    REQUIRE_FALSE(extractFromCodeField("no code here").has_value());
}

TEST_CASE("extractFromLooseCodeField", "[remote]") {
    std::string page = R"(shader = { code : "void mainImage() {}" };)";

    REQUIRE_FALSE(extractFromCodeField(page).has_value());
    auto extracted = extractFromLooseCodeField(page);
    REQUIRE(extracted.has_value());
    REQUIRE(extracted->body == "void mainImage() {}");

    SECTION("escaped quotes do not end the value") {
        std::string quoted = R"(shader = { code : "a(\"b\");\nc();" };)";
        auto full = extractFromLooseCodeField(quoted);
        REQUIRE(full.has_value());
        REQUIRE(full->body == "a(\"b\");\nc();");
    }
}

TEST_CASE("extractShaderName", "[remote]") {
    REQUIRE(extractShaderName(R"({"name" : "Rain"})") == std::optional<std::string>("Rain"));
    REQUIRE_FALSE(extractShaderName("{}").has_value());
}

TEST_CASE("extractRemoteShader strategy order and fallbacks", "[remote]") {
    SECTION("the structured block wins over textual matches") {
        std::string page =
            R"("code": "textual")"
            "<script id=\"jsonData\">"
            R"({"Shader":{"info":{"name":"Structured"},"renderpass":[{"code":"structured"}]}})"
            "</script>";

        RemoteExtraction result = extractRemoteShader(page, "tok");
        REQUIRE(result.ok);
        REQUIRE(result.strategy == "jsonData");
        REQUIRE(result.shader.body == "structured");
        REQUIRE(result.shader.name == "Structured");
    }

    SECTION("textual match takes its name from the page") {
        RemoteExtraction result = extractRemoteShader(R"({"name": "Fire", "code": "x"})", "tok");
        REQUIRE(result.ok);
        REQUIRE(result.strategy == "code-field");
        REQUIRE(result.shader.name == "Fire");
    }

    SECTION("falls back to the default name") {
        RemoteExtraction result = extractRemoteShader(R"({"code": "x"})", "tok");
        REQUIRE(result.ok);
        REQUIRE(result.shader.name == "Shadertoy tok");
    }

    SECTION("nothing matches") {
        RemoteExtraction result = extractRemoteShader("<html>private</html>", "tok");
        REQUIRE_FALSE(result.ok);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("an empty code string is not a match") {
        RemoteExtraction result = extractRemoteShader(R"({"code": ""})", "tok");
        REQUIRE_FALSE(result.ok);
    }
}
