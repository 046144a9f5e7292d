/**
 * @file test_shader_library.cpp
 * @brief Unit tests for ShaderLibrary loading operations
 */

#include <catch2/catch_test_macros.hpp>
#include <shaderlay/builtin_shaders.h>
#include <shaderlay/shader_library.h>
#include "fakes.h"

using namespace shaderlay;
using namespace shaderlay::test;

namespace {

const std::string PAGE =
    "<script id=\"jsonData\">"
    R"({"Shader":{"info":{"name":"Remote One"},"renderpass":[{"code":"void mainImage(out vec4 c, in vec2 p) { c = vec4(0.5); }"}]}})"
    "</script>";

struct LibraryFixture {
    ShaderCatalog catalog;
    FakeFileSource files;
    FakeFetcher fetcher;
    ShaderLibrary library{catalog, files, fetcher};
    std::vector<std::string> selected;

    LibraryFixture() {
        catalog.setSelectionCallback([this](const ShaderSource& s) { selected.push_back(s.id); });
    }
};

} // namespace

TEST_CASE("ShaderLibrary builtins", "[library]") {
    LibraryFixture f;
    f.library.registerBuiltins();

    auto list = f.library.getShaderList();
    REQUIRE(list.size() == 2);
    REQUIRE(list[0].id == DEFAULT_SHADER_ID);
    REQUIRE(list[0].displayName == "Default Rainbow");
    REQUIRE(list[1].id == "plasma");
    REQUIRE(list[1].origin == ShaderOrigin::Builtin);
    REQUIRE(f.library.getCurrentId() == std::optional<std::string>("default"));
}

TEST_CASE("ShaderLibrary selectShader", "[library]") {
    LibraryFixture f;
    f.library.registerBuiltins();
    f.selected.clear();

    REQUIRE(f.library.selectShader("plasma"));
    REQUIRE(f.selected == std::vector<std::string>{"plasma"});
    REQUIRE_FALSE(f.library.selectShader("nope"));
    REQUIRE(f.library.getCurrentId() == std::optional<std::string>("plasma"));
}

TEST_CASE("ShaderLibrary loadFromText", "[library]") {
    LibraryFixture f;
    f.library.registerBuiltins();

    std::string first = f.library.loadFromText("body one", "Pasted");
    std::string second = f.library.loadFromText("body two", "");

    REQUIRE(first == "text-1");
    REQUIRE(second == "text-2");
    REQUIRE(f.catalog.find(first)->displayName == "Pasted");
    REQUIRE(f.catalog.find(second)->displayName == "Custom Shader");
    REQUIRE(f.library.getCurrentId() == std::optional<std::string>("text-2"));
}

TEST_CASE("ShaderLibrary loadFromFile", "[library]") {
    LibraryFixture f;
    f.library.registerBuiltins();
    f.files.files["/lib/glow.glsl"] = "glow body";
    f.files.hidden["/lib/glow.glsl"] = true;

    SECTION("adds a local-file entry and selects it") {
        LoadResult result = f.library.loadFromFile("/lib/glow.glsl");
        REQUIRE(result.ok);
        REQUIRE(result.id == "file-/lib/glow.glsl");

        const ShaderSource* source = f.catalog.find(result.id);
        REQUIRE(source->origin == ShaderOrigin::LocalFile);
        REQUIRE(source->displayName == "glow");
        REQUIRE(source->bodyText == "glow body");
        REQUIRE(f.library.getCurrentId() == std::optional<std::string>(result.id));
    }

    SECTION("a missing file fails without touching the catalog") {
        LoadResult result = f.library.loadFromFile("/lib/missing.glsl");
        REQUIRE_FALSE(result.ok);
        REQUIRE_FALSE(result.error.empty());
        REQUIRE(f.catalog.size() == 2);
        REQUIRE(f.library.getCurrentId() == std::optional<std::string>("default"));
    }
}

TEST_CASE("ShaderLibrary loadFromURL", "[library][remote]") {
    LibraryFixture f;
    f.library.registerBuiltins();

    std::vector<LoadResult> results;
    auto done = [&](const LoadResult& r) { results.push_back(r); };

    SECTION("an invalid URL fails immediately without a request") {
        f.library.loadFromURL("https://example.com/nothing", done);
        REQUIRE(f.fetcher.requests.empty());
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].ok);
        REQUIRE(results[0].error.find("Invalid Shadertoy URL") != std::string::npos);
    }

    SECTION("a successful fetch adds and selects the remote entry") {
        f.library.loadFromURL("https://www.shadertoy.com/view/AbC123", done);
        REQUIRE(f.fetcher.requests.size() == 1);
        REQUIRE(f.fetcher.requests[0].url == "https://www.shadertoy.com/view/AbC123");
        REQUIRE(results.empty());

        f.fetcher.respond(0, 200, PAGE);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].ok);
        REQUIRE(results[0].id == "shadertoy-AbC123");

        const ShaderSource* source = f.catalog.find("shadertoy-AbC123");
        REQUIRE(source->origin == ShaderOrigin::Remote);
        REQUIRE(source->displayName == "Remote One");
        REQUIRE(f.library.getCurrentId() == std::optional<std::string>("shadertoy-AbC123"));
    }

    SECTION("an HTTP error status is reported") {
        f.library.loadFromURL("https://www.shadertoy.com/view/AbC123", done);
        f.fetcher.respond(0, 404, "not found");
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].ok);
        REQUIRE(results[0].error.find("404") != std::string::npos);
        REQUIRE(f.catalog.size() == 2);
    }

    SECTION("a transport error is reported") {
        f.library.loadFromURL("https://www.shadertoy.com/view/AbC123", done);
        f.fetcher.fail(0, "connection refused");
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].ok);
        REQUIRE(results[0].error.find("connection refused") != std::string::npos);
    }

    SECTION("a page without shader code is reported") {
        f.library.loadFromURL("https://www.shadertoy.com/view/AbC123", done);
        f.fetcher.respond(0, 200, "<html>private</html>");
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].ok);
        REQUIRE(f.library.getCurrentId() == std::optional<std::string>("default"));
    }

    SECTION("the last completion wins") {
        f.library.loadFromURL("https://www.shadertoy.com/view/First1", done);
        f.library.loadFromURL("https://www.shadertoy.com/view/Second2", done);

        f.fetcher.respond(1, 200, PAGE);
        f.fetcher.respond(0, 200, PAGE);

        REQUIRE(results.size() == 2);
        REQUIRE(f.library.getCurrentId() == std::optional<std::string>("shadertoy-First1"));
        REQUIRE(f.catalog.contains("shadertoy-Second2"));
    }
}

TEST_CASE("ShaderLibrary refreshFromDirectory", "[library]") {
    LibraryFixture f;
    f.library.registerBuiltins();
    f.files.files["/dir/a.glsl"] = "a";
    f.files.files["/dir/b.frag"] = "b";

    int listChanges = 0;
    f.catalog.setListChangedCallback([&] { listChanges++; });

    f.library.refreshFromDirectory();
    REQUIRE(listChanges == 1);
    REQUIRE(f.catalog.size() == 4);
    REQUIRE(f.catalog.find("file-/dir/a.glsl")->origin == ShaderOrigin::DirectoryScan);

    f.files.files.erase("/dir/a.glsl");
    f.library.refreshFromDirectory();
    REQUIRE(f.catalog.size() == 3);
    REQUIRE(f.library.getCurrentId() == std::optional<std::string>("default"));
}
