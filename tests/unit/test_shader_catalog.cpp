/**
 * @file test_shader_catalog.cpp
 * @brief Unit tests for ShaderCatalog ordering, selection and reconciliation
 */

#include <catch2/catch_test_macros.hpp>
#include <shaderlay/shader_catalog.h>
#include <map>

using namespace shaderlay;

namespace {

ShaderSource makeSource(const std::string& id, const std::string& body = "body",
                        ShaderOrigin origin = ShaderOrigin::Builtin) {
    return {id, "Shader " + id, body, origin, {}};
}

// Reader over an in-memory file map
FileReader mapReader(const std::map<std::string, std::string>& files) {
    return [&files](const std::string& path, std::string& error) -> std::optional<std::string> {
        auto it = files.find(path);
        if (it == files.end()) {
            error = "missing";
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("ShaderCatalog add and list", "[catalog]") {
    ShaderCatalog catalog;
    int listChanges = 0;
    catalog.setListChangedCallback([&] { listChanges++; });

    SECTION("keeps insertion order") {
        catalog.add(makeSource("b"));
        catalog.add(makeSource("a"));
        catalog.add(makeSource("c"));

        auto list = catalog.list();
        REQUIRE(list.size() == 3);
        REQUIRE(list[0].id == "b");
        REQUIRE(list[1].id == "a");
        REQUIRE(list[2].id == "c");
        REQUIRE(listChanges == 3);
    }

    SECTION("adding an existing id replaces it in place") {
        catalog.add(makeSource("a", "one"));
        catalog.add(makeSource("b"));
        std::string id = catalog.add(makeSource("a", "two"));

        REQUIRE(id == "a");
        REQUIRE(catalog.size() == 2);
        REQUIRE(catalog.list()[0].id == "a");
        REQUIRE(catalog.find("a")->bodyText == "two");
    }

    SECTION("add does not select") {
        catalog.add(makeSource("a"));
        REQUIRE_FALSE(catalog.current().has_value());
    }
}

TEST_CASE("ShaderCatalog selection", "[catalog]") {
    ShaderCatalog catalog;
    catalog.add(makeSource("a", "body-a"));
    catalog.add(makeSource("b", "body-b"));

    int listChanges = 0;
    std::vector<std::string> selected;
    catalog.setListChangedCallback([&] { listChanges++; });
    catalog.setSelectionCallback([&](const ShaderSource& s) { selected.push_back(s.bodyText); });

    SECTION("select fires the selection callback only") {
        REQUIRE(catalog.select("b"));
        REQUIRE(catalog.current() == std::optional<std::string>("b"));
        REQUIRE(catalog.currentSource()->bodyText == "body-b");
        REQUIRE(selected == std::vector<std::string>{"body-b"});
        REQUIRE(listChanges == 0);
    }

    SECTION("selecting an unknown id changes nothing") {
        catalog.select("a");
        REQUIRE_FALSE(catalog.select("zzz"));
        REQUIRE(catalog.current() == std::optional<std::string>("a"));
        REQUIRE(selected.size() == 1);
    }

    SECTION("removing the current entry clears the selection") {
        catalog.select("a");
        REQUIRE(catalog.remove("a"));
        REQUIRE_FALSE(catalog.current().has_value());
        REQUIRE(catalog.currentSource() == nullptr);
        REQUIRE(listChanges == 1);
    }

    SECTION("removing another entry keeps the selection") {
        catalog.select("a");
        REQUIRE(catalog.remove("b"));
        REQUIRE(catalog.current() == std::optional<std::string>("a"));
    }

    SECTION("removing an unknown id") {
        REQUIRE_FALSE(catalog.remove("zzz"));
        REQUIRE(listChanges == 0);
    }
}

TEST_CASE("ShaderCatalog reconcile", "[catalog][reconcile]") {
    ShaderCatalog catalog;
    catalog.add(makeSource("default"));
    catalog.add({"text-1", "Pasted", "pasted", ShaderOrigin::LocalFile, {}});

    std::map<std::string, std::string> files = {
        {"/shaders/a.glsl", "body-a"},
        {"/shaders/b.frag", "body-b"},
    };

    int listChanges = 0;
    std::vector<std::string> selected;
    catalog.setListChangedCallback([&] { listChanges++; });
    catalog.setSelectionCallback([&](const ShaderSource& s) { selected.push_back(s.id); });

    SECTION("adds new files as directory entries with one notification") {
        catalog.select("default");
        selected.clear();

        catalog.reconcile({"/shaders/a.glsl", "/shaders/b.frag"}, mapReader(files));

        REQUIRE(listChanges == 1);
        REQUIRE(catalog.size() == 4);
        const ShaderSource* a = catalog.find(ShaderCatalog::idForPath("/shaders/a.glsl"));
        REQUIRE(a != nullptr);
        REQUIRE(a->displayName == "a");
        REQUIRE(a->origin == ShaderOrigin::DirectoryScan);
        REQUIRE(a->path == "/shaders/a.glsl");
        REQUIRE(selected.empty());
    }

    SECTION("drops entries whose file is gone, leaving other origins alone") {
        catalog.reconcile({"/shaders/a.glsl", "/shaders/b.frag"}, mapReader(files));
        listChanges = 0;

        catalog.reconcile({"/shaders/b.frag"}, mapReader(files));

        REQUIRE(listChanges == 1);
        REQUIRE_FALSE(catalog.contains("file-/shaders/a.glsl"));
        REQUIRE(catalog.contains("file-/shaders/b.frag"));
        REQUIRE(catalog.contains("default"));
        REQUIRE(catalog.contains("text-1"));
    }

    SECTION("does not touch a local-file entry with the same path") {
        catalog.add({"file-/shaders/a.glsl", "Mine", "local", ShaderOrigin::LocalFile, "/shaders/a.glsl"});
        catalog.reconcile({}, mapReader(files));
        REQUIRE(catalog.find("file-/shaders/a.glsl")->bodyText == "local");

        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));
        REQUIRE(catalog.find("file-/shaders/a.glsl")->origin == ShaderOrigin::LocalFile);
        REQUIRE(catalog.find("file-/shaders/a.glsl")->bodyText == "local");
    }

    SECTION("auto-selects the first entry when nothing is selected") {
        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));

        REQUIRE(listChanges == 1);
        REQUIRE(catalog.current() == std::optional<std::string>("default"));
        REQUIRE(selected == std::vector<std::string>{"default"});
    }

    SECTION("removing the selected file then auto-selects the first entry") {
        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));
        catalog.select("file-/shaders/a.glsl");
        selected.clear();
        listChanges = 0;

        catalog.reconcile({}, mapReader(files));
        REQUIRE(listChanges == 1);
        REQUIRE(catalog.current() == std::optional<std::string>("default"));
        REQUIRE(selected == std::vector<std::string>{"default"});
    }

    SECTION("re-reads a changed file and reselects it if current") {
        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));
        catalog.select("file-/shaders/a.glsl");
        selected.clear();

        files["/shaders/a.glsl"] = "body-a2";
        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));

        REQUIRE(catalog.find("file-/shaders/a.glsl")->bodyText == "body-a2");
        REQUIRE(selected == std::vector<std::string>{"file-/shaders/a.glsl"});
    }

    SECTION("an unchanged current file is not reselected") {
        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));
        catalog.select("file-/shaders/a.glsl");
        selected.clear();

        catalog.reconcile({"/shaders/a.glsl"}, mapReader(files));
        REQUIRE(selected.empty());
    }

    SECTION("unreadable files are skipped") {
        catalog.select("default");
        catalog.reconcile({"/shaders/a.glsl", "/shaders/missing.glsl"}, mapReader(files));
        REQUIRE(catalog.contains("file-/shaders/a.glsl"));
        REQUIRE_FALSE(catalog.contains("file-/shaders/missing.glsl"));
    }
}

TEST_CASE("ShaderCatalog reconcile on an empty catalog", "[catalog][reconcile]") {
    ShaderCatalog catalog;
    std::map<std::string, std::string> files;
    int listChanges = 0;
    catalog.setListChangedCallback([&] { listChanges++; });

    catalog.reconcile({}, mapReader(files));
    REQUIRE(listChanges == 1);
    REQUIRE(catalog.empty());
    REQUIRE_FALSE(catalog.current().has_value());
}

TEST_CASE("ShaderCatalog path helpers", "[catalog]") {
    REQUIRE(ShaderCatalog::idForPath("/x/y/wave.glsl") == "file-/x/y/wave.glsl");
    REQUIRE(ShaderCatalog::nameForPath("/x/y/wave.glsl") == "wave");
    REQUIRE(ShaderCatalog::nameForPath("/x/y/tunnel.fragment") == "tunnel");
}
