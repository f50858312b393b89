//
// Tests for Fragment Registry and Bound Fragments
//

#include <doctest/doctest.h>
#include <schemagen/codegen/template/fragment_registry.hh>
#include <schemagen/codegen.hh>
#include <schemagen/ast.hh>

using namespace schemagen;
using namespace schemagen::codegen;

TEST_SUITE("Template - Fragment Registry") {

    TEST_CASE("Fragments are loaded with the prefix") {
        MemoryFragmentLoader loader;
        loader.add("scala/enum", "enum {{enum_name}}");
        loader.add("scala/header", "package {{pkg}}");
        loader.add("java/enum", "wrong");

        FragmentRegistry registry(loader, "scala/", {"enum", "header"});

        CHECK(registry.prefix() == "scala/");
        CHECK(registry.has("enum"));
        CHECK(registry.has("header"));
        CHECK_FALSE(registry.has("struct"));

        auto names = registry.names();
        REQUIRE(names.size() == 2);
        CHECK(names[0] == "enum");
        CHECK(names[1] == "header");

        CHECK(registry.get("enum")->render({{"enum_name", "Color"}}) == "enum Color");
    }

    TEST_CASE("Missing fragments fail at construction") {
        MemoryFragmentLoader loader;
        loader.add("scala/enum", "x");

        try {
            FragmentRegistry registry(loader, "scala/", {"enum", "struct"});
            FAIL("expected fragment_not_found_error");
        } catch (const fragment_not_found_error& e) {
            CHECK(e.fragment_name() == "scala/struct");
        }
    }

    TEST_CASE("Broken fragments fail at construction") {
        MemoryFragmentLoader loader;
        loader.add("scala/enum", "{{#values}}never closed");

        try {
            FragmentRegistry registry(loader, "scala/", {"enum"});
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.fragment_name() == "enum");
            CHECK(e.key() == "values");
        }
    }

    TEST_CASE("Unknown names are rejected by get") {
        MemoryFragmentLoader loader;
        loader.add("p/a", "a");
        FragmentRegistry registry(loader, "p/", {"a"});

        CHECK_THROWS_AS((void)registry.get("b"), fragment_not_found_error);
    }

    TEST_CASE("Duplicate names are loaded once") {
        MemoryFragmentLoader loader;
        loader.add("p/a", "a");
        FragmentRegistry registry(loader, "p/", {"a", "a"});
        CHECK(registry.names().size() == 1);
    }

    TEST_CASE("Bound fragments apply their transform") {
        MemoryFragmentLoader loader;
        loader.add("scala/enum", "{{enum_name}}:{{#values}} {{name}}{{/values}}");
        FragmentRegistry registry(loader, "scala/", {"enum"});

        auto enum_fragment = registry.bind<ast::enum_def>("enum", [](const ast::enum_def& e) {
            DictionaryList values;
            for (const auto& v : e.values) {
                values.push_back(Dictionary{{"name", v.name}});
            }
            return Dictionary{{"enum_name", e.name}, {"values", values}};
        });

        ast::enum_def color;
        color.name = "Color";
        color.values.push_back(ast::enum_value{"RED", 1});
        color.values.push_back(ast::enum_value{"GREEN", 2});

        CHECK(enum_fragment.render(color) == "Color: RED GREEN");

        Dictionary unpacked = enum_fragment.unpack(color);
        CHECK(*unpacked.find("enum_name")->as_string() == "Color");
        CHECK(unpacked.find("values")->as_list()->size() == 2);

        Dictionary again = enum_fragment.unpacker()(color);
        CHECK(again.size() == unpacked.size());

        CHECK(enum_fragment.fragment() == registry.get("enum"));
    }

    TEST_CASE("Bound fragments can be embedded as partials") {
        MemoryFragmentLoader loader;
        loader.add("t/item", "<{{name}}>");
        loader.add("t/list", "{{#items}}{{>item}}{{/items}}");
        FragmentRegistry registry(loader, "t/", {"item", "list"});

        auto item = registry.bind<std::string>("item", [](const std::string& s) {
            return Dictionary{{"name", s}};
        });

        DictionaryList items{item.unpack("a"), item.unpack("b")};
        Dictionary dict{{"items", items}, {"item", item.fragment()}};

        CHECK(registry.get("list")->render(dict) == "<a><b>");
    }
}
