//
// Tests for template fragments
//

#include <doctest/doctest.h>
#include <schemagen/codegen/template/fragment.hh>
#include <schemagen/codegen.hh>

using namespace schemagen::codegen;

namespace {
    std::string render(const std::string& source, const Dictionary& dict) {
        return Fragment("test", source).render(dict);
    }
}

TEST_SUITE("Template - Fragment") {

    TEST_CASE("Plain text and variables") {
        CHECK(render("hello", {}) == "hello");
        CHECK(render("hello {{name}}!", {{"name", "world"}}) == "hello world!");
        CHECK(render("{{ name }}", {{"name", "spaced"}}) == "spaced");
    }

    TEST_CASE("Values are substituted verbatim") {
        CHECK(render("{{v}}", {{"v", "<a & \"b\">"}}) == "<a & \"b\">");
    }

    TEST_CASE("Comments are dropped") {
        CHECK(render("a{{! note }}b", {}) == "ab");
    }

    TEST_CASE("Boolean sections") {
        CHECK(render("[{{#f}}on{{/f}}]", {{"f", true}}) == "[on]");
        CHECK(render("[{{#f}}on{{/f}}]", {{"f", false}}) == "[]");
        CHECK(render("[{{^f}}off{{/f}}]", {{"f", false}}) == "[off]");
        CHECK(render("[{{^f}}off{{/f}}]", {{"f", true}}) == "[]");
    }

    TEST_CASE("List sections repeat per item") {
        Dictionary dict{
            {"items", DictionaryList{
                Dictionary{{"n", "1"}},
                Dictionary{{"n", "2"}},
                Dictionary{{"n", "3"}}
            }}
        };
        CHECK(render("{{#items}}<{{n}}>{{/items}}", dict) == "<1><2><3>");

        Dictionary empty{{"items", DictionaryList{}}};
        CHECK(render("{{#items}}x{{/items}}", empty) == "");
        CHECK(render("{{^items}}none{{/items}}", empty) == "none");
    }

    TEST_CASE("Inner scopes fall back to outer keys") {
        Dictionary dict{
            {"owner", "Color"},
            {"name", "outer"},
            {"values", DictionaryList{Dictionary{{"name", "RED"}}}}
        };
        CHECK(render("{{#values}}{{owner}}.{{name}}{{/values}}", dict) == "Color.RED");
    }

    TEST_CASE("Dictionary sections push a scope") {
        Dictionary dict{{"user", Dictionary{{"id", "7"}}}};
        CHECK(render("{{#user}}{{id}}{{/user}}", dict) == "7");
    }

    TEST_CASE("Dotted keys descend into dictionaries") {
        Dictionary dict{{"a", Dictionary{{"b", Dictionary{{"c", "deep"}}}}}};
        CHECK(render("{{a.b.c}}", dict) == "deep");
    }

    TEST_CASE("Standalone tag lines are removed") {
        Dictionary dict{
            {"items", DictionaryList{Dictionary{{"n", "a"}}, Dictionary{{"n", "b"}}}}
        };
        std::string source =
            "begin\n"
            "{{#items}}\n"
            "  item {{n}}\n"
            "{{/items}}\n"
            "end\n";
        CHECK(render(source, dict) == "begin\n  item a\n  item b\nend\n");
    }

    TEST_CASE("Indented standalone tags are removed with their indentation") {
        std::string source =
            "{\n"
            "    {{#f}}\n"
            "    body\n"
            "    {{/f}}\n"
            "}\n";
        CHECK(render(source, {{"f", true}}) == "{\n    body\n}\n");
        CHECK(render(source, {{"f", false}}) == "{\n}\n");
    }

    TEST_CASE("Inline tags keep their line") {
        CHECK(render("a {{#f}}b{{/f}} c\n", {{"f", true}}) == "a b c\n");
    }

    TEST_CASE("Partials render in the current scope") {
        auto item = std::make_shared<const Fragment>("item", "({{n}})");
        Dictionary dict{
            {"item", item},
            {"items", DictionaryList{Dictionary{{"n", "1"}}, Dictionary{{"n", "2"}}}}
        };
        CHECK(render("{{#items}}{{>item}}{{/items}}", dict) == "(1)(2)");
    }

    TEST_CASE("Undefined keys name the fragment and key") {
        try {
            (void)Fragment("header", "line\n{{missing}}").render({});
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.fragment_name() == "header");
            CHECK(e.key() == "missing");
            CHECK(std::string(e.what()).find("line 2") != std::string::npos);
        }
    }

    TEST_CASE("Errors inside partials name the partial") {
        auto inner = std::make_shared<const Fragment>("inner", "{{nope}}");
        try {
            (void)Fragment("outer", "{{>inner}}").render({{"inner", inner}});
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.fragment_name() == "inner");
            CHECK(e.key() == "nope");
        }
    }

    TEST_CASE("Values of the wrong shape are rejected") {
        CHECK_THROWS_AS(render("{{f}}", {{"f", true}}), template_error);
        CHECK_THROWS_AS(render("{{#s}}x{{/s}}", {{"s", "text"}}), template_error);
        CHECK_THROWS_AS(render("{{>s}}", {{"s", "text"}}), template_error);
        CHECK_THROWS_AS(render("{{a.b}}", {{"a", "text"}}), template_error);
        CHECK_THROWS_AS(render("{{a.b}}", {{"a", Dictionary{}}}), template_error);
    }

    TEST_CASE("Malformed fragments fail to compile") {
        CHECK_THROWS_AS(Fragment("t", "{{#a}}never closed"), template_error);
        CHECK_THROWS_AS(Fragment("t", "{{/a}}"), template_error);
        CHECK_THROWS_AS(Fragment("t", "{{#a}}{{/b}}"), template_error);
        CHECK_THROWS_AS(Fragment("t", "{{unterminated"), template_error);
        CHECK_THROWS_AS(Fragment("t", "{{}}"), template_error);

        try {
            Fragment("enum", "{{#values}}\n");
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.fragment_name() == "enum");
            CHECK(e.key() == "values");
        }
    }

    TEST_CASE("Recursive partials stop at the depth limit") {
        auto self = std::make_shared<const Fragment>("loop", "{{>loop}}");
        Dictionary dict{{"loop", self}};
        CHECK_THROWS_AS((void)self->render(dict), template_error);
    }

    TEST_CASE("Rendering is repeatable") {
        Fragment f("t", "{{#items}}{{n}},{{/items}}");
        Dictionary dict{{"items", DictionaryList{Dictionary{{"n", "x"}}}}};
        CHECK(f.render(dict) == f.render(dict));
        CHECK(f.name() == "t");
    }
}
