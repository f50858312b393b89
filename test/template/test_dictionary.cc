//
// Tests for template dictionaries
//

#include <doctest/doctest.h>
#include <schemagen/codegen/template/dictionary.hh>
#include <schemagen/codegen/template/fragment.hh>

using namespace schemagen::codegen;

TEST_SUITE("Template - Dictionary") {

    TEST_CASE("Values keep their kind") {
        Dictionary dict{
            {"name", "Color"},
            {"flag", true},
            {"nested", Dictionary{{"inner", "x"}}},
            {"items", DictionaryList{Dictionary{{"a", "1"}}, Dictionary{{"a", "2"}}}}
        };

        REQUIRE(dict.size() == 4);

        const Value* name = dict.find("name");
        REQUIRE(name != nullptr);
        CHECK(name->kind() == Value::Kind::String);
        REQUIRE(name->as_string() != nullptr);
        CHECK(*name->as_string() == "Color");
        CHECK(name->as_bool() == nullptr);

        const Value* flag = dict.find("flag");
        REQUIRE(flag != nullptr);
        CHECK(flag->kind() == Value::Kind::Boolean);
        CHECK(*flag->as_bool());

        const Value* nested = dict.find("nested");
        REQUIRE(nested != nullptr);
        REQUIRE(nested->as_dictionary() != nullptr);
        CHECK(nested->as_dictionary()->contains("inner"));

        const Value* items = dict.find("items");
        REQUIRE(items != nullptr);
        REQUIRE(items->as_list() != nullptr);
        CHECK(items->as_list()->size() == 2);
    }

    TEST_CASE("String literals are strings, not booleans") {
        Value v("text");
        CHECK(v.kind() == Value::Kind::String);
        CHECK(std::string(v.kind_name()) == "string");
    }

    TEST_CASE("Partials hold compiled fragments") {
        auto fragment = std::make_shared<const Fragment>("inner", "x");
        Value v(fragment);
        CHECK(v.kind() == Value::Kind::Partial);
        CHECK(v.as_partial() == fragment.get());
        CHECK(std::string(v.kind_name()) == "partial");
    }

    TEST_CASE("set replaces existing entries") {
        Dictionary dict;
        CHECK(dict.empty());

        dict.set("key", "first").set("other", false);
        dict.set("key", "second");

        CHECK(dict.size() == 2);
        CHECK(*dict.find("key")->as_string() == "second");
    }

    TEST_CASE("find does not fall back to other scopes") {
        Dictionary dict{{"outer", Dictionary{{"inner", "x"}}}};
        CHECK(dict.find("inner") == nullptr);
        CHECK_FALSE(dict.contains("missing"));
    }
}
