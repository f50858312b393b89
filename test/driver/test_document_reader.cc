//
// Tests for the JSON document reader
//

#include <doctest/doctest.h>
#include "document_reader.hh"
#include <filesystem>
#include <fstream>

using namespace schemagen;
using namespace schemagen::driver;

TEST_SUITE("Driver - Document Reader") {

    TEST_CASE("Minimal document") {
        auto doc = parse_document("{}");
        CHECK(doc.name == "generated");
        CHECK(doc.headers.empty());
        CHECK(doc.structs.empty());

        CHECK(parse_document("{}", "user").name == "user");
        CHECK(parse_document(R"({"name": "explicit"})", "user").name == "explicit");
    }

    TEST_CASE("Namespaces and includes become headers in order") {
        auto doc = parse_document(R"({
            "namespaces": [{"scope": "scala", "name": "com.example"}],
            "includes": [{"path": "idl/common.thrift",
                          "document": {"namespaces": [{"scope": "java", "name": "com.common"}]}}]
        })");

        REQUIRE(doc.headers.size() == 2);

        auto* ns = std::get_if<ast::namespace_decl>(&doc.headers[0]);
        REQUIRE(ns != nullptr);
        CHECK(ns->scope == "scala");
        CHECK(ns->name == "com.example");

        auto* inc = std::get_if<ast::include_decl>(&doc.headers[1]);
        REQUIRE(inc != nullptr);
        CHECK(inc->path == "idl/common.thrift");
        REQUIRE(inc->included != nullptr);
        CHECK(inc->included->name == "common");
        REQUIRE(inc->included->headers.size() == 1);
        auto* included_ns = std::get_if<ast::namespace_decl>(&inc->included->headers[0]);
        REQUIRE(included_ns != nullptr);
        CHECK(included_ns->scope == "java");
        CHECK(included_ns->name == "com.common");
    }

    TEST_CASE("Structs and fields") {
        auto doc = parse_document(R"({
            "structs": [{
                "name": "User",
                "doc": "A user",
                "fields": [
                    {"id": 1, "name": "user_id", "type": "i64", "requiredness": "required"},
                    {"id": 2, "name": "tags", "type": {"list": "string"}, "requiredness": "optional"},
                    {"id": 3, "name": "scores", "type": {"map": {"key": "string", "value": {"set": "double"}}}},
                    {"id": 4, "name": "color", "type": {"enum": "Color"}, "default": {"enum": "Color", "value": "RED"}},
                    {"id": 5, "name": "friend", "type": {"struct": "User"}, "requiredness": "default"},
                    {"id": 6, "name": "alias", "type": {"ref": "Alias"}, "doc": "aliased"}
                ]
            }, {
                "name": "Oops",
                "kind": "exception"
            }]
        })");

        REQUIRE(doc.structs.size() == 2);
        const auto& user = doc.structs[0];
        CHECK(user.name == "User");
        CHECK(user.kind == ast::struct_kind::structure);
        CHECK(user.docstring == std::optional<std::string>("A user"));
        REQUIRE(user.fields.size() == 6);

        CHECK(user.fields[0].id == 1);
        CHECK(user.fields[0].name == "user_id");
        CHECK(std::holds_alternative<ast::i64_type>(user.fields[0].field_type.node));
        CHECK(user.fields[0].req == ast::requiredness::required);

        const auto* list = std::get_if<ast::list_type>(&user.fields[1].field_type.node);
        REQUIRE(list != nullptr);
        CHECK(std::holds_alternative<ast::string_type>(list->element_type->node));
        CHECK(user.fields[1].is_optional());

        const auto* map = std::get_if<ast::map_type>(&user.fields[2].field_type.node);
        REQUIRE(map != nullptr);
        CHECK(std::holds_alternative<ast::string_type>(map->key_type->node));
        CHECK(std::holds_alternative<ast::set_type>(map->value_type->node));
        CHECK(user.fields[2].req == ast::requiredness::unspecified);

        REQUIRE(user.fields[3].default_value.has_value());
        const auto* color = std::get_if<ast::enum_value_constant>(&user.fields[3].default_value->node);
        REQUIRE(color != nullptr);
        CHECK(color->enum_name == "Color");
        CHECK(color->value_name == "RED");

        CHECK(std::holds_alternative<ast::struct_ref>(user.fields[4].field_type.node));
        CHECK(user.fields[4].req == ast::requiredness::unspecified);
        CHECK(std::holds_alternative<ast::named_ref>(user.fields[5].field_type.node));
        CHECK(user.fields[5].docstring == std::optional<std::string>("aliased"));

        CHECK(doc.structs[1].kind == ast::struct_kind::exception);
        CHECK(doc.structs[1].fields.empty());
    }

    TEST_CASE("Enums keep declaration order") {
        auto doc = parse_document(R"({
            "enums": [{"name": "Color", "values": [
                {"name": "RED", "value": 3},
                {"name": "GREEN", "value": -1, "doc": "negative"},
                {"name": "BLUE", "value": 2}
            ]}]
        })");

        REQUIRE(doc.enums.size() == 1);
        const auto& values = doc.enums[0].values;
        REQUIRE(values.size() == 3);
        CHECK(values[0].name == "RED");
        CHECK(values[0].value == 3);
        CHECK(values[1].value == -1);
        CHECK(values[1].docstring == std::optional<std::string>("negative"));
        CHECK(values[2].name == "BLUE");
    }

    TEST_CASE("Constants of every kind") {
        auto doc = parse_document(R"({
            "consts": [
                {"name": "NOTHING", "type": "string", "value": null},
                {"name": "FLAG", "type": "bool", "value": true},
                {"name": "BIG", "type": "i64", "value": 9223372036854775807},
                {"name": "NEG", "type": "i32", "value": -5},
                {"name": "PI", "type": "double", "value": 3.5},
                {"name": "GREETING", "type": "string", "value": "hi"},
                {"name": "LIST", "type": {"list": "i32"}, "value": [1, 2]},
                {"name": "MAP", "type": {"map": {"key": "string", "value": "i32"}}, "value": {"map": [["b", 2], ["a", 1]]}},
                {"name": "ALIAS", "type": "i32", "value": {"id": "NEG"}}
            ]
        })");

        REQUIRE(doc.consts.size() == 9);
        CHECK(std::holds_alternative<ast::null_constant>(doc.consts[0].value.node));
        CHECK(std::get<ast::bool_constant>(doc.consts[1].value.node).value);
        CHECK(std::get<ast::int_constant>(doc.consts[2].value.node).value == INT64_MAX);
        CHECK(std::get<ast::int_constant>(doc.consts[3].value.node).value == -5);
        CHECK(std::get<ast::double_constant>(doc.consts[4].value.node).value == doctest::Approx(3.5));
        CHECK(std::get<ast::string_constant>(doc.consts[5].value.node).value == "hi");
        CHECK(std::get<ast::list_constant>(doc.consts[6].value.node).elems.size() == 2);

        const auto& map = std::get<ast::map_constant>(doc.consts[7].value.node);
        REQUIRE(map.elems.size() == 2);
        CHECK(std::get<ast::string_constant>(map.elems[0].key.node).value == "b");
        CHECK(std::get<ast::int_constant>(map.elems[1].value.node).value == 1);

        CHECK(std::get<ast::identifier_constant>(doc.consts[8].value.node).name == "NEG");
    }

    TEST_CASE("Services and functions") {
        auto doc = parse_document(R"({
            "services": [{
                "name": "UserService",
                "extends": "Base",
                "functions": [
                    {"name": "get_user", "returns": {"struct": "User"},
                     "args": [{"id": 1, "name": "id", "type": "i64"}],
                     "throws": [{"id": 1, "name": "oops", "type": {"struct": "Oops"}}]},
                    {"name": "fire", "oneway": true}
                ]
            }, {
                "name": "Standalone"
            }]
        })");

        REQUIRE(doc.services.size() == 2);
        const auto& svc = doc.services[0];
        CHECK(svc.parent == std::optional<std::string>("Base"));
        REQUIRE(svc.functions.size() == 2);

        CHECK(std::holds_alternative<ast::struct_ref>(svc.functions[0].return_type.node));
        CHECK(svc.functions[0].args.size() == 1);
        CHECK(svc.functions[0].throws.size() == 1);
        CHECK_FALSE(svc.functions[0].oneway);

        CHECK(std::holds_alternative<ast::void_type>(svc.functions[1].return_type.node));
        CHECK(svc.functions[1].oneway);

        CHECK_FALSE(doc.services[1].parent.has_value());
    }

    TEST_CASE("Errors carry the location") {
        auto location_of = [](const std::string& text) -> std::string {
            try {
                (void)parse_document(text);
            } catch (const document_format_error& e) {
                return e.location();
            }
            return "no error";
        };

        CHECK(location_of("{not json") == "$");
        CHECK(location_of("[]") == "$");
        CHECK(location_of(R"({"structs": {}})") == "$.structs");
        CHECK(location_of(R"({"structs": [{"fields": []}]})") == "$.structs[0]");
        CHECK(location_of(R"({"structs": [{"name": "S", "fields": [
                {"id": 1, "name": "a", "type": "i32"},
                {"id": 2, "name": "b", "type": "i128"}]}]})") == "$.structs[0].fields[1].type");
        CHECK(location_of(R"({"structs": [{"name": "S", "kind": "union"}]})") == "$.structs[0].kind");
        CHECK(location_of(R"({"structs": [{"name": "S", "fields": [
                {"id": 1, "name": "a", "type": "i32", "requiredness": "maybe"}]}]})")
              == "$.structs[0].fields[0].requiredness");
        CHECK(location_of(R"({"structs": [{"name": "S", "fields": [
                {"id": 4294967296, "name": "a", "type": "i32"}]}]})") == "$.structs[0].fields[0].id");
        CHECK(location_of(R"({"consts": [{"name": "C", "type": "i64",
                "value": 18446744073709551615}]})") == "$.consts[0].value");
        CHECK(location_of(R"({"consts": [{"name": "C", "type": {"map": {"key": "i32"}}, "value": 1}]})")
              == "$.consts[0].type.map");
        CHECK(location_of(R"({"consts": [{"name": "C", "type": {"list": "i32", "set": "i32"}, "value": 1}]})")
              == "$.consts[0].type");
        CHECK(location_of(R"({"consts": [{"name": "C", "type": "i32", "value": {"map": [[1]]}}]})")
              == "$.consts[0].value.map[0]");
        CHECK(location_of(R"({"services": [{"name": "S", "functions": [{"name": "f", "oneway": "yes"}]}]})")
              == "$.services[0].functions[0].oneway");
        CHECK(location_of(R"({"includes": [{"path": "x.thrift", "document": {"name": 3}}]})")
              == "$.includes[0].document.name");
    }

    TEST_CASE("Reading from a file") {
        auto dir = std::filesystem::temp_directory_path() / "schemagen_document_reader_test";
        std::filesystem::create_directories(dir);
        auto file = dir / "accounts.json";
        {
            std::ofstream out(file);
            out << R"({"structs": [{"name": "Account"}]})";
        }

        auto doc = read_document(file);
        CHECK(doc.name == "accounts");
        REQUIRE(doc.structs.size() == 1);
        CHECK(doc.structs[0].name == "Account");

        std::filesystem::remove_all(dir);

        CHECK_THROWS_AS((void)read_document(dir / "missing.json"), std::runtime_error);
    }
}
