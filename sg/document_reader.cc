#include "document_reader.hh"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>

namespace schemagen::driver {

using json = nlohmann::json;

namespace {

    // ========================================================================
    // Shape checks
    // ========================================================================

    std::string at_index(const std::string& location, size_t index) {
        return location + "[" + std::to_string(index) + "]";
    }

    std::string at_key(const std::string& location, const std::string& key) {
        return location + "." + key;
    }

    const json& require(const json& object, const std::string& key, const std::string& location) {
        if (!object.is_object()) {
            throw document_format_error(location, "expected an object");
        }
        auto it = object.find(key);
        if (it == object.end()) {
            throw document_format_error(location, "missing key '" + key + "'");
        }
        return *it;
    }

    std::string require_string(const json& object, const std::string& key, const std::string& location) {
        const json& value = require(object, key, location);
        if (!value.is_string()) {
            throw document_format_error(at_key(location, key), "expected a string");
        }
        return value.get<std::string>();
    }

    std::optional<std::string> optional_string(const json& object, const std::string& key,
                                               const std::string& location) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw document_format_error(at_key(location, key), "expected a string");
        }
        return it->get<std::string>();
    }

    // Array under key, or an empty array when the key is absent
    const json& optional_array(const json& object, const std::string& key, const std::string& location) {
        static const json empty = json::array();
        auto it = object.find(key);
        if (it == object.end()) {
            return empty;
        }
        if (!it->is_array()) {
            throw document_format_error(at_key(location, key), "expected an array");
        }
        return *it;
    }

    int64_t require_integer(const json& value, const std::string& location) {
        if (value.is_number_unsigned()) {
            auto u = value.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw document_format_error(location, "integer out of range");
            }
            return static_cast<int64_t>(u);
        }
        if (!value.is_number_integer()) {
            throw document_format_error(location, "expected an integer");
        }
        return value.get<int64_t>();
    }

    // ========================================================================
    // Types
    // ========================================================================

    ast::type parse_type(const json& value, const std::string& location) {
        if (value.is_string()) {
            const auto name = value.get<std::string>();
            if (name == "void") return ast::type{ast::void_type{}};
            if (name == "bool") return ast::type{ast::bool_type{}};
            if (name == "byte") return ast::type{ast::byte_type{}};
            if (name == "i16") return ast::type{ast::i16_type{}};
            if (name == "i32") return ast::type{ast::i32_type{}};
            if (name == "i64") return ast::type{ast::i64_type{}};
            if (name == "double") return ast::type{ast::double_type{}};
            if (name == "string") return ast::type{ast::string_type{}};
            if (name == "binary") return ast::type{ast::binary_type{}};
            throw document_format_error(location, "unknown type '" + name + "'");
        }

        if (!value.is_object() || value.size() != 1) {
            throw document_format_error(location, "expected a type name or a one-key type object");
        }

        auto entry = value.begin();
        const std::string kind = entry.key();
        const json& body = entry.value();
        const std::string body_location = at_key(location, kind);

        if (kind == "list") {
            return ast::make_list(parse_type(body, body_location));
        }
        if (kind == "set") {
            return ast::make_set(parse_type(body, body_location));
        }
        if (kind == "map") {
            return ast::make_map(parse_type(require(body, "key", body_location), at_key(body_location, "key")),
                                 parse_type(require(body, "value", body_location), at_key(body_location, "value")));
        }
        if (kind == "enum" || kind == "struct" || kind == "ref") {
            if (!body.is_string()) {
                throw document_format_error(body_location, "expected a type name");
            }
            auto name = body.get<std::string>();
            if (kind == "enum") return ast::type{ast::enum_ref{name}};
            if (kind == "struct") return ast::type{ast::struct_ref{name}};
            return ast::type{ast::named_ref{name}};
        }

        throw document_format_error(location, "unknown type kind '" + kind + "'");
    }

    // ========================================================================
    // Constants
    // ========================================================================

    ast::constant parse_constant(const json& value, const std::string& location) {
        switch (value.type()) {
            case json::value_t::null:
                return ast::constant{ast::null_constant{}};

            case json::value_t::boolean:
                return ast::constant{ast::bool_constant{value.get<bool>()}};

            case json::value_t::number_integer:
            case json::value_t::number_unsigned:
                return ast::constant{ast::int_constant{require_integer(value, location)}};

            case json::value_t::number_float:
                return ast::constant{ast::double_constant{value.get<double>()}};

            case json::value_t::string:
                return ast::constant{ast::string_constant{value.get<std::string>()}};

            case json::value_t::array: {
                ast::list_constant list;
                for (size_t i = 0; i < value.size(); ++i) {
                    list.elems.push_back(parse_constant(value[i], at_index(location, i)));
                }
                return ast::constant{std::move(list)};
            }

            case json::value_t::object:
                break;

            default:
                throw document_format_error(location, "unsupported constant");
        }

        if (value.contains("map")) {
            const json& pairs = value.at("map");
            const std::string pairs_location = at_key(location, "map");
            if (!pairs.is_array()) {
                throw document_format_error(pairs_location, "expected an array of [key, value] pairs");
            }
            ast::map_constant map;
            for (size_t i = 0; i < pairs.size(); ++i) {
                const std::string pair_location = at_index(pairs_location, i);
                if (!pairs[i].is_array() || pairs[i].size() != 2) {
                    throw document_format_error(pair_location, "expected a [key, value] pair");
                }
                map.elems.push_back(ast::map_entry{
                    parse_constant(pairs[i][0], at_index(pair_location, 0)),
                    parse_constant(pairs[i][1], at_index(pair_location, 1))
                });
            }
            return ast::constant{std::move(map)};
        }

        if (value.contains("enum")) {
            return ast::constant{ast::enum_value_constant{
                require_string(value, "enum", location),
                require_string(value, "value", location)
            }};
        }

        if (value.contains("id")) {
            return ast::constant{ast::identifier_constant{require_string(value, "id", location)}};
        }

        throw document_format_error(location, "expected a map, enum value or identifier constant");
    }

    // ========================================================================
    // Definitions
    // ========================================================================

    ast::requiredness parse_requiredness(const json& object, const std::string& location) {
        auto text = optional_string(object, "requiredness", location);
        if (!text || *text == "default") return ast::requiredness::unspecified;
        if (*text == "required") return ast::requiredness::required;
        if (*text == "optional") return ast::requiredness::optional;
        throw document_format_error(at_key(location, "requiredness"),
                                    "expected 'required', 'optional' or 'default'");
    }

    std::vector<ast::field> parse_fields(const json& object, const std::string& key,
                                         const std::string& location) {
        std::vector<ast::field> fields;
        const json& items = optional_array(object, key, location);
        const std::string items_location = at_key(location, key);

        for (size_t i = 0; i < items.size(); ++i) {
            const json& item = items[i];
            const std::string field_location = at_index(items_location, i);

            ast::field f;
            int64_t id = require_integer(require(item, "id", field_location), at_key(field_location, "id"));
            if (id < std::numeric_limits<int32_t>::min() || id > std::numeric_limits<int32_t>::max()) {
                throw document_format_error(at_key(field_location, "id"), "field id out of range");
            }
            f.id = static_cast<int32_t>(id);
            f.name = require_string(item, "name", field_location);
            f.field_type = parse_type(require(item, "type", field_location), at_key(field_location, "type"));
            f.req = parse_requiredness(item, field_location);
            if (auto it = item.find("default"); it != item.end()) {
                f.default_value = parse_constant(*it, at_key(field_location, "default"));
            }
            f.docstring = optional_string(item, "doc", field_location);
            fields.push_back(std::move(f));
        }

        return fields;
    }

    ast::enum_def parse_enum(const json& item, const std::string& location) {
        ast::enum_def e;
        e.name = require_string(item, "name", location);
        e.docstring = optional_string(item, "doc", location);

        const json& values = optional_array(item, "values", location);
        for (size_t i = 0; i < values.size(); ++i) {
            const std::string value_location = at_index(at_key(location, "values"), i);
            ast::enum_value v;
            v.name = require_string(values[i], "name", value_location);
            v.value = require_integer(require(values[i], "value", value_location),
                                      at_key(value_location, "value"));
            v.docstring = optional_string(values[i], "doc", value_location);
            e.values.push_back(std::move(v));
        }
        return e;
    }

    ast::const_def parse_const(const json& item, const std::string& location) {
        ast::const_def c;
        c.name = require_string(item, "name", location);
        c.const_type = parse_type(require(item, "type", location), at_key(location, "type"));
        c.value = parse_constant(require(item, "value", location), at_key(location, "value"));
        return c;
    }

    ast::struct_def parse_struct(const json& item, const std::string& location) {
        ast::struct_def s;
        s.name = require_string(item, "name", location);

        auto kind = optional_string(item, "kind", location);
        if (!kind || *kind == "struct") {
            s.kind = ast::struct_kind::structure;
        } else if (*kind == "exception") {
            s.kind = ast::struct_kind::exception;
        } else {
            throw document_format_error(at_key(location, "kind"), "expected 'struct' or 'exception'");
        }

        s.fields = parse_fields(item, "fields", location);
        s.docstring = optional_string(item, "doc", location);
        return s;
    }

    ast::function_def parse_function(const json& item, const std::string& location) {
        ast::function_def fn;
        fn.name = require_string(item, "name", location);

        if (auto it = item.find("returns"); it != item.end()) {
            fn.return_type = parse_type(*it, at_key(location, "returns"));
        } else {
            fn.return_type = ast::type{ast::void_type{}};
        }

        fn.args = parse_fields(item, "args", location);
        fn.throws = parse_fields(item, "throws", location);

        if (auto it = item.find("oneway"); it != item.end()) {
            if (!it->is_boolean()) {
                throw document_format_error(at_key(location, "oneway"), "expected a boolean");
            }
            fn.oneway = it->get<bool>();
        }

        fn.docstring = optional_string(item, "doc", location);
        return fn;
    }

    ast::service_def parse_service(const json& item, const std::string& location) {
        ast::service_def s;
        s.name = require_string(item, "name", location);
        s.parent = optional_string(item, "extends", location);
        s.docstring = optional_string(item, "doc", location);

        const json& functions = optional_array(item, "functions", location);
        for (size_t i = 0; i < functions.size(); ++i) {
            s.functions.push_back(parse_function(functions[i], at_index(at_key(location, "functions"), i)));
        }
        return s;
    }

    template<typename Def, typename Parse>
    std::vector<Def> parse_list(const json& root, const std::string& key,
                                const std::string& location, Parse parse) {
        std::vector<Def> result;
        const json& items = optional_array(root, key, location);
        for (size_t i = 0; i < items.size(); ++i) {
            result.push_back(parse(items[i], at_index(at_key(location, key), i)));
        }
        return result;
    }

    ast::document parse_document_object(const json& root, const std::string& location,
                                        const std::string& default_name) {
        if (!root.is_object()) {
            throw document_format_error(location, "expected a document object");
        }

        ast::document doc;
        doc.name = optional_string(root, "name", location).value_or(default_name);

        const json& namespaces = optional_array(root, "namespaces", location);
        for (size_t i = 0; i < namespaces.size(); ++i) {
            const std::string ns_location = at_index(at_key(location, "namespaces"), i);
            doc.headers.push_back(ast::namespace_decl{
                require_string(namespaces[i], "scope", ns_location),
                require_string(namespaces[i], "name", ns_location)
            });
        }

        const json& includes = optional_array(root, "includes", location);
        for (size_t i = 0; i < includes.size(); ++i) {
            const std::string inc_location = at_index(at_key(location, "includes"), i);
            ast::include_decl inc;
            inc.path = require_string(includes[i], "path", inc_location);
            inc.included = std::make_shared<const ast::document>(
                parse_document_object(require(includes[i], "document", inc_location),
                                      at_key(inc_location, "document"),
                                      std::filesystem::path(inc.path).stem().string()));
            doc.headers.push_back(std::move(inc));
        }

        doc.consts = parse_list<ast::const_def>(root, "consts", location, parse_const);
        doc.enums = parse_list<ast::enum_def>(root, "enums", location, parse_enum);
        doc.structs = parse_list<ast::struct_def>(root, "structs", location, parse_struct);
        doc.services = parse_list<ast::service_def>(root, "services", location, parse_service);

        return doc;
    }

}  // namespace

ast::document parse_document(const std::string& json_text, const std::string& default_name) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw document_format_error("$", e.what());
    }

    return parse_document_object(root, "$", default_name);
}

ast::document read_document(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw std::runtime_error("Cannot open document: " + file.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed to read document: " + file.string());
    }

    return parse_document(buffer.str(), file.stem().string());
}

}  // namespace schemagen::driver
