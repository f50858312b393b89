//
// Schema AST consumed by the code generators.
//
// Documents arrive here already parsed and validated. Everything in this
// header is treated as immutable by the generators.
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemagen::ast {

    // -----------------------------
    // Schema types
    // -----------------------------
    struct void_type {};
    struct bool_type {};
    struct byte_type {};
    struct i16_type {};
    struct i32_type {};
    struct i64_type {};
    struct double_type {};
    struct string_type {};
    struct binary_type {};

    // Forward declaration for recursive container types
    struct type;
    using type_ptr = std::shared_ptr<const type>;

    struct list_type {
        type_ptr element_type;
    };

    struct set_type {
        type_ptr element_type;
    };

    struct map_type {
        type_ptr key_type;
        type_ptr value_type;
    };

    // References to user-defined entities, by name
    struct enum_ref {
        std::string name;
    };

    struct struct_ref {
        std::string name;
    };

    // Reference the parser could not classify as enum or struct
    struct named_ref {
        std::string name;
    };

    using type_node = std::variant <
        void_type,
        bool_type,
        byte_type,
        i16_type,
        i32_type,
        i64_type,
        double_type,
        string_type,
        binary_type,
        list_type,
        set_type,
        map_type,
        enum_ref,
        struct_ref,
        named_ref
    >;

    struct type {
        type_node node;
    };

    // Helpers for building container types
    type make_list(type element);
    type make_set(type element);
    type make_map(type key, type value);

    /// True for bool, byte, i16, i32, i64, double, string and binary
    [[nodiscard]] bool is_primitive(const type& t);

    [[nodiscard]] bool is_container(const type& t);

    // -----------------------------
    // Constant values
    // -----------------------------
    struct null_constant {};

    struct bool_constant {
        bool value;
    };

    struct int_constant {
        int64_t value;
    };

    struct double_constant {
        double value;
    };

    struct string_constant {
        std::string value;
    };

    // Forward declarations for recursive constants
    struct constant;
    struct map_entry;

    struct list_constant {
        std::vector<constant> elems;
    };

    struct map_constant {
        std::vector<map_entry> elems;
    };

    struct enum_value_constant {
        std::string enum_name;
        std::string value_name;
    };

    struct identifier_constant {
        std::string name;
    };

    using constant_node = std::variant <
        null_constant,
        bool_constant,
        int_constant,
        double_constant,
        string_constant,
        list_constant,
        map_constant,
        enum_value_constant,
        identifier_constant
    >;

    struct constant {
        constant_node node;
    };

    struct map_entry {
        constant key;
        constant value;
    };

    // -----------------------------
    // Definitions
    // -----------------------------
    enum class requiredness {
        required,
        optional,
        unspecified  // default requiredness
    };

    struct field {
        int32_t id = 0;
        std::string name;
        type field_type;
        requiredness req = requiredness::unspecified;
        std::optional<constant> default_value;
        std::optional<std::string> docstring;

        [[nodiscard]] bool is_optional() const { return req == requiredness::optional; }
    };

    struct enum_value {
        std::string name;
        int64_t value = 0;
        std::optional<std::string> docstring;
    };

    struct enum_def {
        std::string name;
        std::vector<enum_value> values;  // declaration order is output order
        std::optional<std::string> docstring;
    };

    struct const_def {
        std::string name;
        type const_type;
        constant value;
    };

    enum class struct_kind {
        structure,
        exception
    };

    struct struct_def {
        std::string name;
        struct_kind kind = struct_kind::structure;
        std::vector<field> fields;
        std::optional<std::string> docstring;
    };

    struct function_def {
        std::string name;
        type return_type;
        std::vector<field> args;
        std::vector<field> throws;
        bool oneway = false;
        std::optional<std::string> docstring;
    };

    struct service_def {
        std::string name;
        std::optional<std::string> parent;  // Name of the extended service
        std::vector<function_def> functions;
        std::optional<std::string> docstring;
    };

    // -----------------------------
    // Headers
    // -----------------------------
    struct document;

    struct include_decl {
        std::string path;
        std::shared_ptr<const document> included;  // Resolved by the parser
    };

    struct namespace_decl {
        std::string scope;  // "scala", "java", "*", ...
        std::string name;   // e.g. "com.example.thrift"
    };

    using header = std::variant<include_decl, namespace_decl>;

    struct document {
        std::string name = "generated";  // Stem of the schema source
        std::vector<header> headers;
        std::vector<const_def> consts;
        std::vector<enum_def> enums;
        std::vector<struct_def> structs;
        std::vector<service_def> services;
    };
}
