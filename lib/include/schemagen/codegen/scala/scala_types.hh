//
// Scala Type Mapping
//
// Pure functions translating schema types into Scala type expressions,
// wire tags, protocol method names and zero values.
//

#pragma once

#include <schemagen/ast.hh>
#include <string>

namespace schemagen::codegen {

/// Wire-level type tags (TType constants of the runtime protocol)
enum class wire_tag {
    void_,
    bool_,
    byte_,
    double_,
    i16,
    i32,
    i64,
    string,
    struct_,
    map,
    set,
    list
};

/// Name of the tag as used by the runtime ("I32", "STRING", ...)
[[nodiscard]] const char* to_string(wire_tag tag);

/// Scala type expression: i32 -> "Int", list<string> -> "Seq[String]"
[[nodiscard]] std::string scala_type(const ast::type& t);

/**
 * Wire tag a value of the type is transmitted with.
 *
 * Binary is tagged STRING and enums are tagged I32.
 *
 * @throws internal_error for unclassified named references
 */
[[nodiscard]] wire_tag get_wire_tag(const ast::type& t);

/// @throws internal_error unless t is a primitive scalar type
[[nodiscard]] std::string protocol_read_method(const ast::type& t);

/// @throws internal_error unless t is a primitive scalar type
[[nodiscard]] std::string protocol_write_method(const ast::type& t);

/// Zero value of a primitive: "false", "0", "0.0", or "null" for string/binary
/// @throws internal_error unless t is a primitive scalar type
[[nodiscard]] std::string zero_value(const ast::type& t);

/// Schema spelling of a type, for diagnostics: "map<string, list<i32>>"
[[nodiscard]] std::string describe_type(const ast::type& t);

}  // namespace schemagen::codegen
