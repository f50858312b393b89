//
// Scala Field Descriptors
//
// Per-field type, default and parameter-list fragments shared by struct and
// service generation, plus the wire read/write expressions used by the
// generated codecs.
//

#pragma once

#include <schemagen/ast.hh>
#include <optional>
#include <string>
#include <vector>

namespace schemagen::codegen {

/// Declared Scala type: Option[T] for optional fields, T otherwise
[[nodiscard]] std::string scala_field_type(const ast::field& f);

/**
 * Default value expression at the declaration site.
 *
 * 1. Explicit default, rendered as a constant (in Some(...) when optional)
 * 2. "None" for optional fields without a default
 * 3. nullopt: the value must be supplied
 */
[[nodiscard]] std::optional<std::string> default_field_value(const ast::field& f);

/// "`a`: Int, `b`: Option[String] = None"
[[nodiscard]] std::string field_args(const std::vector<ast::field>& fields);

/// Backquoted field names, comma-separated in declaration order:
/// "`a`, `b`"
[[nodiscard]] std::string field_names(const std::vector<ast::field>& fields);

/**
 * Value a decoder starts from when the field is absent on the wire.
 *
 * Optional fields start as None; bool, integer and double fields as their
 * zero value; everything else as null. Explicit defaults are ignored.
 */
[[nodiscard]] std::string default_read_value(const ast::field& f);

/// Name of the TField constant of a field: "name" -> "NAME_FIELD_DESC"
[[nodiscard]] std::string write_field_const(const std::string& name);

/// Expression reading a value of the type from _iprot
/// @throws internal_error for void and unclassified references
[[nodiscard]] std::string read_value_expr(const ast::type& t, int depth = 0);

/// Statement writing value (a Scala expression) of the type to _oprot
/// @throws internal_error for void and unclassified references
[[nodiscard]] std::string write_value_stmt(const ast::type& t, const std::string& value, int depth = 0);

}  // namespace schemagen::codegen
