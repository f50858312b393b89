//
// Identifier normalization applied to documents before generation.
//

#pragma once

#include <schemagen/ast.hh>
#include <string>
#include <string_view>

namespace schemagen {

/**
 * Convert a snake_case identifier to camelCase.
 *
 * Every underscore followed by a lowercase ASCII letter or a digit is
 * removed and the following character upper-cased. Other underscores and
 * all remaining characters are kept as they are:
 *
 *   "foo_bar"     -> "fooBar"
 *   "field_2"     -> "field2"
 *   "_private"    -> "Private"
 *   "ALREADY_UP"  -> "ALREADY_UP"
 */
std::string to_camel_case(std::string_view name);

/**
 * Return a copy of the document with field, argument, exception and
 * function names converted by to_camel_case(). Type, enum, constant and
 * service names are untouched, as are the headers.
 */
ast::document camelize(const ast::document& doc);

}  // namespace schemagen
