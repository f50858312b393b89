//
// Scala Constant Rendering
//

#pragma once

#include <schemagen/ast.hh>
#include <string>

namespace schemagen::codegen {

/**
 * Render a constant value as a Scala literal.
 *
 * Each constant kind describes its own rendering; no type information is
 * consulted:
 * - null               -> null
 * - "a\"b"             -> "a\"b" (escaped, quoted)
 * - 42, 3000000000     -> 42, 3000000000L
 * - 2.5, 1.0           -> 2.5, 1.0
 * - [1, 2]             -> List(1, 2)
 * - {"a": 1}           -> Map("a" -> 1)
 * - Color.RED          -> Color.RED
 * - SOME_CONSTANT      -> SOME_CONSTANT
 *
 * Identifiers are emitted verbatim; collisions with Scala keywords are not
 * escaped.
 */
[[nodiscard]] std::string render_constant(const ast::constant& c);

/// Shortest decimal text that reads back as the same double, always
/// carrying a fraction or exponent so Scala reads it as a Double
[[nodiscard]] std::string format_double_literal(double value);

}  // namespace schemagen::codegen
