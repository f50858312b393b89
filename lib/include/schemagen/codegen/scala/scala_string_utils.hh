//
// Scala String Utilities for Code Generation
//
// Provides string formatting utilities for generating valid Scala code:
// - String literal escaping
// - Quoting
//

#pragma once

#include <cstdio>
#include <string>

namespace schemagen::codegen {

/**
 * Escape special characters in a string for use in Scala string literals.
 *
 * Handles: newlines (\n), carriage returns (\r), tabs (\t), backspace (\b),
 * form feed (\f), backslashes (\\) and double quotes (\"). Any other
 * control character becomes a \uXXXX escape. Bytes >= 0x80 are copied so
 * UTF-8 text survives unchanged.
 *
 * @param str The raw string to escape
 * @return The escaped string safe for use in Scala string literals
 */
inline std::string escape_scala_string_literal(const std::string& str) {
    std::string result;
    result.reserve(str.size() + str.size() / 4);  // Reserve extra for escapes

    for (char c : str) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            default: {
                auto uc = static_cast<unsigned char>(c);
                if (uc < 0x20 || uc == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(uc));
                    result += buf;
                } else {
                    result += c;
                }
                break;
            }
        }
    }

    return result;
}

/// Wrap an escaped string in double quotes
inline std::string quote_scala_string(const std::string& str) {
    return "\"" + escape_scala_string_literal(str) + "\"";
}

}  // namespace schemagen::codegen
