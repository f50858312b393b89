//
// Schema documents in JSON interchange form
//
// The IDL parser runs outside sgc and hands over its validated output as
// JSON. This reader turns that JSON back into an ast::document.
//
//   {
//     "name": "user",
//     "namespaces": [{"scope": "scala", "name": "com.example"}],
//     "includes": [{"path": "common.thrift", "document": { ... }}],
//     "consts": [{"name": "MAX", "type": "i32", "value": 10}],
//     "enums": [{"name": "Color", "values": [{"name": "RED", "value": 1}]}],
//     "structs": [{"name": "User", "kind": "struct", "fields": [
//         {"id": 1, "name": "user_id", "type": "i64", "requiredness": "required"},
//         {"id": 2, "name": "tags", "type": {"list": "string"}, "requiredness": "optional"}
//     ]}],
//     "services": [{"name": "UserService", "extends": "Base", "functions": [
//         {"name": "get_user", "returns": {"struct": "User"},
//          "args": [...], "throws": [...], "oneway": false}
//     ]}]
//   }
//
// Types are either primitive names ("i32", "binary", ...) or one-key
// objects: {"list": T}, {"set": T}, {"map": {"key": K, "value": V}},
// {"enum": N}, {"struct": N}, {"ref": N}.
//
// Constants are JSON scalars and arrays, {"map": [[k, v], ...]},
// {"enum": E, "value": V} or {"id": N}.
//

#pragma once

#include <schemagen/ast.hh>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace schemagen::driver {

/**
 * Exception thrown for JSON that is not a valid schema document.
 *
 * location() is a path into the JSON text such as
 * "$.structs[0].fields[2].type".
 */
class document_format_error : public std::runtime_error {
public:
    document_format_error(const std::string& location, const std::string& message)
        : std::runtime_error(location + ": " + message),
          location_(location) {}

    [[nodiscard]] const std::string& location() const { return location_; }

private:
    std::string location_;
};

/**
 * Parse a document from JSON text.
 *
 * @param json_text Document in interchange form
 * @param default_name Document name used when the JSON has no "name"
 * @throws document_format_error for malformed JSON or unexpected shapes
 */
[[nodiscard]] ast::document parse_document(const std::string& json_text,
                                           const std::string& default_name = "generated");

/**
 * Read a document from a JSON file; the file stem names the document
 * unless the JSON carries a "name".
 *
 * @throws std::runtime_error if the file cannot be read
 * @throws document_format_error for malformed content
 */
[[nodiscard]] ast::document read_document(const std::filesystem::path& file);

}  // namespace schemagen::driver
