//
// Template Fragment - a compiled piece of template text
//
// Supported tags:
//
//   {{key}}            substitute a string value (verbatim, no escaping)
//   {{#key}}..{{/key}} section: once per item of a list, once for true or a
//                      nested dictionary, never for false or an empty list
//   {{^key}}..{{/key}} inverted section: once for false or an empty list
//   {{>key}}           render the partial stored under key in the current scope
//   {{! comment }}     ignored
//
// Keys are resolved innermost scope first, falling back to enclosing
// scopes. Dotted keys ("a.b") resolve "a" that way and then descend into
// nested dictionaries. A line holding nothing but a section, inverted,
// close, comment or partial tag is dropped from the output.
//

#pragma once

#include <schemagen/codegen/template/dictionary.hh>
#include <string>
#include <vector>

namespace schemagen::codegen {

class Fragment {
public:
    /// Compile template text
    /// @param name Fragment name reported in errors
    /// @param source Template text
    /// @throws template_error on unbalanced sections or unterminated tags
    Fragment(std::string name, const std::string& source);

    [[nodiscard]] const std::string& name() const { return name_; }

    /// Render the fragment against a dictionary
    /// @throws template_error for undefined keys or values of the wrong shape
    [[nodiscard]] std::string render(const Dictionary& dict) const;

    /// Maximum nesting of partial inclusions
    static constexpr int max_partial_depth = 64;

private:
    struct Node {
        enum class Type {
            Text,
            Variable,
            Section,
            Inverted,
            Partial
        };

        Type type = Type::Text;
        std::string text;          // Literal text, or the key for tags
        size_t line = 0;           // Source line of the tag
        std::vector<Node> children;
    };

    using ScopeChain = std::vector<const Dictionary*>;

    void render_nodes(const std::vector<Node>& nodes,
                      ScopeChain& scopes,
                      int depth,
                      std::string& out) const;

    const Value& lookup(const Node& node, const ScopeChain& scopes) const;

    [[noreturn]] void fail(const Node& node, const std::string& message) const;

    std::string name_;
    std::vector<Node> nodes_;
};

}  // namespace schemagen::codegen
