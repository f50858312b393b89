//
// Template Fragment Implementation
//

#include <schemagen/codegen/template/fragment.hh>
#include <schemagen/codegen.hh>
#include <algorithm>
#include <string_view>

namespace schemagen::codegen {

namespace {

    // ========================================================================
    // Tokenizer
    // ========================================================================

    enum class TokenType {
        Text,
        Variable,
        SectionOpen,
        InvertedOpen,
        SectionClose,
        Partial,
        Comment
    };

    struct Token {
        TokenType type;
        std::string text;   // Raw text, or trimmed tag name
        size_t line;
        size_t trim_front = 0;
        size_t trim_back = 0;
    };

    constexpr const char* OPEN_DELIMITER = "{{";
    constexpr const char* CLOSE_DELIMITER = "}}";

    bool is_blank(char c) {
        return c == ' ' || c == '\t' || c == '\r';
    }

    std::string trim(const std::string& str) {
        size_t begin = 0;
        size_t end = str.size();
        while (begin < end && (is_blank(str[begin]) || str[begin] == '\n')) ++begin;
        while (end > begin && (is_blank(str[end - 1]) || str[end - 1] == '\n')) --end;
        return str.substr(begin, end - begin);
    }

    bool may_stand_alone(TokenType type) {
        return type != TokenType::Text && type != TokenType::Variable;
    }

    std::vector<Token> tokenize(const std::string& fragment_name, const std::string& source) {
        std::vector<Token> tokens;
        size_t pos = 0;
        size_t line = 1;

        while (pos < source.size()) {
            size_t open = source.find(OPEN_DELIMITER, pos);
            if (open == std::string::npos) {
                tokens.push_back({TokenType::Text, source.substr(pos), line});
                break;
            }

            if (open > pos) {
                std::string text = source.substr(pos, open - pos);
                tokens.push_back({TokenType::Text, text, line});
                line += static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
            }

            size_t close = source.find(CLOSE_DELIMITER, open + 2);
            if (close == std::string::npos) {
                throw template_error(fragment_name, "",
                    "unterminated tag at line " + std::to_string(line));
            }

            std::string content = source.substr(open + 2, close - open - 2);
            size_t tag_line = line;
            line += static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
            pos = close + 2;

            TokenType type = TokenType::Variable;
            std::string name = trim(content);
            if (!name.empty()) {
                switch (name[0]) {
                    case '#': type = TokenType::SectionOpen; break;
                    case '^': type = TokenType::InvertedOpen; break;
                    case '/': type = TokenType::SectionClose; break;
                    case '>': type = TokenType::Partial; break;
                    case '!': type = TokenType::Comment; break;
                    default: break;
                }
                if (type != TokenType::Variable) {
                    name = trim(name.substr(1));
                }
            }

            if (name.empty() && type != TokenType::Comment) {
                throw template_error(fragment_name, "",
                    "empty tag at line " + std::to_string(tag_line));
            }

            tokens.push_back({type, name, tag_line});
        }

        return tokens;
    }

    // ========================================================================
    // Standalone line detection
    // ========================================================================

    // A tag stands alone when the text before it on its line and the text
    // after it up to the newline are blank. Decisions use the original
    // text; trims are applied afterwards so adjacent standalone lines do
    // not hide each other.
    void mark_standalone_lines(std::vector<Token>& tokens) {
        struct Trim {
            size_t token;
            bool back;
            size_t amount;
        };
        std::vector<Trim> trims;

        for (size_t i = 0; i < tokens.size(); ++i) {
            if (!may_stand_alone(tokens[i].type)) {
                continue;
            }

            // Text before the tag on the same line
            size_t back_amount = 0;
            bool has_prev = i > 0;
            if (has_prev) {
                const Token& prev = tokens[i - 1];
                if (prev.type != TokenType::Text) {
                    continue;  // Another tag shares the line
                }
                size_t nl = prev.text.rfind('\n');
                if (nl == std::string::npos && i - 1 != 0) {
                    continue;  // Line started before the preceding tag
                }
                size_t line_start = (nl == std::string::npos) ? 0 : nl + 1;
                std::string_view before(prev.text);
                before = before.substr(line_start);
                if (!std::all_of(before.begin(), before.end(), is_blank)) {
                    continue;
                }
                back_amount = before.size();
            }

            // Text after the tag up to and including the newline
            size_t front_amount = 0;
            bool has_next = i + 1 < tokens.size();
            if (has_next) {
                const Token& next = tokens[i + 1];
                if (next.type != TokenType::Text) {
                    continue;
                }
                size_t nl = next.text.find('\n');
                if (nl == std::string::npos && i + 1 != tokens.size() - 1) {
                    continue;  // Line continues past the following tag
                }
                size_t line_end = (nl == std::string::npos) ? next.text.size() : nl;
                std::string_view after(next.text);
                after = after.substr(0, line_end);
                if (!std::all_of(after.begin(), after.end(), is_blank)) {
                    continue;
                }
                front_amount = (nl == std::string::npos) ? next.text.size() : nl + 1;
            }

            if (has_prev) {
                trims.push_back({i - 1, true, back_amount});
            }
            if (has_next) {
                trims.push_back({i + 1, false, front_amount});
            }
        }

        for (const auto& t : trims) {
            if (t.back) {
                tokens[t.token].trim_back = std::max(tokens[t.token].trim_back, t.amount);
            } else {
                tokens[t.token].trim_front = std::max(tokens[t.token].trim_front, t.amount);
            }
        }

        for (auto& token : tokens) {
            if (token.type != TokenType::Text) {
                continue;
            }
            size_t size = token.text.size();
            if (token.trim_front + token.trim_back >= size) {
                token.text.clear();
            } else {
                token.text = token.text.substr(token.trim_front, size - token.trim_front - token.trim_back);
            }
        }
    }

}  // namespace

// ============================================================================
// Fragment Compilation
// ============================================================================

Fragment::Fragment(std::string name, const std::string& source)
    : name_(std::move(name))
{
    std::vector<Token> tokens = tokenize(name_, source);
    mark_standalone_lines(tokens);

    // Open sections: the node and the list that receives nested nodes
    std::vector<Node*> open_sections;
    auto current_list = [&]() -> std::vector<Node>& {
        return open_sections.empty() ? nodes_ : open_sections.back()->children;
    };

    for (const auto& token : tokens) {
        switch (token.type) {
            case TokenType::Text:
                if (!token.text.empty()) {
                    current_list().push_back({Node::Type::Text, token.text, token.line, {}});
                }
                break;

            case TokenType::Comment:
                break;

            case TokenType::Variable:
                current_list().push_back({Node::Type::Variable, token.text, token.line, {}});
                break;

            case TokenType::Partial:
                current_list().push_back({Node::Type::Partial, token.text, token.line, {}});
                break;

            case TokenType::SectionOpen:
            case TokenType::InvertedOpen: {
                auto type = token.type == TokenType::SectionOpen ? Node::Type::Section
                                                                 : Node::Type::Inverted;
                auto& list = current_list();
                list.push_back({type, token.text, token.line, {}});
                open_sections.push_back(&list.back());
                break;
            }

            case TokenType::SectionClose:
                if (open_sections.empty()) {
                    throw template_error(name_, token.text,
                        "closing tag without open section at line " + std::to_string(token.line));
                }
                if (open_sections.back()->text != token.text) {
                    throw template_error(name_, token.text,
                        "closing tag does not match section '" + open_sections.back()->text +
                        "' opened at line " + std::to_string(open_sections.back()->line));
                }
                open_sections.pop_back();
                break;
        }
    }

    if (!open_sections.empty()) {
        throw template_error(name_, open_sections.back()->text,
            "section opened at line " + std::to_string(open_sections.back()->line) +
            " is never closed");
    }
}

// ============================================================================
// Rendering
// ============================================================================

std::string Fragment::render(const Dictionary& dict) const {
    std::string out;
    ScopeChain scopes{&dict};
    render_nodes(nodes_, scopes, 0, out);
    return out;
}

void Fragment::render_nodes(const std::vector<Node>& nodes,
                            ScopeChain& scopes,
                            int depth,
                            std::string& out) const {
    for (const auto& node : nodes) {
        switch (node.type) {
            case Node::Type::Text:
                out += node.text;
                break;

            case Node::Type::Variable: {
                const Value& value = lookup(node, scopes);
                const std::string* text = value.as_string();
                if (!text) {
                    fail(node, std::string("expected a string, found a ") + value.kind_name());
                }
                out += *text;
                break;
            }

            case Node::Type::Section: {
                const Value& value = lookup(node, scopes);
                if (const auto* items = value.as_list()) {
                    for (const auto& item : *items) {
                        scopes.push_back(&item);
                        render_nodes(node.children, scopes, depth, out);
                        scopes.pop_back();
                    }
                } else if (const bool* flag = value.as_bool()) {
                    if (*flag) {
                        render_nodes(node.children, scopes, depth, out);
                    }
                } else if (const auto* nested = value.as_dictionary()) {
                    scopes.push_back(nested);
                    render_nodes(node.children, scopes, depth, out);
                    scopes.pop_back();
                } else {
                    fail(node, std::string("cannot open a section on a ") + value.kind_name());
                }
                break;
            }

            case Node::Type::Inverted: {
                const Value& value = lookup(node, scopes);
                bool render_body = false;
                if (const auto* items = value.as_list()) {
                    render_body = items->empty();
                } else if (const bool* flag = value.as_bool()) {
                    render_body = !*flag;
                } else if (value.as_dictionary() == nullptr) {
                    fail(node, std::string("cannot invert a ") + value.kind_name());
                }
                if (render_body) {
                    render_nodes(node.children, scopes, depth, out);
                }
                break;
            }

            case Node::Type::Partial: {
                const Value& value = lookup(node, scopes);
                const Fragment* partial = value.as_partial();
                if (!partial) {
                    fail(node, std::string("expected a partial, found a ") + value.kind_name());
                }
                if (depth >= max_partial_depth) {
                    fail(node, "partials nested deeper than " + std::to_string(max_partial_depth));
                }
                partial->render_nodes(partial->nodes_, scopes, depth + 1, out);
                break;
            }
        }
    }
}

const Value& Fragment::lookup(const Node& node, const ScopeChain& scopes) const {
    const std::string& key = node.text;
    size_t dot = key.find('.');
    std::string head = key.substr(0, dot);

    const Value* value = nullptr;
    for (auto it = scopes.rbegin(); it != scopes.rend() && !value; ++it) {
        value = (*it)->find(head);
    }
    if (!value) {
        fail(node, "undefined key");
    }

    while (dot != std::string::npos) {
        size_t next = key.find('.', dot + 1);
        std::string segment = key.substr(dot + 1, next == std::string::npos ? std::string::npos : next - dot - 1);
        const Dictionary* nested = value->as_dictionary();
        if (!nested) {
            fail(node, "'" + segment + "' looked up in a " + value->kind_name());
        }
        value = nested->find(segment);
        if (!value) {
            fail(node, "undefined key '" + segment + "'");
        }
        dot = next;
    }

    return *value;
}

void Fragment::fail(const Node& node, const std::string& message) const {
    throw template_error(name_, node.text, message + " (line " + std::to_string(node.line) + ")");
}

}  // namespace schemagen::codegen
