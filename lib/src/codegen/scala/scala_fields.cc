#include <schemagen/codegen/scala/scala_fields.hh>
#include <schemagen/codegen/scala/scala_constants.hh>
#include <schemagen/codegen/scala/scala_types.hh>
#include <schemagen/codegen.hh>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <variant>

namespace schemagen::codegen {

namespace {

    std::string tag_of(const ast::type& t) {
        return std::string("TType.") + to_string(get_wire_tag(t));
    }

    // ========================================================================
    // Read expressions
    // ========================================================================

    struct read_visitor {
        const ast::type& type;
        int depth;

        std::string primitive() const {
            return "_iprot." + protocol_read_method(type) + "()";
        }

        std::string operator()(const ast::bool_type&) const { return primitive(); }
        std::string operator()(const ast::byte_type&) const { return primitive(); }
        std::string operator()(const ast::i16_type&) const { return primitive(); }
        std::string operator()(const ast::i32_type&) const { return primitive(); }
        std::string operator()(const ast::i64_type&) const { return primitive(); }
        std::string operator()(const ast::double_type&) const { return primitive(); }
        std::string operator()(const ast::string_type&) const { return primitive(); }
        std::string operator()(const ast::binary_type&) const { return primitive(); }

        std::string operator()(const ast::void_type&) const {
            throw internal_error("read_value_expr", "cannot read a value of type void");
        }

        std::string operator()(const ast::list_type& l) const {
            std::string d = std::to_string(depth);
            return "{ val _list" + d + " = _iprot.readListBegin(); "
                   "val _rv" + d + " = (0 until _list" + d + ".size).map { _ => " +
                   read_value_expr(*l.element_type, depth + 1) + " }.toList; "
                   "_iprot.readListEnd(); _rv" + d + " }";
        }

        std::string operator()(const ast::set_type& s) const {
            std::string d = std::to_string(depth);
            return "{ val _set" + d + " = _iprot.readSetBegin(); "
                   "val _rv" + d + " = (0 until _set" + d + ".size).map { _ => " +
                   read_value_expr(*s.element_type, depth + 1) + " }.toSet; "
                   "_iprot.readSetEnd(); _rv" + d + " }";
        }

        std::string operator()(const ast::map_type& m) const {
            std::string d = std::to_string(depth);
            return "{ val _map" + d + " = _iprot.readMapBegin(); "
                   "val _rv" + d + " = (0 until _map" + d + ".size).map { _ => (" +
                   read_value_expr(*m.key_type, depth + 1) + ", " +
                   read_value_expr(*m.value_type, depth + 1) + ") }.toMap; "
                   "_iprot.readMapEnd(); _rv" + d + " }";
        }

        std::string operator()(const ast::enum_ref& r) const {
            return r.name + "(_iprot.readI32())";
        }

        std::string operator()(const ast::struct_ref& r) const {
            return r.name + ".decode(_iprot)";
        }

        std::string operator()(const ast::named_ref& r) const {
            throw internal_error("read_value_expr", "unresolved type reference " + r.name);
        }
    };

    // ========================================================================
    // Write statements
    // ========================================================================

    struct write_visitor {
        const ast::type& type;
        const std::string& value;
        int depth;

        std::string primitive() const {
            return "_oprot." + protocol_write_method(type) + "(" + value + ")";
        }

        std::string operator()(const ast::bool_type&) const { return primitive(); }
        std::string operator()(const ast::byte_type&) const { return primitive(); }
        std::string operator()(const ast::i16_type&) const { return primitive(); }
        std::string operator()(const ast::i32_type&) const { return primitive(); }
        std::string operator()(const ast::i64_type&) const { return primitive(); }
        std::string operator()(const ast::double_type&) const { return primitive(); }
        std::string operator()(const ast::string_type&) const { return primitive(); }
        std::string operator()(const ast::binary_type&) const { return primitive(); }

        std::string operator()(const ast::void_type&) const {
            throw internal_error("write_value_stmt", "cannot write a value of type void");
        }

        std::string operator()(const ast::list_type& l) const {
            std::string elem = "_e" + std::to_string(depth);
            return "_oprot.writeListBegin(new TList(" + tag_of(*l.element_type) + ", " + value + ".size)); " +
                   value + ".foreach { " + elem + " => " +
                   write_value_stmt(*l.element_type, elem, depth + 1) + " }; "
                   "_oprot.writeListEnd()";
        }

        std::string operator()(const ast::set_type& s) const {
            std::string elem = "_e" + std::to_string(depth);
            return "_oprot.writeSetBegin(new TSet(" + tag_of(*s.element_type) + ", " + value + ".size)); " +
                   value + ".foreach { " + elem + " => " +
                   write_value_stmt(*s.element_type, elem, depth + 1) + " }; "
                   "_oprot.writeSetEnd()";
        }

        std::string operator()(const ast::map_type& m) const {
            std::string d = std::to_string(depth);
            std::string key = "_k" + d;
            std::string val = "_v" + d;
            return "_oprot.writeMapBegin(new TMap(" + tag_of(*m.key_type) + ", " +
                   tag_of(*m.value_type) + ", " + value + ".size)); " +
                   value + ".foreach { case (" + key + ", " + val + ") => " +
                   write_value_stmt(*m.key_type, key, depth + 1) + "; " +
                   write_value_stmt(*m.value_type, val, depth + 1) + " }; "
                   "_oprot.writeMapEnd()";
        }

        std::string operator()(const ast::enum_ref&) const {
            return "_oprot.writeI32(" + value + ".value)";
        }

        std::string operator()(const ast::struct_ref&) const {
            return value + ".write(_oprot)";
        }

        std::string operator()(const ast::named_ref& r) const {
            throw internal_error("write_value_stmt", "unresolved type reference " + r.name);
        }
    };

}  // namespace

std::string scala_field_type(const ast::field& f) {
    if (f.is_optional()) {
        return "Option[" + scala_type(f.field_type) + "]";
    }
    return scala_type(f.field_type);
}

std::optional<std::string> default_field_value(const ast::field& f) {
    if (f.default_value) {
        std::string value = render_constant(*f.default_value);
        return f.is_optional() ? "Some(" + value + ")" : value;
    }
    if (f.is_optional()) {
        return std::string("None");
    }
    return std::nullopt;
}

std::string field_args(const std::vector<ast::field>& fields) {
    std::ostringstream oss;
    bool first = true;

    for (const auto& f : fields) {
        if (!first) oss << ", ";
        first = false;

        oss << "`" << f.name << "`: " << scala_field_type(f);
        if (auto value = default_field_value(f)) {
            oss << " = " << *value;
        }
    }

    return oss.str();
}

std::string field_names(const std::vector<ast::field>& fields) {
    std::string result;
    for (const auto& f : fields) {
        if (!result.empty()) result += ", ";
        result += "`" + f.name + "`";
    }
    return result;
}

std::string default_read_value(const ast::field& f) {
    if (f.is_optional()) {
        return "None";
    }

    const auto& node = f.field_type.node;
    if (std::holds_alternative<ast::bool_type>(node) ||
        std::holds_alternative<ast::byte_type>(node) ||
        std::holds_alternative<ast::i16_type>(node) ||
        std::holds_alternative<ast::i32_type>(node) ||
        std::holds_alternative<ast::i64_type>(node) ||
        std::holds_alternative<ast::double_type>(node)) {
        return zero_value(f.field_type);
    }

    return "null";
}

std::string write_field_const(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper + "_FIELD_DESC";
}

std::string read_value_expr(const ast::type& t, int depth) {
    return std::visit(read_visitor{t, depth}, t.node);
}

std::string write_value_stmt(const ast::type& t, const std::string& value, int depth) {
    return std::visit(write_visitor{t, value, depth}, t.node);
}

}  // namespace schemagen::codegen
