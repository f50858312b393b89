//
// Scala Type Mapping Implementation
//
// Every visitor below has one overload per schema type alternative, so a
// new alternative in ast::type_node does not compile until it is mapped.
//

#include <schemagen/codegen/scala/scala_types.hh>
#include <schemagen/codegen.hh>
#include <variant>

namespace schemagen::codegen {

namespace {

    // ========================================================================
    // Scala type expressions
    // ========================================================================

    struct scala_type_visitor {
        std::string operator()(const ast::void_type&) const { return "Unit"; }
        std::string operator()(const ast::bool_type&) const { return "Boolean"; }
        std::string operator()(const ast::byte_type&) const { return "Byte"; }
        std::string operator()(const ast::i16_type&) const { return "Short"; }
        std::string operator()(const ast::i32_type&) const { return "Int"; }
        std::string operator()(const ast::i64_type&) const { return "Long"; }
        std::string operator()(const ast::double_type&) const { return "Double"; }
        std::string operator()(const ast::string_type&) const { return "String"; }
        std::string operator()(const ast::binary_type&) const { return "ByteBuffer"; }

        std::string operator()(const ast::map_type& m) const {
            return "Map[" + scala_type(*m.key_type) + ", " + scala_type(*m.value_type) + "]";
        }

        std::string operator()(const ast::set_type& s) const {
            return "Set[" + scala_type(*s.element_type) + "]";
        }

        std::string operator()(const ast::list_type& l) const {
            return "Seq[" + scala_type(*l.element_type) + "]";
        }

        std::string operator()(const ast::enum_ref& r) const { return r.name; }
        std::string operator()(const ast::struct_ref& r) const { return r.name; }
        std::string operator()(const ast::named_ref& r) const { return r.name; }
    };

    // ========================================================================
    // Wire tags
    // ========================================================================

    struct wire_tag_visitor {
        const ast::type& type;

        wire_tag operator()(const ast::void_type&) const { return wire_tag::void_; }
        wire_tag operator()(const ast::bool_type&) const { return wire_tag::bool_; }
        wire_tag operator()(const ast::byte_type&) const { return wire_tag::byte_; }
        wire_tag operator()(const ast::i16_type&) const { return wire_tag::i16; }
        wire_tag operator()(const ast::i32_type&) const { return wire_tag::i32; }
        wire_tag operator()(const ast::i64_type&) const { return wire_tag::i64; }
        wire_tag operator()(const ast::double_type&) const { return wire_tag::double_; }
        wire_tag operator()(const ast::string_type&) const { return wire_tag::string; }
        // Binary shares the STRING tag at the wire level
        wire_tag operator()(const ast::binary_type&) const { return wire_tag::string; }
        wire_tag operator()(const ast::map_type&) const { return wire_tag::map; }
        wire_tag operator()(const ast::set_type&) const { return wire_tag::set; }
        wire_tag operator()(const ast::list_type&) const { return wire_tag::list; }
        // Enums are transmitted as integers
        wire_tag operator()(const ast::enum_ref&) const { return wire_tag::i32; }
        wire_tag operator()(const ast::struct_ref&) const { return wire_tag::struct_; }

        wire_tag operator()(const ast::named_ref&) const {
            throw internal_error("get_wire_tag", "no wire tag for " + describe_type(type));
        }
    };

    // ========================================================================
    // Primitive tables
    // ========================================================================

    // Names of one primitive per scalar kind, or nullptr for composites
    struct primitive_entry {
        const char* read;
        const char* write;
        const char* zero;
    };

    struct primitive_visitor {
        primitive_entry operator()(const ast::bool_type&) const { return {"readBool", "writeBool", "false"}; }
        primitive_entry operator()(const ast::byte_type&) const { return {"readByte", "writeByte", "0"}; }
        primitive_entry operator()(const ast::i16_type&) const { return {"readI16", "writeI16", "0"}; }
        primitive_entry operator()(const ast::i32_type&) const { return {"readI32", "writeI32", "0"}; }
        primitive_entry operator()(const ast::i64_type&) const { return {"readI64", "writeI64", "0"}; }
        primitive_entry operator()(const ast::double_type&) const { return {"readDouble", "writeDouble", "0.0"}; }
        primitive_entry operator()(const ast::string_type&) const { return {"readString", "writeString", "null"}; }
        primitive_entry operator()(const ast::binary_type&) const { return {"readBinary", "writeBinary", "null"}; }

        primitive_entry operator()(const ast::void_type&) const { return {}; }
        primitive_entry operator()(const ast::map_type&) const { return {}; }
        primitive_entry operator()(const ast::set_type&) const { return {}; }
        primitive_entry operator()(const ast::list_type&) const { return {}; }
        primitive_entry operator()(const ast::enum_ref&) const { return {}; }
        primitive_entry operator()(const ast::struct_ref&) const { return {}; }
        primitive_entry operator()(const ast::named_ref&) const { return {}; }
    };

    primitive_entry primitive_for(const char* function, const ast::type& t) {
        primitive_entry entry = std::visit(primitive_visitor{}, t.node);
        if (!entry.read) {
            throw internal_error(function, "not a primitive type: " + describe_type(t));
        }
        return entry;
    }

    // ========================================================================
    // Schema spelling
    // ========================================================================

    struct describe_visitor {
        std::string operator()(const ast::void_type&) const { return "void"; }
        std::string operator()(const ast::bool_type&) const { return "bool"; }
        std::string operator()(const ast::byte_type&) const { return "byte"; }
        std::string operator()(const ast::i16_type&) const { return "i16"; }
        std::string operator()(const ast::i32_type&) const { return "i32"; }
        std::string operator()(const ast::i64_type&) const { return "i64"; }
        std::string operator()(const ast::double_type&) const { return "double"; }
        std::string operator()(const ast::string_type&) const { return "string"; }
        std::string operator()(const ast::binary_type&) const { return "binary"; }

        std::string operator()(const ast::map_type& m) const {
            return "map<" + describe_type(*m.key_type) + ", " + describe_type(*m.value_type) + ">";
        }

        std::string operator()(const ast::set_type& s) const {
            return "set<" + describe_type(*s.element_type) + ">";
        }

        std::string operator()(const ast::list_type& l) const {
            return "list<" + describe_type(*l.element_type) + ">";
        }

        std::string operator()(const ast::enum_ref& r) const { return "enum " + r.name; }
        std::string operator()(const ast::struct_ref& r) const { return "struct " + r.name; }
        std::string operator()(const ast::named_ref& r) const { return r.name; }
    };

}  // namespace

const char* to_string(wire_tag tag) {
    switch (tag) {
        case wire_tag::void_: return "VOID";
        case wire_tag::bool_: return "BOOL";
        case wire_tag::byte_: return "BYTE";
        case wire_tag::double_: return "DOUBLE";
        case wire_tag::i16: return "I16";
        case wire_tag::i32: return "I32";
        case wire_tag::i64: return "I64";
        case wire_tag::string: return "STRING";
        case wire_tag::struct_: return "STRUCT";
        case wire_tag::map: return "MAP";
        case wire_tag::set: return "SET";
        case wire_tag::list: return "LIST";
    }
    return "VOID";
}

std::string scala_type(const ast::type& t) {
    return std::visit(scala_type_visitor{}, t.node);
}

wire_tag get_wire_tag(const ast::type& t) {
    return std::visit(wire_tag_visitor{t}, t.node);
}

std::string protocol_read_method(const ast::type& t) {
    return primitive_for("protocol_read_method", t).read;
}

std::string protocol_write_method(const ast::type& t) {
    return primitive_for("protocol_write_method", t).write;
}

std::string zero_value(const ast::type& t) {
    return primitive_for("zero_value", t).zero;
}

std::string describe_type(const ast::type& t) {
    return std::visit(describe_visitor{}, t.node);
}

}  // namespace schemagen::codegen
