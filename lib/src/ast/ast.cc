#include <schemagen/ast.hh>

namespace schemagen::ast {

type make_list(type element) {
    return type{list_type{std::make_shared<const type>(std::move(element))}};
}

type make_set(type element) {
    return type{set_type{std::make_shared<const type>(std::move(element))}};
}

type make_map(type key, type value) {
    return type{map_type{
        std::make_shared<const type>(std::move(key)),
        std::make_shared<const type>(std::move(value))
    }};
}

bool is_primitive(const type& t) {
    return std::holds_alternative<bool_type>(t.node) ||
           std::holds_alternative<byte_type>(t.node) ||
           std::holds_alternative<i16_type>(t.node) ||
           std::holds_alternative<i32_type>(t.node) ||
           std::holds_alternative<i64_type>(t.node) ||
           std::holds_alternative<double_type>(t.node) ||
           std::holds_alternative<string_type>(t.node) ||
           std::holds_alternative<binary_type>(t.node);
}

bool is_container(const type& t) {
    return std::holds_alternative<list_type>(t.node) ||
           std::holds_alternative<set_type>(t.node) ||
           std::holds_alternative<map_type>(t.node);
}

} // namespace schemagen::ast
