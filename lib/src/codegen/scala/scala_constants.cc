#include <schemagen/codegen/scala/scala_constants.hh>
#include <schemagen/codegen/scala/scala_string_utils.hh>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>
#include <system_error>
#include <variant>

namespace schemagen::codegen {

namespace {

    struct constant_visitor {
        std::string operator()(const ast::null_constant&) const {
            return "null";
        }

        std::string operator()(const ast::bool_constant& c) const {
            return c.value ? "true" : "false";
        }

        std::string operator()(const ast::int_constant& c) const {
            std::string text = std::to_string(c.value);
            if (c.value < std::numeric_limits<int32_t>::min() ||
                c.value > std::numeric_limits<int32_t>::max()) {
                text += "L";
            }
            return text;
        }

        std::string operator()(const ast::double_constant& c) const {
            return format_double_literal(c.value);
        }

        std::string operator()(const ast::string_constant& c) const {
            return quote_scala_string(c.value);
        }

        std::string operator()(const ast::list_constant& c) const {
            std::ostringstream oss;
            oss << "List(";
            bool first = true;
            for (const auto& elem : c.elems) {
                if (!first) oss << ", ";
                first = false;
                oss << render_constant(elem);
            }
            oss << ")";
            return oss.str();
        }

        std::string operator()(const ast::map_constant& c) const {
            std::ostringstream oss;
            oss << "Map(";
            bool first = true;
            for (const auto& entry : c.elems) {
                if (!first) oss << ", ";
                first = false;
                oss << render_constant(entry.key) << " -> " << render_constant(entry.value);
            }
            oss << ")";
            return oss.str();
        }

        std::string operator()(const ast::enum_value_constant& c) const {
            return c.enum_name + "." + c.value_name;
        }

        std::string operator()(const ast::identifier_constant& c) const {
            return c.name;
        }
    };

}  // namespace

std::string render_constant(const ast::constant& c) {
    return std::visit(constant_visitor{}, c.node);
}

std::string format_double_literal(double value) {
    if (std::isnan(value)) {
        return "Double.NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Double.PositiveInfinity" : "Double.NegativeInfinity";
    }

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text = (ec == std::errc()) ? std::string(buf, end) : std::to_string(value);

    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace schemagen::codegen
