#include <schemagen/normalize.hh>
#include <cctype>

namespace schemagen {

namespace {
    bool is_camel_trigger(char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    }

    void camelize_fields(std::vector<ast::field>& fields) {
        for (auto& f : fields) {
            f.name = to_camel_case(f.name);
        }
    }
}

std::string to_camel_case(std::string_view name) {
    std::string result;
    result.reserve(name.size());

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_' && i + 1 < name.size() && is_camel_trigger(name[i + 1])) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(name[i + 1])));
            ++i;
            continue;
        }
        result += c;
    }

    return result;
}

ast::document camelize(const ast::document& doc) {
    ast::document result = doc;

    for (auto& s : result.structs) {
        camelize_fields(s.fields);
    }

    for (auto& service : result.services) {
        for (auto& fn : service.functions) {
            fn.name = to_camel_case(fn.name);
            camelize_fields(fn.args);
            camelize_fields(fn.throws);
        }
    }

    return result;
}

}  // namespace schemagen
