//
// Scala Generator Implementation
//
// Model transforms for every Scala fragment. Each transform builds a fresh
// Dictionary; the keys here are the contract with templates/scala/.
//

#include <schemagen/codegen/scala/scala_generator.hh>
#include <schemagen/codegen/scala/scala_constants.hh>
#include <schemagen/codegen/scala/scala_fields.hh>
#include <schemagen/codegen/scala/scala_types.hh>
#include <schemagen/codegen.hh>
#include <schemagen/normalize.hh>
#include <algorithm>
#include <cctype>
#include <variant>

namespace schemagen::codegen {

namespace {

    std::optional<std::string> declared_namespace(const ast::document& doc, const std::string& scope) {
        for (const auto& h : doc.headers) {
            if (auto* ns = std::get_if<ast::namespace_decl>(&h)) {
                if (ns->scope == scope) {
                    return ns->name;
                }
            }
        }
        return std::nullopt;
    }

    std::string to_lower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return text;
    }

    // ========================================================================
    // Header
    // ========================================================================

    Dictionary header_dictionary(const ast::document& doc) {
        DictionaryList imports;
        for (const auto& ns : ScalaGenerator::collect_imports(doc)) {
            imports.push_back(Dictionary{{"namespace", ns}});
        }

        return Dictionary{
            {"scalaNamespace", ScalaGenerator::scala_namespace(doc)},
            {"hasImports", !imports.empty()},
            {"imports", std::move(imports)}
        };
    }

    // ========================================================================
    // Enums and constants
    // ========================================================================

    Dictionary enum_dictionary(const ast::enum_def& e) {
        DictionaryList values;
        for (const auto& v : e.values) {
            values.push_back(Dictionary{
                {"name", v.name},
                {"nameLowerCase", to_lower(v.name)},
                {"value", std::to_string(v.value)}
            });
        }

        return Dictionary{
            {"enum_name", e.name},
            {"values", std::move(values)}
        };
    }

    Dictionary constants_dictionary(const std::vector<ast::const_def>& consts) {
        DictionaryList constants;
        for (const auto& c : consts) {
            constants.push_back(Dictionary{
                {"name", c.name},
                {"type", scala_type(c.const_type)},
                {"value", render_constant(c.value)}
            });
        }

        return Dictionary{
            {"hasConstants", !constants.empty()},
            {"constants", std::move(constants)}
        };
    }

    // ========================================================================
    // Structs
    // ========================================================================

    Dictionary field_dictionary(const ast::field& f) {
        auto default_value = default_field_value(f);

        return Dictionary{
            {"id", std::to_string(f.id)},
            {"name", f.name},
            {"fieldConst", write_field_const(f.name)},
            {"type", scala_field_type(f)},
            {"valueType", scala_type(f.field_type)},
            {"wireTag", to_string(get_wire_tag(f.field_type))},
            {"optional", f.is_optional()},
            {"required", f.req == ast::requiredness::required},
            {"hasDefault", default_value.has_value()},
            {"default", default_value.value_or("")},
            {"defaultReadValue", default_read_value(f)},
            {"readValue", read_value_expr(f.field_type)},
            {"writeValue", write_value_stmt(f.field_type, "_item")}
        };
    }

    Dictionary struct_dictionary(const ast::struct_def& s) {
        DictionaryList fields;
        for (const auto& f : s.fields) {
            fields.push_back(field_dictionary(f));
        }

        return Dictionary{
            {"name", s.name},
            {"isException", s.kind == ast::struct_kind::exception},
            {"hasFields", !fields.empty()},
            {"fieldArgs", field_args(s.fields)},
            {"fieldNames", field_names(s.fields)},
            {"fields", std::move(fields)}
        };
    }

    // ========================================================================
    // Services
    // ========================================================================

    ast::struct_def args_struct(const ast::function_def& fn) {
        ast::struct_def result;
        result.name = fn.name + "_args";
        result.fields = fn.args;
        return result;
    }

    ast::struct_def result_struct(const ast::function_def& fn) {
        ast::struct_def result;
        result.name = fn.name + "_result";

        if (!std::holds_alternative<ast::void_type>(fn.return_type.node)) {
            ast::field success;
            success.id = 0;
            success.name = "success";
            success.field_type = fn.return_type;
            success.req = ast::requiredness::optional;
            result.fields.push_back(std::move(success));
        }

        for (const auto& t : fn.throws) {
            ast::field ex = t;
            ex.req = ast::requiredness::optional;
            ex.default_value.reset();
            result.fields.push_back(std::move(ex));
        }

        return result;
    }

    Dictionary function_dictionary(const ast::function_def& fn,
                                   const BoundFragment<ast::struct_def>& struct_fragment) {
        std::string arg_values;
        for (const auto& a : fn.args) {
            if (!arg_values.empty()) arg_values += ", ";
            arg_values += "args.`" + a.name + "`";
        }

        DictionaryList throws;
        for (const auto& t : fn.throws) {
            throws.push_back(Dictionary{
                {"name", t.name},
                {"type", scala_type(t.field_type)}
            });
        }

        return Dictionary{
            {"name", fn.name},
            {"returnType", scala_type(fn.return_type)},
            {"fieldArgs", field_args(fn.args)},
            {"argNames", field_names(fn.args)},
            {"argValues", arg_values},
            {"isVoid", std::holds_alternative<ast::void_type>(fn.return_type.node)},
            {"oneway", fn.oneway},
            {"hasThrows", !throws.empty()},
            {"throws", std::move(throws)},
            {"argsStruct", struct_fragment.unpack(args_struct(fn))},
            {"resultStruct", struct_fragment.unpack(result_struct(fn))}
        };
    }

    Dictionary service_dictionary(const ScalaService& model,
                                  const BoundFragment<ast::struct_def>& struct_fragment) {
        const auto& service = model.service;
        const auto& options = model.options;

        DictionaryList functions;
        for (const auto& fn : service.functions) {
            functions.push_back(function_dictionary(fn, struct_fragment));
        }

        return Dictionary{
            {"name", service.name},
            {"hasParent", service.parent.has_value()},
            {"parent", service.parent.value_or("")},
            {"functions", std::move(functions)},
            {"struct", struct_fragment.fragment()},
            {"withFinagleClient", options.contains(ScalaServiceOption::WithFinagleClient)},
            {"withFinagleService", options.contains(ScalaServiceOption::WithFinagleService)},
            {"withOstrichServer", options.contains(ScalaServiceOption::WithOstrichServer)}
        };
    }

}  // namespace

// ============================================================================
// Construction
// ============================================================================

const std::vector<std::string>& ScalaGenerator::fragment_names() {
    static const std::vector<std::string> names = {
        "header", "enum", "enums", "consts", "struct", "service"
    };
    return names;
}

ScalaGenerator::ScalaGenerator(const FragmentRegistry& registry, ScalaServiceOptions options)
    : options_(std::move(options)),
      header_(registry.bind<ast::document>("header", header_dictionary)),
      enum_(registry.bind<ast::enum_def>("enum", enum_dictionary)),
      enums_(registry.bind<std::vector<ast::enum_def>>("enums",
          [enum_fragment = enum_](const std::vector<ast::enum_def>& enums) {
              DictionaryList items;
              for (const auto& e : enums) {
                  items.push_back(enum_fragment.unpack(e));
              }
              return Dictionary{
                  {"hasEnums", !items.empty()},
                  {"enums", std::move(items)},
                  {"enum", enum_fragment.fragment()}
              };
          })),
      consts_(registry.bind<std::vector<ast::const_def>>("consts", constants_dictionary)),
      struct_(registry.bind<ast::struct_def>("struct", struct_dictionary)),
      service_(registry.bind<ScalaService>("service",
          [struct_fragment = struct_](const ScalaService& model) {
              return service_dictionary(model, struct_fragment);
          }))
{
}

// ============================================================================
// Document Assembly
// ============================================================================

std::string ScalaGenerator::render_document(const ast::document& raw) const {
    ast::document doc = camelize(raw);

    std::string output = header_.render(doc);
    output += "\n";
    output += consts_.render(doc.consts);
    output += enums_.render(doc.enums);

    // Each struct and service ends in a blank line. With none of either,
    // the enums are the last text and nothing is appended after them.
    for (const auto& s : doc.structs) {
        output += struct_.render(s);
        output += "\n\n";
    }

    for (const auto& s : doc.services) {
        output += service_.render(ScalaService{s, options_});
        output += "\n\n";
    }

    return output;
}

// ============================================================================
// Per-entity rendering
// ============================================================================

std::string ScalaGenerator::render_header(const ast::document& doc) const {
    return header_.render(doc);
}

std::string ScalaGenerator::render_enum(const ast::enum_def& e) const {
    return enum_.render(e);
}

std::string ScalaGenerator::render_enums(const std::vector<ast::enum_def>& enums) const {
    return enums_.render(enums);
}

std::string ScalaGenerator::render_constants(const std::vector<ast::const_def>& consts) const {
    return consts_.render(consts);
}

std::string ScalaGenerator::render_struct(const ast::struct_def& s) const {
    return struct_.render(s);
}

std::string ScalaGenerator::render_service(const ast::service_def& s) const {
    return service_.render(ScalaService{s, options_});
}

std::string ScalaGenerator::enum_unit(const ast::document& doc, const ast::enum_def& e) const {
    return render_header(doc) + render_enum(e);
}

std::string ScalaGenerator::constants_unit(const ast::document& doc,
                                           const std::vector<ast::const_def>& consts) const {
    return render_header(doc) + render_constants(consts);
}

std::string ScalaGenerator::struct_unit(const ast::document& doc, const ast::struct_def& s) const {
    return render_header(doc) + render_struct(s);
}

std::string ScalaGenerator::service_unit(const ast::document& doc, const ast::service_def& s) const {
    return render_header(doc) + render_service(s);
}

// ============================================================================
// Document helpers
// ============================================================================

std::string ScalaGenerator::scala_namespace(const ast::document& doc) {
    for (const char* scope : {"scala", "java", "*"}) {
        if (auto ns = declared_namespace(doc, scope)) {
            return *ns;
        }
    }
    return "thrift";
}

std::vector<std::string> ScalaGenerator::collect_imports(const ast::document& doc) {
    const std::string own = scala_namespace(doc);
    std::vector<std::string> imports;

    for (const auto& h : doc.headers) {
        auto* inc = std::get_if<ast::include_decl>(&h);
        if (!inc) {
            continue;
        }
        if (!inc->included) {
            throw internal_error("collect_imports",
                                 "include '" + inc->path + "' has no resolved document");
        }

        std::string ns = scala_namespace(*inc->included);
        if (ns != own && std::find(imports.begin(), imports.end(), ns) == imports.end()) {
            imports.push_back(std::move(ns));
        }
    }

    return imports;
}

}  // namespace schemagen::codegen
