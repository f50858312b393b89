//
// Scala Code Renderer Implementation
//

#include <schemagen/codegen/scala/scala_renderer.hh>
#include <algorithm>
#include <stdexcept>

namespace schemagen::codegen {

namespace {

ScalaServiceOption service_option_named(const std::string& name) {
    if (name == "finagle-client") {
        return ScalaServiceOption::WithFinagleClient;
    }
    if (name == "finagle-service") {
        return ScalaServiceOption::WithFinagleService;
    }
    if (name == "ostrich-server") {
        return ScalaServiceOption::WithOstrichServer;
    }
    throw std::invalid_argument("Unknown scala option: " + name);
}

}  // namespace

ScalaServiceOptions ScalaRenderer::service_options_from(const GeneratorOptions& options) {
    ScalaServiceOptions result;
    for (const auto& [name, value] : options) {
        ScalaServiceOption option = service_option_named(name);
        const bool* enabled = std::get_if<bool>(&value);
        if (!enabled) {
            throw std::invalid_argument("scala option " + name + " takes a boolean value");
        }
        if (*enabled) {
            result.insert(option);
        }
    }
    return result;
}

// ============================================================================
// BaseRenderer Interface Implementation
// ============================================================================

std::string ScalaRenderer::render_document(const ast::document& doc,
                                           const FragmentRegistry& fragments,
                                           const GeneratorOptions& options) const {
    ScalaGenerator generator(fragments, service_options_from(options));
    return generator.render_document(doc);
}

std::vector<std::string> ScalaRenderer::required_fragments() const {
    return ScalaGenerator::fragment_names();
}

std::string ScalaRenderer::get_template_prefix() const {
    return "scala/";
}

std::string ScalaRenderer::get_language_name() const {
    return "Scala";
}

std::string ScalaRenderer::get_file_extension() const {
    return ".scala";
}

std::string ScalaRenderer::get_option_prefix() const {
    return "scala";
}

std::vector<OptionDescription> ScalaRenderer::get_options() const {
    return {
        {
            "finagle-client",
            OptionType::Bool,
            "Generate a FutureIface and a Finagle client for every service",
            "false",
            {}
        },
        {
            "finagle-service",
            OptionType::Bool,
            "Generate a Finagle service wrapping every Iface",
            "false",
            {}
        },
        {
            "ostrich-server",
            OptionType::Bool,
            "Generate an Ostrich ThriftServer trait (needs finagle-service)",
            "false",
            {}
        }
    };
}

std::vector<OutputFile> ScalaRenderer::generate_files(
    const ast::document& doc,
    const FragmentRegistry& fragments,
    const GeneratorOptions& options,
    const std::filesystem::path& output_dir) const
{
    // Package "com.example.thrift" lands in com/example/thrift/
    std::string package_path = ScalaGenerator::scala_namespace(doc);
    std::replace(package_path.begin(), package_path.end(), '.', '/');

    std::filesystem::path output_path = output_dir / package_path / (doc.name + get_file_extension());
    return {{output_path, render_document(doc, fragments, options)}};
}

}  // namespace schemagen::codegen
