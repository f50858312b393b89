//
// Base Renderer - interface of a target language backend
//

#pragma once

#include <schemagen/ast.hh>
#include <schemagen/codegen/option_description.hh>
#include <schemagen/codegen/template/fragment_registry.hh>
#include <filesystem>
#include <string>
#include <vector>

namespace schemagen::codegen {

// ============================================================================
// Abstract Base Renderer
// ============================================================================

/// A target language backend.
///
/// Text layout lives in fragments: a renderer names the fragments it needs
/// and receives them compiled in a FragmentRegistry. Renderers hold no
/// per-run state. Generator options travel with every call, so one
/// registered renderer serves any number of runs.
///
/// \code
///   const auto* renderer = RendererRegistry::instance().get_renderer("scala");
///   FragmentRegistry fragments(loader, renderer->get_template_prefix(),
///                              renderer->required_fragments());
///   auto files = renderer->generate_files(doc, fragments, options, "out");
/// \endcode
class BaseRenderer {
public:
    virtual ~BaseRenderer() = default;

    /// Render a complete document to source code
    /// @param fragments Compiled fragments, holding every required_fragments() entry
    /// @param options Values for names listed by get_options()
    /// @throws std::invalid_argument for an option this renderer does not know
    [[nodiscard]] virtual std::string render_document(const ast::document& doc,
                                                      const FragmentRegistry& fragments,
                                                      const GeneratorOptions& options) const = 0;

    /// Names of the fragments render_document() binds
    [[nodiscard]] virtual std::vector<std::string> required_fragments() const = 0;

    /// Loader prefix of this renderer's fragments (e.g., "scala/")
    [[nodiscard]] virtual std::string get_template_prefix() const = 0;

    /// Display name (e.g., "Scala")
    [[nodiscard]] virtual std::string get_language_name() const = 0;

    /// Extension of generated files (e.g., ".scala")
    [[nodiscard]] virtual std::string get_file_extension() const = 0;

    // ========================================================================
    // Command Line Surface
    // ========================================================================

    /// Prefix of this renderer's flags: --<prefix>-<option>=<value>
    [[nodiscard]] virtual std::string get_option_prefix() const = 0;

    /// Options accepted by render_document(), empty when there are none
    [[nodiscard]] virtual std::vector<OptionDescription> get_options() const {
        return {};
    }

    /// Files for one document. The driver creates directories and writes them.
    ///
    /// The default is a single <output_dir>/<document name><extension>.
    [[nodiscard]] virtual std::vector<OutputFile> generate_files(
        const ast::document& doc,
        const FragmentRegistry& fragments,
        const GeneratorOptions& options,
        const std::filesystem::path& output_dir) const;
};

} // namespace schemagen::codegen
