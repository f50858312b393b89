#pragma once

#include <schemagen/base_renderer.hh>
#include <schemagen/codegen/scala/scala_generator.hh>
#include <string>
#include <vector>

namespace schemagen::codegen {

// ============================================================================
// Scala Code Renderer
// ============================================================================

/**
 * Renders schema documents as Scala source.
 *
 * Every call turns the given generator options into ScalaServiceOptions and
 * builds a ScalaGenerator over the caller's fragments.
 *
 * Example usage:
 *   ScalaRenderer renderer;
 *   FragmentRegistry fragments(loader, renderer.get_template_prefix(),
 *                              renderer.required_fragments());
 *   auto files = renderer.generate_files(doc, fragments,
 *                                        {{"finagle-client", true}}, "out");
 */
class ScalaRenderer : public BaseRenderer {
public:
    ScalaRenderer() = default;

    /// Service options named by a set of generator options.
    /// Options set to false are left out.
    /// @throws std::invalid_argument on an unknown name or a non-boolean value
    [[nodiscard]] static ScalaServiceOptions service_options_from(const GeneratorOptions& options);

    // ========================================================================
    // BaseRenderer Interface Implementation
    // ========================================================================

    std::string render_document(const ast::document& doc,
                                const FragmentRegistry& fragments,
                                const GeneratorOptions& options) const override;

    std::vector<std::string> required_fragments() const override;

    /// Fragment prefix: "scala/"
    std::string get_template_prefix() const override;

    /// "Scala"
    std::string get_language_name() const override;

    /// ".scala"
    std::string get_file_extension() const override;

    /// "scala"
    std::string get_option_prefix() const override;

    /// finagle-client, finagle-service and ostrich-server, all boolean
    std::vector<OptionDescription> get_options() const override;

    /// One file per document: <namespace path>/<document name>.scala
    std::vector<OutputFile> generate_files(
        const ast::document& doc,
        const FragmentRegistry& fragments,
        const GeneratorOptions& options,
        const std::filesystem::path& output_dir) const override;
};

}  // namespace schemagen::codegen
