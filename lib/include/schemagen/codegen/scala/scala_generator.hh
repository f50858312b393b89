//
// Scala Generator
//
// Binds the Scala fragments to their model transforms and assembles whole
// documents. A generator holds only compiled fragments and the service
// options it was built with; it is immutable and may be shared by threads
// generating independent documents.
//

#pragma once

#include <schemagen/ast.hh>
#include <schemagen/codegen/template/fragment_registry.hh>
#include <set>
#include <string>
#include <vector>

namespace schemagen::codegen {

// ============================================================================
// Service Options
// ============================================================================

enum class ScalaServiceOption {
    WithFinagleClient,
    WithFinagleService,
    WithOstrichServer
};

using ScalaServiceOptions = std::set<ScalaServiceOption>;

/// A service paired with the options it is rendered with
struct ScalaService {
    const ast::service_def& service;
    const ScalaServiceOptions& options;
};

// ============================================================================
// Scala Generator
// ============================================================================

/**
 * Generates Scala source for a schema document.
 *
 * Whole-document output is, in order: header, a blank line, the constants
 * section, the enums section, every struct and every service (each followed
 * by a blank line). Sections with nothing to show produce no text.
 *
 * \code
 *   FragmentRegistry registry(loader, "scala/", ScalaGenerator::fragment_names());
 *   ScalaGenerator generator(registry, {ScalaServiceOption::WithFinagleClient});
 *   std::string code = generator.render_document(doc);
 * \endcode
 */
class ScalaGenerator {
public:
    /// Fragments a registry must hold for this generator
    [[nodiscard]] static const std::vector<std::string>& fragment_names();

    /**
     * Bind all fragments.
     *
     * @throws fragment_not_found_error if the registry lacks a fragment
     */
    explicit ScalaGenerator(const FragmentRegistry& registry,
                            ScalaServiceOptions options = {});

    /// Camelize the document and render it as a single compilation unit
    [[nodiscard]] std::string render_document(const ast::document& doc) const;

    // ========================================================================
    // Per-entity rendering
    // ========================================================================

    [[nodiscard]] std::string render_header(const ast::document& doc) const;
    [[nodiscard]] std::string render_enum(const ast::enum_def& e) const;
    [[nodiscard]] std::string render_enums(const std::vector<ast::enum_def>& enums) const;
    [[nodiscard]] std::string render_constants(const std::vector<ast::const_def>& consts) const;
    [[nodiscard]] std::string render_struct(const ast::struct_def& s) const;
    [[nodiscard]] std::string render_service(const ast::service_def& s) const;

    // Header followed by a single entity, without normalization
    [[nodiscard]] std::string enum_unit(const ast::document& doc, const ast::enum_def& e) const;
    [[nodiscard]] std::string constants_unit(const ast::document& doc,
                                             const std::vector<ast::const_def>& consts) const;
    [[nodiscard]] std::string struct_unit(const ast::document& doc, const ast::struct_def& s) const;
    [[nodiscard]] std::string service_unit(const ast::document& doc, const ast::service_def& s) const;

    [[nodiscard]] const ScalaServiceOptions& service_options() const { return options_; }

    // ========================================================================
    // Document helpers
    // ========================================================================

    /// Namespace of the generated package: scala, then java, then "*", else "thrift"
    [[nodiscard]] static std::string scala_namespace(const ast::document& doc);

    /**
     * Namespaces of included documents to import.
     *
     * First-seen order, each namespace once, never the document's own.
     *
     * @throws internal_error for an include whose document was not resolved
     */
    [[nodiscard]] static std::vector<std::string> collect_imports(const ast::document& doc);

private:
    ScalaServiceOptions options_;

    BoundFragment<ast::document> header_;
    BoundFragment<ast::enum_def> enum_;
    BoundFragment<std::vector<ast::enum_def>> enums_;
    BoundFragment<std::vector<ast::const_def>> consts_;
    BoundFragment<ast::struct_def> struct_;
    BoundFragment<ScalaService> service_;
};

}  // namespace schemagen::codegen
