#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <schemagen/ast.hh>
#include <schemagen/base_renderer.hh>
#include <schemagen/codegen/option_description.hh>
#include <schemagen/codegen/template/fragment_registry.hh>

namespace schemagen::driver {

/// Main compiler driver
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Generate code for every input document
    /// Returns 0 on success, non-zero on error
    int compile();

private:
    // ========================================================================
    // Compilation Pipeline Stages
    // ========================================================================

    /// Stage 1: Look up the renderer
    const codegen::BaseRenderer& select_renderer();

    /// Stage 2: Load and compile the renderer's fragments
    codegen::FragmentRegistry load_fragments(const codegen::BaseRenderer& renderer);

    /// Stage 3: Read a schema document
    ast::document load_document(const std::filesystem::path& input_file);

    /// Stage 4: Generate code in target language
    std::vector<codegen::OutputFile> generate_code(const codegen::BaseRenderer& renderer,
                                                   const codegen::FragmentRegistry& fragments,
                                                   const ast::document& doc);

    // ========================================================================
    // Output File Writing
    // ========================================================================

    /// Write output files to disk
    void write_output_files(const std::vector<codegen::OutputFile>& files);

    /// Print output paths relative to the output directory (for --print-outputs)
    void print_outputs(const std::vector<codegen::OutputFile>& files);

    /// Output directory, defaulting to the current directory
    std::filesystem::path output_root() const;

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace schemagen::driver
