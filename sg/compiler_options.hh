#pragma once

#include <schemagen/codegen/option_description.hh>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#ifndef SCHEMAGEN_DEFAULT_TEMPLATE_DIR
#define SCHEMAGEN_DEFAULT_TEMPLATE_DIR "templates"
#endif

namespace schemagen::driver {

/// Output mode for the compiler
enum class OutputMode {
    Compile,       // Normal compilation (default)
    PrintOutputs   // Print output filenames and exit (for build-system dependency tracking)
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;  // JSON schema documents
    std::filesystem::path output_dir;                // Always a directory
    std::filesystem::path template_dir = SCHEMAGEN_DEFAULT_TEMPLATE_DIR;  // -T, --templates

    // ========================================================================
    // Target Selection
    // ========================================================================

    std::string target_language = "scala";           // Language name from registry

    // ========================================================================
    // Generator Options
    // ========================================================================

    /// Generator-specific options (e.g., "finagle-client" -> true)
    /// Parsed from CLI args like --scala-finagle-client=true
    /// Passed to the renderer with every document
    codegen::GeneratorOptions generator_options;

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    bool debug = false;                              // --debug

    // ========================================================================
    // Output Mode
    // ========================================================================

    OutputMode output_mode = OutputMode::Compile;    // --print-outputs
    bool flat_output = false;                        // --flat-output (no package subdirs)
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print available code generators
void print_generators();

}  // namespace schemagen::driver
