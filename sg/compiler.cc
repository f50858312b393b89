#include "compiler.hh"
#include "directory_fragment_loader.hh"
#include "document_reader.hh"
#include <schemagen/codegen.hh>
#include <schemagen/renderer_registry.hh>
#include <fstream>
#include <iostream>

namespace schemagen::driver {

using namespace schemagen::codegen;

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        logger_.verbose("Starting compilation...");

        const BaseRenderer& renderer = select_renderer();
        FragmentRegistry fragments = load_fragments(renderer);

        for (const auto& input_file : options_.input_files) {
            if (options_.output_mode == OutputMode::Compile) {
                logger_.info("Compiling: " + input_file.string());
            }

            ast::document doc = load_document(input_file);
            auto files = generate_code(renderer, fragments, doc);

            if (options_.output_mode == OutputMode::PrintOutputs) {
                print_outputs(files);
                continue;
            }

            write_output_files(files);
        }

        if (options_.output_mode == OutputMode::Compile) {
            logger_.success("Compilation successful");
        }
        return 0;

    } catch (const document_format_error& e) {
        logger_.error(std::string("Malformed document: ") + e.what());
        return 1;
    } catch (const template_error& e) {
        logger_.error(std::string("Template error: ") + e.what());
        if (!e.key().empty()) {
            logger_.indent("fragment '" + e.fragment_name() + "', key '" + e.key() + "'",
                           2, LogLevel::Quiet);
        }
        return 1;
    } catch (const internal_error& e) {
        logger_.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

const BaseRenderer& Compiler::select_renderer() {
    auto& registry = RendererRegistry::instance();
    const BaseRenderer* renderer = registry.get_renderer(options_.target_language);

    if (!renderer) {
        auto available = registry.get_available_languages();
        std::string error_msg = "Renderer not found for language: " + options_.target_language;

        if (!available.empty()) {
            error_msg += "\n\nAvailable languages:";
            for (const auto& lang : available) {
                error_msg += "\n  - " + lang;
            }
        }

        throw std::runtime_error(error_msg);
    }

    for (const auto& entry : options_.generator_options) {
        logger_.debug("Option " + renderer->get_option_prefix() + "-" + entry.first);
    }

    return *renderer;
}

FragmentRegistry Compiler::load_fragments(const BaseRenderer& renderer) {
    DirectoryFragmentLoader loader(options_.template_dir);
    logger_.verbose("Loading fragments from: " + loader.root().string());

    for (const auto& name : renderer.required_fragments()) {
        logger_.debug("Fragment: " + loader.path_for(renderer.get_template_prefix(), name).string());
    }

    return FragmentRegistry(loader, renderer.get_template_prefix(), renderer.required_fragments());
}

ast::document Compiler::load_document(const std::filesystem::path& input_file) {
    logger_.verbose("Loading: " + input_file.string());

    ast::document doc = read_document(input_file);

    logger_.debug(doc.name + ": " +
                  std::to_string(doc.consts.size()) + " const(s), " +
                  std::to_string(doc.enums.size()) + " enum(s), " +
                  std::to_string(doc.structs.size()) + " struct(s), " +
                  std::to_string(doc.services.size()) + " service(s)");
    return doc;
}

std::vector<OutputFile> Compiler::generate_code(const BaseRenderer& renderer,
                                                const FragmentRegistry& fragments,
                                                const ast::document& doc) {
    logger_.verbose("Generating code for language: " + options_.target_language);

    const std::filesystem::path root = output_root();
    auto output_files = renderer.generate_files(doc, fragments, options_.generator_options, root);

    // --flat-output drops the namespace subdirectories
    if (options_.flat_output) {
        for (auto& file : output_files) {
            file.path = root / file.path.filename();
        }
    }

    logger_.verbose("Generated " + std::to_string(output_files.size()) + " file(s)");
    return output_files;
}

// ============================================================================
// Output File Writing
// ============================================================================

void Compiler::write_output_files(const std::vector<OutputFile>& files) {
    for (const auto& file : files) {
        logger_.verbose("Writing: " + file.path.string());

        auto parent = file.path.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream ofs(file.path, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Failed to open file for writing: " + file.path.string());
        }

        ofs << file.content;

        if (!ofs) {
            throw std::runtime_error("Failed to write file: " + file.path.string());
        }

        logger_.success("Generated: " + file.path.string());
    }
}

void Compiler::print_outputs(const std::vector<OutputFile>& files) {
    const std::filesystem::path root = output_root();
    for (const auto& file : files) {
        std::cout << file.path.lexically_relative(root).generic_string() << "\n";
    }
}

std::filesystem::path Compiler::output_root() const {
    if (options_.output_dir.empty()) {
        return std::filesystem::current_path();
    }
    return options_.output_dir;
}

}  // namespace schemagen::driver
