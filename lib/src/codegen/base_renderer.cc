#include <schemagen/base_renderer.hh>

namespace schemagen::codegen {

std::vector<OutputFile> BaseRenderer::generate_files(
    const ast::document& doc,
    const FragmentRegistry& fragments,
    const GeneratorOptions& options,
    const std::filesystem::path& output_dir) const
{
    std::filesystem::path output_path = output_dir / (doc.name + get_file_extension());
    return {{output_path, render_document(doc, fragments, options)}};
}

} // namespace schemagen::codegen
