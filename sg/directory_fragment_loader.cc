#include "directory_fragment_loader.hh"
#include <schemagen/codegen.hh>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace schemagen::driver {

DirectoryFragmentLoader::DirectoryFragmentLoader(std::filesystem::path root)
    : root_(std::move(root))
{
}

std::filesystem::path DirectoryFragmentLoader::path_for(const std::string& prefix,
                                                        const std::string& name) const {
    return root_ / (prefix + name + extension);
}

std::string DirectoryFragmentLoader::load(const std::string& prefix,
                                          const std::string& name) const {
    const auto path = path_for(prefix, name);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw codegen::fragment_not_found_error(prefix + name);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open fragment: " + path.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed to read fragment: " + path.string());
    }

    return buffer.str();
}

}  // namespace schemagen::driver
