#pragma once

#include <schemagen/codegen/template/fragment_loader.hh>
#include <filesystem>
#include <string>

namespace schemagen::driver {

/**
 * Loads fragment sources from disk: <root>/<prefix><name>.mustache
 *
 * \code
 *   DirectoryFragmentLoader loader("templates");
 *   loader.load("scala/", "enum");  // reads templates/scala/enum.mustache
 * \endcode
 */
class DirectoryFragmentLoader : public codegen::FragmentLoader {
public:
    explicit DirectoryFragmentLoader(std::filesystem::path root);

    /// @throws fragment_not_found_error if the file does not exist
    /// @throws std::runtime_error if the file exists but cannot be read
    [[nodiscard]] std::string load(const std::string& prefix,
                                   const std::string& name) const override;

    /// File a fragment is read from
    [[nodiscard]] std::filesystem::path path_for(const std::string& prefix,
                                                 const std::string& name) const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    static constexpr const char* extension = ".mustache";

private:
    std::filesystem::path root_;
};

}  // namespace schemagen::driver
