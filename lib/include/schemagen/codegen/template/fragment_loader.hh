//
// Fragment Loader Interface
//
// Supplies raw template text for a named fragment. The core never reads
// files itself; loaders backed by disk live with the driver.
//

#pragma once

#include <map>
#include <string>

namespace schemagen::codegen {

class FragmentLoader {
public:
    virtual ~FragmentLoader() = default;

    /**
     * Return the source text of a fragment.
     *
     * @param prefix Namespace of the fragment set (e.g., "scala/")
     * @param name Fragment name (e.g., "enum")
     * @return Raw template text
     * @throws fragment_not_found_error if the fragment does not exist
     */
    [[nodiscard]] virtual std::string load(const std::string& prefix,
                                           const std::string& name) const = 0;
};

/**
 * Loader over fragments held in memory, keyed by prefix + name.
 */
class MemoryFragmentLoader : public FragmentLoader {
public:
    MemoryFragmentLoader() = default;

    /// Add or replace a fragment (key is prefix + name)
    MemoryFragmentLoader& add(const std::string& key, std::string source);

    [[nodiscard]] std::string load(const std::string& prefix,
                                   const std::string& name) const override;

private:
    std::map<std::string, std::string> sources_;
};

}  // namespace schemagen::codegen
