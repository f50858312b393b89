#include <schemagen/codegen/template/fragment_registry.hh>
#include <schemagen/codegen.hh>

namespace schemagen::codegen {

FragmentRegistry::FragmentRegistry(const FragmentLoader& loader,
                                   const std::string& prefix,
                                   const std::vector<std::string>& names)
    : prefix_(prefix)
{
    for (const auto& name : names) {
        if (fragments_.count(name) > 0) {
            continue;
        }
        std::string source = loader.load(prefix_, name);
        fragments_.emplace(name, std::make_shared<const Fragment>(name, source));
    }
}

const FragmentPtr& FragmentRegistry::get(const std::string& name) const {
    auto it = fragments_.find(name);
    if (it == fragments_.end()) {
        throw fragment_not_found_error(prefix_ + name);
    }
    return it->second;
}

bool FragmentRegistry::has(const std::string& name) const {
    return fragments_.find(name) != fragments_.end();
}

std::vector<std::string> FragmentRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(fragments_.size());

    for (const auto& [name, _] : fragments_) {
        result.push_back(name);
    }

    return result;
}

}  // namespace schemagen::codegen
