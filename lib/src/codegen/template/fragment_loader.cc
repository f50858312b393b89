#include <schemagen/codegen/template/fragment_loader.hh>
#include <schemagen/codegen.hh>

namespace schemagen::codegen {

MemoryFragmentLoader& MemoryFragmentLoader::add(const std::string& key, std::string source) {
    sources_.insert_or_assign(key, std::move(source));
    return *this;
}

std::string MemoryFragmentLoader::load(const std::string& prefix,
                                       const std::string& name) const {
    auto it = sources_.find(prefix + name);
    if (it == sources_.end()) {
        throw fragment_not_found_error(prefix + name);
    }
    return it->second;
}

}  // namespace schemagen::codegen
