#include <schemagen/renderer_registry.hh>
#include <schemagen/renderer_plugin.hh>
#include <algorithm>
#include <cctype>

namespace schemagen::codegen {

// Defined in scala_renderer_plugin.cc
void ensure_scala_renderer_registered();

namespace {

std::string lowercase(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

}  // namespace

RendererRegistry& RendererRegistry::instance() {
    static RendererRegistry registry;
    // Keeps the plugin's object file, and so its registrar, in the link
    ensure_scala_renderer_registered();
    return registry;
}

void RendererRegistry::register_renderer(const std::string& language_name,
                                         std::unique_ptr<BaseRenderer> renderer) {
    renderers_[lowercase(language_name)] = std::move(renderer);
}

void RendererRegistry::register_plugin(std::unique_ptr<RendererPlugin> plugin) {
    if (!plugin) {
        return;
    }
    plugin->register_renderer(*this);
    plugins_.push_back(std::move(plugin));
}

const BaseRenderer* RendererRegistry::get_renderer(const std::string& language_name) const {
    auto it = renderers_.find(lowercase(language_name));
    return it == renderers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> RendererRegistry::get_available_languages() const {
    std::vector<std::string> names;
    names.reserve(renderers_.size());
    for (const auto& entry : renderers_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace schemagen::codegen
