//
// Renderer Registry - target languages by name
//

#pragma once

#include <schemagen/base_renderer.hh>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace schemagen::codegen {

class RendererPlugin;

/// Process-wide table of renderers, keyed by lowercase language name.
///
/// Plugins fill it during static initialization (see renderer_plugin.hh);
/// afterwards it is only read. Renderers are stateless, so the driver
/// shares them freely and hands generator options to each call.
class RendererRegistry {
public:
    static RendererRegistry& instance();

    RendererRegistry(const RendererRegistry&) = delete;
    RendererRegistry& operator=(const RendererRegistry&) = delete;

    /// Install a renderer, replacing any earlier one of the same name
    void register_renderer(const std::string& language_name,
                           std::unique_ptr<BaseRenderer> renderer);

    /// Run a plugin's registration and keep the plugin alive
    void register_plugin(std::unique_ptr<RendererPlugin> plugin);

    /// Case-insensitive lookup; nullptr when nothing is registered
    [[nodiscard]] const BaseRenderer* get_renderer(const std::string& language_name) const;

    /// Registered names, lowercase and sorted
    [[nodiscard]] std::vector<std::string> get_available_languages() const;

private:
    RendererRegistry() = default;

    std::map<std::string, std::unique_ptr<BaseRenderer>> renderers_;
    std::vector<std::unique_ptr<RendererPlugin>> plugins_;
};

} // namespace schemagen::codegen
