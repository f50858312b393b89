//
// Renderer Plugin - static registration of renderers
//

#pragma once

#include <memory>

namespace schemagen::codegen {

class RendererRegistry;

/// Installs one renderer into the registry.
///
/// A backend defines a plugin next to its renderer and registers it with
/// SCHEMAGEN_REGISTER_RENDERER_PLUGIN, so the registry never names
/// concrete renderers.
class RendererPlugin {
public:
    virtual ~RendererPlugin() = default;

    virtual void register_renderer(RendererRegistry& registry) = 0;
};

} // namespace schemagen::codegen

/// Registers PluginClass before main() runs. Use inside
/// namespace schemagen::codegen, in the plugin's own translation unit.
#define SCHEMAGEN_REGISTER_RENDERER_PLUGIN(PluginClass)                     \
    namespace {                                                             \
        [[maybe_unused]] const bool PluginClass##_registered = [] {         \
            RendererRegistry::instance().register_plugin(                   \
                std::make_unique<PluginClass>());                           \
            return true;                                                    \
        }();                                                                \
    }
