//
// Scala Renderer Plugin
//

#include <schemagen/renderer_plugin.hh>
#include <schemagen/renderer_registry.hh>
#include <schemagen/codegen/scala/scala_renderer.hh>

namespace schemagen::codegen {

class ScalaRendererPlugin : public RendererPlugin {
public:
    void register_renderer(RendererRegistry& registry) override {
        registry.register_renderer("scala", std::make_unique<ScalaRenderer>());
    }
};

SCHEMAGEN_REGISTER_RENDERER_PLUGIN(ScalaRendererPlugin)

// Referenced from RendererRegistry::instance() so a static link keeps this file
void ensure_scala_renderer_registered() {
}

} // namespace schemagen::codegen
