//
// Built-in Backends Plugin
//

#include <zplc/backend_plugin.hh>
#include <zplc/backend_registry.hh>
#include <zplc/render/listing_backend.hh>
#include <zplc/render/zpl_backend.hh>

namespace zplc::render {

namespace {
    class BuiltinBackendsPlugin : public BackendPlugin {
    public:
        const char* name() const override { return "builtin"; }

        void register_backends(BackendRegistry& registry) override {
            registry.register_backend("listing", std::make_unique<ListingBackend>());
            registry.register_backend("zpl", std::make_unique<ZplBackend>());
        }
    };
}

REGISTER_BACKEND_PLUGIN(BuiltinBackendsPlugin)

// Referenced from BackendRegistry::instance() so the registrar above is linked
void ensure_builtin_backends_registered() {
}

} // namespace zplc::render
