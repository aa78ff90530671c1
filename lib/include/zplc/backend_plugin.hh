//
// Backend plugins
//
// A plugin adds one or more backends to the BackendRegistry from its own
// translation unit, so the registry never depends on concrete backends.
//

#pragma once

#include <memory>

namespace zplc::render {

class BackendRegistry;

class BackendPlugin {
public:
    virtual ~BackendPlugin() = default;

    /// Short plugin name shown by `zc --list-backends`
    virtual const char* name() const = 0;

    virtual void register_backends(BackendRegistry& registry) = 0;
};

/**
 * Registers a plugin during static initialization:
 *
 *   REGISTER_BACKEND_PLUGIN(MyBackendPlugin);
 */
#define REGISTER_BACKEND_PLUGIN(PluginClass)                                     \
    namespace {                                                                 \
        [[maybe_unused]] const bool PluginClass##_registered =                  \
            (::zplc::render::BackendRegistry::instance().add_plugin(            \
                 std::make_unique<PluginClass>()),                              \
             true);                                                             \
    }

} // namespace zplc::render
