#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <zplc/backend.hh>

namespace zplc::render {

class BackendPlugin;

/**
 * Process-wide table of output backends, keyed by lowercase name.
 *
 * The built-in `listing` and `zpl` backends are always present; further
 * backends arrive through plugins (see backend_plugin.hh).
 */
class BackendRegistry {
public:
    static BackendRegistry& instance();

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /// Replaces a backend already registered under the same name
    void register_backend(const std::string& name, std::unique_ptr<Backend> backend);

    /// Runs plugin->register_backends() and keeps the plugin alive
    void add_plugin(std::unique_ptr<BackendPlugin> plugin);

    /// Case-insensitive lookup, nullptr when unknown
    Backend* find(const std::string& name) const;

    /// Case-insensitive lookup; throws backend_error listing the known names
    Backend& get(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Sorted backend names
    std::vector<std::string> names() const;

    /// Names of the plugins in registration order
    std::vector<std::string> plugin_names() const;

private:
    BackendRegistry() = default;

    std::map<std::string, std::unique_ptr<Backend>> backends_;
    std::vector<std::unique_ptr<BackendPlugin>> plugins_;
};

} // namespace zplc::render
