//
// Backend Registry Implementation
//

#include <algorithm>
#include <cctype>

#include <zplc/backend_plugin.hh>
#include <zplc/backend_registry.hh>
#include <zplc/error.hh>

namespace zplc::render {

// Defined in builtin_backends_plugin.cc
void ensure_builtin_backends_registered();

namespace {
    std::string lowercase(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return name;
    }
}

BackendRegistry& BackendRegistry::instance() {
    static BackendRegistry registry;
    // Pulls the built-in plugin's object file out of the static library
    ensure_builtin_backends_registered();
    return registry;
}

void BackendRegistry::register_backend(const std::string& name, std::unique_ptr<Backend> backend) {
    if (!backend) {
        throw backend_error("cannot register null backend '" + name + "'");
    }
    backends_[lowercase(name)] = std::move(backend);
}

void BackendRegistry::add_plugin(std::unique_ptr<BackendPlugin> plugin) {
    if (!plugin) {
        return;
    }
    plugin->register_backends(*this);
    plugins_.push_back(std::move(plugin));
}

Backend* BackendRegistry::find(const std::string& name) const {
    auto it = backends_.find(lowercase(name));
    return it == backends_.end() ? nullptr : it->second.get();
}

Backend& BackendRegistry::get(const std::string& name) const {
    if (Backend* backend = find(name)) {
        return *backend;
    }
    std::string message = "unknown backend '" + name + "' (available:";
    for (const auto& [known, _] : backends_) {
        message += " " + known;
    }
    message += ")";
    throw backend_error(message);
}

std::vector<std::string> BackendRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(backends_.size());
    for (const auto& [name, _] : backends_) {
        out.push_back(name);
    }
    return out;
}

std::vector<std::string> BackendRegistry::plugin_names() const {
    std::vector<std::string> out;
    out.reserve(plugins_.size());
    for (const auto& plugin : plugins_) {
        out.emplace_back(plugin->name());
    }
    return out;
}

} // namespace zplc::render
