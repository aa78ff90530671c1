//
// Created by igor on 08/12/2025.
//

#include <fstream>
#include <limits>
#include <sstream>

#include <fkYAML/node.hpp>

#include <zplc/error.hh>
#include <zplc/label_config.hh>

namespace zplc {

namespace {
    std::string scalar_text(const fkyaml::node& node, const std::string& key) {
        if (node.is_string()) {
            return node.get_value<std::string>();
        }
        if (node.is_integer()) {
            return std::to_string(node.get_value<int64_t>());
        }
        if (node.is_float_number()) {
            std::ostringstream ss;
            ss << node.get_value<double>();
            return ss.str();
        }
        if (node.is_boolean()) {
            return node.get_value<bool>() ? "true" : "false";
        }
        throw config_error("'" + key + "' must be a scalar");
    }

    unit parse_length(const fkyaml::node& node, const std::string& key) {
        if (node.is_integer()) {
            int64_t dots = node.get_value<int64_t>();
            if (dots < 0) {
                throw config_error("'" + key + "' must not be negative");
            }
            if (dots > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
                throw config_error("'" + key + "' is too large: " + std::to_string(dots) + " dots");
            }
            return unit::dots(static_cast<uint32_t>(dots));
        }
        if (node.is_string()) {
            return unit::parse(node.get_value<std::string>());
        }
        throw config_error("'" + key + "' must be a length such as 812, 4in, 100mm or 10cm");
    }

    char parse_font_id(const fkyaml::node& item, const char* key) {
        if (!item.contains(key)) {
            throw config_error(std::string("font entry is missing '") + key + "'");
        }
        std::string id = scalar_text(item[key], key);
        if (id.size() != 1) {
            throw config_error(std::string("font '") + key + "' must be a single id (A-Z, 0-9), got '" + id + "'");
        }
        return id[0];
    }

    void parse_variables(const fkyaml::node& vars, label_config& config) {
        if (!vars.is_mapping()) {
            throw config_error("'variables' must be a mapping");
        }
        for (auto it = vars.begin(); it != vars.end(); ++it) {
            std::string name = scalar_text(it.key(), "variables");
            config.variables[name] = scalar_text(*it, "variables." + name);
        }
    }

    void parse_fonts(const fkyaml::node& fonts, const std::filesystem::path& base_dir, label_config& config) {
        if (!fonts.is_sequence()) {
            throw config_error("'fonts' must be a sequence");
        }
        for (size_t i = 0; i < fonts.size(); ++i) {
            const auto& item = fonts[i];
            if (!item.is_mapping() || !item.contains("file") || !item["file"].is_string()) {
                throw config_error("font entry " + std::to_string(i) + " needs a 'file' string");
            }
            std::filesystem::path file = item["file"].get_value<std::string>();
            if (file.is_relative() && !base_dir.empty()) {
                file = base_dir / file;
            }
            config.fonts.push_back({file, parse_font_id(item, "from"), parse_font_id(item, "to")});
        }
    }
}

label_config parse_label_config(std::string_view yaml, const std::filesystem::path& base_dir) {
    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(std::string(yaml));
    } catch (const fkyaml::exception& e) {
        throw config_error("failed to parse YAML: " + std::string(e.what()));
    }

    label_config config;
    if (root.is_null()) {
        return config;
    }
    if (!root.is_mapping()) {
        throw config_error("top level must be a mapping");
    }

    if (root.contains("width")) {
        config.width = parse_length(root["width"], "width");
    }
    if (root.contains("height")) {
        config.height = parse_length(root["height"], "height");
    }
    if (root.contains("dpi")) {
        const auto& dpi = root["dpi"];
        if (dpi.is_integer()) {
            config.dpi = static_cast<double>(dpi.get_value<int64_t>());
        } else if (dpi.is_float_number()) {
            config.dpi = dpi.get_value<double>();
        } else {
            throw config_error("'dpi' must be a number");
        }
        if (*config.dpi <= 0) {
            throw config_error("'dpi' must be positive");
        }
    }
    if (root.contains("backend")) {
        if (!root["backend"].is_string()) {
            throw config_error("'backend' must be a string");
        }
        config.backend = root["backend"].get_value<std::string>();
    }
    if (root.contains("variables")) {
        parse_variables(root["variables"], config);
    }
    if (root.contains("fonts")) {
        parse_fonts(root["fonts"], base_dir, config);
    }
    return config;
}

label_config load_label_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw config_error("cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_label_config(buffer.str(), path.parent_path());
}

} // namespace zplc
