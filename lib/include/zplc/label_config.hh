//
// Created by igor on 08/12/2025.
//
// YAML label configuration:
//
//   width: 4in            # unit string or a number of dots
//   height: 6in
//   dpi: 203
//   backend: zpl
//   variables:
//     name: Ann
//   fonts:
//     - file: fonts/Roboto.ttf
//       from: A
//       to: Z
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine.hh"
#include "units.hh"

namespace zplc {
    struct font_binding {
        std::filesystem::path file;
        char from;
        char to;
    };

    struct label_config {
        std::optional<unit> width;
        std::optional<unit> height;
        std::optional<double> dpi;
        std::optional<std::string> backend;
        variable_map variables;
        std::vector<font_binding> fonts;
    };

    /// Parse a configuration document. Relative font paths are resolved
    /// against base_dir. Throws config_error.
    label_config parse_label_config(std::string_view yaml, const std::filesystem::path& base_dir = {});

    label_config load_label_config(const std::filesystem::path& path);
}
