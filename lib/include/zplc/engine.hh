//
// Created by igor on 07/12/2025.
//
// Compile entry points and the label engine that drives a backend.
//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "backend.hh"
#include "font_registry.hh"
#include "ir.hh"
#include "units.hh"

namespace zplc {
    using variable_map = std::map<std::string, std::string>;

    /// Parse and build. Throws parse_error, or empty_input_error when the
    /// text holds no commands.
    ir::build_result compile_label(std::string_view text);

    /// compile_label without the diagnostics
    ir::instruction_list compile(std::string_view text);

    /// Replace every {{name}} whose name is in vars, in one left-to-right
    /// pass. Unknown placeholders stay as written.
    std::string substitute_variables(std::string_view text, const variable_map& vars);

    class engine {
        public:
            engine(std::string_view zpl, unit width, unit height, resolution res);

            /// Fonts handed to the backend; an empty registry is used when unset
            void set_fonts(shared_font_registry fonts);

            /// Draw every instruction through backend and return its output
            std::vector<uint8_t> render(render::Backend& backend, const variable_map& vars = {}) const;

            [[nodiscard]] const ir::instruction_list& instructions() const { return m_instructions; }
            [[nodiscard]] const std::vector<ir::diagnostic>& diagnostics() const { return m_diagnostics; }

            [[nodiscard]] uint32_t width_dots() const { return m_width.to_dots(m_resolution); }
            [[nodiscard]] uint32_t height_dots() const { return m_height.to_dots(m_resolution); }
            [[nodiscard]] const resolution& get_resolution() const { return m_resolution; }

        private:
            ir::instruction_list m_instructions;
            std::vector<ir::diagnostic> m_diagnostics;
            unit m_width;
            unit m_height;
            resolution m_resolution;
            shared_font_registry m_fonts;
    };
}
