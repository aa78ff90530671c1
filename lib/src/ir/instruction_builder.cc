//
// Created by igor on 05/12/2025.
//

#include <string>
#include <variant>

#include <zplc/ast.hh>
#include <zplc/codec.hh>
#include <zplc/ir.hh>
#include <zplc/ir_builder.hh>

#include "ir/modal_state.hh"

namespace zplc::ir {

namespace {
    using detail::modal_state;
    using detail::pending_kind;

    constexpr uint32_t default_barcode_height = 10;
    constexpr uint32_t default_module_width = 2;
    constexpr uint32_t default_magnification = 2;
    constexpr uint32_t default_font_height = 9;

    uint32_t saturating_add(uint32_t a, uint32_t b) {
        uint32_t r = a + b;
        return r < a ? UINT32_MAX : r;
    }

    uint32_t saturating_mul(uint32_t a, uint32_t b) {
        uint64_t r = static_cast<uint64_t>(a) * b;
        return r > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(r);
    }

    class instruction_builder {
        public:
            build_result run(const ast::command_list& commands) {
                for (const auto& cmd : commands) {
                    m_line = cmd.line;
                    bool keep_going = std::visit([this](const auto& node) { return apply(node); }, cmd.node);
                    if (!keep_going) {
                        break;
                    }
                }
                return std::move(m_result);
            }

        private:
            // ================================================================
            // Positioning
            // ================================================================

            bool apply(const ast::field_origin& cmd) {
                if (cmd.x) {
                    m_state.position.x = *cmd.x;
                }
                if (cmd.y) {
                    m_state.position.y = *cmd.y;
                }
                return true;
            }

            bool apply(const ast::field_typeset& cmd) {
                if (cmd.x) {
                    m_state.typeset.x = saturating_add(m_state.typeset.x, *cmd.x);
                }
                if (cmd.y) {
                    m_state.typeset.y = saturating_add(m_state.typeset.y, *cmd.y);
                }
                return true;
            }

            bool apply(const ast::field_reverse&) {
                m_state.reverse = !m_state.reverse;
                return true;
            }

            // ================================================================
            // Fonts and data
            // ================================================================

            bool apply(const ast::font_spec& cmd) {
                m_state.font.name = cmd.font_name;
                if (cmd.height) {
                    m_state.font.height = cmd.height;
                }
                if (cmd.width) {
                    m_state.font.width = cmd.width;
                }
                return true;
            }

            bool apply(const ast::font_spec_full& cmd) {
                m_state.font.name = cmd.font_name;
                if (cmd.orientation) {
                    m_state.font.orientation = cmd.orientation;
                }
                if (cmd.height) {
                    m_state.font.height = cmd.height;
                }
                if (cmd.width) {
                    m_state.font.width = cmd.width;
                }
                return true;
            }

            bool apply(const ast::field_data& cmd) {
                m_state.value = cmd.data;
                return true;
            }

            bool apply(const ast::text_color& cmd) {
                m_state.font.color = cmd.color;
                return true;
            }

            bool apply(const ast::line_color& cmd) {
                m_state.attributes.custom_line_color = cmd.color;
                return true;
            }

            // ================================================================
            // Graphics
            // ================================================================

            bool apply(const ast::graphic_box& cmd) {
                m_state.metrics.width = cmd.width;
                m_state.metrics.height = cmd.height;
                m_state.metrics.thickness = cmd.border_thickness.value_or(1);
                m_state.attributes.line_color = cmd.line_color;
                m_state.params.rounding = cmd.corner_rounding.value_or(0);
                m_state.kind = pending_kind::graphic_box;
                return true;
            }

            bool apply(const ast::graphic_circle& cmd) {
                m_state.metrics.width = cmd.diameter.value_or(0);
                m_state.metrics.thickness = cmd.border_thickness.value_or(1);
                m_state.attributes.line_color = cmd.line_color;
                m_state.kind = pending_kind::graphic_circle;
                return true;
            }

            bool apply(const ast::graphic_ellipse& cmd) {
                m_state.metrics.width = cmd.width.value_or(0);
                m_state.metrics.height = cmd.height.value_or(0);
                m_state.metrics.thickness = cmd.border_thickness.value_or(1);
                m_state.attributes.line_color = cmd.line_color;
                m_state.kind = pending_kind::graphic_ellipse;
                return true;
            }

            bool apply(const ast::graphic_field& cmd) {
                char compression = cmd.compression_type.value_or('A');
                if (compression != 'A') {
                    // Binary and compressed-binary payloads are not decoded;
                    // nothing after this command is drawn.
                    warn("^GF compression type '" + std::string(1, compression)
                         + "' is not supported, remaining commands are ignored");
                    return false;
                }

                m_state.bitmap = codec::decode(cmd.data, cmd.bytes_per_row.value_or(0));
                if (cmd.bytes_per_row) {
                    uint32_t bpr = *cmd.bytes_per_row;
                    m_state.metrics.width = saturating_mul(bpr, 8);
                    if (cmd.graphic_field_count && bpr > 0) {
                        m_state.metrics.height = *cmd.graphic_field_count / bpr;
                    }
                }
                m_state.kind = pending_kind::graphic_field;
                return true;
            }

            bool apply(const ast::custom_image& cmd) {
                m_state.metrics.width = cmd.width;
                m_state.metrics.height = cmd.height;
                m_state.value = cmd.data;
                m_state.kind = pending_kind::custom_image;
                return true;
            }

            // ================================================================
            // Barcodes
            // ================================================================

            bool apply(const ast::barcode_default& cmd) {
                if (cmd.module_width) {
                    m_state.barcode_defaults.thickness = *cmd.module_width;
                }
                if (cmd.height) {
                    m_state.barcode_defaults.height = *cmd.height;
                }
                if (cmd.ratio) {
                    m_state.params.ratio = static_cast<double>(*cmd.ratio);
                }
                return true;
            }

            bool apply(const ast::code128& cmd) {
                auto& attrs = m_state.attributes;
                attrs.orientation = cmd.orientation;
                attrs.interpretation_line = cmd.interpretation_line;
                attrs.interpretation_line_above = cmd.interpretation_line_above;
                attrs.check_digit = cmd.check_digit;
                attrs.mode = cmd.mode;
                m_state.metrics.height = barcode_height(cmd.height);
                m_state.kind = pending_kind::code128;
                return true;
            }

            bool apply(const ast::code39& cmd) {
                auto& attrs = m_state.attributes;
                attrs.orientation = cmd.orientation;
                attrs.check_digit = cmd.check_digit;
                attrs.interpretation_line = cmd.interpretation_line;
                attrs.interpretation_line_above = cmd.interpretation_line_above;
                m_state.metrics.height = barcode_height(cmd.height);
                m_state.kind = pending_kind::code39;
                return true;
            }

            bool apply(const ast::qr_code& cmd) {
                m_state.attributes.orientation = cmd.orientation;
                m_state.attributes.error_correction = cmd.error_correction;
                m_state.params.model = cmd.model.value_or(2);
                m_state.params.mask = cmd.mask.value_or(7);
                if (cmd.magnification) {
                    m_state.metrics.thickness = *cmd.magnification;
                } else if (m_state.barcode_defaults.thickness > 0) {
                    m_state.metrics.thickness = m_state.barcode_defaults.thickness;
                } else {
                    m_state.metrics.thickness = default_magnification;
                }
                m_state.kind = pending_kind::qr_code;
                return true;
            }

            bool apply(const ast::unsupported_command& cmd) {
                m_result.diagnostics.push_back({diagnostic_level::note,
                                                "unsupported command " + cmd.command + " ignored",
                                                m_line});
                return true;
            }

            bool apply(const ast::field_separator&) {
                flush();
                m_state.end_field();
                return true;
            }

            // Setup, comments, ^FB, ^LR, ^CI, ^BX: nothing to draw
            template<typename Node>
            bool apply(const Node&) {
                return true;
            }

            // ================================================================
            // Field flush
            // ================================================================

            void flush() {
                if (m_state.kind) {
                    emit(*m_state.kind);
                } else if (m_state.value) {
                    emit(pending_kind::text);
                }
            }

            void emit(pending_kind kind) {
                const auto& s = m_state;
                const uint32_t x = s.position.x;
                const uint32_t y = s.position.y;
                const std::string data = s.value.value_or(std::string());
                const bool reverse = s.reverse;

                switch (kind) {
                    case pending_kind::text: {
                        text instr;
                        instr.x = x;
                        instr.y = y;
                        instr.font = s.font.name;
                        instr.orientation = s.font.orientation.value_or('N');
                        instr.height = s.font.height.value_or(default_font_height);
                        instr.width = s.font.width.value_or(instr.height);
                        instr.content = data;
                        instr.reverse_print = reverse;
                        instr.color = s.font.color;
                        push(std::move(instr));
                        break;
                    }
                    case pending_kind::graphic_box:
                        push(graphic_box{x, y, s.metrics.width, s.metrics.height, s.metrics.thickness,
                                         s.attributes.line_color.value_or('B'),
                                         s.attributes.custom_line_color, s.params.rounding, reverse});
                        break;
                    case pending_kind::graphic_circle:
                        push(graphic_circle{x, y, s.metrics.width, s.metrics.thickness,
                                            s.attributes.line_color.value_or('B'),
                                            s.attributes.custom_line_color, reverse});
                        break;
                    case pending_kind::graphic_ellipse:
                        push(graphic_ellipse{x, y, s.metrics.width, s.metrics.height, s.metrics.thickness,
                                             s.attributes.line_color.value_or('B'),
                                             s.attributes.custom_line_color, reverse});
                        break;
                    case pending_kind::graphic_field:
                        if (s.bitmap) {
                            push(graphic_field{x, y, s.metrics.width, s.metrics.height, *s.bitmap, reverse});
                        }
                        break;
                    case pending_kind::custom_image:
                        push(custom_image{x, y, s.metrics.width, s.metrics.height, data});
                        break;
                    case pending_kind::code128: {
                        code128 instr;
                        instr.x = x;
                        instr.y = y;
                        instr.orientation = s.attributes.orientation.value_or('N');
                        instr.height = s.metrics.height;
                        instr.module_width = module_width();
                        instr.interpretation_line = s.attributes.interpretation_line.value_or('Y');
                        instr.interpretation_line_above = s.attributes.interpretation_line_above.value_or('N');
                        instr.check_digit = s.attributes.check_digit.value_or('N');
                        instr.mode = s.attributes.mode.value_or('N');
                        instr.data = data;
                        instr.reverse_print = reverse;
                        push(std::move(instr));
                        break;
                    }
                    case pending_kind::code39: {
                        code39 instr;
                        instr.x = x;
                        instr.y = y;
                        instr.orientation = s.attributes.orientation.value_or('N');
                        instr.check_digit = s.attributes.check_digit.value_or('N');
                        instr.height = s.metrics.height;
                        instr.module_width = module_width();
                        instr.ratio = s.params.ratio.value_or(3.0);
                        instr.interpretation_line = s.attributes.interpretation_line.value_or('Y');
                        instr.interpretation_line_above = s.attributes.interpretation_line_above.value_or('N');
                        instr.data = data;
                        instr.reverse_print = reverse;
                        push(std::move(instr));
                        break;
                    }
                    case pending_kind::qr_code: {
                        qr_code instr;
                        instr.x = x;
                        instr.y = y;
                        instr.orientation = s.attributes.orientation.value_or('N');
                        instr.model = s.params.model;
                        instr.magnification = s.metrics.thickness;
                        instr.error_correction = s.attributes.error_correction.value_or('M');
                        instr.mask = s.params.mask;
                        instr.data = data;
                        instr.reverse_print = reverse;
                        push(std::move(instr));
                        break;
                    }
                }
            }

            [[nodiscard]] uint32_t barcode_height(const std::optional<uint32_t>& explicit_height) const {
                if (explicit_height) {
                    return *explicit_height;
                }
                if (m_state.barcode_defaults.height > 0) {
                    return m_state.barcode_defaults.height;
                }
                return default_barcode_height;
            }

            [[nodiscard]] uint32_t module_width() const {
                return m_state.barcode_defaults.thickness > 0 ? m_state.barcode_defaults.thickness
                                                              : default_module_width;
            }

            void push(instruction instr) {
                m_result.instructions.push_back(std::move(instr));
            }

            void warn(std::string message) {
                m_result.diagnostics.push_back({diagnostic_level::warning, std::move(message), m_line});
            }

            modal_state m_state;
            build_result m_result;
            std::size_t m_line = 0;
    };
}

build_result build_instructions(const ast::command_list& commands) {
    instruction_builder builder;
    return builder.run(commands);
}

} // namespace zplc::ir
