//
// Created by igor on 07/12/2025.
//

#include <memory>
#include <variant>

#include <zplc/engine.hh>
#include <zplc/error.hh>
#include <zplc/ir_builder.hh>
#include <zplc/parser.hh>

namespace zplc {

ir::build_result compile_label(std::string_view text) {
    ast::command_list commands = parse_zpl(text);
    if (commands.empty()) {
        throw empty_input_error();
    }
    return ir::build_instructions(commands);
}

ir::instruction_list compile(std::string_view text) {
    return compile_label(text).instructions;
}

engine::engine(std::string_view zpl, unit width, unit height, resolution res)
    : m_width(width),
      m_height(height),
      m_resolution(res) {
    ir::build_result result = compile_label(zpl);
    m_instructions = std::move(result.instructions);
    m_diagnostics = std::move(result.diagnostics);
}

void engine::set_fonts(shared_font_registry fonts) {
    m_fonts = std::move(fonts);
}

namespace {
    // Dispatches one instruction to the matching backend primitive
    class instruction_dispatcher {
        public:
            instruction_dispatcher(render::Backend& backend, const variable_map& vars)
                : m_backend(backend),
                  m_vars(vars) {
            }

            void operator()(const ir::text& instr) const {
                ir::text copy = instr;
                copy.content = substitute_variables(instr.content, m_vars);
                m_backend.draw_text(copy);
            }

            void operator()(const ir::graphic_box& instr) const { m_backend.draw_graphic_box(instr); }
            void operator()(const ir::graphic_circle& instr) const { m_backend.draw_graphic_circle(instr); }
            void operator()(const ir::graphic_ellipse& instr) const { m_backend.draw_graphic_ellipse(instr); }
            void operator()(const ir::graphic_field& instr) const { m_backend.draw_graphic_field(instr); }
            void operator()(const ir::custom_image& instr) const { m_backend.draw_custom_image(instr); }

            void operator()(const ir::code128& instr) const {
                ir::code128 copy = instr;
                copy.data = substitute_variables(instr.data, m_vars);
                m_backend.draw_code128(copy);
            }

            void operator()(const ir::code39& instr) const {
                ir::code39 copy = instr;
                copy.data = substitute_variables(instr.data, m_vars);
                m_backend.draw_code39(copy);
            }

            void operator()(const ir::qr_code& instr) const {
                ir::qr_code copy = instr;
                copy.data = substitute_variables(instr.data, m_vars);
                m_backend.draw_qr_code(copy);
            }

        private:
            render::Backend& m_backend;
            const variable_map& m_vars;
    };
}

std::vector<uint8_t> engine::render(render::Backend& backend, const variable_map& vars) const {
    shared_font_registry fonts = m_fonts ? m_fonts : std::make_shared<const font_registry>();

    backend.setup_page(width_dots(), height_dots(), m_resolution.dpi());
    backend.setup_font_source(fonts);

    instruction_dispatcher dispatch(backend, vars);
    for (const auto& instr : m_instructions) {
        std::visit(dispatch, instr);
    }
    return backend.finalize();
}

} // namespace zplc
