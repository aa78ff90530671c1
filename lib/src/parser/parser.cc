/*
 * ZPL Parser - ordered command matchers
 */

#include <array>
#include <fstream>
#include <sstream>
#include <string_view>

#include <zplc/parser.hh>
#include <zplc/ast.hh>
#include <zplc/error.hh>

#include "parser/commands.hh"
#include "parser/scanner_context.hh"

namespace zplc {
    namespace {
        struct matcher {
            std::string_view tag;
            parser::matcher_fn fn;
        };

        // First match wins. Longer codes sharing a prefix with the two
        // character fallback must stay ahead of it.
        constexpr std::array matchers{
            matcher{"^XA", parser::match_start_format},
            matcher{"^XZ", parser::match_end_format},
            matcher{"^LH", parser::match_label_home},
            matcher{"^LL", parser::match_label_length},
            matcher{"^FO", parser::match_field_origin},
            matcher{"^FT", parser::match_field_typeset},
            matcher{"^FS", parser::match_field_separator},
            matcher{"^LR", parser::match_label_reverse},
            matcher{"^FX", parser::match_comment},
            matcher{"^A", parser::match_font_full},
            matcher{"^CF", parser::match_change_font},
            matcher{"^CI", parser::match_change_charset},
            matcher{"^FD", parser::match_field_data},
            matcher{"^FB", parser::match_field_block},
            matcher{"^FR", parser::match_field_reverse},
            matcher{"^GB", parser::match_graphic_box},
            matcher{"^GC", parser::match_graphic_circle},
            matcher{"^GE", parser::match_graphic_ellipse},
            matcher{"^GF", parser::match_graphic_field},
            matcher{"^BQ", parser::match_qr_code},
            matcher{"^B3", parser::match_code39},
            matcher{"^BY", parser::match_barcode_default},
            matcher{"^BX", parser::match_data_matrix},
            matcher{"^BC", parser::match_code128},
            matcher{"^GIC", parser::match_custom_image},
            matcher{"^GTC", parser::match_text_color},
            matcher{"^GLC", parser::match_line_color},
            matcher{"^", parser::match_unsupported},
        };

        bool parse_one(parser::scanner_context& ctx, ast::command_list& out) {
            const std::size_t start = ctx.cursor;
            for (const auto& m : matchers) {
                if (!ctx.consume(m.tag)) {
                    continue;
                }
                if (auto node = m.fn(ctx)) {
                    out.push_back(ast::command{ctx.line_at(start), std::move(*node)});
                    return true;
                }
                ctx.cursor = start;
            }
            return false;
        }

        ast::command_list parse_zpl_impl(std::string_view input) {
            parser::scanner_context ctx(input);
            ast::command_list commands;

            ctx.skip_whitespace();
            while (!ctx.at_end()) {
                if (!parse_one(ctx, commands)) {
                    parser::fail(ctx, ctx.cursor, "unrecognized input " + ctx.excerpt(ctx.cursor));
                }
                ctx.skip_whitespace();
            }
            return commands;
        }
    } // anonymous namespace

    ast::command_list parse_zpl(std::string_view text) {
        return parse_zpl_impl(text);
    }

    ast::command_list parse_zpl_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw error("Cannot open file: " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse_zpl_impl(buffer.str());
    }
} // namespace zplc
