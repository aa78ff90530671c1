//
// Created by igor on 03/12/2025.
//
// Extension commands (^GIC, ^GTC, ^GLC) and the catch-all for codes this
// compiler does not know.
//

#include <zplc/ast.hh>

#include "parser/commands.hh"
#include "parser/parameters.hh"

namespace zplc::parser {

match_result match_custom_image(scanner_context& ctx) {
    ast::custom_image node{};
    node.width = mandatory_u32(ctx, "width", "^GIC");
    mandatory_comma(ctx, "height", "^GIC");
    node.height = mandatory_u32(ctx, "height", "^GIC");
    mandatory_comma(ctx, "image data", "^GIC");
    std::size_t at = ctx.cursor;
    node.data = trim(ctx.take_till_caret());
    if (node.data.empty()) {
        fail(ctx, at, "expected base64 image data for '^GIC'");
    }
    return node;
}

match_result match_text_color(scanner_context& ctx) {
    return ast::text_color{trim(ctx.take_till_caret())};
}

match_result match_line_color(scanner_context& ctx) {
    return ast::line_color{trim(ctx.take_till_caret())};
}

namespace {
    // Byte length of the UTF-8 sequence starting with lead, 1 for stray bytes
    std::size_t utf8_length(unsigned char lead) {
        if (lead < 0x80) {
            return 1;
        }
        if ((lead & 0xE0) == 0xC0) {
            return 2;
        }
        if ((lead & 0xF0) == 0xE0) {
            return 3;
        }
        if ((lead & 0xF8) == 0xF0) {
            return 4;
        }
        return 1;
    }

    bool take_code_point(scanner_context& ctx) {
        if (ctx.at_end()) {
            return false;
        }
        std::size_t n = utf8_length(static_cast<unsigned char>(ctx.peek()));
        if (ctx.limit - ctx.cursor < n) {
            return false;
        }
        ctx.cursor += n;
        return true;
    }
}

match_result match_unsupported(scanner_context& ctx) {
    // The caret has already been consumed
    std::size_t start = ctx.cursor - 1;
    if (!take_code_point(ctx) || !take_code_point(ctx)) {
        return std::nullopt;
    }
    ast::unsupported_command node;
    node.command = std::string(ctx.input.substr(start, ctx.cursor - start));
    node.args = trim(ctx.take_till_caret());
    return node;
}

} // namespace zplc::parser
