//
// Created by igor on 02/12/2025.
//

#include <zplc/ast.hh>

#include "parser/commands.hh"
#include "parser/parameters.hh"

namespace zplc::parser {

namespace {

    // Restricts the scanner to the text up to the next '^'. Parameters are
    // parsed inside the region and whatever they leave behind is skipped.
    class argument_region {
        public:
            explicit argument_region(scanner_context& ctx)
                : m_ctx(ctx),
                  m_saved_limit(ctx.limit) {
                std::size_t end = ctx.cursor;
                while (end < ctx.limit && ctx.input[end] != '^') {
                    end++;
                }
                m_end = end;
                ctx.limit = end;
            }

            ~argument_region() {
                m_ctx.limit = m_saved_limit;
                m_ctx.cursor = m_end;
            }

            argument_region(const argument_region&) = delete;
            argument_region& operator=(const argument_region&) = delete;

        private:
            scanner_context& m_ctx;
            std::size_t m_saved_limit;
            std::size_t m_end;
    };

    template<typename Node>
    void parse_xy(scanner_context& ctx, Node& node, const char* tag) {
        node.x = required_leading_param(ctx, scan_u32, "unsigned integer (x)", tag);
        node.y = next_param(ctx, scan_u32);
    }

    std::optional<ast::yes_no> to_yes_no(std::optional<char> c) {
        if (!c) {
            return std::nullopt;
        }
        return ast::yes_no_from_char(*c);
    }

} // anonymous namespace

// ============================================================================
// Format and label setup
// ============================================================================

match_result match_start_format(scanner_context&) {
    return ast::start_format{};
}

match_result match_end_format(scanner_context&) {
    return ast::end_format{};
}

match_result match_label_home(scanner_context& ctx) {
    ast::label_home node;
    parse_xy(ctx, node, "^LH");
    return node;
}

match_result match_label_length(scanner_context& ctx) {
    ast::label_length node;
    node.length = required_leading_param(ctx, scan_u32, "unsigned integer (length)", "^LL");
    return node;
}

match_result match_label_reverse(scanner_context& ctx) {
    ast::label_reverse node;
    node.reverse = to_yes_no(required_leading_param(ctx, scan_char, "Y or N", "^LR"));
    return node;
}

match_result match_change_charset(scanner_context& ctx) {
    argument_region region(ctx);
    std::optional<uint32_t> charset;
    if (!leading_param(ctx, scan_u32, charset)) {
        return std::nullopt;
    }
    return ast::change_charset{charset};
}

match_result match_comment(scanner_context& ctx) {
    return ast::comment{trim(ctx.take_till_caret())};
}

// ============================================================================
// Fields
// ============================================================================

match_result match_field_origin(scanner_context& ctx) {
    ast::field_origin node;
    parse_xy(ctx, node, "^FO");
    return node;
}

match_result match_field_typeset(scanner_context& ctx) {
    ast::field_typeset node;
    parse_xy(ctx, node, "^FT");
    return node;
}

match_result match_field_separator(scanner_context&) {
    return ast::field_separator{};
}

match_result match_field_reverse(scanner_context&) {
    return ast::field_reverse{};
}

match_result match_field_data(scanner_context& ctx) {
    return ast::field_data{trim(ctx.take_till_caret())};
}

match_result match_field_block(scanner_context& ctx) {
    ast::field_block node;
    node.width = required_leading_param(ctx, scan_u32, "unsigned integer (width)", "^FB");
    node.max_lines = next_param(ctx, scan_u32);
    node.line_spacing = next_param(ctx, scan_u32);
    if (auto j = next_param(ctx, scan_char)) {
        node.justify = ast::justification_from_char(*j);
    }
    node.indent = next_param(ctx, scan_u32);
    return node;
}

// ============================================================================
// Fonts
// ============================================================================

match_result match_font_full(scanner_context& ctx) {
    ast::font_spec_full node{};
    node.font_name = mandatory_char(ctx, "font name", "^A");
    std::optional<char> orientation;
    if (leading_param(ctx, scan_char, orientation)) {
        node.orientation = orientation;
    }
    node.height = next_param(ctx, scan_u32);
    node.width = next_param(ctx, scan_u32);
    return node;
}

match_result match_change_font(scanner_context& ctx) {
    ast::font_spec node{};
    node.font_name = mandatory_char(ctx, "font name", "^CF");
    node.height = next_param(ctx, scan_u32);
    node.width = next_param(ctx, scan_u32);
    return node;
}

// ============================================================================
// Graphics
// ============================================================================

match_result match_graphic_box(scanner_context& ctx) {
    ast::graphic_box node{};
    node.width = mandatory_u32(ctx, "width", "^GB");
    mandatory_comma(ctx, "height", "^GB");
    node.height = mandatory_u32(ctx, "height", "^GB");
    node.border_thickness = next_param(ctx, scan_u32);
    node.line_color = next_param(ctx, scan_char);
    node.corner_rounding = next_param(ctx, scan_u32);
    return node;
}

match_result match_graphic_circle(scanner_context& ctx) {
    ast::graphic_circle node;
    node.diameter = required_leading_param(ctx, scan_u32, "unsigned integer (diameter)", "^GC");
    node.border_thickness = next_param(ctx, scan_u32);
    node.line_color = next_param(ctx, scan_char);
    return node;
}

match_result match_graphic_ellipse(scanner_context& ctx) {
    ast::graphic_ellipse node;
    node.width = required_leading_param(ctx, scan_u32, "unsigned integer (width)", "^GE");
    node.height = next_param(ctx, scan_u32);
    node.border_thickness = next_param(ctx, scan_u32);
    node.line_color = next_param(ctx, scan_char);
    return node;
}

match_result match_graphic_field(scanner_context& ctx) {
    ast::graphic_field node;
    node.compression_type = required_leading_param(ctx, scan_char, "compression type", "^GF");
    node.binary_byte_count = next_param(ctx, scan_u32);
    node.graphic_field_count = next_param(ctx, scan_u32);
    node.bytes_per_row = next_param(ctx, scan_u32);
    ctx.consume(',');
    node.data = trim(ctx.take_till_caret());
    return node;
}

// ============================================================================
// Barcodes
// ============================================================================

match_result match_qr_code(scanner_context& ctx) {
    argument_region region(ctx);
    ast::qr_code node;
    node.orientation = required_leading_param(ctx, scan_char, "orientation", "^BQ");
    node.model = next_param(ctx, scan_u32);
    node.magnification = next_param(ctx, scan_u32);
    node.error_correction = next_param(ctx, scan_char);
    node.mask = next_param(ctx, scan_u32);
    return node;
}

match_result match_code39(scanner_context& ctx) {
    argument_region region(ctx);
    ast::code39 node;
    node.orientation = required_leading_param(ctx, scan_char, "orientation", "^B3");
    node.check_digit = next_param(ctx, scan_char);
    node.height = next_param(ctx, scan_u32);
    node.interpretation_line = next_param(ctx, scan_char);
    node.interpretation_line_above = next_param(ctx, scan_char);
    return node;
}

match_result match_barcode_default(scanner_context& ctx) {
    argument_region region(ctx);
    ast::barcode_default node;
    // A non-numeric module width is not ^BY; leave it to the fallback
    if (!leading_param(ctx, scan_u32, node.module_width)) {
        return std::nullopt;
    }
    node.ratio = next_param(ctx, scan_f32);
    node.height = next_param(ctx, scan_u32);
    return node;
}

match_result match_data_matrix(scanner_context& ctx) {
    argument_region region(ctx);
    ast::data_matrix node;
    node.orientation = required_leading_param(ctx, scan_char, "orientation", "^BX");
    node.height = next_param(ctx, scan_u32);
    node.quality = next_param(ctx, scan_u32);
    node.columns = next_param(ctx, scan_u32);
    node.rows = next_param(ctx, scan_u32);
    return node;
}

match_result match_code128(scanner_context& ctx) {
    argument_region region(ctx);
    ast::code128 node;
    node.orientation = required_leading_param(ctx, scan_char, "orientation", "^BC");
    node.height = next_param(ctx, scan_u32);
    node.interpretation_line = next_param(ctx, scan_char);
    node.interpretation_line_above = next_param(ctx, scan_char);
    node.check_digit = next_param(ctx, scan_char);
    node.mode = next_param(ctx, scan_char);
    return node;
}

} // namespace zplc::parser
