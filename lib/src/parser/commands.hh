//
// Created by igor on 02/12/2025.
//
// Command matchers. Each matcher runs with the cursor placed right after its
// tag and either returns the parsed command, returns nullopt to let the next
// matcher in the table try (soft failure, cursor is restored by the caller),
// or throws parse_error (hard failure).
//

#pragma once

#include <optional>

#include <zplc/ast.hh>

#include "parser/scanner_context.hh"

namespace zplc::parser {

using match_result = std::optional<ast::command_node>;
using matcher_fn = match_result (*)(scanner_context&);

// Format and label setup
match_result match_start_format(scanner_context& ctx);
match_result match_end_format(scanner_context& ctx);
match_result match_label_home(scanner_context& ctx);
match_result match_label_length(scanner_context& ctx);
match_result match_label_reverse(scanner_context& ctx);
match_result match_change_charset(scanner_context& ctx);
match_result match_comment(scanner_context& ctx);

// Fields
match_result match_field_origin(scanner_context& ctx);
match_result match_field_typeset(scanner_context& ctx);
match_result match_field_separator(scanner_context& ctx);
match_result match_field_reverse(scanner_context& ctx);
match_result match_field_data(scanner_context& ctx);
match_result match_field_block(scanner_context& ctx);

// Fonts
match_result match_font_full(scanner_context& ctx);
match_result match_change_font(scanner_context& ctx);

// Graphics
match_result match_graphic_box(scanner_context& ctx);
match_result match_graphic_circle(scanner_context& ctx);
match_result match_graphic_ellipse(scanner_context& ctx);
match_result match_graphic_field(scanner_context& ctx);

// Barcodes
match_result match_qr_code(scanner_context& ctx);
match_result match_code39(scanner_context& ctx);
match_result match_barcode_default(scanner_context& ctx);
match_result match_data_matrix(scanner_context& ctx);
match_result match_code128(scanner_context& ctx);

// Extensions
match_result match_custom_image(scanner_context& ctx);
match_result match_text_color(scanner_context& ctx);
match_result match_line_color(scanner_context& ctx);

/// "^" followed by any two characters; arguments are kept verbatim
match_result match_unsupported(scanner_context& ctx);

} // namespace zplc::parser
