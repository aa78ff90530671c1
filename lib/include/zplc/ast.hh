//
// Command model produced by the ZPL parser.
//
// One record per recognized directive. Records are plain data: every optional
// parameter stays optional here, defaults are applied later by the
// instruction builder.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zplc::ast {
    enum class yes_no {
        yes,
        no
    };

    enum class justification {
        left,
        center,
        right,
        justified
    };

    /// 'Y' maps to yes, anything else to no
    yes_no yes_no_from_char(char c);

    /// 'L', 'C', 'R', 'J'; anything else maps to left
    justification justification_from_char(char c);

    char to_char(yes_no value);
    char to_char(justification value);

    // -----------------------------
    // Format and label setup
    // -----------------------------

    // ^XA
    struct start_format {
    };

    // ^XZ
    struct end_format {
    };

    // ^LH
    struct label_home {
        std::optional<uint32_t> x;
        std::optional<uint32_t> y;
    };

    // ^LL
    struct label_length {
        std::optional<uint32_t> length;
    };

    // ^LR
    struct label_reverse {
        std::optional<yes_no> reverse;
    };

    // ^CI
    struct change_charset {
        std::optional<uint32_t> charset;
    };

    // ^FX
    struct comment {
        std::string text;
    };

    // -----------------------------
    // Field positioning and data
    // -----------------------------

    // ^FO
    struct field_origin {
        std::optional<uint32_t> x;
        std::optional<uint32_t> y;
    };

    // ^FT
    struct field_typeset {
        std::optional<uint32_t> x;
        std::optional<uint32_t> y;
    };

    // ^FS
    struct field_separator {
    };

    // ^FR
    struct field_reverse {
    };

    // ^FD
    struct field_data {
        std::string data;
    };

    // ^FB
    struct field_block {
        std::optional<uint32_t> width;
        std::optional<uint32_t> max_lines;
        std::optional<uint32_t> line_spacing;
        std::optional<justification> justify;
        std::optional<uint32_t> indent;
    };

    // -----------------------------
    // Fonts
    // -----------------------------

    // ^CF - change default font
    struct font_spec {
        char font_name;
        std::optional<uint32_t> height;
        std::optional<uint32_t> width;
    };

    // ^A - font for the following field
    struct font_spec_full {
        char font_name;
        std::optional<char> orientation;
        std::optional<uint32_t> height;
        std::optional<uint32_t> width;
    };

    // -----------------------------
    // Graphics
    // -----------------------------

    // ^GB - width and height are mandatory
    struct graphic_box {
        uint32_t width;
        uint32_t height;
        std::optional<uint32_t> border_thickness;
        std::optional<char> line_color;
        std::optional<uint32_t> corner_rounding;
    };

    // ^GC
    struct graphic_circle {
        std::optional<uint32_t> diameter;
        std::optional<uint32_t> border_thickness;
        std::optional<char> line_color;
    };

    // ^GE
    struct graphic_ellipse {
        std::optional<uint32_t> width;
        std::optional<uint32_t> height;
        std::optional<uint32_t> border_thickness;
        std::optional<char> line_color;
    };

    // ^GF - raw bitmap, data is the compressed payload
    struct graphic_field {
        std::optional<char> compression_type;
        std::optional<uint32_t> binary_byte_count;
        std::optional<uint32_t> graphic_field_count;
        std::optional<uint32_t> bytes_per_row;
        std::string data;
    };

    // ^GIC - color image extension, all parameters mandatory
    struct custom_image {
        uint32_t width;
        uint32_t height;
        std::string data;  // base64
    };

    // ^GTC - text color extension
    struct text_color {
        std::string color;
    };

    // ^GLC - line color extension
    struct line_color {
        std::string color;
    };

    // -----------------------------
    // Barcodes
    // -----------------------------

    // ^BC
    struct code128 {
        std::optional<char> orientation;
        std::optional<uint32_t> height;
        std::optional<char> interpretation_line;
        std::optional<char> interpretation_line_above;
        std::optional<char> check_digit;
        std::optional<char> mode;
    };

    // ^B3
    struct code39 {
        std::optional<char> orientation;
        std::optional<char> check_digit;
        std::optional<uint32_t> height;
        std::optional<char> interpretation_line;
        std::optional<char> interpretation_line_above;
    };

    // ^BQ
    struct qr_code {
        std::optional<char> orientation;
        std::optional<uint32_t> model;
        std::optional<uint32_t> magnification;
        std::optional<char> error_correction;
        std::optional<uint32_t> mask;
    };

    // ^BX
    struct data_matrix {
        std::optional<char> orientation;
        std::optional<uint32_t> height;
        std::optional<uint32_t> quality;
        std::optional<uint32_t> columns;
        std::optional<uint32_t> rows;
    };

    // ^BY
    struct barcode_default {
        std::optional<uint32_t> module_width;
        std::optional<float> ratio;
        std::optional<uint32_t> height;
    };

    // Any "^" followed by two characters that no other matcher accepted
    struct unsupported_command {
        std::string command;  // e.g. "^ZZ"
        std::string args;
    };

    using command_node = std::variant <
        start_format,
        end_format,
        label_home,
        label_length,
        label_reverse,
        change_charset,
        comment,
        field_origin,
        field_typeset,
        field_separator,
        field_reverse,
        field_data,
        field_block,
        font_spec,
        font_spec_full,
        graphic_box,
        graphic_circle,
        graphic_ellipse,
        graphic_field,
        custom_image,
        text_color,
        line_color,
        code128,
        code39,
        qr_code,
        data_matrix,
        barcode_default,
        unsupported_command
    >;

    struct command {
        std::size_t line;  // 1-indexed line the command tag starts on
        command_node node;
    };

    using command_list = std::vector<command>;
}
