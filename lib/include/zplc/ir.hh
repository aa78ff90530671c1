//
// Drawing instructions produced by the instruction builder
//
// Every field is resolved: absolute coordinates in dots, defaults applied.
// The order of an instruction list is the draw order.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zplc::ir {

// ============================================================================
// Text
// ============================================================================

struct text {
    uint32_t x = 0;
    uint32_t y = 0;
    char font = '0';
    char orientation = 'N';
    uint32_t height = 0;
    uint32_t width = 0;
    std::string content;
    bool reverse_print = false;
    std::optional<std::string> color;  // custom text color, absent = black

    bool operator==(const text&) const = default;
};

// ============================================================================
// Graphics
// ============================================================================

struct graphic_box {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t thickness = 1;
    char color = 'B';
    std::optional<std::string> custom_color;
    uint32_t rounding = 0;
    bool reverse_print = false;

    bool operator==(const graphic_box&) const = default;
};

struct graphic_circle {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t diameter = 0;
    uint32_t thickness = 1;
    char color = 'B';
    std::optional<std::string> custom_color;
    bool reverse_print = false;

    bool operator==(const graphic_circle&) const = default;
};

struct graphic_ellipse {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t thickness = 1;
    char color = 'B';
    std::optional<std::string> custom_color;
    bool reverse_print = false;

    bool operator==(const graphic_ellipse&) const = default;
};

/// Monochrome bitmap, rows of ceil(width / 8) bytes, MSB is the leftmost dot
struct graphic_field {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> data;
    bool reverse_print = false;

    bool operator==(const graphic_field&) const = default;
};

struct custom_image {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string data;  // base64 payload

    bool operator==(const custom_image&) const = default;
};

// ============================================================================
// Barcodes
// ============================================================================

struct code128 {
    uint32_t x = 0;
    uint32_t y = 0;
    char orientation = 'N';
    uint32_t height = 10;
    uint32_t module_width = 2;
    char interpretation_line = 'Y';
    char interpretation_line_above = 'N';
    char check_digit = 'N';
    char mode = 'N';
    std::string data;
    bool reverse_print = false;

    bool operator==(const code128&) const = default;
};

struct code39 {
    uint32_t x = 0;
    uint32_t y = 0;
    char orientation = 'N';
    char check_digit = 'N';
    uint32_t height = 10;
    uint32_t module_width = 2;
    double ratio = 3.0;
    char interpretation_line = 'Y';
    char interpretation_line_above = 'N';
    std::string data;
    bool reverse_print = false;

    bool operator==(const code39&) const = default;
};

struct qr_code {
    uint32_t x = 0;
    uint32_t y = 0;
    char orientation = 'N';
    uint32_t model = 2;
    uint32_t magnification = 2;
    char error_correction = 'M';
    uint32_t mask = 7;
    std::string data;
    bool reverse_print = false;

    bool operator==(const qr_code&) const = default;
};

using instruction = std::variant<
    text,
    graphic_box,
    graphic_circle,
    graphic_ellipse,
    graphic_field,
    custom_image,
    code128,
    code39,
    qr_code
>;

using instruction_list = std::vector<instruction>;

// ============================================================================
// Builder diagnostics
// ============================================================================

enum class diagnostic_level {
    note,
    warning
};

struct diagnostic {
    diagnostic_level level;
    std::string message;
    std::size_t line;  // source line of the command that caused it

    bool operator==(const diagnostic&) const = default;
};

/// Result of building one label
struct build_result {
    instruction_list instructions;
    std::vector<diagnostic> diagnostics;
};

} // namespace zplc::ir
