//
// Created by igor on 05/12/2025.
//
// Registers accumulated by the instruction builder while it walks one label.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zplc::ir::detail {

struct position_state {
    uint32_t x = 0;
    uint32_t y = 0;
};

/// Width, height and thickness. Thickness doubles as QR magnification.
struct metrics_state {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t thickness = 0;
};

struct attribute_state {
    std::optional<char> orientation;
    std::optional<char> interpretation_line;
    std::optional<char> interpretation_line_above;
    std::optional<char> check_digit;
    std::optional<char> mode;
    std::optional<char> error_correction;
    std::optional<char> line_color;
    std::optional<std::string> custom_line_color;
};

struct parameter_state {
    uint32_t rounding = 0;
    uint32_t model = 2;
    uint32_t mask = 7;
    std::optional<double> ratio;
};

struct font_state {
    char name = '0';
    std::optional<char> orientation;
    std::optional<uint32_t> height;
    std::optional<uint32_t> width;
    std::optional<std::string> color;
};

enum class pending_kind {
    text,
    graphic_box,
    graphic_circle,
    graphic_ellipse,
    graphic_field,
    custom_image,
    code128,
    code39,
    qr_code
};

struct modal_state {
    position_state position;
    position_state typeset;
    metrics_state metrics;
    metrics_state barcode_defaults;
    attribute_state attributes;
    parameter_state params;
    font_state font;
    bool reverse = false;

    // Per field, cleared by ^FS
    std::optional<std::string> value;
    std::optional<std::vector<uint8_t>> bitmap;
    std::optional<pending_kind> kind;

    void end_field() {
        value.reset();
        bitmap.reset();
        kind.reset();
        reverse = false;
    }
};

} // namespace zplc::ir::detail
