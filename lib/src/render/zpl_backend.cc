//
// ZPL Backend Implementation
//

#include <charconv>

#include <zplc/codec.hh>
#include <zplc/error.hh>
#include <zplc/render/zpl_backend.hh>

namespace zplc::render {

namespace {
    // Shortest fixed notation that parses back to the same float
    std::string ratio_text(double ratio) {
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<float>(ratio),
                                       std::chars_format::fixed);
        if (ec != std::errc()) {
            return "3.0";
        }
        return std::string(buf, end);
    }
}

// ============================================================================
// Page lifecycle
// ============================================================================

void ZplBackend::setup_page(uint32_t width_dots, uint32_t height_dots, double dpi) {
    (void)width_dots;
    (void)dpi;
    writer_ = std::make_unique<LineWriter>();
    line_color_.reset();
    text_color_.reset();
    writer_->write_line("^XA");
    *writer_ << "^LL" << height_dots << endl;
}

void ZplBackend::setup_font_source(const shared_font_registry&) {
    // Font ids are kept as they are; the printer resolves them
}

std::vector<uint8_t> ZplBackend::finalize() {
    if (!writer_) {
        throw backend_error("zpl: finalize called before setup_page");
    }
    writer_->write_line("^XZ");
    std::vector<uint8_t> bytes = writer_->take();
    writer_.reset();
    return bytes;
}

LineWriter& ZplBackend::begin_field(const char* primitive, uint32_t x, uint32_t y, bool reverse) {
    if (!writer_) {
        throw backend_error(std::string("zpl: ") + primitive + " called before setup_page");
    }
    *writer_ << "^FO" << x << ',' << y;
    if (reverse) {
        *writer_ << "^FR";
    }
    return *writer_;
}

// Custom colors persist until replaced, so only changes are written
void ZplBackend::set_line_color(const std::optional<std::string>& color) {
    if (color && color != line_color_) {
        writer_->write_line("^GLC" + *color);
        line_color_ = color;
    }
}

void ZplBackend::set_text_color(const std::optional<std::string>& color) {
    if (color && color != text_color_) {
        writer_->write_line("^GTC" + *color);
        text_color_ = color;
    }
}

// ============================================================================
// Primitives
// ============================================================================

void ZplBackend::draw_text(const ir::text& instr) {
    if (writer_) {
        set_text_color(instr.color);
    }
    LineWriter& w = begin_field("draw_text", instr.x, instr.y, instr.reverse_print);
    w << "^A" << instr.font << instr.orientation << "," << instr.height << "," << instr.width
      << "^FD" << instr.content << "^FS" << endl;
}

void ZplBackend::draw_graphic_box(const ir::graphic_box& instr) {
    if (writer_) {
        set_line_color(instr.custom_color);
    }
    LineWriter& w = begin_field("draw_graphic_box", instr.x, instr.y, instr.reverse_print);
    w << "^GB" << instr.width << "," << instr.height << "," << instr.thickness << "," << instr.color << ","
      << instr.rounding << "^FS" << endl;
}

void ZplBackend::draw_graphic_circle(const ir::graphic_circle& instr) {
    if (writer_) {
        set_line_color(instr.custom_color);
    }
    LineWriter& w = begin_field("draw_graphic_circle", instr.x, instr.y, instr.reverse_print);
    w << "^GC" << instr.diameter << "," << instr.thickness << "," << instr.color << "^FS" << endl;
}

void ZplBackend::draw_graphic_ellipse(const ir::graphic_ellipse& instr) {
    if (writer_) {
        set_line_color(instr.custom_color);
    }
    LineWriter& w = begin_field("draw_graphic_ellipse", instr.x, instr.y, instr.reverse_print);
    w << "^GE" << instr.width << "," << instr.height << "," << instr.thickness << "," << instr.color << "^FS"
      << endl;
}

void ZplBackend::draw_graphic_field(const ir::graphic_field& instr) {
    LineWriter& w = begin_field("draw_graphic_field", instr.x, instr.y, instr.reverse_print);
    const uint32_t bytes_per_row = instr.width / 8;
    const uint32_t field_count = bytes_per_row * instr.height;
    const std::string data = compress_ ? codec::compress_bitmap(instr.data) : codec::to_hex(instr.data);
    w << "^GFA," << instr.data.size() << "," << field_count << "," << bytes_per_row << "," << data << "^FS"
      << endl;
}

void ZplBackend::draw_custom_image(const ir::custom_image& instr) {
    LineWriter& w = begin_field("draw_custom_image", instr.x, instr.y, false);
    w << "^GIC" << instr.width << "," << instr.height << "," << instr.data << "^FS" << endl;
}

void ZplBackend::draw_code128(const ir::code128& instr) {
    LineWriter& w = begin_field("draw_code128", instr.x, instr.y, instr.reverse_print);
    w << "^BY" << instr.module_width << "^BC" << instr.orientation << "," << instr.height << ","
      << instr.interpretation_line << "," << instr.interpretation_line_above << "," << instr.check_digit << ","
      << instr.mode << "^FD" << instr.data << "^FS" << endl;
}

void ZplBackend::draw_code39(const ir::code39& instr) {
    LineWriter& w = begin_field("draw_code39", instr.x, instr.y, instr.reverse_print);
    w << "^BY" << instr.module_width << "," << ratio_text(instr.ratio) << "^B3" << instr.orientation << ","
      << instr.check_digit << "," << instr.height << "," << instr.interpretation_line << ","
      << instr.interpretation_line_above << "^FD" << instr.data << "^FS" << endl;
}

void ZplBackend::draw_qr_code(const ir::qr_code& instr) {
    LineWriter& w = begin_field("draw_qr_code", instr.x, instr.y, instr.reverse_print);
    w << "^BQ" << instr.orientation << "," << instr.model << "," << instr.magnification << ","
      << instr.error_correction << "," << instr.mask << "^FD" << instr.data << "^FS" << endl;
}

// ============================================================================
// Options
// ============================================================================

std::string ZplBackend::get_description() const {
    return "Canonical ZPL with absolute positions and explicit parameters";
}

std::vector<OptionDescription> ZplBackend::get_options() const {
    return {
        {"compress", OptionType::Bool, "Run-length compress ^GF bitmap data", "true", {}}
    };
}

void ZplBackend::set_option(const std::string& name, const OptionValue& value) {
    if (name == "compress") {
        if (!std::holds_alternative<bool>(value)) {
            throw std::invalid_argument("zpl-compress expects a boolean");
        }
        compress_ = std::get<bool>(value);
        return;
    }
    Backend::set_option(name, value);
}

} // namespace zplc::render
