//
// Listing Backend Implementation
//

#include <sstream>

#include <zplc/error.hh>
#include <zplc/render/listing_backend.hh>

namespace zplc::render {

namespace {
    // Width of the instruction kind column
    constexpr std::size_t kind_width = 7;

    std::string quoted(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        out += '"';
        return out;
    }

    std::string number(double value) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }

    char yes_no(bool value) {
        return value ? 'Y' : 'N';
    }

    void custom_color(LineWriter& w, const std::optional<std::string>& color) {
        if (color) {
            w.field("custom-color", *color);
        }
    }
}

// ============================================================================
// Page lifecycle
// ============================================================================

void ListingBackend::setup_page(uint32_t width_dots, uint32_t height_dots, double dpi) {
    writer_ = std::make_unique<LineWriter>();
    count_ = 0;
    *writer_ << "; page " << width_dots << 'x' << height_dots << " dots, " << number(dpi) << " dpi" << endl;
}

void ListingBackend::setup_font_source(const shared_font_registry& fonts) {
    if (!writer_) {
        throw backend_error("listing: setup_font_source called before setup_page");
    }
    LineWriter& w = *writer_;
    if (!fonts || fonts->empty()) {
        w.write_line("; fonts: none registered");
        return;
    }
    w << "; fonts:";
    for (const auto& [id, name] : fonts->mapping()) {
        w << ' ' << id << '=' << name;
    }
    w << endl;
}

std::vector<uint8_t> ListingBackend::finalize() {
    if (!writer_) {
        throw backend_error("listing: finalize called before setup_page");
    }
    *writer_ << "; " << count_ << " instruction(s)" << endl;
    std::vector<uint8_t> bytes = writer_->take();
    writer_.reset();
    return bytes;
}

LineWriter& ListingBackend::begin_instruction(const char* primitive, std::string_view kind) {
    if (!writer_) {
        throw backend_error(std::string("listing: ") + primitive + " called before setup_page");
    }
    count_++;
    *writer_ << kind;
    for (std::size_t i = kind.size(); i < kind_width; ++i) {
        *writer_ << ' ';
    }
    return *writer_;
}

// ============================================================================
// Primitives
// ============================================================================

void ListingBackend::draw_text(const ir::text& instr) {
    LineWriter& w = begin_instruction("draw_text", "text");
    w.field("x", instr.x).field("y", instr.y).field("font", instr.font).field("orientation", instr.orientation)
     .field("height", instr.height).field("width", instr.width).field("reverse", yes_no(instr.reverse_print));
    if (instr.color) {
        w.field("color", *instr.color);
    }
    w << ' ' << quoted(instr.content) << endl;
}

void ListingBackend::draw_graphic_box(const ir::graphic_box& instr) {
    LineWriter& w = begin_instruction("draw_graphic_box", "box");
    w.field("x", instr.x).field("y", instr.y).field("width", instr.width).field("height", instr.height)
     .field("thickness", instr.thickness).field("color", instr.color);
    custom_color(w, instr.custom_color);
    w.field("rounding", instr.rounding).field("reverse", yes_no(instr.reverse_print)) << endl;
}

void ListingBackend::draw_graphic_circle(const ir::graphic_circle& instr) {
    LineWriter& w = begin_instruction("draw_graphic_circle", "circle");
    w.field("x", instr.x).field("y", instr.y).field("diameter", instr.diameter)
     .field("thickness", instr.thickness).field("color", instr.color);
    custom_color(w, instr.custom_color);
    w.field("reverse", yes_no(instr.reverse_print)) << endl;
}

void ListingBackend::draw_graphic_ellipse(const ir::graphic_ellipse& instr) {
    LineWriter& w = begin_instruction("draw_graphic_ellipse", "ellipse");
    w.field("x", instr.x).field("y", instr.y).field("width", instr.width).field("height", instr.height)
     .field("thickness", instr.thickness).field("color", instr.color);
    custom_color(w, instr.custom_color);
    w.field("reverse", yes_no(instr.reverse_print)) << endl;
}

void ListingBackend::draw_graphic_field(const ir::graphic_field& instr) {
    LineWriter& w = begin_instruction("draw_graphic_field", "bitmap");
    w.field("x", instr.x).field("y", instr.y).field("width", instr.width).field("height", instr.height)
     .field("bytes", instr.data.size()).field("reverse", yes_no(instr.reverse_print)) << endl;
    if (bitmap_preview_) {
        write_bitmap_preview(instr);
    }
}

// One row of '#' (set) and '.' (clear) per bitmap row
void ListingBackend::write_bitmap_preview(const ir::graphic_field& instr) {
    const std::size_t bytes_per_row = (static_cast<std::size_t>(instr.width) + 7) / 8;
    if (bytes_per_row == 0) {
        return;
    }
    auto block = writer_->indented();
    for (std::size_t row = 0; row < instr.height; ++row) {
        const std::size_t offset = row * bytes_per_row;
        if (offset >= instr.data.size()) {
            break;
        }
        std::string line;
        line.reserve(instr.width);
        for (std::size_t x = 0; x < instr.width; ++x) {
            const std::size_t index = offset + x / 8;
            const bool set = index < instr.data.size() && (instr.data[index] >> (7 - x % 8)) & 1;
            line += set ? '#' : '.';
        }
        writer_->write_line(line);
    }
}

void ListingBackend::draw_custom_image(const ir::custom_image& instr) {
    LineWriter& w = begin_instruction("draw_custom_image", "image");
    w.field("x", instr.x).field("y", instr.y).field("width", instr.width).field("height", instr.height)
     .field("base64-length", instr.data.size()) << endl;
}

void ListingBackend::draw_code128(const ir::code128& instr) {
    LineWriter& w = begin_instruction("draw_code128", "code128");
    w.field("x", instr.x).field("y", instr.y).field("orientation", instr.orientation)
     .field("height", instr.height).field("module-width", instr.module_width)
     .field("interpretation", instr.interpretation_line).field("above", instr.interpretation_line_above)
     .field("check-digit", instr.check_digit).field("mode", instr.mode)
     .field("reverse", yes_no(instr.reverse_print));
    w << ' ' << quoted(instr.data) << endl;
}

void ListingBackend::draw_code39(const ir::code39& instr) {
    LineWriter& w = begin_instruction("draw_code39", "code39");
    w.field("x", instr.x).field("y", instr.y).field("orientation", instr.orientation)
     .field("height", instr.height).field("module-width", instr.module_width).field("ratio", number(instr.ratio))
     .field("interpretation", instr.interpretation_line).field("above", instr.interpretation_line_above)
     .field("check-digit", instr.check_digit).field("reverse", yes_no(instr.reverse_print));
    w << ' ' << quoted(instr.data) << endl;
}

void ListingBackend::draw_qr_code(const ir::qr_code& instr) {
    LineWriter& w = begin_instruction("draw_qr_code", "qr");
    w.field("x", instr.x).field("y", instr.y).field("orientation", instr.orientation)
     .field("model", instr.model).field("magnification", instr.magnification)
     .field("error-correction", instr.error_correction).field("mask", instr.mask)
     .field("reverse", yes_no(instr.reverse_print));
    w << ' ' << quoted(instr.data) << endl;
}

// ============================================================================
// Options
// ============================================================================

std::string ListingBackend::get_description() const {
    return "Human-readable listing of the resolved drawing instructions";
}

std::vector<OptionDescription> ListingBackend::get_options() const {
    return {
        {"bitmap-preview", OptionType::Bool, "Draw ^GF bitmaps as rows of '#' and '.'", "false", {}}
    };
}

void ListingBackend::set_option(const std::string& name, const OptionValue& value) {
    if (name == "bitmap-preview") {
        if (!std::holds_alternative<bool>(value)) {
            throw std::invalid_argument("listing-bitmap-preview expects a boolean");
        }
        bitmap_preview_ = std::get<bool>(value);
        return;
    }
    Backend::set_option(name, value);
}

} // namespace zplc::render
