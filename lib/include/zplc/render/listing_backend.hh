//
// Listing backend
//
// Human-readable dump of resolved instructions, one line each.
//

#pragma once

#include <memory>

#include <zplc/backend.hh>
#include <zplc/render/line_writer.hh>

namespace zplc::render {

class ListingBackend : public Backend {
public:
    ListingBackend() = default;

    void setup_page(uint32_t width_dots, uint32_t height_dots, double dpi) override;
    void setup_font_source(const shared_font_registry& fonts) override;
    std::vector<uint8_t> finalize() override;

    void draw_text(const ir::text& instr) override;
    void draw_graphic_box(const ir::graphic_box& instr) override;
    void draw_graphic_circle(const ir::graphic_circle& instr) override;
    void draw_graphic_ellipse(const ir::graphic_ellipse& instr) override;
    void draw_graphic_field(const ir::graphic_field& instr) override;
    void draw_custom_image(const ir::custom_image& instr) override;
    void draw_code128(const ir::code128& instr) override;
    void draw_code39(const ir::code39& instr) override;
    void draw_qr_code(const ir::qr_code& instr) override;

    [[nodiscard]] std::string get_name() const override { return "listing"; }
    [[nodiscard]] std::string get_description() const override;
    [[nodiscard]] std::string get_file_extension() const override { return ".txt"; }

    [[nodiscard]] std::vector<OptionDescription> get_options() const override;
    void set_option(const std::string& name, const OptionValue& value) override;

private:
    /// Writer positioned on a new instruction line, starting with the kind column
    LineWriter& begin_instruction(const char* primitive, std::string_view kind);
    void write_bitmap_preview(const ir::graphic_field& instr);

    bool bitmap_preview_ = false;

    std::unique_ptr<LineWriter> writer_;
    std::size_t count_ = 0;
};

} // namespace zplc::render
