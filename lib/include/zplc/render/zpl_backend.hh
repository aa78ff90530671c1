//
// ZPL backend
//
// Re-emits a label as canonical ZPL: one field per instruction, every
// parameter explicit, absolute ^FO positions. Compiling the output yields
// the same instructions.
//

#pragma once

#include <memory>
#include <optional>

#include <zplc/backend.hh>
#include <zplc/render/line_writer.hh>

namespace zplc::render {

class ZplBackend : public Backend {
public:
    ZplBackend() = default;

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

    [[nodiscard]] std::string get_name() const override { return "zpl"; }
    [[nodiscard]] std::string get_description() const override;
    [[nodiscard]] std::string get_file_extension() const override { return ".zpl"; }

    [[nodiscard]] std::vector<OptionDescription> get_options() const override;
    void set_option(const std::string& name, const OptionValue& value) override;

private:
    /// ^FO plus ^FR, the common head of every field
    LineWriter& begin_field(const char* primitive, uint32_t x, uint32_t y, bool reverse);
    void set_line_color(const std::optional<std::string>& color);
    void set_text_color(const std::optional<std::string>& color);

    bool compress_ = true;

    std::unique_ptr<LineWriter> writer_;
    std::optional<std::string> line_color_;
    std::optional<std::string> text_color_;
};

} // namespace zplc::render
