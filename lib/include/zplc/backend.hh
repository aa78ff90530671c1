#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <zplc/font_registry.hh>
#include <zplc/ir.hh>
#include <zplc/render/option_description.hh>

namespace zplc::render {

// ============================================================================
// Abstract Backend
// ============================================================================

/// Output target for resolved drawing instructions
///
/// The engine drives a backend in a fixed order: setup_page, then
/// setup_font_source, then one draw call per instruction in draw order, then
/// finalize. All coordinates are absolute dots and every default has already
/// been applied. Text and barcode payloads arrive with variables substituted.
///
/// **Example Usage:**
/// \code
///   auto* backend = BackendRegistry::instance().find("zpl");
///   zplc::engine label(text, unit::inches(4), unit::inches(6), resolution());
///   std::vector<uint8_t> bytes = label.render(*backend);
/// \endcode
class Backend {
public:
    virtual ~Backend() = default;

    // ========================================================================
    // Page lifecycle
    // ========================================================================

    /// Start a new page, discarding anything drawn before
    virtual void setup_page(uint32_t width_dots, uint32_t height_dots, double dpi) = 0;

    virtual void setup_font_source(const shared_font_registry& fonts) = 0;

    /// Finish the page and hand back the encoded output
    /// @throws backend_error if no page was set up
    virtual std::vector<uint8_t> finalize() = 0;

    // ========================================================================
    // Drawing primitives
    // ========================================================================

    virtual void draw_text(const ir::text& instr) = 0;
    virtual void draw_graphic_box(const ir::graphic_box& instr) = 0;
    virtual void draw_graphic_circle(const ir::graphic_circle& instr) = 0;
    virtual void draw_graphic_ellipse(const ir::graphic_ellipse& instr) = 0;
    virtual void draw_graphic_field(const ir::graphic_field& instr) = 0;

    /// width or height of 0 asks for the image's natural size
    virtual void draw_custom_image(const ir::custom_image& instr) = 0;

    virtual void draw_code128(const ir::code128& instr) = 0;
    virtual void draw_code39(const ir::code39& instr) = 0;
    virtual void draw_qr_code(const ir::qr_code& instr) = 0;

    // ========================================================================
    // Metadata & options (for CLI driver)
    // ========================================================================

    /// Registry name, also the prefix of its options: --<name>-<option>=<value>
    [[nodiscard]] virtual std::string get_name() const = 0;

    [[nodiscard]] virtual std::string get_description() const = 0;

    /// Extension of the files this backend writes, including the dot
    [[nodiscard]] virtual std::string get_file_extension() const = 0;

    [[nodiscard]] virtual std::vector<OptionDescription> get_options() const {
        return {};
    }

    /// @throws std::invalid_argument if option name is unknown or value is invalid
    virtual void set_option(const std::string& name, const OptionValue& value) {
        (void)value;
        throw std::invalid_argument(get_name() + " backend has no option: " + name);
    }
};

} // namespace zplc::render
