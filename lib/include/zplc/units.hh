//
// Created by igor on 06/12/2025.
//

#pragma once

#include <cstdint>
#include <string_view>

namespace zplc {
    /// Printer resolution. The four standard heads use their nominal
    /// dots-per-millimeter; anything else is a custom dpi.
    class resolution {
        public:
            enum class kind {
                dpi152,
                dpi203,
                dpi300,
                dpi600,
                custom
            };

            constexpr resolution()
                : m_kind(kind::dpi203),
                  m_custom_dpi(0) {
            }

            static constexpr resolution standard(kind k) {
                return resolution(k, 0);
            }

            static constexpr resolution custom(double dpi) {
                return resolution(kind::custom, dpi);
            }

            /// 152, 203, 300 and 600 select the standard heads
            static resolution from_dpi(double dpi);

            [[nodiscard]] kind get_kind() const { return m_kind; }
            [[nodiscard]] double dpi() const;
            [[nodiscard]] double dpmm() const;

            bool operator==(const resolution&) const = default;

        private:
            constexpr resolution(kind k, double custom_dpi)
                : m_kind(k),
                  m_custom_dpi(custom_dpi) {
            }

            kind m_kind;
            double m_custom_dpi;
    };

    /// Physical length of a label edge
    struct unit {
        enum class kind {
            dots,
            inches,
            millimeters,
            centimeters
        };

        kind type = kind::dots;
        double value = 0;

        static unit dots(uint32_t v) { return {kind::dots, static_cast<double>(v)}; }
        static unit inches(double v) { return {kind::inches, v}; }
        static unit millimeters(double v) { return {kind::millimeters, v}; }
        static unit centimeters(double v) { return {kind::centimeters, v}; }

        /// Parse "812", "812dots", "4in", "100mm" or "10cm". Throws config_error.
        static unit parse(std::string_view text);

        /// Negative lengths clamp to zero, the result is rounded to the nearest dot
        [[nodiscard]] uint32_t to_dots(const resolution& res) const;

        bool operator==(const unit&) const = default;
    };
}
