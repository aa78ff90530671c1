//
// Created by igor on 06/12/2025.
//

#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

#include <zplc/error.hh>
#include <zplc/units.hh>

namespace zplc {

resolution resolution::from_dpi(double dpi) {
    if (dpi == 152) {
        return standard(kind::dpi152);
    }
    if (dpi == 203) {
        return standard(kind::dpi203);
    }
    if (dpi == 300) {
        return standard(kind::dpi300);
    }
    if (dpi == 600) {
        return standard(kind::dpi600);
    }
    return custom(dpi);
}

double resolution::dpi() const {
    switch (m_kind) {
        case kind::dpi152: return 152.0;
        case kind::dpi203: return 203.2;
        case kind::dpi300: return 304.8;
        case kind::dpi600: return 609.6;
        case kind::custom: break;
    }
    return m_custom_dpi;
}

double resolution::dpmm() const {
    switch (m_kind) {
        case kind::dpi152: return 6.0;
        case kind::dpi203: return 8.0;
        case kind::dpi300: return 12.0;
        case kind::dpi600: return 24.0;
        case kind::custom: break;
    }
    return m_custom_dpi / 25.4;
}

uint32_t unit::to_dots(const resolution& res) const {
    double v = value > 0 ? value : 0.0;
    double dots = 0;
    switch (type) {
        case kind::dots: dots = v; break;
        case kind::inches: dots = v * res.dpi(); break;
        case kind::millimeters: dots = v * res.dpmm(); break;
        case kind::centimeters: dots = v * 10.0 * res.dpmm(); break;
    }
    dots = std::round(dots);
    if (dots >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(dots);
}

unit unit::parse(std::string_view text) {
    std::string s(text);
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin) {
        throw config_error("invalid length '" + s + "'");
    }
    std::string suffix(end);

    if (suffix.empty() || suffix == "dots") {
        if (v < 0 || v != std::floor(v)) {
            throw config_error("length in dots must be a whole number: '" + s + "'");
        }
        return {kind::dots, v};
    }
    if (suffix == "in") {
        return inches(v);
    }
    if (suffix == "mm") {
        return millimeters(v);
    }
    if (suffix == "cm") {
        return centimeters(v);
    }
    throw config_error("unknown length unit '" + suffix + "' in '" + s + "' (use dots, in, mm or cm)");
}

} // namespace zplc
