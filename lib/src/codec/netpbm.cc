//
// Created by igor on 04/12/2025.
//

#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include <zplc/error.hh>
#include <zplc/netpbm.hh>

namespace zplc::codec {

namespace {
    class header_reader {
        public:
            explicit header_reader(std::string_view bytes)
                : m_bytes(bytes),
                  m_pos(0) {
            }

            // Next whitespace separated token, skipping '#' comments
            std::string next_token(const char* what) {
                skip_space_and_comments();
                std::size_t start = m_pos;
                while (m_pos < m_bytes.size() && !is_space(m_bytes[m_pos])) {
                    m_pos++;
                }
                if (start == m_pos) {
                    throw image_error(std::string("truncated header, missing ") + what);
                }
                return std::string(m_bytes.substr(start, m_pos - start));
            }

            uint32_t next_number(const char* what, uint32_t max_value) {
                std::string tok = next_token(what);
                uint64_t value = 0;
                for (char c : tok) {
                    if (c < '0' || c > '9') {
                        throw image_error(std::string("invalid ") + what + " '" + tok + "'");
                    }
                    value = value * 10 + static_cast<uint64_t>(c - '0');
                    if (value > max_value) {
                        throw image_error(std::string(what) + " out of range: " + tok);
                    }
                }
                return static_cast<uint32_t>(value);
            }

            // Binary formats: exactly one whitespace byte follows maxval
            std::string_view raster() {
                if (m_pos < m_bytes.size()) {
                    m_pos++;
                }
                return m_bytes.substr(m_pos);
            }

        private:
            static bool is_space(char c) {
                return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
            }

            void skip_space_and_comments() {
                while (m_pos < m_bytes.size()) {
                    char c = m_bytes[m_pos];
                    if (is_space(c)) {
                        m_pos++;
                    } else if (c == '#') {
                        while (m_pos < m_bytes.size() && m_bytes[m_pos] != '\n') {
                            m_pos++;
                        }
                    } else {
                        break;
                    }
                }
            }

            std::string_view m_bytes;
            std::size_t m_pos;
    };

    uint8_t scale(uint32_t sample, uint32_t maxval) {
        return static_cast<uint8_t>((static_cast<uint64_t>(sample) * 255 + maxval / 2) / maxval);
    }

    uint8_t luma(uint8_t r, uint8_t g, uint8_t b) {
        return static_cast<uint8_t>((2126u * r + 7152u * g + 722u * b) / 10000u);
    }
}

gray_image read_netpbm(std::string_view bytes) {
    header_reader reader(bytes);
    std::string magic = reader.next_token("magic");
    if (magic != "P2" && magic != "P3" && magic != "P5" && magic != "P6") {
        throw image_error("unsupported image format '" + magic + "' (expected P2, P3, P5 or P6)");
    }
    const bool color = magic == "P3" || magic == "P6";
    const bool binary = magic == "P5" || magic == "P6";

    gray_image image;
    image.width = reader.next_number("width", std::numeric_limits<uint32_t>::max());
    image.height = reader.next_number("height", std::numeric_limits<uint32_t>::max());
    uint32_t maxval = reader.next_number("maxval", 65535);
    if (image.width == 0 || image.height == 0) {
        throw image_error("invalid dimensions " + std::to_string(image.width) + "x"
                          + std::to_string(image.height));
    }
    if (maxval == 0) {
        throw image_error("maxval must be positive");
    }

    const uint64_t pixel_count = static_cast<uint64_t>(image.width) * image.height;
    const uint64_t packed = (static_cast<uint64_t>(image.width) + 7) / 8 * image.height;
    if (packed > max_bitmap_size) {
        throw security_limit_error("image " + std::to_string(image.width) + "x"
                                   + std::to_string(image.height) + " exceeds the bitmap limit");
    }

    const unsigned channels = color ? 3 : 1;
    const unsigned sample_size = maxval > 255 ? 2 : 1;
    image.pixels.reserve(static_cast<std::size_t>(pixel_count));

    if (binary) {
        std::string_view raster = reader.raster();
        const uint64_t needed = pixel_count * channels * sample_size;
        if (raster.size() < needed) {
            throw image_error("pixel data truncated: expected " + std::to_string(needed)
                              + " bytes, found " + std::to_string(raster.size()));
        }
        std::size_t pos = 0;
        auto sample = [&]() -> uint8_t {
            uint32_t v = static_cast<unsigned char>(raster[pos++]);
            if (sample_size == 2) {
                v = (v << 8) | static_cast<unsigned char>(raster[pos++]);
            }
            return scale(v > maxval ? maxval : v, maxval);
        };
        for (uint64_t i = 0; i < pixel_count; ++i) {
            if (color) {
                uint8_t r = sample();
                uint8_t g = sample();
                uint8_t b = sample();
                image.pixels.push_back(luma(r, g, b));
            } else {
                image.pixels.push_back(sample());
            }
        }
    } else {
        auto sample = [&]() -> uint8_t {
            return scale(reader.next_number("pixel", maxval), maxval);
        };
        for (uint64_t i = 0; i < pixel_count; ++i) {
            if (color) {
                uint8_t r = sample();
                uint8_t g = sample();
                uint8_t b = sample();
                image.pixels.push_back(luma(r, g, b));
            } else {
                image.pixels.push_back(sample());
            }
        }
    }
    return image;
}

gray_image load_netpbm(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw image_error("cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return read_netpbm(buffer.str());
}

} // namespace zplc::codec
