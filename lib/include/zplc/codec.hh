//
// ^GF bitmap codec
//
// Decodes the ASCII hex payload of ^GFA (including the G..Y / g..z repeat
// letters and the ':' ',' '!' row shortcuts) into packed 1-bit rows, and
// produces such payloads from grayscale images.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace zplc::codec {

/// Upper bound on a decoded or encoded bitmap, in bytes
inline constexpr std::size_t max_bitmap_size = 10 * 1024 * 1024;

/// Largest run a single repeat sequence may describe when encoding
inline constexpr std::size_t max_run_length = 400;

/// 8-bit grayscale image, row-major, one sample per pixel
struct gray_image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;
};

struct encoded_bitmap {
    std::string data;           // compressed ASCII hex
    std::size_t total_bytes;    // ^GF binary byte count and field count
    std::size_t bytes_per_row;
};

/// Decode an ASCII hex payload. Never fails: unknown characters are skipped
/// and output stops growing at max_bitmap_size. bytes_per_row == 0 disables
/// the row shortcuts.
std::vector<uint8_t> decode(std::string_view text, std::size_t bytes_per_row);

/// Threshold to 1 bit per pixel (luma < 128 is black) and compress.
/// Throws security_limit_error when the packed bitmap exceeds max_bitmap_size.
encoded_bitmap encode(const gray_image& image);

/// Pack an image without compressing it
std::vector<uint8_t> pack_bitmap(const gray_image& image);

/// Uppercase hex, two characters per byte
std::string to_hex(const std::vector<uint8_t>& bytes);

/// Replace runs of identical hex characters with repeat letters
std::string compress_hex(std::string_view hex);

/// to_hex followed by compress_hex
std::string compress_bitmap(const std::vector<uint8_t>& bytes);

} // namespace zplc::codec
