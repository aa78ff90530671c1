//
// Created by igor on 04/12/2025.
//

#include <algorithm>
#include <string>

#include <zplc/codec.hh>
#include <zplc/error.hh>

namespace zplc::codec {

std::vector<uint8_t> pack_bitmap(const gray_image& image) {
    const std::size_t bytes_per_row = (static_cast<std::size_t>(image.width) + 7) / 8;
    const std::size_t total = bytes_per_row * image.height;
    if (total > max_bitmap_size) {
        throw security_limit_error("bitmap of " + std::to_string(total) + " bytes exceeds the "
                                   + std::to_string(max_bitmap_size) + " byte limit");
    }
    if (image.pixels.size() < static_cast<std::size_t>(image.width) * image.height) {
        throw image_error("pixel buffer is smaller than " + std::to_string(image.width) + "x"
                          + std::to_string(image.height));
    }

    std::vector<uint8_t> bitmap(total, 0);
    for (std::size_t y = 0; y < image.height; ++y) {
        const std::size_t row_offset = y * bytes_per_row;
        for (std::size_t x = 0; x < image.width; ++x) {
            // 1 is a printed (black) dot
            if (image.pixels[y * image.width + x] < 128) {
                bitmap[row_offset + x / 8] |= static_cast<uint8_t>(1u << (7 - x % 8));
            }
        }
    }
    return bitmap;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex += digits[b >> 4];
        hex += digits[b & 0x0F];
    }
    return hex;
}

std::string compress_hex(std::string_view hex) {
    std::string encoded;
    std::size_t i = 0;
    while (i < hex.size()) {
        std::size_t count = 1;
        while (i + count < hex.size() && hex[i + count] == hex[i] && count < max_run_length) {
            count++;
        }

        if (count > 1) {
            std::size_t remaining = count;
            // Multiples of 20: g..z
            while (remaining >= 20) {
                std::size_t factor = std::min<std::size_t>(remaining / 20, 20);
                encoded += static_cast<char>('g' + factor - 1);
                remaining -= factor * 20;
            }
            // Units: G..Y
            if (remaining > 0) {
                encoded += static_cast<char>('G' + remaining - 1);
            }
        }
        encoded += hex[i];
        i += count;
    }
    return encoded;
}

std::string compress_bitmap(const std::vector<uint8_t>& bytes) {
    return compress_hex(to_hex(bytes));
}

encoded_bitmap encode(const gray_image& image) {
    std::vector<uint8_t> bitmap = pack_bitmap(image);
    encoded_bitmap result;
    result.data = compress_bitmap(bitmap);
    result.total_bytes = bitmap.size();
    result.bytes_per_row = (static_cast<std::size_t>(image.width) + 7) / 8;
    return result;
}

} // namespace zplc::codec
