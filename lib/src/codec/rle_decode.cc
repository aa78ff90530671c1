//
// Created by igor on 04/12/2025.
//

#include <algorithm>
#include <optional>

#include <zplc/codec.hh>

namespace zplc::codec {

namespace {
    // Repeat count applied to a single hex digit
    constexpr std::size_t max_digit_repeat = 10000;
    // Copies of the previous row a single ':' may add
    constexpr std::size_t max_row_repeat = 1000;

    int hex_value(char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        return -1;
    }

    std::size_t saturating_add(std::size_t a, std::size_t b) {
        std::size_t r = a + b;
        return r < a ? static_cast<std::size_t>(-1) : r;
    }

    class bitmap_writer {
        public:
            explicit bitmap_writer(std::size_t bytes_per_row)
                : m_bytes_per_row(bytes_per_row) {
            }

            [[nodiscard]] bool full() const { return m_out.size() >= max_bitmap_size; }

            [[nodiscard]] std::size_t row_position() const {
                return m_bytes_per_row == 0 ? 0 : m_out.size() % m_bytes_per_row;
            }

            void push(uint8_t b) {
                if (!full()) {
                    m_out.push_back(b);
                }
            }

            void fill(std::size_t count, uint8_t b) {
                count = std::min(count, max_bitmap_size - std::min(max_bitmap_size, m_out.size()));
                m_out.insert(m_out.end(), count, b);
            }

            /// Append out[from, from + count), clipped to the cap
            void copy_back(std::size_t from, std::size_t count) {
                count = std::min(count, max_bitmap_size - std::min(max_bitmap_size, m_out.size()));
                for (std::size_t i = 0; i < count; ++i) {
                    uint8_t b = m_out[from + i];
                    m_out.push_back(b);
                }
            }

            void flush_nibble(std::optional<uint8_t>& high, uint8_t low) {
                if (high) {
                    push(static_cast<uint8_t>((*high << 4) | low));
                    high.reset();
                }
            }

            // ':' - complete the current row from the previous one, then repeat
            // the last full row
            void repeat_row(std::size_t multiplier) {
                const std::size_t bpr = m_bytes_per_row;
                std::size_t total = multiplier == 0 ? 1 : multiplier;
                std::size_t done = 0;

                std::size_t pos = row_position();
                if (pos > 0) {
                    std::size_t row_start = m_out.size() - pos;
                    if (row_start >= bpr) {
                        copy_back(row_start - bpr + pos, bpr - pos);
                    } else {
                        fill(bpr - pos, 0x00);
                    }
                    done++;
                }

                if (done >= total) {
                    return;
                }
                std::size_t remaining = std::min(total - done, max_row_repeat);
                for (std::size_t i = 0; i < remaining; ++i) {
                    if (m_out.size() + bpr > max_bitmap_size) {
                        break;
                    }
                    if (m_out.size() >= bpr) {
                        copy_back(m_out.size() - bpr, bpr);
                    } else {
                        fill(bpr, 0x00);
                    }
                }
            }

            // ',' and '!' - pad the current row, or add a whole row when the
            // previous token already ended one
            void pad_row(uint8_t value, bool after_row_terminator) {
                std::size_t pos = row_position();
                if (pos != 0) {
                    fill(m_bytes_per_row - pos, value);
                } else if (after_row_terminator) {
                    fill(m_bytes_per_row, value);
                }
            }

            std::vector<uint8_t> take() { return std::move(m_out); }

        private:
            std::size_t m_bytes_per_row;
            std::vector<uint8_t> m_out;
    };
}

std::vector<uint8_t> decode(std::string_view text, std::size_t bytes_per_row) {
    bitmap_writer out(bytes_per_row);
    std::size_t multiplier = 0;
    std::optional<uint8_t> high;
    bool last_was_row_terminator = false;

    for (char c : text) {
        if (out.full()) {
            break;
        }

        if (c >= 'G' && c <= 'Y') {
            multiplier = saturating_add(multiplier, static_cast<std::size_t>(c - 'G') + 1);
            continue;
        }
        if (c >= 'g' && c <= 'z') {
            multiplier = saturating_add(multiplier, (static_cast<std::size_t>(c - 'g') + 1) * 20);
            continue;
        }

        switch (c) {
            case ':':
                out.flush_nibble(high, 0x00);
                if (bytes_per_row > 0) {
                    out.repeat_row(multiplier);
                }
                multiplier = 0;
                last_was_row_terminator = true;
                continue;
            case ',':
                out.flush_nibble(high, 0x00);
                if (bytes_per_row > 0) {
                    out.pad_row(0x00, last_was_row_terminator);
                }
                multiplier = 0;
                last_was_row_terminator = true;
                continue;
            case '!':
                out.flush_nibble(high, 0x0F);
                if (bytes_per_row > 0) {
                    out.pad_row(0xFF, last_was_row_terminator);
                }
                multiplier = 0;
                last_was_row_terminator = true;
                continue;
            default:
                break;
        }

        int value = hex_value(c);
        if (value < 0) {
            continue;
        }
        std::size_t count = std::min(multiplier == 0 ? std::size_t{1} : multiplier, max_digit_repeat);
        multiplier = 0;
        for (std::size_t i = 0; i < count && !out.full(); ++i) {
            if (high) {
                out.flush_nibble(high, static_cast<uint8_t>(value));
            } else {
                high = static_cast<uint8_t>(value);
            }
        }
        last_was_row_terminator = false;
    }

    out.flush_nibble(high, 0x00);
    return out.take();
}

} // namespace zplc::codec
