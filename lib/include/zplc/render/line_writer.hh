//
// Created by igor on 06/12/2025.
//
// Page text buffer for the textual backends. Text is streamed into the
// pending line and committed by `endl`; committed lines get the current
// indentation.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace zplc::render {

class IndentBlock;

class LineWriter {
public:
    explicit LineWriter(std::string indent_unit = "    ");

    LineWriter(const LineWriter&) = delete;
    LineWriter& operator=(const LineWriter&) = delete;

    /// Commit a whole line; anything pending is committed first
    void write_line(std::string_view line);

    LineWriter& operator<<(std::string_view text);
    LineWriter& operator<<(char c);
    LineWriter& operator<<(uint32_t value);
    LineWriter& operator<<(std::size_t value);
    LineWriter& operator<<(LineWriter& (*manip)(LineWriter&));

    /// Append " key=value" to the pending line
    template<typename T>
    LineWriter& field(std::string_view key, const T& value) {
        return *this << ' ' << key << '=' << value;
    }

    [[nodiscard]] IndentBlock indented();

    [[nodiscard]] std::size_t line_count() const { return lines_; }

    /// Committed text as bytes; the writer is empty afterwards
    [[nodiscard]] std::vector<uint8_t> take();

    friend LineWriter& endl(LineWriter& writer);

private:
    friend class IndentBlock;

    void commit();

    std::string text_;
    std::string pending_;
    std::string unit_;
    std::size_t depth_ = 0;
    std::size_t lines_ = 0;
};

/// Commit the pending line
LineWriter& endl(LineWriter& writer);

/// Raises the indentation of a LineWriter for its lifetime
class IndentBlock {
public:
    explicit IndentBlock(LineWriter& writer);
    ~IndentBlock();

    IndentBlock(const IndentBlock&) = delete;
    IndentBlock& operator=(const IndentBlock&) = delete;
    IndentBlock(IndentBlock&& other) noexcept;
    IndentBlock& operator=(IndentBlock&&) = delete;

private:
    LineWriter* writer_;
};

} // namespace zplc::render
