//
// Cursor over the ZPL source shared by all command matchers.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace zplc::parser {

struct source_location {
    std::size_t line;
    std::size_t column;
};

/// 1-indexed line/column of a byte offset in the input
source_location locate(std::string_view input, std::size_t offset);

struct scanner_context {
    explicit scanner_context(std::string_view text)
        : input(text),
          cursor(0),
          limit(text.size()) {
    }

    std::string_view input;
    std::size_t cursor;
    std::size_t limit;  // end of the region being scanned, normally input.size()

    /// 1-indexed line of offset. Offsets must not decrease between calls;
    /// lines are counted incrementally from the previous offset.
    std::size_t line_at(std::size_t offset);

    [[nodiscard]] bool at_end() const { return cursor >= limit; }

    [[nodiscard]] char peek() const { return at_end() ? '\0' : input[cursor]; }

    /// Advance past tag if the remaining input starts with it
    bool consume(std::string_view tag);

    bool consume(char c);

    /// Consume everything up to (not including) the next '^' or the region end
    std::string_view take_till_caret();

    /// Skip spaces, tabs, carriage returns and newlines
    void skip_whitespace();

    /// Short printable excerpt of the input at offset, for diagnostics
    [[nodiscard]] std::string excerpt(std::size_t offset, std::size_t max_length = 16) const;

private:
    std::size_t m_line_offset = 0;
    std::size_t m_line = 1;
};

/// Throws parse_error located at offset
[[noreturn]] void fail(const scanner_context& ctx, std::size_t offset, const std::string& message);

/// Strip leading and trailing ASCII whitespace
std::string trim(std::string_view text);

} // namespace zplc::parser
