#include "parser/parameters.hh"

#include <charconv>
#include <limits>

namespace zplc::parser {

bool is_delimiter(char c) {
    switch (c) {
        case ',':
        case '^':
        case '\r':
        case '\n':
        case ' ':
        case '\t':
            return true;
        default:
            return false;
    }
}

bool at_terminator(const scanner_context& ctx) {
    return ctx.at_end() || is_delimiter(ctx.peek());
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

std::optional<uint32_t> scan_u32(scanner_context& ctx) {
    std::size_t pos = ctx.cursor;
    uint64_t value = 0;
    while (pos < ctx.limit && is_digit(ctx.input[pos])) {
        value = value * 10 + static_cast<uint64_t>(ctx.input[pos] - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        pos++;
    }
    if (pos == ctx.cursor) {
        return std::nullopt;
    }
    ctx.cursor = pos;
    return static_cast<uint32_t>(value);
}

std::optional<float> scan_f32(scanner_context& ctx) {
    std::size_t pos = ctx.cursor;
    while (pos < ctx.limit && is_digit(ctx.input[pos])) {
        pos++;
    }
    if (pos == ctx.cursor) {
        return std::nullopt;
    }
    // Fraction only counts when at least one digit follows the dot
    if (pos + 1 < ctx.limit && ctx.input[pos] == '.' && is_digit(ctx.input[pos + 1])) {
        pos++;
        while (pos < ctx.limit && is_digit(ctx.input[pos])) {
            pos++;
        }
    }
    const char* first = ctx.input.data() + ctx.cursor;
    const char* last = ctx.input.data() + pos;
    ctx.cursor = pos;
    float value = 0.0f;
    // The span holds digits and at most one '.', so it always parses whole
    if (std::from_chars(first, last, value, std::chars_format::fixed).ec == std::errc::result_out_of_range) {
        // Too many digits for a float: saturate, or flush to zero when only
        // the fraction is non-zero
        for (const char* p = first; p != last && *p != '.'; ++p) {
            if (*p != '0') {
                return std::numeric_limits<float>::infinity();
            }
        }
        return 0.0f;
    }
    return value;
}

std::optional<char> scan_char(scanner_context& ctx) {
    if (ctx.at_end() || is_delimiter(ctx.peek())) {
        return std::nullopt;
    }
    return ctx.input[ctx.cursor++];
}

uint32_t mandatory_u32(scanner_context& ctx, const char* what, const char* tag) {
    std::size_t at = ctx.cursor;
    auto value = scan_u32(ctx);
    if (!value) {
        fail(ctx, at, std::string("expected unsigned integer (") + what + ") for '" + tag
                      + "', found " + ctx.excerpt(at));
    }
    return *value;
}

char mandatory_char(scanner_context& ctx, const char* what, const char* tag) {
    std::size_t at = ctx.cursor;
    auto value = scan_char(ctx);
    if (!value) {
        fail(ctx, at, std::string("expected ") + what + " after '" + tag + "', found "
                      + ctx.excerpt(at));
    }
    return *value;
}

void mandatory_comma(scanner_context& ctx, const char* before, const char* tag) {
    std::size_t at = ctx.cursor;
    if (!ctx.consume(',')) {
        fail(ctx, at, std::string("expected ',' before ") + before + " for '" + tag
                      + "', found " + ctx.excerpt(at));
    }
}

} // namespace zplc::parser
