//
// Parameter primitives and combinators for ZPL command matchers.
//
// Primitives advance the cursor only when they match. Combinators implement
// the positional, comma-delimited parameter lists:
//
//   leading_param   - first parameter (no comma). Absent when the cursor sits
//                     on a terminator; returns false if a value is present
//                     but does not match.
//   next_param      - ",value". A missing comma, an empty value or a
//                     mismatching value all yield "absent"; on mismatch the
//                     cursor is restored to before the comma.
//   mandatory_*     - hard failures: throw parse_error, no backtracking into
//                     other matchers.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "parser/scanner_context.hh"

namespace zplc::parser {

/// Characters that can never start or form a parameter value
bool is_delimiter(char c);

/// True at region end or on ',', '^' or whitespace
bool at_terminator(const scanner_context& ctx);

/// One or more ASCII digits that fit in 32 bits
std::optional<uint32_t> scan_u32(scanner_context& ctx);

/// Digits with an optional fractional part
std::optional<float> scan_f32(scanner_context& ctx);

/// Any single character except , ^ \r \n space tab
std::optional<char> scan_char(scanner_context& ctx);

template<typename Scan>
auto leading_param(scanner_context& ctx, Scan scan, decltype(scan(ctx))& out) -> bool {
    out.reset();
    if (at_terminator(ctx)) {
        return true;
    }
    out = scan(ctx);
    return out.has_value();
}

template<typename Scan>
auto next_param(scanner_context& ctx, Scan scan) -> decltype(scan(ctx)) {
    std::size_t saved = ctx.cursor;
    if (!ctx.consume(',')) {
        return std::nullopt;
    }
    if (at_terminator(ctx)) {
        return std::nullopt;
    }
    auto value = scan(ctx);
    if (!value) {
        ctx.cursor = saved;
    }
    return value;
}

/// Leading parameter whose mismatch is a hard failure
template<typename Scan>
auto required_leading_param(scanner_context& ctx, Scan scan,
                            const char* expected, const char* tag) -> decltype(scan(ctx)) {
    decltype(scan(ctx)) out;
    std::size_t at = ctx.cursor;
    if (!leading_param(ctx, scan, out)) {
        fail(ctx, at, std::string("expected ") + expected + " for '" + tag + "', found "
                      + ctx.excerpt(at));
    }
    return out;
}

uint32_t mandatory_u32(scanner_context& ctx, const char* what, const char* tag);

char mandatory_char(scanner_context& ctx, const char* what, const char* tag);

void mandatory_comma(scanner_context& ctx, const char* before, const char* tag);

} // namespace zplc::parser
