//
// Created by igor on 02/12/2025.
//

#include <zplc/error.hh>

#include "parser/scanner_context.hh"

namespace zplc::parser {

source_location locate(std::string_view input, std::size_t offset) {
    if (offset > input.size()) {
        offset = input.size();
    }
    source_location loc{1, 1};
    for (std::size_t i = 0; i < offset; ++i) {
        if (input[i] == '\n') {
            loc.line++;
            loc.column = 1;
        } else {
            loc.column++;
        }
    }
    return loc;
}

std::size_t scanner_context::line_at(std::size_t offset) {
    if (offset > input.size()) {
        offset = input.size();
    }
    if (offset < m_line_offset) {
        return locate(input, offset).line;
    }
    for (; m_line_offset < offset; ++m_line_offset) {
        if (input[m_line_offset] == '\n') {
            m_line++;
        }
    }
    return m_line;
}

bool scanner_context::consume(std::string_view tag) {
    if (cursor > limit || limit - cursor < tag.size()) {
        return false;
    }
    if (input.compare(cursor, tag.size(), tag) != 0) {
        return false;
    }
    cursor += tag.size();
    return true;
}

bool scanner_context::consume(char c) {
    if (at_end() || input[cursor] != c) {
        return false;
    }
    cursor++;
    return true;
}

std::string_view scanner_context::take_till_caret() {
    std::size_t start = cursor;
    while (!at_end() && input[cursor] != '^') {
        cursor++;
    }
    return input.substr(start, cursor - start);
}

void scanner_context::skip_whitespace() {
    while (!at_end()) {
        char c = input[cursor];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            break;
        }
        cursor++;
    }
}

std::string scanner_context::excerpt(std::size_t offset, std::size_t max_length) const {
    std::string out;
    for (std::size_t i = offset; i < input.size() && out.size() < max_length; ++i) {
        char c = input[i];
        if (c == '\n' || c == '\r') {
            break;
        }
        out += c;
    }
    if (out.empty()) {
        return offset < input.size() ? "end of line" : "end of input";
    }
    return "'" + out + "'";
}

void fail(const scanner_context& ctx, std::size_t offset, const std::string& message) {
    source_location loc = locate(ctx.input, offset);
    throw parse_error(message, loc.line, loc.column);
}

std::string trim(std::string_view text) {
    const char* ws = " \t\r\n\f\v";
    std::size_t first = text.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    std::size_t last = text.find_last_not_of(ws);
    return std::string(text.substr(first, last - first + 1));
}

} // namespace zplc::parser
