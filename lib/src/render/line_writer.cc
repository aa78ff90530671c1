//
// Created by igor on 06/12/2025.
//

#include <charconv>
#include <utility>

#include <zplc/render/line_writer.hh>

namespace zplc::render {

namespace {
    template<typename Int>
    void append_number(std::string& out, Int value) {
        char buf[24];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        (void)ec;  // 24 bytes hold any 64-bit value
        out.append(buf, end);
    }
}

LineWriter::LineWriter(std::string indent_unit)
    : unit_(std::move(indent_unit)) {
}

void LineWriter::commit() {
    if (!pending_.empty()) {
        for (std::size_t i = 0; i < depth_; ++i) {
            text_ += unit_;
        }
        text_ += pending_;
        pending_.clear();
    }
    text_ += '\n';
    lines_++;
}

void LineWriter::write_line(std::string_view line) {
    if (!pending_.empty()) {
        commit();
    }
    pending_ = line;
    commit();
}

LineWriter& LineWriter::operator<<(std::string_view text) {
    pending_ += text;
    return *this;
}

LineWriter& LineWriter::operator<<(char c) {
    pending_ += c;
    return *this;
}

LineWriter& LineWriter::operator<<(uint32_t value) {
    append_number(pending_, value);
    return *this;
}

LineWriter& LineWriter::operator<<(std::size_t value) {
    append_number(pending_, value);
    return *this;
}

LineWriter& LineWriter::operator<<(LineWriter& (*manip)(LineWriter&)) {
    return manip(*this);
}

IndentBlock LineWriter::indented() {
    return IndentBlock(*this);
}

std::vector<uint8_t> LineWriter::take() {
    std::vector<uint8_t> bytes(text_.begin(), text_.end());
    text_.clear();
    pending_.clear();
    lines_ = 0;
    return bytes;
}

LineWriter& endl(LineWriter& writer) {
    writer.commit();
    return writer;
}

// ============================================================================
// IndentBlock
// ============================================================================

IndentBlock::IndentBlock(LineWriter& writer)
    : writer_(&writer) {
    writer_->depth_++;
}

IndentBlock::~IndentBlock() {
    if (writer_ && writer_->depth_ > 0) {
        writer_->depth_--;
    }
}

IndentBlock::IndentBlock(IndentBlock&& other) noexcept
    : writer_(other.writer_) {
    other.writer_ = nullptr;
}

} // namespace zplc::render
