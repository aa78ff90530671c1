//
// Tests for LineWriter
//

#include <doctest/doctest.h>
#include <zplc/render/line_writer.hh>

#include <string>
#include <utility>

using namespace zplc::render;

namespace {
    std::string text_of(LineWriter& w) {
        auto bytes = w.take();
        return std::string(bytes.begin(), bytes.end());
    }
}

TEST_SUITE("Render - Line Writer") {
    TEST_CASE("Streamed text is committed by endl") {
        LineWriter w;
        w << "^FO" << uint32_t{10} << ',' << std::size_t{20} << endl;
        w.write_line("^XZ");
        CHECK(w.line_count() == 2);
        CHECK(text_of(w) == "^FO10,20\n^XZ\n");
    }

    TEST_CASE("Indented blocks nest and unwind") {
        LineWriter w;
        w.write_line("a");
        {
            auto outer = w.indented();
            w.write_line("b");
            {
                auto inner = w.indented();
                w << "c" << endl;
            }
            w.write_line("d");
        }
        w.write_line("e");
        CHECK(text_of(w) == "a\n    b\n        c\n    d\ne\n");
    }

    TEST_CASE("Blank lines are not indented") {
        LineWriter w("  ");
        auto block = w.indented();
        w << endl;
        w.write_line("x");
        CHECK(text_of(w) == "\n  x\n");
    }

    TEST_CASE("Fields are space separated") {
        LineWriter w;
        w << "box";
        w.field("width", uint32_t{100}).field("color", 'B').field("name", std::string("logo")) << endl;
        CHECK(text_of(w) == "box width=100 color=B name=logo\n");
    }

    TEST_CASE("write_line commits pending text first") {
        LineWriter w;
        w << "partial";
        w.write_line("whole");
        CHECK(text_of(w) == "partial\nwhole\n");
    }

    TEST_CASE("Moved block restores indentation once") {
        LineWriter w;
        {
            auto first = w.indented();
            IndentBlock second(std::move(first));
            w.write_line("x");
        }
        w.write_line("y");
        CHECK(text_of(w) == "    x\ny\n");
    }

    TEST_CASE("take empties the writer") {
        LineWriter w;
        w.write_line("once");
        CHECK_FALSE(w.take().empty());
        CHECK(w.take().empty());
        CHECK(w.line_count() == 0);
    }
}
