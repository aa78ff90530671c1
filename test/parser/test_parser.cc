//
// Parser tests: command recognition, parameters and error locations
//

#include <doctest/doctest.h>
#include <zplc/parser.hh>

#include <cmath>
#include <string>
#include <variant>

using namespace zplc;

namespace {
    template<typename T>
    const T& node_at(const ast::command_list& cmds, std::size_t i) {
        REQUIRE(i < cmds.size());
        REQUIRE(std::holds_alternative<T>(cmds[i].node));
        return std::get<T>(cmds[i].node);
    }

    std::size_t error_line(const char* text) {
        try {
            parse_zpl(text);
        } catch (const parse_error& e) {
            return e.line();
        }
        FAIL("expected parse_error");
        return 0;
    }
}

TEST_SUITE("Parser - Commands") {
    TEST_CASE("Whitespace-only input yields no commands") {
        CHECK(parse_zpl("").empty());
        CHECK(parse_zpl("  \r\n\t ").empty());
    }

    TEST_CASE("Simple text label") {
        auto cmds = parse_zpl("^XA^FO50,50^A0N,50,50^FDHello^FS^XZ");
        REQUIRE(cmds.size() == 6);

        node_at<ast::start_format>(cmds, 0);

        const auto& fo = node_at<ast::field_origin>(cmds, 1);
        CHECK(fo.x == 50u);
        CHECK(fo.y == 50u);

        const auto& font = node_at<ast::font_spec_full>(cmds, 2);
        CHECK(font.font_name == '0');
        CHECK(font.orientation == 'N');
        CHECK(font.height == 50u);
        CHECK(font.width == 50u);

        CHECK(node_at<ast::field_data>(cmds, 3).data == "Hello");
        node_at<ast::field_separator>(cmds, 4);
        node_at<ast::end_format>(cmds, 5);
    }

    TEST_CASE("Commands may be separated by line breaks") {
        auto cmds = parse_zpl("^XA\r\n^FO10,20\n^FDA B C^FS\n^XZ\n");
        REQUIRE(cmds.size() == 5);
        CHECK(node_at<ast::field_data>(cmds, 2).data == "A B C");
    }

    TEST_CASE("Optional parameters stay absent") {
        auto cmds = parse_zpl("^FO50^A0^GC100^LH,5");
        CHECK(node_at<ast::field_origin>(cmds, 0).x == 50u);
        CHECK_FALSE(node_at<ast::field_origin>(cmds, 0).y.has_value());

        const auto& font = node_at<ast::font_spec_full>(cmds, 1);
        CHECK(font.font_name == '0');
        CHECK_FALSE(font.orientation.has_value());
        CHECK_FALSE(font.height.has_value());

        const auto& gc = node_at<ast::graphic_circle>(cmds, 2);
        CHECK(gc.diameter == 100u);
        CHECK_FALSE(gc.border_thickness.has_value());

        const auto& lh = node_at<ast::label_home>(cmds, 3);
        CHECK_FALSE(lh.x.has_value());
        CHECK(lh.y == 5u);
    }

    TEST_CASE("Font without orientation") {
        auto cmds = parse_zpl("^AD,36,20");
        const auto& font = node_at<ast::font_spec_full>(cmds, 0);
        CHECK(font.font_name == 'D');
        CHECK_FALSE(font.orientation.has_value());
        CHECK(font.height == 36u);
        CHECK(font.width == 20u);
    }

    TEST_CASE("Graphic box parameters") {
        auto cmds = parse_zpl("^GB300,200,5,W,3");
        const auto& gb = node_at<ast::graphic_box>(cmds, 0);
        CHECK(gb.width == 300u);
        CHECK(gb.height == 200u);
        CHECK(gb.border_thickness == 5u);
        CHECK(gb.line_color == 'W');
        CHECK(gb.corner_rounding == 3u);
    }

    TEST_CASE("Graphic field keeps its payload") {
        auto cmds = parse_zpl("^GFA,4,4,2,FFFF00FF^FS");
        const auto& gf = node_at<ast::graphic_field>(cmds, 0);
        CHECK(gf.compression_type == 'A');
        CHECK(gf.binary_byte_count == 4u);
        CHECK(gf.graphic_field_count == 4u);
        CHECK(gf.bytes_per_row == 2u);
        CHECK(gf.data == "FFFF00FF");
    }

    TEST_CASE("Barcode defaults with a fractional ratio") {
        auto cmds = parse_zpl("^BY3,2.5,40^FS");
        const auto& by = node_at<ast::barcode_default>(cmds, 0);
        CHECK(by.module_width == 3u);
        REQUIRE(by.ratio.has_value());
        CHECK(*by.ratio == doctest::Approx(2.5));
        CHECK(by.height == 40u);
    }

    TEST_CASE("Overlong barcode ratio saturates") {
        const std::string zpl = "^BY2," + std::string(60, '9') + ",20^FS";
        auto cmds = parse_zpl(zpl);
        const auto& by = node_at<ast::barcode_default>(cmds, 0);
        CHECK(by.module_width == 2u);
        REQUIRE(by.ratio.has_value());
        CHECK(std::isinf(*by.ratio));
        CHECK(by.height == 20u);

        // Fraction too small for a float flushes to zero
        cmds = parse_zpl("^BY2,0." + std::string(60, '0') + "1,20");
        const auto& tiny = node_at<ast::barcode_default>(cmds, 0);
        REQUIRE(tiny.ratio.has_value());
        CHECK(*tiny.ratio == 0.0f);
        CHECK(tiny.height == 20u);
    }

    TEST_CASE("Barcode commands") {
        auto cmds = parse_zpl("^BCN,100,Y,N,N^B3R,Y,60^BQN,2,5^BXN,10");
        const auto& bc = node_at<ast::code128>(cmds, 0);
        CHECK(bc.orientation == 'N');
        CHECK(bc.height == 100u);
        CHECK(bc.interpretation_line == 'Y');
        CHECK(bc.interpretation_line_above == 'N');
        CHECK(bc.check_digit == 'N');
        CHECK_FALSE(bc.mode.has_value());

        const auto& b3 = node_at<ast::code39>(cmds, 1);
        CHECK(b3.orientation == 'R');
        CHECK(b3.check_digit == 'Y');
        CHECK(b3.height == 60u);

        const auto& qr = node_at<ast::qr_code>(cmds, 2);
        CHECK(qr.model == 2u);
        CHECK(qr.magnification == 5u);

        CHECK(node_at<ast::data_matrix>(cmds, 3).height == 10u);
    }

    TEST_CASE("Extension commands") {
        auto cmds = parse_zpl("^GTC#FF0000^GLC#00FF00^GIC10,20,QUJD^FS");
        CHECK(node_at<ast::text_color>(cmds, 0).color == "#FF0000");
        CHECK(node_at<ast::line_color>(cmds, 1).color == "#00FF00");
        const auto& img = node_at<ast::custom_image>(cmds, 2);
        CHECK(img.width == 10u);
        CHECK(img.height == 20u);
        CHECK(img.data == "QUJD");
    }

    TEST_CASE("Comments and charset") {
        auto cmds = parse_zpl("^FX shipping label ^CI28");
        CHECK(node_at<ast::comment>(cmds, 0).text == "shipping label");
        CHECK(node_at<ast::change_charset>(cmds, 1).charset == 28u);
    }

    TEST_CASE("Unknown commands pass through") {
        auto cmds = parse_zpl("^ZZfoo^FS");
        REQUIRE(cmds.size() == 2);
        const auto& u = node_at<ast::unsupported_command>(cmds, 0);
        CHECK(u.command == "^ZZ");
        CHECK(u.args == "foo");
        node_at<ast::field_separator>(cmds, 1);
    }

    TEST_CASE("Non-numeric barcode defaults fall back to an unsupported command") {
        auto cmds = parse_zpl("^BYX^FS");
        const auto& u = node_at<ast::unsupported_command>(cmds, 0);
        CHECK(u.command == "^BY");
        CHECK(u.args == "X");
    }

    TEST_CASE("Commands remember their line") {
        auto cmds = parse_zpl("^XA\n^FO1,1\n\n^FDx^FS\n^XZ");
        REQUIRE(cmds.size() == 5);
        CHECK(cmds[0].line == 1);
        CHECK(cmds[1].line == 2);
        CHECK(cmds[2].line == 4);
        CHECK(cmds[3].line == 4);
        CHECK(cmds[4].line == 5);
    }

    TEST_CASE("Lines stay exact over a long batch of labels") {
        std::string zpl;
        const std::size_t labels = 20000;
        for (std::size_t i = 0; i < labels; ++i) {
            zpl += "^XA\n^FO10,10^FDx^FS\n^XZ\n";
        }
        auto cmds = parse_zpl(zpl);
        REQUIRE(cmds.size() == labels * 5);
        CHECK(cmds[5].line == 4);
        CHECK(cmds[6].line == 5);
        CHECK(cmds.back().line == labels * 3);

        // Errors after a long prefix are still located exactly
        try {
            parse_zpl(zpl + "^GB10\n");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.line() == labels * 3 + 1);
        }
    }
}

TEST_SUITE("Parser - Errors") {
    TEST_CASE("Font name is mandatory") {
        CHECK_THROWS_AS(parse_zpl("^XA^A^XZ"), parse_error);
        CHECK(error_line("^XA\n^A\n^XZ") == 2);
    }

    TEST_CASE("Graphic box needs width and height") {
        CHECK_THROWS_AS(parse_zpl("^GB100"), parse_error);
        CHECK_THROWS_AS(parse_zpl("^GB,100"), parse_error);
        CHECK(error_line("^XA\n^GB100\n^XZ") == 2);
    }

    TEST_CASE("Non-numeric coordinates are rejected") {
        CHECK_THROWS_AS(parse_zpl("^FOA,10"), parse_error);
        CHECK_THROWS_AS(parse_zpl("^LLABC"), parse_error);
    }

    TEST_CASE("Custom image needs data") {
        CHECK_THROWS_AS(parse_zpl("^GIC10,10,^FS"), parse_error);
        CHECK_THROWS_AS(parse_zpl("^GIC10^FS"), parse_error);
    }

    TEST_CASE("Text outside a command is rejected") {
        CHECK(error_line("hello") == 1);
        CHECK(error_line("^XA\n^FS\nstray") == 3);
    }

    TEST_CASE("Missing value at a line break is reported as end of line") {
        try {
            parse_zpl("^XA\n^A\n^XZ");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.line() == 2);
            CHECK(e.detail() == "expected font name after '^A', found end of line");
        }
        try {
            parse_zpl("^XA^A");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.detail() == "expected font name after '^A', found end of input");
        }
    }

    TEST_CASE("Message names the offending command") {
        try {
            parse_zpl("^XA^GB100^XZ");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.detail().find("^GB") != std::string::npos);
            CHECK(std::string(e.what()).find("line 1") != std::string::npos);
        }
    }
}
