//
// Instruction builder tests: field flushing, modal state and diagnostics
//

#include <doctest/doctest.h>
#include <zplc/engine.hh>
#include <zplc/ir_builder.hh>
#include <zplc/parser.hh>

#include <cmath>
#include <string>
#include <variant>

using namespace zplc;

namespace {
    ir::build_result build(const char* zpl) {
        return ir::build_instructions(parse_zpl(zpl));
    }

    template<typename T>
    const T& instr_at(const ir::instruction_list& list, std::size_t i) {
        REQUIRE(i < list.size());
        REQUIRE(std::holds_alternative<T>(list[i]));
        return std::get<T>(list[i]);
    }
}

TEST_SUITE("Builder - Fields") {
    TEST_CASE("Text field is flushed on field separator") {
        auto result = build("^XA^FO50,50^A0N,50,50^FDHello^FS^XZ");
        REQUIRE(result.instructions.size() == 1);
        CHECK(result.diagnostics.empty());

        const auto& t = instr_at<ir::text>(result.instructions, 0);
        CHECK(t.x == 50);
        CHECK(t.y == 50);
        CHECK(t.font == '0');
        CHECK(t.orientation == 'N');
        CHECK(t.height == 50);
        CHECK(t.width == 50);
        CHECK(t.content == "Hello");
        CHECK_FALSE(t.reverse_print);
        CHECK_FALSE(t.color.has_value());
    }

    TEST_CASE("Empty field separator emits nothing") {
        auto result = build("^XA^FO10,10^FS^FS^XZ");
        CHECK(result.instructions.empty());
    }

    TEST_CASE("Data without a separator is not emitted") {
        auto result = build("^XA^FO10,10^FDdangling^XZ");
        CHECK(result.instructions.empty());
    }

    TEST_CASE("Text defaults without a font command") {
        auto result = build("^FDx^FS");
        const auto& t = instr_at<ir::text>(result.instructions, 0);
        CHECK(t.x == 0);
        CHECK(t.y == 0);
        CHECK(t.font == '0');
        CHECK(t.height == 9);
        CHECK(t.width == 9);
    }

    TEST_CASE("Font width follows height when omitted") {
        auto result = build("^A0N,40^FDx^FS");
        const auto& t = instr_at<ir::text>(result.instructions, 0);
        CHECK(t.height == 40);
        CHECK(t.width == 40);
    }

    TEST_CASE("Font and position persist across fields") {
        auto result = build("^FO5,6^ADR,20,10^FDone^FS^FDtwo^FS^CFB^FDthree^FS");
        REQUIRE(result.instructions.size() == 3);

        const auto& second = instr_at<ir::text>(result.instructions, 1);
        CHECK(second.x == 5);
        CHECK(second.y == 6);
        CHECK(second.font == 'D');
        CHECK(second.orientation == 'R');
        CHECK(second.height == 20);
        CHECK(second.width == 10);

        const auto& third = instr_at<ir::text>(result.instructions, 2);
        CHECK(third.font == 'B');
        CHECK(third.height == 20);
        CHECK(third.orientation == 'R');
    }

    TEST_CASE("Reverse print lasts one field") {
        auto result = build("^FR^FDa^FS^FDb^FS^FR^FR^FDc^FS");
        REQUIRE(result.instructions.size() == 3);
        CHECK(instr_at<ir::text>(result.instructions, 0).reverse_print);
        CHECK_FALSE(instr_at<ir::text>(result.instructions, 1).reverse_print);
        CHECK_FALSE(instr_at<ir::text>(result.instructions, 2).reverse_print);
    }

    TEST_CASE("Text color persists") {
        auto result = build("^GTC#112233^FDa^FS^FDb^FS");
        REQUIRE(result.instructions.size() == 2);
        CHECK(instr_at<ir::text>(result.instructions, 1).color == std::optional<std::string>("#112233"));
    }

    TEST_CASE("Typeset offsets do not move the field origin") {
        auto result = build("^FO10,20^FT5,5^FDx^FS");
        const auto& t = instr_at<ir::text>(result.instructions, 0);
        CHECK(t.x == 10);
        CHECK(t.y == 20);
    }
}

TEST_SUITE("Builder - Graphics") {
    TEST_CASE("Graphic box defaults") {
        auto result = build("^FO1,2^GB100,50^FS");
        const auto& b = instr_at<ir::graphic_box>(result.instructions, 0);
        CHECK(b.x == 1);
        CHECK(b.y == 2);
        CHECK(b.width == 100);
        CHECK(b.height == 50);
        CHECK(b.thickness == 1);
        CHECK(b.color == 'B');
        CHECK(b.rounding == 0);
        CHECK_FALSE(b.custom_color.has_value());
    }

    TEST_CASE("Line color applies to later shapes") {
        auto result = build("^GLC#FF0000^GB10,10,2,W^FS^GC30,3^FS^GE40,20^FS");
        REQUIRE(result.instructions.size() == 3);

        const auto& box = instr_at<ir::graphic_box>(result.instructions, 0);
        CHECK(box.color == 'W');
        CHECK(box.custom_color == std::optional<std::string>("#FF0000"));

        const auto& circle = instr_at<ir::graphic_circle>(result.instructions, 1);
        CHECK(circle.diameter == 30);
        CHECK(circle.thickness == 3);
        CHECK(circle.color == 'B');
        CHECK(circle.custom_color == std::optional<std::string>("#FF0000"));

        const auto& ellipse = instr_at<ir::graphic_ellipse>(result.instructions, 2);
        CHECK(ellipse.width == 40);
        CHECK(ellipse.height == 20);
        CHECK(ellipse.thickness == 1);
    }

    TEST_CASE("Graphic field is decoded") {
        auto result = build("^FO3,4^GFA,4,4,2,FF00:^FS");
        const auto& gf = instr_at<ir::graphic_field>(result.instructions, 0);
        CHECK(gf.x == 3);
        CHECK(gf.y == 4);
        CHECK(gf.width == 16);
        CHECK(gf.height == 2);
        CHECK(gf.data == std::vector<uint8_t>{0xFF, 0x00, 0xFF, 0x00});
    }

    TEST_CASE("Custom image carries its data") {
        auto result = build("^FO7,8^GIC2,3,QUJD^FS");
        const auto& img = instr_at<ir::custom_image>(result.instructions, 0);
        CHECK(img.x == 7);
        CHECK(img.width == 2);
        CHECK(img.height == 3);
        CHECK(img.data == "QUJD");
    }

    TEST_CASE("Unsupported graphic compression stops the label") {
        auto result = build("^XA\n^FDa^FS\n^GFB,1,1,1,xx^FS\n^FDb^FS\n^XZ");
        REQUIRE(result.instructions.size() == 1);
        CHECK(instr_at<ir::text>(result.instructions, 0).content == "a");

        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].level == ir::diagnostic_level::warning);
        CHECK(result.diagnostics[0].line == 3);
        CHECK(result.diagnostics[0].message.find("'B'") != std::string::npos);
    }
}

TEST_SUITE("Builder - Barcodes") {
    TEST_CASE("Barcode defaults fill in missing values") {
        auto result = build("^BY2,3,20^BCN^FD123^FS");
        const auto& bc = instr_at<ir::code128>(result.instructions, 0);
        CHECK(bc.module_width == 2);
        CHECK(bc.height == 20);
        CHECK(bc.orientation == 'N');
        CHECK(bc.interpretation_line == 'Y');
        CHECK(bc.interpretation_line_above == 'N');
        CHECK(bc.check_digit == 'N');
        CHECK(bc.mode == 'N');
        CHECK(bc.data == "123");
    }

    TEST_CASE("Barcode defaults persist across fields") {
        auto result = build("^BY4,,70^BCN^FDa^FS^FO0,100^B3N,N^FDb^FS^BCN,30^FDc^FS");
        REQUIRE(result.instructions.size() == 3);

        const auto& first = instr_at<ir::code128>(result.instructions, 0);
        CHECK(first.module_width == 4);
        CHECK(first.height == 70);

        const auto& second = instr_at<ir::code39>(result.instructions, 1);
        CHECK(second.module_width == 4);
        CHECK(second.height == 70);
        CHECK(second.ratio == doctest::Approx(3.0));
        CHECK(second.y == 100);

        const auto& third = instr_at<ir::code128>(result.instructions, 2);
        CHECK(third.height == 30);
    }

    TEST_CASE("Built-in barcode defaults") {
        auto result = build("^BCN^FDx^FS");
        const auto& bc = instr_at<ir::code128>(result.instructions, 0);
        CHECK(bc.module_width == 2);
        CHECK(bc.height == 10);
    }

    TEST_CASE("Code 39 ratio comes from barcode defaults") {
        auto result = build("^BY3,2.5^B3R,Y,50,N,Y^FDABC^FS");
        const auto& b3 = instr_at<ir::code39>(result.instructions, 0);
        CHECK(b3.ratio == doctest::Approx(2.5));
        CHECK(b3.orientation == 'R');
        CHECK(b3.check_digit == 'Y');
        CHECK(b3.height == 50);
        CHECK(b3.interpretation_line == 'N');
        CHECK(b3.interpretation_line_above == 'Y');
    }

    TEST_CASE("Overlong ratio compiles without error") {
        const std::string zpl = "^XA^BY2," + std::string(60, '9') + ",20^BCN^FD1^FS^B3N^FD2^FS^XZ";
        auto list = compile(zpl);
        REQUIRE(list.size() == 2);
        const auto& bc = instr_at<ir::code128>(list, 0);
        CHECK(bc.module_width == 2);
        CHECK(bc.height == 20);
        CHECK(std::isinf(instr_at<ir::code39>(list, 1).ratio));
    }

    TEST_CASE("QR code defaults") {
        auto result = build("^FO10,10^BQN,2,5^FDQA,hello^FS^BQN^FDx^FS");
        REQUIRE(result.instructions.size() == 2);

        const auto& qr = instr_at<ir::qr_code>(result.instructions, 0);
        CHECK(qr.model == 2);
        CHECK(qr.magnification == 5);
        CHECK(qr.error_correction == 'M');
        CHECK(qr.mask == 7);
        CHECK(qr.data == "QA,hello");

        CHECK(instr_at<ir::qr_code>(result.instructions, 1).magnification == 2);
    }

    TEST_CASE("QR magnification falls back to the module width") {
        auto result = build("^BY6^BQN^FDx^FS");
        CHECK(instr_at<ir::qr_code>(result.instructions, 0).magnification == 6);
    }
}

TEST_SUITE("Builder - Diagnostics") {
    TEST_CASE("Unsupported commands become notes") {
        auto result = build("^XA\n^ZZfoo^FS\n^FDok^FS\n^XZ");
        REQUIRE(result.instructions.size() == 1);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].level == ir::diagnostic_level::note);
        CHECK(result.diagnostics[0].line == 2);
        CHECK(result.diagnostics[0].message.find("^ZZ") != std::string::npos);
    }

    TEST_CASE("Setup commands draw nothing") {
        auto result = build("^XA^LH10,10^LL500^LRN^CI28^FB200,2^BXN,10^FX note^XZ");
        CHECK(result.instructions.empty());
        CHECK(result.diagnostics.empty());
    }

    TEST_CASE("Compiling twice gives the same instructions") {
        const char* zpl = "^XA^FO10,10^A0N,30^FDa^FS^BY2^BCN,50^FD1^FS^GB5,5^FS^XZ";
        CHECK(compile(zpl) == compile(zpl));
    }

    TEST_CASE("Empty input is rejected") {
        CHECK_THROWS_AS(compile_label(""), empty_input_error);
        CHECK_THROWS_AS(compile_label(" \n "), empty_input_error);
    }
}
