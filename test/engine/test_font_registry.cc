//
// Font id mapping
//

#include <doctest/doctest.h>
#include <zplc/error.hh>
#include <zplc/font_registry.hh>

#include <vector>

using namespace zplc;

namespace {
    std::vector<uint8_t> truetype_blob() {
        return {0x00, 0x01, 0x00, 0x00, 0x00, 0x10};
    }

    std::vector<uint8_t> opentype_blob() {
        return {'O', 'T', 'T', 'O', 0x00, 0x0A};
    }
}

TEST_SUITE("Engine - Font Registry") {
    TEST_CASE("New registry is empty") {
        font_registry fonts;
        CHECK(fonts.empty());
        CHECK(fonts.find('A') == nullptr);
        CHECK(fonts.mapping().empty());
    }

    TEST_CASE("Range maps every id in between") {
        font_registry fonts;
        fonts.register_font("Sans", truetype_blob(), 'A', 'C');
        CHECK_FALSE(fonts.empty());

        auto mapping = fonts.mapping();
        CHECK(mapping.size() == 3);
        CHECK(mapping['A'] == "Sans");
        CHECK(mapping['C'] == "Sans");
        CHECK(fonts.find('B')->name == "Sans");
        CHECK(fonts.find('D') == nullptr);
    }

    TEST_CASE("Ranges run from letters into digits") {
        font_registry fonts;
        fonts.register_font("Mono", opentype_blob(), 'Y', '1');
        CHECK(fonts.mapping().size() == 4);
        CHECK(fonts.find('0')->name == "Mono");
    }

    TEST_CASE("Unmapped ids fall back to font 0") {
        font_registry fonts;
        fonts.register_font("Default", truetype_blob(), '0', '0');
        fonts.register_font("Title", opentype_blob(), 'T', 'T');
        CHECK(fonts.find('T')->name == "Title");
        CHECK(fonts.find('Q')->name == "Default");
    }

    TEST_CASE("Later registrations replace earlier ids") {
        font_registry fonts;
        fonts.register_font("First", truetype_blob(), 'A', 'Z');
        fonts.register_font("Second", truetype_blob(), 'M', 'M');
        CHECK(fonts.find('M')->name == "Second");
        CHECK(fonts.find('N')->name == "First");
    }

    TEST_CASE("Only TrueType and OpenType data is accepted") {
        font_registry fonts;
        CHECK_THROWS_AS(fonts.register_font("Bad", {'G', 'I', 'F', '8'}, 'A', 'A'), font_error);
        CHECK_THROWS_AS(fonts.register_font("Short", {0x00, 0x01}, 'A', 'A'), font_error);
        CHECK(fonts.empty());
    }

    TEST_CASE("Invalid id ranges are rejected") {
        font_registry fonts;
        CHECK_THROWS_AS(fonts.register_font("Sans", truetype_blob(), 'a', 'c'), font_error);
        CHECK_THROWS_AS(fonts.register_font("Sans", truetype_blob(), 'A', '!'), font_error);
        CHECK_THROWS_AS(fonts.register_font("Sans", truetype_blob(), 'C', 'A'), font_error);
    }

    TEST_CASE("Missing font file") {
        font_registry fonts;
        CHECK_THROWS_AS(fonts.register_font_file("/nonexistent/font.ttf", 'A', 'Z'), font_error);
    }
}
