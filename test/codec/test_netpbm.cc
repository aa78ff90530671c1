//
// PGM / PPM reader
//

#include <doctest/doctest.h>
#include <zplc/error.hh>
#include <zplc/netpbm.hh>

#include <string>

using namespace zplc;
using namespace zplc::codec;

TEST_SUITE("Codec - Netpbm") {
    TEST_CASE("ASCII graymap with a comment") {
        auto image = read_netpbm("P2\n# logo\n3 1\n255\n0 128 255\n");
        CHECK(image.width == 3);
        CHECK(image.height == 1);
        CHECK(image.pixels == std::vector<uint8_t>{0, 128, 255});
    }

    TEST_CASE("Samples are scaled to 8 bits") {
        auto image = read_netpbm("P2 2 1 15 0 15");
        CHECK(image.pixels == std::vector<uint8_t>{0, 255});
    }

    TEST_CASE("Binary graymap") {
        std::string data = "P5\n2 2\n255\n";
        data += std::string("\x00\xff\x80\x10", 4);
        auto image = read_netpbm(data);
        CHECK(image.pixels == std::vector<uint8_t>{0x00, 0xFF, 0x80, 0x10});
    }

    TEST_CASE("Sixteen bit samples") {
        std::string data = "P5 1 1 65535\n";
        data += std::string("\xff\xff", 2);
        CHECK(read_netpbm(data).pixels == std::vector<uint8_t>{255});
    }

    TEST_CASE("Color is reduced to luma") {
        auto red = read_netpbm("P3 1 1 255 255 0 0");
        CHECK(red.pixels == std::vector<uint8_t>{54});

        std::string data = "P6 1 1 255\n";
        data += std::string("\xff\xff\xff", 3);
        CHECK(read_netpbm(data).pixels == std::vector<uint8_t>{255});
    }

    TEST_CASE("Malformed images are rejected") {
        CHECK_THROWS_AS(read_netpbm("P4 1 1\n"), image_error);
        CHECK_THROWS_AS(read_netpbm("P2 2 2 255 0 0 0"), image_error);
        CHECK_THROWS_AS(read_netpbm("P5 2 2 255\n\x01"), image_error);
        CHECK_THROWS_AS(read_netpbm("P2 0 1 255"), image_error);
        CHECK_THROWS_AS(read_netpbm("P2 1 1 0 0"), image_error);
        CHECK_THROWS_AS(read_netpbm("P2 1 1 255 300"), image_error);
    }

    TEST_CASE("Images beyond the bitmap limit are rejected") {
        CHECK_THROWS_AS(read_netpbm("P5 100000 1000 255\n"), security_limit_error);
    }

    TEST_CASE("Missing file") {
        CHECK_THROWS_AS(load_netpbm("/nonexistent/logo.pgm"), image_error);
    }
}
