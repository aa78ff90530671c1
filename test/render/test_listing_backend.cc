//
// Listing backend output
//

#include <doctest/doctest.h>
#include <zplc/engine.hh>
#include <zplc/error.hh>
#include <zplc/render/listing_backend.hh>

#include <string>

using namespace zplc;
using namespace zplc::render;

namespace {
    std::string listing_of(const char* zpl, ListingBackend& backend) {
        engine label(zpl, unit::inches(4), unit::inches(6), resolution::from_dpi(203));
        auto out = label.render(backend);
        return std::string(out.begin(), out.end());
    }
}

TEST_SUITE("Render - Listing Backend") {
    TEST_CASE("Text label") {
        ListingBackend backend;
        CHECK(listing_of("^XA^FO50,50^A0N,50,50^FDHello^FS^XZ", backend) ==
              "; page 813x1219 dots, 203.2 dpi\n"
              "; fonts: none registered\n"
              "text    x=50 y=50 font=0 orientation=N height=50 width=50 reverse=N \"Hello\"\n"
              "; 1 instruction(s)\n");
    }

    TEST_CASE("Every instruction kind is listed") {
        ListingBackend backend;
        auto out = listing_of("^XA"
                              "^FO1,1^GB10,20,2^FS"
                              "^FO2,2^GC30^FS"
                              "^FO3,3^GE40,20^FS"
                              "^FO4,4^GFA,2,2,1,FF00^FS"
                              "^FO5,5^GIC2,2,QUJD^FS"
                              "^FO6,6^BY3^BCN,50^FD123^FS"
                              "^FO7,7^B3N,N,40^FDABC^FS"
                              "^FO8,8^BQN,2,4^FDQA,x^FS"
                              "^XZ",
                              backend);

        CHECK(out.find("box     x=1 y=1 width=10 height=20 thickness=2 color=B rounding=0 reverse=N\n")
              != std::string::npos);
        CHECK(out.find("circle  x=2 y=2 diameter=30 thickness=1 color=B reverse=N\n") != std::string::npos);
        CHECK(out.find("ellipse x=3 y=3 width=40 height=20 thickness=1 color=B reverse=N\n")
              != std::string::npos);
        CHECK(out.find("bitmap  x=4 y=4 width=8 height=2 bytes=2 reverse=N\n") != std::string::npos);
        CHECK(out.find("image   x=5 y=5 width=2 height=2 base64-length=4\n") != std::string::npos);
        CHECK(out.find("code128 x=6 y=6 orientation=N height=50 module-width=3") != std::string::npos);
        CHECK(out.find("code39  x=7 y=7 orientation=N height=40 module-width=3 ratio=3") != std::string::npos);
        CHECK(out.find("qr      x=8 y=8 orientation=N model=2 magnification=4 error-correction=M mask=7")
              != std::string::npos);
        CHECK(out.find("; 8 instruction(s)\n") != std::string::npos);
    }

    TEST_CASE("Quotes in content are escaped") {
        ListingBackend backend;
        auto out = listing_of("^XA^FDsay \"hi\"^FS^XZ", backend);
        CHECK(out.find("\"say \\\"hi\\\"\"") != std::string::npos);
    }

    TEST_CASE("Bitmap preview") {
        ListingBackend backend;
        backend.set_option("bitmap-preview", OptionValue{true});
        auto out = listing_of("^XA^GFA,4,4,2,FF00:^FS^XZ", backend);
        CHECK(out.find("\n    ########........\n    ########........\n") != std::string::npos);
    }

    TEST_CASE("Drawing before page setup fails") {
        ListingBackend backend;
        CHECK_THROWS_AS(backend.draw_text(ir::text{}), backend_error);
        CHECK_THROWS_AS(backend.finalize(), backend_error);
    }
}
