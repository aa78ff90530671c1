//
// Tests for Backend Registry
//

#include <doctest/doctest.h>
#include <zplc/backend_registry.hh>
#include <zplc/error.hh>

#include <algorithm>
#include <stdexcept>

using namespace zplc;
using namespace zplc::render;

TEST_SUITE("Render - Backend Registry") {
    TEST_CASE("Singleton instance access") {
        auto& registry1 = BackendRegistry::instance();
        auto& registry2 = BackendRegistry::instance();
        CHECK(&registry1 == &registry2);
    }

    TEST_CASE("Built-in backends are registered") {
        auto& registry = BackendRegistry::instance();
        CHECK(registry.contains("listing"));
        CHECK(registry.contains("zpl"));

        auto names = registry.names();
        CHECK(std::is_sorted(names.begin(), names.end()));
        CHECK(std::find(names.begin(), names.end(), "listing") != names.end());
        CHECK(std::find(names.begin(), names.end(), "zpl") != names.end());
    }

    TEST_CASE("Case-insensitive lookup") {
        auto& registry = BackendRegistry::instance();
        auto* zpl = registry.find("zpl");
        REQUIRE(zpl != nullptr);
        CHECK(registry.find("ZPL") == zpl);
        CHECK(registry.find("Zpl") == zpl);
        CHECK(zpl->get_name() == "zpl");
    }

    TEST_CASE("Unknown backend") {
        auto& registry = BackendRegistry::instance();
        CHECK_FALSE(registry.contains("pdf"));
        CHECK(registry.find("pdf") == nullptr);
        CHECK_THROWS_WITH_AS(registry.get("pdf"), "unknown backend 'pdf' (available: listing zpl)",
                             zplc::backend_error);
    }

    TEST_CASE("Built-in plugin is recorded") {
        auto plugins = BackendRegistry::instance().plugin_names();
        CHECK(std::find(plugins.begin(), plugins.end(), "builtin") != plugins.end());
    }

    TEST_CASE("Backends describe themselves") {
        auto& registry = BackendRegistry::instance();
        for (const auto& name : registry.names()) {
            auto* backend = registry.find(name);
            REQUIRE(backend != nullptr);
            CHECK_FALSE(backend->get_description().empty());
            CHECK(backend->get_file_extension().front() == '.');
        }
    }

    TEST_CASE("Unknown options are rejected") {
        auto* listing = BackendRegistry::instance().find("listing");
        REQUIRE(listing != nullptr);
        CHECK_THROWS_AS(listing->set_option("no-such-option", OptionValue{true}), std::invalid_argument);
        CHECK_THROWS_AS(listing->set_option("bitmap-preview", OptionValue{std::string("yes")}),
                        std::invalid_argument);
    }
}
