//
// Tests for backend option parsing
//

#include <doctest/doctest.h>
#include <zplc/render/option_description.hh>

#include <stdexcept>

using namespace zplc::render;

TEST_SUITE("Render - Option Description") {
    TEST_CASE("Boolean spellings") {
        OptionDescription opt{"compress", OptionType::Bool, "", "true", {}};
        CHECK(std::get<bool>(opt.parse_value("yes")));
        CHECK(std::get<bool>(opt.parse_value("1")));
        CHECK_FALSE(std::get<bool>(opt.parse_value("off")));
        CHECK_FALSE(std::get<bool>(opt.parse_value("false")));
        CHECK_THROWS_AS((void)opt.parse_value("maybe"), std::invalid_argument);
    }

    TEST_CASE("Integers must be complete") {
        OptionDescription opt{"limit", OptionType::Int, "", std::nullopt, {}};
        CHECK(std::get<int64_t>(opt.parse_value("-42")) == -42);
        CHECK_THROWS_AS((void)opt.parse_value("12ab"), std::invalid_argument);
        CHECK_THROWS_AS((void)opt.parse_value(""), std::invalid_argument);
    }

    TEST_CASE("Choices are checked") {
        OptionDescription opt{"mode", OptionType::Choice, "", "a", {"a", "b"}};
        CHECK(std::get<std::string>(opt.parse_value("b")) == "b");
        CHECK_THROWS_WITH_AS((void)opt.parse_value("c"),
                             "invalid choice for mode: 'c' (valid: a, b)", std::invalid_argument);
    }

    TEST_CASE("Strings pass through and print back") {
        OptionDescription opt{"title", OptionType::String, "", std::nullopt, {}};
        OptionValue value = opt.parse_value("Shipping");
        CHECK(to_string(value) == "Shipping");
        CHECK(to_string(OptionValue{true}) == "true");
        CHECK(to_string(OptionValue{int64_t{7}}) == "7");
    }
}
