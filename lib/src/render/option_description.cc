//
// Created by igor on 07/12/2025.
//

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include <zplc/render/option_description.hh>

namespace zplc::render {

namespace {
    std::optional<bool> parse_bool(std::string_view text) {
        for (std::string_view yes : {"true", "yes", "on", "1"}) {
            if (text == yes) {
                return true;
            }
        }
        for (std::string_view no : {"false", "no", "off", "0"}) {
            if (text == no) {
                return false;
            }
        }
        return std::nullopt;
    }

    std::string join(const std::vector<std::string>& items) {
        std::string out;
        for (const auto& item : items) {
            if (!out.empty()) {
                out += ", ";
            }
            out += item;
        }
        return out;
    }
}

OptionValue OptionDescription::parse_value(std::string_view text) const {
    const std::string shown(text);
    switch (type) {
        case OptionType::Bool:
            if (auto b = parse_bool(text)) {
                return *b;
            }
            throw std::invalid_argument("invalid boolean for " + name + ": '" + shown
                                        + "' (expected true/false, yes/no, on/off, 1/0)");

        case OptionType::Int: {
            int64_t value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
                throw std::invalid_argument("invalid integer for " + name + ": '" + shown + "'");
            }
            return value;
        }

        case OptionType::Choice:
            if (std::find(choices.begin(), choices.end(), shown) == choices.end()) {
                throw std::invalid_argument("invalid choice for " + name + ": '" + shown
                                            + "' (valid: " + join(choices) + ")");
            }
            return shown;

        case OptionType::String:
            break;
    }
    return shown;
}

std::string to_string(const OptionValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const int64_t* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    return std::get<std::string>(value);
}

}  // namespace zplc::render
