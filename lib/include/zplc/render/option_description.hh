//
// Created by igor on 07/12/2025.
//
// Backend options as the driver exposes them: --<backend>-<name>=<value>
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zplc::render {

enum class OptionType {
    Bool,      // true/false, on/off, yes/no, 1/0
    String,
    Int,
    Choice     // one of `choices`
};

using OptionValue = std::variant<bool, int64_t, std::string>;

struct OptionDescription {
    std::string name;
    OptionType type;
    std::string description;
    std::optional<std::string> default_value;
    std::vector<std::string> choices;

    /// Convert command line text to a value of this option's type.
    /// Throws std::invalid_argument naming the option on bad input.
    [[nodiscard]] OptionValue parse_value(std::string_view text) const;
};

/// Human-readable form of a value, as accepted by parse_value
std::string to_string(const OptionValue& value);

}  // namespace zplc::render
