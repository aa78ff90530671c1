//
// Created by igor on 02/12/2025.
//

#pragma once

#include <filesystem>
#include <string_view>

#include "ast.hh"
#include "error.hh"

namespace zplc {
    /// Parse ZPL source into commands. Throws parse_error on malformed input.
    /// Whitespace-only input yields an empty list.
    ast::command_list parse_zpl(std::string_view text);

    ast::command_list parse_zpl_file(const std::filesystem::path& path);
}
