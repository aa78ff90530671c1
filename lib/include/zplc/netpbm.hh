//
// Created by igor on 04/12/2025.
//

#pragma once

#include <filesystem>
#include <string_view>

#include "codec.hh"

namespace zplc::codec {
    /// Read a PGM or PPM image (P2, P3, P5, P6) as grayscale.
    /// Color is reduced with Rec. 709 luma weights. Throws image_error.
    gray_image read_netpbm(std::string_view bytes);

    gray_image load_netpbm(const std::filesystem::path& path);
}
