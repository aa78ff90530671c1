//
// Created by igor on 06/12/2025.
//
// Font blobs mapped onto ZPL font ids (A-Z, 0-9). Built once, then shared
// read-only between engines.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace zplc {
    struct font_face {
        std::string name;
        std::vector<uint8_t> data;  // TrueType / OpenType file contents
    };

    class font_registry {
        public:
            /// Font ids in mapping order
            static constexpr std::string_view font_ids = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

            /// Register a font and map it to every id from..to (inclusive, in
            /// font_ids order). Throws font_error for data that is not an sfnt
            /// font or for an invalid id range.
            void register_font(const std::string& name, std::vector<uint8_t> data, char from, char to);

            void register_font_file(const std::filesystem::path& path, char from, char to);

            /// Font mapped to id, falling back to the font of id '0'; nullptr if neither is mapped
            [[nodiscard]] const font_face* find(char id) const;

            [[nodiscard]] bool empty() const { return m_faces.empty(); }

            /// Registered font name per mapped id
            [[nodiscard]] std::map<char, std::string> mapping() const;

        private:
            std::map<std::string, std::shared_ptr<const font_face>> m_faces;
            std::map<char, std::shared_ptr<const font_face>> m_ids;
    };

    using shared_font_registry = std::shared_ptr<const font_registry>;
}
