//
// Created by igor on 06/12/2025.
//

#include <fstream>
#include <iterator>

#include <zplc/error.hh>
#include <zplc/font_registry.hh>

namespace zplc {

namespace {
    bool is_sfnt(const std::vector<uint8_t>& data) {
        if (data.size() < 4) {
            return false;
        }
        const std::string_view tag(reinterpret_cast<const char*>(data.data()), 4);
        return tag == std::string_view("\x00\x01\x00\x00", 4) || tag == "OTTO" || tag == "true"
               || tag == "ttcf";
    }
}

void font_registry::register_font(const std::string& name, std::vector<uint8_t> data, char from, char to) {
    if (!is_sfnt(data)) {
        throw font_error("'" + name + "' is not a TrueType or OpenType font");
    }
    const auto first = font_ids.find(from);
    const auto last = font_ids.find(to);
    if (first == std::string_view::npos || last == std::string_view::npos) {
        throw font_error(std::string("invalid font id range ") + from + "-" + to
                         + " (ids are A-Z and 0-9)");
    }
    if (first > last) {
        throw font_error(std::string("empty font id range ") + from + "-" + to);
    }

    auto face = std::make_shared<const font_face>(font_face{name, std::move(data)});
    m_faces[name] = face;
    for (auto i = first; i <= last; ++i) {
        m_ids[font_ids[i]] = face;
    }
}

void font_registry::register_font_file(const std::filesystem::path& path, char from, char to) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw font_error("cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    register_font(path.stem().string(), std::move(data), from, to);
}

const font_face* font_registry::find(char id) const {
    auto it = m_ids.find(id);
    if (it == m_ids.end()) {
        it = m_ids.find('0');
    }
    return it == m_ids.end() ? nullptr : it->second.get();
}

std::map<char, std::string> font_registry::mapping() const {
    std::map<char, std::string> out;
    for (const auto& [id, face] : m_ids) {
        out[id] = face->name;
    }
    return out;
}

} // namespace zplc
