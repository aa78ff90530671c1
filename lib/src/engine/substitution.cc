//
// Created by igor on 07/12/2025.
//

#include <zplc/engine.hh>

namespace zplc {

std::string substitute_variables(std::string_view text, const variable_map& vars) {
    if (vars.empty()) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t open = text.find("{{", pos);
        if (open == std::string_view::npos) {
            break;
        }
        std::size_t close = text.find("}}", open + 2);
        if (close == std::string_view::npos) {
            break;
        }
        out.append(text.substr(pos, open - pos));
        auto it = vars.find(std::string(text.substr(open + 2, close - open - 2)));
        if (it != vars.end()) {
            out += it->second;
            pos = close + 2;
        } else {
            // Keep the braces and rescan from the next character, so a
            // placeholder nested inside literal braces is still found
            out += text[open];
            pos = open + 1;
        }
    }
    out.append(text.substr(pos));
    return out;
}

} // namespace zplc
