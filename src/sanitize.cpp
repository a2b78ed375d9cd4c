#include "sanitize.hpp"

namespace mirror {

std::string sanitize_name(std::string_view name) {
    std::string result(name);
    for (char& c : result) {
        if (reserved_path_chars.find(c) != std::string_view::npos) {
            c = '_';
        }
    }
    return result;
}

bool has_reserved_chars(std::string_view name) {
    return name.find_first_of(reserved_path_chars) != std::string_view::npos;
}

} // namespace mirror
