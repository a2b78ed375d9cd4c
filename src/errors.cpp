#include "errors.hpp"
#include <utility>

namespace mirror {

std::string_view to_string(error_kind kind) {
    switch (kind) {
        case error_kind::input_read:         return "input read error";
        case error_kind::parse:              return "parse error";
        case error_kind::directory_creation: return "directory creation error";
        case error_kind::serialization:      return "serialization error";
        case error_kind::write:              return "write error";
        case error_kind::depth_limit:        return "depth limit exceeded";
        case error_kind::settings:           return "settings error";
    }
    return "unknown error";
}

error::error(error_kind kind, std::string path, const std::string& what)
    : std::runtime_error(what),
      m_kind(kind),
      m_path(std::move(path))
{}

} // namespace mirror
