#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mirror {

enum class error_kind {
    input_read,
    parse,
    directory_creation,
    serialization,
    write,
    depth_limit,
    settings
};

std::string_view to_string(error_kind kind);

// Every failure in a run is fatal and surfaces as this exception.
// path() names the file or directory involved (may be empty for settings errors).
class error : public std::runtime_error {
public:
    error(error_kind kind, std::string path, const std::string& what);

    error_kind kind() const noexcept { return m_kind; }
    const std::string& path() const noexcept { return m_path; }

private:
    error_kind m_kind;
    std::string m_path;
};

} // namespace mirror
