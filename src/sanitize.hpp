#pragma once

#include <string>
#include <string_view>

namespace mirror {

// Characters that may not appear in a path segment.
inline constexpr std::string_view reserved_path_chars = "/\\:*?\"<>|";

// Replace every reserved character with '_'. Length-preserving and idempotent;
// all other bytes (including UTF-8 sequences) pass through untouched.
std::string sanitize_name(std::string_view name);

bool has_reserved_chars(std::string_view name);

} // namespace mirror
