#pragma once

#include <string>
#include <string_view>

namespace utils
{

/// Strips leading and trailing ASCII whitespace
std::string trim(std::string_view s);

/// Shortens s to max_len characters, replacing the tail with "..." when cut
std::string truncate(const std::string& s, std::size_t max_len);

bool contains(std::string_view haystack, std::string_view needle);

} // namespace utils
