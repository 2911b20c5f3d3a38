#include "StringUtils.hpp"

#include <cctype>

namespace utils
{

namespace
{
bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
} // namespace

std::string trim(std::string_view s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isSpace(s[begin]))
        ++begin;
    while (end > begin && isSpace(s[end - 1]))
        --end;
    return std::string(s.substr(begin, end - begin));
}

std::string truncate(const std::string& s, std::size_t max_len)
{
    if (s.size() <= max_len)
        return s;
    if (max_len <= 3)
        return s.substr(0, max_len);
    return s.substr(0, max_len - 3) + "...";
}

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace utils
