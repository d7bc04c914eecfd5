#include "utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

bool startsWith(const std::string &str, const std::string &prefix)
{
    if (prefix.size() > str.size())
        return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s)
{
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim_copy(const std::string &s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string strip_name_tag(const std::string &base)
{
    // The earliest " - " whose remainder is a parenthesis-free tag wins,
    // so "Show - S01 - 1080p" becomes "Show"
    auto pos = base.find(" - ");
    while (pos != std::string::npos)
    {
        const std::string tag = base.substr(pos + 3);
        if (!tag.empty() && tag.find_first_of("()") == std::string::npos)
            return base.substr(0, pos);
        pos = base.find(" - ", pos + 1);
    }
    return base;
}

std::string format_bitrate(int64_t bitsPerSecond)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f Mbps", bitsPerSecond / 1000000.0);
    return buf;
}
