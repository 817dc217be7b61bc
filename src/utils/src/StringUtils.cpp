#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <string>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

std::string StringUtils::trimmed(const std::string& str) {
    std::string copy = str;
    trim(copy);
    return copy;
}

std::string StringUtils::replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result;
    result.reserve(str.size());

    size_t start = 0;
    size_t pos = 0;
    while ((pos = str.find(from, start)) != std::string::npos) {
        result.append(str, start, pos - start);
        result += to;
        start = pos + from.size();
    }
    result.append(str, start, std::string::npos);
    return result;
}

size_t StringUtils::count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return 0;
    }

    size_t count = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}
