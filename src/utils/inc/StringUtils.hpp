#pragma once

#include <string>
#include <algorithm>
#include <cctype>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);

    // Replace every occurrence of `from` in `str` with `to`
    static std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

    // Number of non-overlapping occurrences of `needle`
    static size_t count_occurrences(const std::string& haystack, const std::string& needle);
};
