#include "StringUtils.hpp"
#include <cassert>
#include <iostream>
#include <string>


void test_trim() {
    std::string value = " \t SrvA \r\n";
    StringUtils::trim(value);
    assert(value == "SrvA");

    std::string blank = "   ";
    StringUtils::trim(blank);
    assert(blank.empty());

    assert(StringUtils::trimmed("  DB1") == "DB1");
    std::cout << "test_trim passed\n";
}

void test_to_lower() {
    assert(StringUtils::to_lower("CRLF") == "crlf");
    std::cout << "test_to_lower passed\n";
}

void test_replace_all() {
    assert(StringUtils::replace_all("O'Brien's", "'", "''") == "O''Brien''s");
    assert(StringUtils::replace_all("a]b]", "]", "]]") == "a]]b]]");
    assert(StringUtils::replace_all("none", "'", "''") == "none");
    assert(StringUtils::replace_all("abc", "", "x") == "abc");
    std::cout << "test_replace_all passed\n";
}

void test_count_occurrences() {
    assert(StringUtils::count_occurrences("secret secret", "secret") == 2);
    assert(StringUtils::count_occurrences("aaaa", "aa") == 2);
    assert(StringUtils::count_occurrences("abc", "") == 0);
    std::cout << "test_count_occurrences passed\n";
}

int main() {
    test_trim();
    test_to_lower();
    test_replace_all();
    test_count_occurrences();

    std::cout << "All StringUtils tests passed!\n";
    return 0;
}
