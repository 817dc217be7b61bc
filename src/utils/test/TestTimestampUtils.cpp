#include "TimestampUtils.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>


void test_format_compact_utc() {
    auto tp = TimestampUtils::from_utc(2026, 1, 3, 21, 35, 22);
    assert(TimestampUtils::format_compact(tp, true) == "20260103_213522");
    std::cout << "test_format_compact_utc passed\n";
}

void test_format_compact_zero_padding() {
    auto tp = TimestampUtils::from_utc(2026, 2, 5, 4, 3, 9);
    assert(TimestampUtils::format_compact(tp, true) == "20260205_040309");
    std::cout << "test_format_compact_zero_padding passed\n";
}

void test_format_readable_utc() {
    auto tp = TimestampUtils::from_utc(2026, 1, 3, 21, 35, 22);
    assert(TimestampUtils::format_readable(tp, true) == "2026-01-03 21:35:22");
    std::cout << "test_format_readable_utc passed\n";
}

void test_sub_second_is_truncated() {
    auto tp = TimestampUtils::from_utc(2026, 1, 3, 21, 35, 22) + std::chrono::milliseconds(999);
    assert(TimestampUtils::format_compact(tp, true) == "20260103_213522");
    std::cout << "test_sub_second_is_truncated passed\n";
}

void test_local_time_shape() {
    const std::string stamp = TimestampUtils::format_compact(std::chrono::system_clock::now());
    assert(stamp.size() == 15);
    assert(stamp[8] == '_');
    for (size_t i = 0; i < stamp.size(); ++i) {
        if (i != 8) {
            assert(stamp[i] >= '0' && stamp[i] <= '9');
        }
    }
    std::cout << "test_local_time_shape passed\n";
}

void test_compact_order_is_chronological() {
    auto base = TimestampUtils::from_utc(2025, 12, 31, 23, 59, 59);
    std::string previous = TimestampUtils::format_compact(base, true);
    for (int step : {1, 60, 3600, 86400, 86400 * 40}) {
        std::string next = TimestampUtils::format_compact(base + std::chrono::seconds(step), true);
        assert(previous < next);
        previous = next;
    }
    std::cout << "test_compact_order_is_chronological passed\n";
}

int main() {
    test_format_compact_utc();
    test_format_compact_zero_padding();
    test_format_readable_utc();
    test_sub_second_is_truncated();
    test_local_time_shape();
    test_compact_order_is_chronological();

    std::cout << "All TimestampUtils tests passed!\n";
    return 0;
}
