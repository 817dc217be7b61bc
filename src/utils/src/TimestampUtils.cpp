#include "TimestampUtils.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <time.h>


std::tm TimestampUtils::to_tm(TimePoint tp, bool utc) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm result{};

#if defined(_WIN32)
    const bool ok = utc ? gmtime_s(&result, &seconds) == 0 : localtime_s(&result, &seconds) == 0;
#else
    const bool ok = utc ? gmtime_r(&seconds, &result) != nullptr : localtime_r(&seconds, &result) != nullptr;
#endif

    if (!ok) {
        throw std::runtime_error("Failed to convert timestamp " + std::to_string(seconds) + " to calendar time");
    }
    return result;
}

std::string TimestampUtils::format_compact(TimePoint tp, bool utc) {
    return fmt::format("{:%Y%m%d_%H%M%S}", to_tm(tp, utc));
}

std::string TimestampUtils::format_readable(TimePoint tp, bool utc) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", to_tm(tp, utc));
}

TimestampUtils::TimePoint TimestampUtils::from_utc(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

#if defined(_WIN32)
    const std::time_t seconds = _mkgmtime(&tm);
#else
    const std::time_t seconds = timegm(&tm);
#endif

    if (seconds == static_cast<std::time_t>(-1)) {
        throw std::invalid_argument(fmt::format("Invalid UTC date-time {:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                                                year, month, day, hour, minute, second));
    }
    return std::chrono::system_clock::from_time_t(seconds);
}
