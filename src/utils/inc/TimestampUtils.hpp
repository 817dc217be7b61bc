#pragma once

#include <chrono>
#include <ctime>
#include <string>


class TimestampUtils {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static std::tm to_tm(TimePoint tp, bool utc = false);

    // Fixed width "YYYYMMDD_HHMMSS"; lexicographic order equals chronological order
    static std::string format_compact(TimePoint tp, bool utc = false);

    // "YYYY-MM-DD HH:MM:SS"
    static std::string format_readable(TimePoint tp, bool utc = false);

    static TimePoint from_utc(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
};
