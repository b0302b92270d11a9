#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace TimeUtils {

// Time conversion constants
constexpr int SECONDS_PER_MINUTE = 60;
constexpr int MINUTES_PER_HOUR = 60;
constexpr int HOURS_PER_DAY = 24;
constexpr int SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;

// Time format constants
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";

enum class Weekday { Sunday = 0, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };

// Time of day with second resolution, ordered by seconds since midnight.
struct TimeOfDay {
    int seconds_since_midnight;

    TimeOfDay() : seconds_since_midnight(0) {}
    explicit TimeOfDay(int seconds_value) : seconds_since_midnight(seconds_value) {}
    TimeOfDay(int hour_value, int minute_value, int second_value = 0)
        : seconds_since_midnight(hour_value * SECONDS_PER_HOUR + minute_value * SECONDS_PER_MINUTE + second_value) {}

    bool operator<(const TimeOfDay& other) const { return seconds_since_midnight < other.seconds_since_midnight; }
    bool operator<=(const TimeOfDay& other) const { return seconds_since_midnight <= other.seconds_since_midnight; }
    bool operator>(const TimeOfDay& other) const { return seconds_since_midnight > other.seconds_since_midnight; }
    bool operator>=(const TimeOfDay& other) const { return seconds_since_midnight >= other.seconds_since_midnight; }
    bool operator==(const TimeOfDay& other) const { return seconds_since_midnight == other.seconds_since_midnight; }
    bool operator!=(const TimeOfDay& other) const { return seconds_since_midnight != other.seconds_since_midnight; }
};

// Current wall-clock time, used for log line prefixes and file names
std::string get_current_human_readable_time();

// Parses "HH:MM" or "HH:MM:SS". Throws std::runtime_error on malformed input.
TimeOfDay parse_time_of_day(const std::string& time_string);
std::string format_time_of_day(const TimeOfDay& time_of_day);

// Parses "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[Z]". Throws std::runtime_error on malformed input.
// tm_wday and tm_yday are normalized.
std::tm parse_bar_timestamp(const std::string& timestamp);
std::string format_bar_timestamp(const std::tm& timestamp_tm);

// Seconds since the epoch treating the broken-down time as UTC. Bars carry exchange-local
// times, so this is only used for ordering and day arithmetic.
long long to_epoch_seconds(const std::tm& timestamp_tm);

Weekday weekday_of(const std::tm& timestamp_tm);
TimeOfDay time_of_day_of(const std::tm& timestamp_tm);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
