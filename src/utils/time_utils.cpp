#include "time_utils.hpp"
#include <stdexcept>
#include <cstdio>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

TimeOfDay parse_time_of_day(const std::string& time_string) {
    int hour_value = 0;
    int minute_value = 0;
    int second_value = 0;
    int consumed_chars = 0;

    bool well_formed = std::sscanf(time_string.c_str(), "%d:%d%n", &hour_value, &minute_value, &consumed_chars) == 2;
    if (well_formed && time_string.compare(consumed_chars, 1, ":") == 0) {
        int seconds_chars = 0;
        well_formed = std::sscanf(time_string.c_str() + consumed_chars, ":%d%n", &second_value, &seconds_chars) == 1;
        consumed_chars += seconds_chars;
    }
    if (!well_formed || static_cast<size_t>(consumed_chars) != time_string.size()) {
        throw std::runtime_error("Invalid time of day '" + time_string + "' - expected HH:MM or HH:MM:SS");
    }
    if (hour_value < 0 || hour_value >= HOURS_PER_DAY || minute_value < 0 || minute_value >= MINUTES_PER_HOUR ||
        second_value < 0 || second_value >= SECONDS_PER_MINUTE) {
        throw std::runtime_error("Time of day out of range: '" + time_string + "'");
    }
    return TimeOfDay(hour_value, minute_value, second_value);
}

std::string format_time_of_day(const TimeOfDay& time_of_day) {
    int total_seconds = time_of_day.seconds_since_midnight;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << total_seconds / SECONDS_PER_HOUR << ":"
        << std::setw(2) << (total_seconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE << ":"
        << std::setw(2) << total_seconds % SECONDS_PER_MINUTE;
    return oss.str();
}

std::tm parse_bar_timestamp(const std::string& timestamp) {
    std::string base_timestamp = timestamp;

    // Handle Z suffix
    if (!base_timestamp.empty() && base_timestamp.back() == 'Z') {
        base_timestamp.pop_back();
    }
    if (base_timestamp.size() > 10 && base_timestamp[10] == 'T') {
        base_timestamp[10] = ' ';
    }

    std::tm t = {};
    std::istringstream ss(base_timestamp);
    ss >> std::get_time(&t, HUMAN_READABLE);
    std::string trailing_text;
    if (ss.fail() || ss >> trailing_text) {
        throw std::runtime_error("Invalid bar timestamp '" + timestamp + "' - expected YYYY-MM-DD HH:MM:SS");
    }

    // Round-trip through timegm to fill in the weekday and reject impossible dates
    std::tm normalized_tm = t;
    time_t epoch_seconds = timegm(&normalized_tm);
    if (epoch_seconds == static_cast<time_t>(-1) || normalized_tm.tm_mday != t.tm_mday || normalized_tm.tm_mon != t.tm_mon) {
        throw std::runtime_error("Invalid calendar date in bar timestamp '" + timestamp + "'");
    }
    return normalized_tm;
}

std::string format_bar_timestamp(const std::tm& timestamp_tm) {
    std::stringstream ss;
    ss << std::put_time(&timestamp_tm, HUMAN_READABLE);
    return ss.str();
}

long long to_epoch_seconds(const std::tm& timestamp_tm) {
    std::tm copy_tm = timestamp_tm;
    return static_cast<long long>(timegm(&copy_tm));
}

Weekday weekday_of(const std::tm& timestamp_tm) {
    return static_cast<Weekday>(timestamp_tm.tm_wday);
}

TimeOfDay time_of_day_of(const std::tm& timestamp_tm) {
    return TimeOfDay(timestamp_tm.tm_hour, timestamp_tm.tm_min, timestamp_tm.tm_sec);
}

} // namespace TimeUtils
