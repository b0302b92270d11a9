#include <catch2/catch.hpp>
#include <stdexcept>
#include "utils/time_utils.hpp"

using TimeUtils::TimeOfDay;
using TimeUtils::Weekday;

TEST_CASE("parse_time_of_day accepts HH:MM and HH:MM:SS", "[time_utils]") {
    REQUIRE(TimeUtils::parse_time_of_day("18:00") == TimeOfDay(18, 0, 0));
    REQUIRE(TimeUtils::parse_time_of_day("06:30:15") == TimeOfDay(6, 30, 15));
    REQUIRE(TimeUtils::parse_time_of_day("00:00").seconds_since_midnight == 0);
}

TEST_CASE("parse_time_of_day rejects malformed and out of range values", "[time_utils]") {
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("18"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("evening"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("24:00"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("12:60"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("18:00x"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("18:00:"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_time_of_day("18:00:00 pm"), std::runtime_error);
}

TEST_CASE("format_time_of_day pads every field", "[time_utils]") {
    REQUIRE(TimeUtils::format_time_of_day(TimeOfDay(6, 5, 0)) == "06:05:00");
}

TEST_CASE("parse_bar_timestamp derives the weekday", "[time_utils]") {
    std::tm monday_tm = TimeUtils::parse_bar_timestamp("2024-01-08 18:15:00");
    REQUIRE(TimeUtils::weekday_of(monday_tm) == Weekday::Monday);
    REQUIRE(TimeUtils::time_of_day_of(monday_tm) == TimeOfDay(18, 15, 0));

    std::tm saturday_tm = TimeUtils::parse_bar_timestamp("2024-01-13T09:00:00Z");
    REQUIRE(TimeUtils::weekday_of(saturday_tm) == Weekday::Saturday);
    REQUIRE(TimeUtils::format_bar_timestamp(saturday_tm) == "2024-01-13 09:00:00");
}

TEST_CASE("parse_bar_timestamp rejects impossible dates", "[time_utils]") {
    REQUIRE_THROWS_AS(TimeUtils::parse_bar_timestamp("2024-02-30 10:00:00"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_bar_timestamp("not a timestamp"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_bar_timestamp("2024-01-08 18:15:00 junk"), std::runtime_error);
    REQUIRE_THROWS_AS(TimeUtils::parse_bar_timestamp("2024-01-08 18:15:00.5"), std::runtime_error);
}

TEST_CASE("to_epoch_seconds orders consecutive bars", "[time_utils]") {
    long long first_epoch = TimeUtils::to_epoch_seconds(TimeUtils::parse_bar_timestamp("2024-01-08 23:45:00"));
    long long second_epoch = TimeUtils::to_epoch_seconds(TimeUtils::parse_bar_timestamp("2024-01-09 00:00:00"));
    REQUIRE(second_epoch - first_epoch == 15 * 60);
}
