#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "trader/market_data/csv_bar_feed.hpp"

using AryaTrader::Core::Bar;
using AryaTrader::Core::CsvBarFeed;

namespace {

std::string write_bars_file(const std::string& file_name, const std::string& contents) {
    std::ofstream bars_file(file_name, std::ios::trunc);
    bars_file << contents;
    return file_name;
}

} // anonymous namespace

TEST_CASE("CSV feed skips header, comments and blank lines", "[csv_bar_feed]") {
    std::string bars_path = write_bars_file("test_bars_valid.csv",
        "timestamp,open,high,low,close\n"
        "# first session\n"
        "2024-01-08 18:00:00,1.0950,1.0960,1.0940,1.0955\n"
        "\n"
        "2024-01-08T18:15:00Z,1.0955,1.0970,1.0950,1.0965\n");

    CsvBarFeed csv_bar_feed(bars_path, 0.0001);
    std::optional<Bar> first_bar = csv_bar_feed.next_bar();
    REQUIRE(first_bar.has_value());
    REQUIRE(first_bar->timestamp == "2024-01-08 18:00:00");
    REQUIRE(first_bar->high_price == Approx(1.0960));
    REQUIRE(first_bar->tick_size == Approx(0.0001));

    std::optional<Bar> second_bar = csv_bar_feed.next_bar();
    REQUIRE(second_bar.has_value());
    REQUIRE(second_bar->timestamp == "2024-01-08 18:15:00");
    REQUIRE_FALSE(csv_bar_feed.next_bar().has_value());

    // Restartable
    csv_bar_feed.reset();
    REQUIRE(csv_bar_feed.next_bar()->timestamp == "2024-01-08 18:00:00");
    std::remove(bars_path.c_str());
}

TEST_CASE("CSV feed rejects out of order timestamps with file and line", "[csv_bar_feed]") {
    std::string bars_path = write_bars_file("test_bars_unordered.csv",
        "2024-01-08 18:15:00,1.0,1.1,0.9,1.0\n"
        "2024-01-08 18:00:00,1.0,1.1,0.9,1.0\n");

    CsvBarFeed csv_bar_feed(bars_path, 0.0001);
    REQUIRE(csv_bar_feed.next_bar().has_value());
    REQUIRE_THROWS_WITH(csv_bar_feed.next_bar(), Catch::Contains("test_bars_unordered.csv:2"));
    std::remove(bars_path.c_str());
}

TEST_CASE("parse_bar_line validates fields and price consistency", "[csv_bar_feed]") {
    REQUIRE_THROWS_AS(CsvBarFeed::parse_bar_line("2024-01-08 18:00:00,1.0,1.1,0.9", 0.0001), std::runtime_error);
    REQUIRE_THROWS_AS(CsvBarFeed::parse_bar_line("2024-01-08 18:00:00,1.0,abc,0.9,1.0", 0.0001), std::runtime_error);
    // High below close
    REQUIRE_THROWS_AS(CsvBarFeed::parse_bar_line("2024-01-08 18:00:00,1.0,1.05,0.9,1.08", 0.0001), std::runtime_error);
    // Non-finite prices
    REQUIRE_THROWS_AS(CsvBarFeed::parse_bar_line("2024-01-08 18:00:00,1.0,nan,0.9,1.0", 0.0001), std::runtime_error);
    REQUIRE_THROWS_AS(CsvBarFeed::parse_bar_line("2024-01-08 18:00:00,1.0,inf,0.9,1.0", 0.0001), std::runtime_error);
    REQUIRE_THROWS_AS(CsvBarFeed::parse_bar_line("2024-01-08 18:00:00,nan,1.1,0.9,1.0", 0.0001), std::runtime_error);

    Bar bar = CsvBarFeed::parse_bar_line(" 2024-01-08 18:00:00 , 1.0 , 1.1 , 0.9 , 1.05 ", 0.25);
    REQUIRE(bar.close_price == Approx(1.05));
    REQUIRE(bar.tick_size == Approx(0.25));
}

TEST_CASE("missing bars file throws", "[csv_bar_feed]") {
    REQUIRE_THROWS_AS(CsvBarFeed("no_such_bars.csv", 0.0001), std::runtime_error);
}
