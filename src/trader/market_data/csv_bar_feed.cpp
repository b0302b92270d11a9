#include "csv_bar_feed.hpp"
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace AryaTrader {
namespace Core {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline double parse_price_field(const std::string& field_value, const std::string& field_name) {
        size_t parsed_characters = 0;
        double parsed_value = 0.0;
        try {
            parsed_value = std::stod(field_value, &parsed_characters);
        } catch (const std::exception&) {
            throw std::runtime_error("invalid " + field_name + " '" + field_value + "'");
        }
        if (parsed_characters != field_value.size() || !std::isfinite(parsed_value)) {
            throw std::runtime_error("invalid " + field_name + " '" + field_value + "'");
        }
        return parsed_value;
    }

    inline bool is_header_line(const std::string& csv_line) {
        return !csv_line.empty() && std::isalpha(static_cast<unsigned char>(csv_line[0]));
    }
}

CsvBarFeed::CsvBarFeed(const std::string& csv_file_path, double instrument_tick_size)
    : file_path(csv_file_path), tick_size(instrument_tick_size), file_stream(), line_number(0),
      last_epoch_seconds(0), has_last_bar(false) {
    open_file();
}

void CsvBarFeed::open_file() {
    file_stream.close();
    file_stream.clear();
    file_stream.open(file_path);
    if (!file_stream.is_open()) {
        throw std::runtime_error("Failed to open bars CSV: " + file_path);
    }
    line_number = 0;
    has_last_bar = false;
    last_epoch_seconds = 0;
}

void CsvBarFeed::reset() {
    open_file();
}

Bar CsvBarFeed::parse_bar_line(const std::string& csv_line, double instrument_tick_size) {
    std::vector<std::string> fields;
    std::stringstream line_stream(csv_line);
    std::string field_value;
    while (std::getline(line_stream, field_value, ',')) {
        fields.push_back(trim(field_value));
    }
    if (fields.size() < 5) {
        throw std::runtime_error("expected timestamp,open,high,low,close but got " + std::to_string(fields.size()) + " fields");
    }

    Bar bar;
    bar.timestamp_tm = TimeUtils::parse_bar_timestamp(fields[0]);
    bar.timestamp = TimeUtils::format_bar_timestamp(bar.timestamp_tm);
    bar.open_price = parse_price_field(fields[1], "open");
    bar.high_price = parse_price_field(fields[2], "high");
    bar.low_price = parse_price_field(fields[3], "low");
    bar.close_price = parse_price_field(fields[4], "close");
    bar.tick_size = instrument_tick_size;

    double body_high = std::max(bar.open_price, bar.close_price);
    double body_low = std::min(bar.open_price, bar.close_price);
    if (!(bar.high_price >= body_high) || !(bar.low_price <= body_low)) {
        throw std::runtime_error("inconsistent OHLC prices at " + bar.timestamp);
    }
    return bar;
}

std::optional<Bar> CsvBarFeed::next_bar() {
    std::string csv_line;
    while (std::getline(file_stream, csv_line)) {
        ++line_number;
        csv_line = trim(csv_line);
        if (csv_line.empty() || csv_line[0] == '#') continue;
        if (line_number == 1 && is_header_line(csv_line)) continue;

        Bar bar;
        try {
            bar = parse_bar_line(csv_line, tick_size);
        } catch (const std::exception& parse_exception_error) {
            throw std::runtime_error(file_path + ":" + std::to_string(line_number) + ": " + parse_exception_error.what());
        }

        long long bar_epoch_seconds = bar.epoch_seconds();
        if (has_last_bar && bar_epoch_seconds <= last_epoch_seconds) {
            throw std::runtime_error(file_path + ":" + std::to_string(line_number) + ": timestamp " + bar.timestamp +
                                     " is not after the previous bar");
        }
        last_epoch_seconds = bar_epoch_seconds;
        has_last_bar = true;
        return bar;
    }
    return std::nullopt;
}

} // namespace Core
} // namespace AryaTrader
