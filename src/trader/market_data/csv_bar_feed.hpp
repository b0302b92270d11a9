#ifndef CSV_BAR_FEED_HPP
#define CSV_BAR_FEED_HPP

#include "bar_feed_interface.hpp"
#include <fstream>
#include <string>

namespace AryaTrader {
namespace Core {

/**
 * Reads timestamp,open,high,low,close rows from a CSV file.
 * An optional header row is skipped, as are blank lines and lines starting with '#'.
 * Malformed rows, inconsistent prices and non-increasing timestamps throw std::runtime_error
 * naming the file and line.
 */
class CsvBarFeed : public BarFeedInterface {
public:
    CsvBarFeed(const std::string& csv_file_path, double instrument_tick_size);

    CsvBarFeed(const CsvBarFeed&) = delete;
    CsvBarFeed& operator=(const CsvBarFeed&) = delete;

    void reset() override;
    std::optional<Bar> next_bar() override;
    std::string get_feed_name() const override { return "CSV:" + file_path; }

    // Parses one data row. Exposed for validation of individual lines.
    static Bar parse_bar_line(const std::string& csv_line, double instrument_tick_size);

private:
    std::string file_path;
    double tick_size;
    std::ifstream file_stream;
    int line_number;
    long long last_epoch_seconds;
    bool has_last_bar;

    void open_file();
};

} // namespace Core
} // namespace AryaTrader

#endif // CSV_BAR_FEED_HPP
