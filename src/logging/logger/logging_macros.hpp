#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace AryaTrader {
namespace Logging {

constexpr size_t TABLE_LABEL_WIDTH = 17;
constexpr size_t TABLE_VALUE_WIDTH = 30;

// Cuts or pads text to exactly cell_width characters
inline std::string format_table_cell(const std::string& cell_text, size_t cell_width) {
    std::string cell_string = cell_text.substr(0, cell_width);
    cell_string.resize(cell_width, ' ');
    return cell_string;
}

} // namespace Logging
} // namespace AryaTrader

// Section blocks
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SUBCONTENT(msg) log_message("|     " + std::string(msg), "")
#define LOG_THREAD_SEPARATOR() log_message("|", "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

#define LOG_THREAD_SIGNAL_ANALYSIS_HEADER(symbol) LOG_THREAD_SECTION_HEADER("SIGNAL ANALYSIS - " + symbol)
#define LOG_THREAD_ORDER_EXECUTION_HEADER() LOG_THREAD_SECTION_HEADER("ORDER EXECUTION")
#define LOG_THREAD_TRAILING_STOP_HEADER() LOG_THREAD_SECTION_HEADER("TRAILING STOP")

// Startup blocks
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// One banner per processed bar
#define LOG_BAR_HEADER(bar_num, timestamp) do { \
    log_message("", ""); \
    log_message(std::string(80, '='), ""); \
    log_message(std::string(22, ' ') + "BAR #" + std::to_string(bar_num) + " - " + std::string(timestamp), ""); \
    log_message(std::string(80, '='), ""); \
} while (0)

// Two-column tables: 17 character label, 30 character value
#define TABLE_HEADER_30(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬────────────────────────────────┐"); \
    LOG_THREAD_CONTENT("│ " + AryaTrader::Logging::format_table_cell(title, AryaTrader::Logging::TABLE_LABEL_WIDTH) + " │ " + \
                       AryaTrader::Logging::format_table_cell(subtitle, AryaTrader::Logging::TABLE_VALUE_WIDTH) + " │"); \
    LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤"); \
} while (0)

#define TABLE_ROW_30(label, value) \
    LOG_THREAD_CONTENT("│ " + AryaTrader::Logging::format_table_cell(label, AryaTrader::Logging::TABLE_LABEL_WIDTH) + " │ " + \
                       AryaTrader::Logging::format_table_cell(value, AryaTrader::Logging::TABLE_VALUE_WIDTH) + " │")

#define TABLE_SEPARATOR_30() LOG_THREAD_CONTENT("├───────────────────┼────────────────────────────────┤")

#define TABLE_FOOTER_30() LOG_THREAD_CONTENT("└───────────────────┴────────────────────────────────┘")

#endif // LOGGING_MACROS_HPP
