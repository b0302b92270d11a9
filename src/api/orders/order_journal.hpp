#ifndef ORDER_JOURNAL_HPP
#define ORDER_JOURNAL_HPP

#include <fstream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "trader/data_structures/data_structures.hpp"

namespace AryaTrader {
namespace API {
namespace Orders {

/**
 * Append-only record of every order request and fill, one JSON object per line.
 */
class OrderJournal {
public:
    // Throws std::runtime_error if the journal file cannot be created.
    explicit OrderJournal(const std::string& journal_file_path);

    void record_request(const std::string& request_action, const Core::Order& order, const std::string& bar_time);
    void record_fill(const Core::Order& order, double fill_price, const std::string& bar_time);

    static nlohmann::json build_order_entry(const std::string& request_action, const Core::Order& order, const std::string& bar_time);

    const std::string& get_file_path() const { return file_path; }
    unsigned long get_entries_written() const { return entries_written; }

private:
    std::string file_path;
    std::ofstream journal_stream;
    unsigned long entries_written;

    void write_entry(const nlohmann::json& journal_entry);
};

} // namespace Orders
} // namespace API
} // namespace AryaTrader

#endif // ORDER_JOURNAL_HPP
