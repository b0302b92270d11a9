#include "api/orders/order_journal.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace AryaTrader {
namespace API {
namespace Orders {

OrderJournal::OrderJournal(const std::string& journal_file_path)
    : file_path(journal_file_path), journal_stream(journal_file_path, std::ios::out | std::ios::trunc), entries_written(0) {
    if (!journal_stream.is_open()) {
        throw std::runtime_error("Cannot open order journal file: " + journal_file_path);
    }
}

json OrderJournal::build_order_entry(const std::string& request_action, const Core::Order& order, const std::string& bar_time) {
    json journal_entry;
    journal_entry["action"] = request_action;
    journal_entry["order_id"] = order.order_id;
    journal_entry["side"] = Core::to_string(order.side);
    journal_entry["type"] = Core::to_string(order.type);
    journal_entry["qty"] = order.quantity;
    if (order.price) {
        journal_entry["price"] = *order.price;
    } else {
        journal_entry["price"] = nullptr;
    }
    journal_entry["label"] = order.label;
    if (order.linked_order_id) {
        journal_entry["linked_order_id"] = *order.linked_order_id;
    } else {
        journal_entry["linked_order_id"] = nullptr;
    }
    journal_entry["bar_time"] = bar_time;
    return journal_entry;
}

void OrderJournal::record_request(const std::string& request_action, const Core::Order& order, const std::string& bar_time) {
    write_entry(build_order_entry(request_action, order, bar_time));
}

void OrderJournal::record_fill(const Core::Order& order, double fill_price, const std::string& bar_time) {
    json journal_entry = build_order_entry("fill", order, bar_time);
    journal_entry["fill_price"] = fill_price;
    write_entry(journal_entry);
}

void OrderJournal::write_entry(const json& journal_entry) {
    journal_stream << journal_entry.dump() << '\n';
    journal_stream.flush();
    if (!journal_stream) {
        throw std::runtime_error("Failed to write order journal entry to " + file_path);
    }
    entries_written++;
}

} // namespace Orders
} // namespace API
} // namespace AryaTrader
