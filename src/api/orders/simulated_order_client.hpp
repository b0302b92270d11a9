#ifndef SIMULATED_ORDER_CLIENT_HPP
#define SIMULATED_ORDER_CLIENT_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"
#include "trader/trading_logic/execution_interface.hpp"
#include "api/orders/order_journal.hpp"

namespace AryaTrader {
namespace API {
namespace Orders {

struct OrderFill {
    Core::Order order;
    double fill_price;
    std::string bar_time;

    OrderFill(const Core::Order& filled_order, double fill_price_value, const std::string& bar_time_value)
        : order(filled_order), fill_price(fill_price_value), bar_time(bar_time_value) {}
};

using FillCallback = std::function<void(const OrderFill&)>;

/**
 * Bar-driven execution venue for backtests.
 *
 * Market orders fill at the open of the next processed bar. Stop and limit orders fill when the
 * bar trades through their price, at the open if the bar gapped past it. Working orders are
 * evaluated in id order, so a stop is checked before the target placed with it. A fill cancels
 * the order named by linked_order_id.
 */
class SimulatedOrderClient : public Core::ExecutionServiceInterface {
public:
    // journal_ptr may be null
    SimulatedOrderClient(double instrument_tick_size, OrderJournal* journal_ptr);

    void insert_order(const Core::Order& order) override;
    void modify_order(const Core::Order& order) override;
    void cancel_order(Core::OrderId order_id) override;
    std::string get_execution_name() const override { return "SIMULATED"; }

    // Matches working orders against the bar, then reports each fill through the callback.
    std::vector<OrderFill> process_bar(const Core::Bar& bar);

    // Fills pending market orders at the given price, used when the bar stream ends.
    std::vector<OrderFill> settle_market_orders(double settlement_price, const std::string& bar_time);

    void set_fill_callback(const FillCallback& callback) { fill_callback = callback; }

    bool has_working_order(Core::OrderId order_id) const;
    std::optional<Core::Order> get_working_order(Core::OrderId order_id) const;
    size_t get_working_order_count() const { return working_orders.size(); }

    int get_net_position() const { return net_position; }
    double get_realized_pnl() const { return realized_pnl; }
    double get_realized_pnl_ticks() const;
    unsigned long get_completed_trades() const { return completed_trades; }
    unsigned long get_filled_order_count() const { return filled_order_count; }

private:
    double tick_size;
    OrderJournal* journal_ptr;
    FillCallback fill_callback;
    std::map<Core::OrderId, Core::Order> working_orders;
    std::string current_bar_time;

    int net_position;
    double average_entry_price;
    double realized_pnl;
    unsigned long completed_trades;
    unsigned long filled_order_count;

    std::optional<double> determine_fill_price(const Core::Order& order, const Core::Bar& bar) const;
    void apply_fill(const Core::Order& order, double fill_price);
    void dispatch_fills(const std::vector<OrderFill>& fills);
    void journal_request(const std::string& request_action, const Core::Order& order);
};

} // namespace Orders
} // namespace API
} // namespace AryaTrader

#endif // SIMULATED_ORDER_CLIENT_HPP
