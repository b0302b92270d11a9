#include "api/orders/simulated_order_client.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/trading_logs.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace AryaTrader {
namespace API {
namespace Orders {

constexpr int FILL_LOG_PRICE_PRECISION = 5;

using AryaTrader::Logging::TradingLogs;
using AryaTrader::Logging::log_message;
using Core::Order;
using Core::OrderId;
using Core::OrderSide;
using Core::OrderType;

SimulatedOrderClient::SimulatedOrderClient(double instrument_tick_size, OrderJournal* journal_pointer)
    : tick_size(instrument_tick_size), journal_ptr(journal_pointer), fill_callback(), working_orders(), current_bar_time(""),
      net_position(0), average_entry_price(0.0), realized_pnl(0.0), completed_trades(0), filled_order_count(0) {
    if (instrument_tick_size <= 0.0) {
        throw std::runtime_error("Simulated order client requires a positive tick size");
    }
}

void SimulatedOrderClient::insert_order(const Order& order) {
    if (working_orders.count(order.order_id) > 0) {
        throw std::runtime_error("Insert rejected - order #" + std::to_string(order.order_id) + " is already working");
    }
    if (order.quantity <= 0) {
        throw std::runtime_error("Insert rejected - order #" + std::to_string(order.order_id) + " has non-positive quantity");
    }
    if (order.type != OrderType::Market && !order.price) {
        throw std::runtime_error("Insert rejected - " + Core::to_string(order.type) + " order #" + std::to_string(order.order_id) +
                                 " requires a price");
    }
    if (order.type == OrderType::Market && order.price) {
        throw std::runtime_error("Insert rejected - market order #" + std::to_string(order.order_id) + " must not carry a price");
    }

    working_orders.emplace(order.order_id, order);
    journal_request("insert", order);
}

void SimulatedOrderClient::modify_order(const Order& order) {
    std::map<OrderId, Order>::iterator working_order_iterator = working_orders.find(order.order_id);
    if (working_order_iterator == working_orders.end()) {
        throw std::runtime_error("Modify rejected - order #" + std::to_string(order.order_id) + " is not working");
    }
    Order& working_order = working_order_iterator->second;
    if (working_order.type != order.type || working_order.side != order.side) {
        throw std::runtime_error("Modify rejected - order #" + std::to_string(order.order_id) + " cannot change side or type");
    }
    if (working_order.type != OrderType::Market && !order.price) {
        throw std::runtime_error("Modify rejected - order #" + std::to_string(order.order_id) + " requires a price");
    }

    working_order.price = order.price;
    working_order.label = order.label;
    journal_request("modify", working_order);
}

void SimulatedOrderClient::cancel_order(OrderId order_id) {
    std::map<OrderId, Order>::iterator working_order_iterator = working_orders.find(order_id);
    if (working_order_iterator == working_orders.end()) {
        throw std::runtime_error("Cancel rejected - order #" + std::to_string(order_id) + " is not working");
    }
    Order cancelled_order = working_order_iterator->second;
    working_orders.erase(working_order_iterator);
    journal_request("cancel", cancelled_order);
}

std::vector<OrderFill> SimulatedOrderClient::process_bar(const Core::Bar& bar) {
    current_bar_time = bar.timestamp;
    std::vector<OrderFill> bar_fills;

    // Market orders first, at the open
    std::vector<OrderId> market_order_ids;
    for (const auto& working_order_entry : working_orders) {
        if (working_order_entry.second.type == OrderType::Market) {
            market_order_ids.push_back(working_order_entry.first);
        }
    }
    for (OrderId market_order_id : market_order_ids) {
        Order filled_order = working_orders.at(market_order_id);
        working_orders.erase(market_order_id);
        apply_fill(filled_order, bar.open_price);
        bar_fills.emplace_back(filled_order, bar.open_price, bar.timestamp);
    }

    // Resting orders in id order; a fill removes its linked partner before the partner is checked
    std::vector<OrderId> resting_order_ids;
    for (const auto& working_order_entry : working_orders) {
        resting_order_ids.push_back(working_order_entry.first);
    }
    for (OrderId resting_order_id : resting_order_ids) {
        std::map<OrderId, Order>::iterator working_order_iterator = working_orders.find(resting_order_id);
        if (working_order_iterator == working_orders.end()) {
            continue;
        }
        std::optional<double> fill_price = determine_fill_price(working_order_iterator->second, bar);
        if (!fill_price) {
            continue;
        }

        Order filled_order = working_order_iterator->second;
        working_orders.erase(working_order_iterator);
        if (filled_order.linked_order_id) {
            std::map<OrderId, Order>::iterator linked_order_iterator = working_orders.find(*filled_order.linked_order_id);
            if (linked_order_iterator != working_orders.end()) {
                Order linked_order = linked_order_iterator->second;
                working_orders.erase(linked_order_iterator);
                journal_request("oco_cancel", linked_order);
            }
        }
        apply_fill(filled_order, *fill_price);
        bar_fills.emplace_back(filled_order, *fill_price, bar.timestamp);
    }

    dispatch_fills(bar_fills);
    return bar_fills;
}

std::vector<OrderFill> SimulatedOrderClient::settle_market_orders(double settlement_price, const std::string& bar_time) {
    std::vector<OrderFill> settlement_fills;
    std::map<OrderId, Order>::iterator working_order_iterator = working_orders.begin();
    while (working_order_iterator != working_orders.end()) {
        if (working_order_iterator->second.type != OrderType::Market) {
            ++working_order_iterator;
            continue;
        }
        Order filled_order = working_order_iterator->second;
        working_order_iterator = working_orders.erase(working_order_iterator);
        apply_fill(filled_order, settlement_price);
        settlement_fills.emplace_back(filled_order, settlement_price, bar_time);
    }
    dispatch_fills(settlement_fills);
    return settlement_fills;
}

std::optional<double> SimulatedOrderClient::determine_fill_price(const Order& order, const Core::Bar& bar) const {
    if (!order.price) {
        return std::nullopt;
    }
    double order_price = *order.price;

    if (order.type == OrderType::Stop) {
        if (order.side == OrderSide::Sell && bar.low_price <= order_price) {
            return std::min(bar.open_price, order_price);
        }
        if (order.side == OrderSide::Buy && bar.high_price >= order_price) {
            return std::max(bar.open_price, order_price);
        }
    } else if (order.type == OrderType::Limit) {
        if (order.side == OrderSide::Sell && bar.high_price >= order_price) {
            return std::max(bar.open_price, order_price);
        }
        if (order.side == OrderSide::Buy && bar.low_price <= order_price) {
            return std::min(bar.open_price, order_price);
        }
    }
    return std::nullopt;
}

void SimulatedOrderClient::apply_fill(const Order& order, double fill_price) {
    int signed_quantity = order.side == OrderSide::Buy ? order.quantity : -order.quantity;
    filled_order_count++;

    if (net_position == 0 || (net_position > 0) == (signed_quantity > 0)) {
        int total_quantity = std::abs(net_position) + order.quantity;
        average_entry_price = (average_entry_price * std::abs(net_position) + fill_price * order.quantity) / total_quantity;
        net_position += signed_quantity;
        return;
    }

    int closing_quantity = std::min(order.quantity, std::abs(net_position));
    double direction_multiplier = net_position > 0 ? 1.0 : -1.0;
    realized_pnl += closing_quantity * (fill_price - average_entry_price) * direction_multiplier;
    net_position += signed_quantity;

    if (net_position == 0) {
        average_entry_price = 0.0;
        completed_trades++;
    } else if ((net_position > 0) == (signed_quantity > 0)) {
        // Flipped through flat
        average_entry_price = fill_price;
        completed_trades++;
    }
}

void SimulatedOrderClient::dispatch_fills(const std::vector<OrderFill>& fills) {
    for (const OrderFill& order_fill : fills) {
        if (journal_ptr) {
            journal_ptr->record_fill(order_fill.order, order_fill.fill_price, order_fill.bar_time);
        }
        log_message("Filled #" + std::to_string(order_fill.order.order_id) + " " + Core::to_string(order_fill.order.type) + " " +
                    Core::to_string(order_fill.order.side) + " @ " + TradingLogs::format_price(order_fill.fill_price, FILL_LOG_PRICE_PRECISION) +
                    " '" + order_fill.order.label + "'", "");
        if (fill_callback) {
            fill_callback(order_fill);
        }
    }
}

void SimulatedOrderClient::journal_request(const std::string& request_action, const Order& order) {
    if (journal_ptr) {
        journal_ptr->record_request(request_action, order, current_bar_time);
    }
}

bool SimulatedOrderClient::has_working_order(OrderId order_id) const {
    return working_orders.count(order_id) > 0;
}

std::optional<Order> SimulatedOrderClient::get_working_order(OrderId order_id) const {
    std::map<OrderId, Order>::const_iterator working_order_iterator = working_orders.find(order_id);
    if (working_order_iterator == working_orders.end()) {
        return std::nullopt;
    }
    return working_order_iterator->second;
}

double SimulatedOrderClient::get_realized_pnl_ticks() const {
    return realized_pnl / tick_size;
}

} // namespace Orders
} // namespace API
} // namespace AryaTrader
