#ifndef POSITION_MANAGER_HPP
#define POSITION_MANAGER_HPP

#include <optional>
#include <string>
#include "configs/orders_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "execution_interface.hpp"

namespace AryaTrader {
namespace Core {

struct EntryRequest {
    OrderSide side;
    double current_close;
    double tick_size;
    int stop_ticks;
    int profit_ticks;
    double base_acceleration;

    EntryRequest(OrderSide order_side, double close_price, double instrument_tick_size, int stop_loss_ticks,
                 int profit_target_ticks, double trailing_acceleration)
        : side(order_side), current_close(close_price), tick_size(instrument_tick_size), stop_ticks(stop_loss_ticks),
          profit_ticks(profit_target_ticks), base_acceleration(trailing_acceleration) {}
};

/**
 * Owns the single position slot and its linked stop/target pair.
 * Every state change goes through enter(), exit(), modify_stop() or handle_exit_order_filled().
 * State is committed only after all requests of an operation were accepted by the collaborator.
 * Calls made in the wrong state throw std::runtime_error.
 */
class PositionManager {
public:
    PositionManager(ExecutionServiceInterface& execution_service, const Config::OrdersConfig& orders_config);

    void enter(const EntryRequest& entry_request);
    void exit(const std::string& exit_label);
    void modify_stop(double new_stop_price, const std::string& new_label);

    // The stop or target of the open position filled at the venue (which cancelled its partner).
    // Returns false when the id does not belong to the open position.
    bool handle_exit_order_filled(OrderId order_id);

    PositionSide get_position_side() const;
    bool is_flat() const { return !open_position.has_value(); }
    const std::optional<OpenPosition>& get_open_position() const { return open_position; }

    // Trailing state is read and advanced by the trailing stop controller
    TrailingState& get_trailing_state();

    // Id of the last entry market order, 0 before the first entry
    OrderId get_last_entry_order_id() const { return last_entry_order_id; }

private:
    ExecutionServiceInterface& execution_service;
    const Config::OrdersConfig& orders_config;
    std::optional<OpenPosition> open_position;
    OrderId next_order_id;
    OrderId last_entry_order_id;

    OrderId allocate_order_id() { return next_order_id++; }
    OpenPosition& require_open_position(const std::string& operation_name);
};

} // namespace Core
} // namespace AryaTrader

#endif // POSITION_MANAGER_HPP
