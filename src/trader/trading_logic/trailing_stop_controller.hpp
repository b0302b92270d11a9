#ifndef TRAILING_STOP_CONTROLLER_HPP
#define TRAILING_STOP_CONTROLLER_HPP

#include "configs/orders_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "position_manager.hpp"

namespace AryaTrader {
namespace Core {

/**
 * Accelerating trailing stop, run once per bar while a position is open.
 *
 * On a new favorable close the acceleration is multiplied by the distance between that close
 * and the current stop, and the stop is stepped by the new acceleration. When the step would
 * meet or cross the close the position is flattened instead.
 */
class TrailingStopController {
public:
    TrailingStopController(PositionManager& position_manager, const Config::OrdersConfig& orders_config);

    // Throws std::runtime_error when no position is open.
    TrailingStopAction update(double current_close);

private:
    PositionManager& position_manager;
    const Config::OrdersConfig& orders_config;

    TrailingStopAction update_long(const OpenPosition& open_position, double current_close);
    TrailingStopAction update_short(const OpenPosition& open_position, double current_close);
};

} // namespace Core
} // namespace AryaTrader

#endif // TRAILING_STOP_CONTROLLER_HPP
