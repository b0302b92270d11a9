#ifndef BAR_FEED_INTERFACE_HPP
#define BAR_FEED_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <optional>
#include <memory>
#include <string>

namespace AryaTrader {
namespace Core {

// Forward-only bar source in strictly increasing timestamp order, restartable per backtest.
class BarFeedInterface {
public:
    virtual ~BarFeedInterface() = default;

    virtual void reset() = 0;
    virtual std::optional<Bar> next_bar() = 0;
    virtual std::string get_feed_name() const = 0;
};

using BarFeedPtr = std::unique_ptr<BarFeedInterface>;

} // namespace Core
} // namespace AryaTrader

#endif // BAR_FEED_INTERFACE_HPP
