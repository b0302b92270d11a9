#ifndef INDICATOR_PROVIDER_INTERFACE_HPP
#define INDICATOR_PROVIDER_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>

namespace AryaTrader {
namespace Core {

// Indicator service fed one bar at a time. snapshot() exposes the last two values of each series;
// a series that has not warmed up reports ready == false.
class IndicatorProviderInterface {
public:
    virtual ~IndicatorProviderInterface() = default;

    virtual void update(const Bar& bar) = 0;
    // Restores the state held before the most recent update()
    virtual void rollback_last_update() = 0;
    virtual IndicatorSnapshot snapshot() const = 0;
    virtual void reset() = 0;
};

using IndicatorProviderPtr = std::unique_ptr<IndicatorProviderInterface>;

} // namespace Core
} // namespace AryaTrader

#endif // INDICATOR_PROVIDER_INTERFACE_HPP
