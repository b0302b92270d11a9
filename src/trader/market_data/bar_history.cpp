#include "bar_history.hpp"
#include <algorithm>
#include <stdexcept>

namespace AryaTrader {
namespace Core {

BarHistory::BarHistory(size_t max_bars_capacity) : max_bars(max_bars_capacity), bars(), undo_available(false), evicted_bar() {
    if (max_bars == 0) {
        throw std::runtime_error("BarHistory capacity must be > 0");
    }
}

void BarHistory::append(const Bar& bar) {
    if (!bars.empty() && bar.epoch_seconds() <= bars.front().epoch_seconds()) {
        throw std::runtime_error("Bar " + bar.timestamp + " is not newer than current bar " + bars.front().timestamp);
    }
    bars.push_front(bar);
    evicted_bar.reset();
    if (bars.size() > max_bars) {
        evicted_bar = bars.back();
        bars.pop_back();
    }
    undo_available = true;
}

void BarHistory::undo_append() {
    if (!undo_available) {
        throw std::runtime_error("BarHistory has no append to undo");
    }
    bars.pop_front();
    if (evicted_bar) {
        bars.push_back(*evicted_bar);
        evicted_bar.reset();
    }
    undo_available = false;
}

void BarHistory::clear() {
    bars.clear();
    undo_available = false;
    evicted_bar.reset();
}

std::optional<Bar> BarHistory::history(size_t bars_back) const {
    if (bars_back >= bars.size()) {
        return std::nullopt;
    }
    return bars[bars_back];
}

std::optional<double> BarHistory::highest_high(size_t lookback_bars) const {
    if (lookback_bars == 0 || lookback_bars > bars.size()) {
        return std::nullopt;
    }
    double highest_value = bars.front().high_price;
    for (size_t bar_index = 1; bar_index < lookback_bars; ++bar_index) {
        highest_value = std::max(highest_value, bars[bar_index].high_price);
    }
    return highest_value;
}

std::optional<double> BarHistory::lowest_low(size_t lookback_bars) const {
    if (lookback_bars == 0 || lookback_bars > bars.size()) {
        return std::nullopt;
    }
    double lowest_value = bars.front().low_price;
    for (size_t bar_index = 1; bar_index < lookback_bars; ++bar_index) {
        lowest_value = std::min(lowest_value, bars[bar_index].low_price);
    }
    return lowest_value;
}

} // namespace Core
} // namespace AryaTrader
