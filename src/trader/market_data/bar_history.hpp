#ifndef BAR_HISTORY_HPP
#define BAR_HISTORY_HPP

#include <deque>
#include <optional>
#include <cstddef>
#include "trader/data_structures/data_structures.hpp"

namespace AryaTrader {
namespace Core {

/**
 * Bounded look-back window over the bar stream.
 * Index 0 is the current bar, 1 the previous one. Queries that reach past the stored
 * history return nullopt rather than a partial answer.
 */
class BarHistory {
public:
    explicit BarHistory(size_t max_bars_capacity);

    // Throws std::runtime_error if the bar is not strictly newer than the current bar.
    void append(const Bar& bar);
    // Removes the bar added by the last append() and restores the bar it evicted.
    // Throws std::runtime_error when there is no append to undo.
    void undo_append();
    void clear();

    std::optional<Bar> history(size_t bars_back) const;
    std::optional<double> highest_high(size_t lookback_bars) const;
    std::optional<double> lowest_low(size_t lookback_bars) const;

    size_t size() const { return bars.size(); }
    size_t capacity() const { return max_bars; }
    bool empty() const { return bars.empty(); }

private:
    size_t max_bars;
    std::deque<Bar> bars;  // front = most recent
    bool undo_available;
    std::optional<Bar> evicted_bar;
};

} // namespace Core
} // namespace AryaTrader

#endif // BAR_HISTORY_HPP
