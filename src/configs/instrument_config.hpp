// InstrumentConfig.hpp
#ifndef INSTRUMENT_CONFIG_HPP
#define INSTRUMENT_CONFIG_HPP

#include <string>
#include "utils/time_utils.hpp"

namespace AryaTrader {
namespace Config {

struct InstrumentConfig {
    std::string symbol = "URO";
    double tick_size = 0.0001;                       // Minimum price increment

    // Intraday positions are flattened when the bar sequence crosses the session close
    bool force_close_at_session_end = true;
    TimeUtils::TimeOfDay session_close_time{16, 0, 0};

    int max_open_position = 1;                       // Contracts, either side
};

} // namespace Config
} // namespace AryaTrader

#endif // INSTRUMENT_CONFIG_HPP
