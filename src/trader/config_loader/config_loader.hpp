#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

namespace AryaTrader {
namespace Config {

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false if the file cannot be opened,
// throws std::runtime_error naming the key when a known key carries a malformed value.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Load and validate the complete system configuration. Throws std::runtime_error on any failure.
void load_system_config(SystemConfig& config, const std::string& csv_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& errorMessage);

// Largest number of bars any filter or indicator needs before producing a value.
int required_history_bars(const StrategyConfig& strategy_config);

} // namespace Config
} // namespace AryaTrader

#endif // CONFIG_LOADER_HPP
