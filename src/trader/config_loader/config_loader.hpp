#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

namespace BybitTrader {
namespace Config {

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false if the file cannot be opened.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Load strategy and risk parameters from separate CSV file. Returns false if the file cannot be opened.
bool load_strategy_config(SystemConfig& cfg, const std::string& strategy_config_path);

// Override credentials from BYBIT_API_KEY / BYBIT_API_SECRET when set.
void apply_environment_overrides(SystemConfig& cfg);

// Load complete system configuration (runtime config, strategy config, environment). Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config);
int load_system_config(SystemConfig& config, const std::string& runtime_config_path, const std::string& strategy_config_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& errorMessage);

} // namespace Config
} // namespace BybitTrader

#endif // CONFIG_LOADER_HPP
