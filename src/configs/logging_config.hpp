// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace BybitTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "trading_bot.log";
    std::string runtime_log_directory = "runtime_logs";
};

} // namespace Config
} // namespace BybitTrader

#endif // LOGGING_CONFIG_HPP
