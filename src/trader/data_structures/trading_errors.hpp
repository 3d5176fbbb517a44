#ifndef TRADING_ERRORS_HPP
#define TRADING_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

namespace BybitTrader {
namespace Core {

// Bar timestamp not strictly after the last processed bar. Engine state is unchanged.
class OutOfOrderBar : public std::runtime_error {
public:
    OutOfOrderBar(std::int64_t bar_timestamp_ms, std::int64_t last_timestamp_ms)
        : std::runtime_error("Out of order bar: timestamp " + std::to_string(bar_timestamp_ms) +
                             " is not after last processed " + std::to_string(last_timestamp_ms)),
          bar_timestamp(bar_timestamp_ms), last_timestamp(last_timestamp_ms) {}

    std::int64_t bar_timestamp;
    std::int64_t last_timestamp;
};

// Computed size is zero at the exchange increment, below the minimum, or needs more margin than available.
class InsufficientEquity : public std::runtime_error {
public:
    explicit InsufficientEquity(const std::string& message)
        : std::runtime_error("Insufficient equity: " + message) {}
};

// Transport failure or a non-zero exchange return code.
class GatewayError : public std::runtime_error {
public:
    GatewayError(const std::string& message, int exchange_ret_code = 0)
        : std::runtime_error(message), ret_code(exchange_ret_code) {}

    int ret_code;
};

// Exit order failed twice. Entries stay halted until the exchange reports flat.
class StuckPosition : public std::runtime_error {
public:
    explicit StuckPosition(const std::string& message)
        : std::runtime_error("Stuck position: " + message) {}
};

} // namespace Core
} // namespace BybitTrader

#endif // TRADING_ERRORS_HPP
