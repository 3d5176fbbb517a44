// ApiConfig.hpp
#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace BybitTrader {
namespace Config {

struct ApiConfig {
    // Authentication
    std::string api_key;
    std::string api_secret;

    // Base URLs (testnet flag selects which one is used)
    std::string mainnet_url = "https://api.bybit.com";
    std::string testnet_url = "https://api-testnet.bybit.com";
    bool testnet = true;                       // Paper trading against the exchange testnet

    // Product scope
    std::string category = "linear";           // USDT perpetual futures
    std::string account_type = "UNIFIED";      // Wallet queried for equity

    // HTTP Configuration
    int recv_window_ms = 5000;
    int retry_count = 3;
    int timeout_seconds = 10;
    bool enable_ssl_verification = true;
    int rate_limit_delay_ms = 100;

    const std::string& active_base_url() const { return testnet ? testnet_url : mainnet_url; }
};

} // namespace Config
} // namespace BybitTrader

#endif // API_CONFIG_HPP
