#include "config_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace BybitTrader {
namespace Config {

namespace {
    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline bool to_bool(const std::string& v) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s == "1" || s == "true" || s == "yes";
    }

    inline int to_int(const std::string& key, const std::string& value) {
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for " + key + ": '" + value + "'");
        }
    }

    inline double to_double(const std::string& key, const std::string& value) {
        try {
            return std::stod(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number for " + key + ": '" + value + "'");
        }
    }

    // Reads the next "key,value" pair, skipping blank lines and '#' comments.
    bool read_key_value(std::ifstream& in, std::string& key, std::string& value) {
        std::string line;
        while (std::getline(in, line)) {
            std::string trimmed_line = trim(line);
            if (trimmed_line.empty() || trimmed_line[0] == '#') continue;
            std::stringstream ss(trimmed_line);
            if (!std::getline(ss, key, ',')) continue;
            if (!std::getline(ss, value)) continue;
            key = trim(key); value = trim(value);
            return true;
        }
        return false;
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream in(csv_path);
    if (!in.is_open()) return false;
    std::string key, value;
    while (read_key_value(in, key, value)) {
        // API
        if (key == "api.api_key") cfg.api.api_key = value;
        else if (key == "api.api_secret") cfg.api.api_secret = value;
        else if (key == "api.mainnet_url") cfg.api.mainnet_url = value;
        else if (key == "api.testnet_url") cfg.api.testnet_url = value;
        else if (key == "api.testnet") cfg.api.testnet = to_bool(value);
        else if (key == "api.category") cfg.api.category = value;
        else if (key == "api.account_type") cfg.api.account_type = value;
        else if (key == "api.recv_window_ms") cfg.api.recv_window_ms = to_int(key, value);
        else if (key == "api.retry_count") cfg.api.retry_count = to_int(key, value);
        else if (key == "api.timeout_seconds") cfg.api.timeout_seconds = to_int(key, value);
        else if (key == "api.enable_ssl_verification") cfg.api.enable_ssl_verification = to_bool(value);
        else if (key == "api.rate_limit_delay_ms") cfg.api.rate_limit_delay_ms = to_int(key, value);

        // Target
        else if (key == "target.symbol") cfg.strategy.symbol = value;

        // Timing
        else if (key == "timing.market_data_poll_interval_sec") cfg.timing.thread_market_data_poll_interval_sec = to_int(key, value);
        else if (key == "timing.reconciliation_interval_sec") cfg.timing.thread_reconciliation_interval_sec = to_int(key, value);
        else if (key == "timing.logging_poll_interval_sec") cfg.timing.thread_logging_poll_interval_sec = to_int(key, value);
        else if (key == "timing.order_confirmation_timeout_ms") cfg.timing.order_confirmation_timeout_ms = to_int(key, value);
        else if (key == "timing.order_status_poll_interval_ms") cfg.timing.order_status_poll_interval_ms = to_int(key, value);
        else if (key == "timing.thread_startup_delay_ms") cfg.timing.thread_startup_sequence_delay_milliseconds = to_int(key, value);
        else if (key == "timing.connectivity_max_retry_delay_sec") cfg.timing.connectivity_max_retry_delay_seconds = to_int(key, value);
        else if (key == "timing.connectivity_degraded_threshold") cfg.timing.connectivity_degraded_threshold = to_int(key, value);
        else if (key == "timing.connectivity_disconnected_threshold") cfg.timing.connectivity_disconnected_threshold = to_int(key, value);
        else if (key == "timing.connectivity_backoff_multiplier") cfg.timing.connectivity_backoff_multiplier = to_double(key, value);

        // Flags
        else if (key == "flags.close_position_on_shutdown") cfg.flags.close_position_on_shutdown = to_bool(value);

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.runtime_log_directory") cfg.logging.runtime_log_directory = value;
    }
    return true;
}

bool load_strategy_config(SystemConfig& cfg, const std::string& strategy_config_path) {
    std::ifstream in(strategy_config_path);
    if (!in.is_open()) return false;
    std::string key, value;
    while (read_key_value(in, key, value)) {
        // Strategy parameters
        if (key == "strategy.fast_ema") cfg.strategy.fast_ema = to_int(key, value);
        else if (key == "strategy.slow_ema") cfg.strategy.slow_ema = to_int(key, value);
        else if (key == "strategy.stoch_period") cfg.strategy.stoch_period = to_int(key, value);
        else if (key == "strategy.stoch_k_period") cfg.strategy.stoch_k_period = to_int(key, value);
        else if (key == "strategy.stoch_oversold_level") cfg.strategy.stoch_oversold_level = to_double(key, value);
        else if (key == "strategy.stoch_overbought_level") cfg.strategy.stoch_overbought_level = to_double(key, value);
        else if (key == "strategy.atr_period") cfg.strategy.atr_period = to_int(key, value);
        else if (key == "strategy.volume_ma_period") cfg.strategy.volume_ma_period = to_int(key, value);
        else if (key == "strategy.volume_std_multiplier") cfg.strategy.volume_std_multiplier = to_double(key, value);
        else if (key == "strategy.kline_interval") cfg.strategy.kline_interval = value;
        else if (key == "strategy.warmup_bars") cfg.strategy.warmup_bars = to_int(key, value);

        // Risk parameters
        else if (key == "risk.leverage") cfg.risk.leverage = to_double(key, value);
        else if (key == "risk.position_size") cfg.risk.position_size = to_double(key, value);
        else if (key == "risk.scale_size_by_leverage") cfg.risk.scale_size_by_leverage = to_bool(value);
        else if (key == "risk.risk_reward_ratio") cfg.risk.risk_reward_ratio = to_double(key, value);
        else if (key == "risk.atr_multiplier") cfg.risk.atr_multiplier = to_double(key, value);
        else if (key == "risk.sizing_policy") cfg.risk.sizing_policy = value;
        else if (key == "risk.equity_fraction") cfg.risk.equity_fraction = to_double(key, value);
        else if (key == "risk.qty_step") cfg.risk.qty_step = to_double(key, value);
        else if (key == "risk.min_order_qty") cfg.risk.min_order_qty = to_double(key, value);
        else if (key == "risk.size_tolerance") cfg.risk.size_tolerance = to_double(key, value);
    }
    return true;
}

void apply_environment_overrides(SystemConfig& cfg) {
    const char* api_key_env = std::getenv("BYBIT_API_KEY");
    if (api_key_env && *api_key_env) cfg.api.api_key = api_key_env;
    const char* api_secret_env = std::getenv("BYBIT_API_SECRET");
    if (api_secret_env && *api_secret_env) cfg.api.api_secret = api_secret_env;
}

int load_system_config(SystemConfig& config) {
    return load_system_config(config, "config/runtime_config.csv", "config/strategy_config.csv");
}

int load_system_config(SystemConfig& config, const std::string& runtime_config_path, const std::string& strategy_config_path) {
    if (!load_config_from_csv(config, runtime_config_path)) {
        fprintf(stderr, "Failed to load config CSV from %s\n", runtime_config_path.c_str());
        return 1;
    }

    if (!load_strategy_config(config, strategy_config_path)) {
        fprintf(stderr, "Failed to load strategy config from %s\n", strategy_config_path.c_str());
        return 1;
    }

    apply_environment_overrides(config);
    return 0;
}

bool validate_config(const SystemConfig& config, std::string& errorMessage) {
    if (config.api.api_key.empty() || config.api.api_secret.empty()) {
        errorMessage = "API credentials missing (provide via runtime config or BYBIT_API_KEY/BYBIT_API_SECRET)";
        return false;
    }
    if (config.api.active_base_url().empty()) {
        errorMessage = "API base URL missing for the selected mode";
        return false;
    }
    if (config.strategy.symbol.empty()) {
        errorMessage = "Symbol is missing (target.symbol)";
        return false;
    }
    if (config.logging.log_file.empty()) {
        errorMessage = "Logging path is empty (logging.log_file)";
        return false;
    }
    if (config.strategy.fast_ema < 1 || config.strategy.slow_ema < 1) {
        errorMessage = "strategy.fast_ema and strategy.slow_ema must be >= 1";
        return false;
    }
    if (config.strategy.slow_ema <= config.strategy.fast_ema) {
        errorMessage = "strategy.slow_ema must be greater than strategy.fast_ema";
        return false;
    }
    if (config.strategy.stoch_period < 1 || config.strategy.stoch_k_period < 1) {
        errorMessage = "strategy.stoch_period and strategy.stoch_k_period must be >= 1";
        return false;
    }
    if (config.strategy.stoch_oversold_level >= config.strategy.stoch_overbought_level) {
        errorMessage = "strategy.stoch_oversold_level must be below strategy.stoch_overbought_level";
        return false;
    }
    if (config.strategy.atr_period < 1 || config.strategy.volume_ma_period < 1) {
        errorMessage = "strategy.atr_period and strategy.volume_ma_period must be >= 1";
        return false;
    }
    if (config.strategy.volume_std_multiplier < 0.0) {
        errorMessage = "strategy.volume_std_multiplier must be >= 0";
        return false;
    }
    if (config.risk.risk_reward_ratio <= 0.0) {
        errorMessage = "risk.risk_reward_ratio must be > 0";
        return false;
    }
    if (config.risk.atr_multiplier <= 0.0) {
        errorMessage = "risk.atr_multiplier must be > 0";
        return false;
    }
    if (config.risk.leverage < 1.0) {
        errorMessage = "risk.leverage must be >= 1";
        return false;
    }
    if (config.risk.qty_step <= 0.0 || config.risk.min_order_qty <= 0.0) {
        errorMessage = "risk.qty_step and risk.min_order_qty must be > 0";
        return false;
    }
    if (config.risk.sizing_policy != "fixed" && config.risk.sizing_policy != "equity_fraction") {
        errorMessage = "risk.sizing_policy must be 'fixed' or 'equity_fraction'";
        return false;
    }
    if (config.risk.sizing_policy == "fixed" && config.risk.position_size <= 0.0) {
        errorMessage = "risk.position_size must be > 0";
        return false;
    }
    if (config.risk.equity_fraction <= 0.0 || config.risk.equity_fraction > 1.0) {
        errorMessage = "risk.equity_fraction must be in (0, 1]";
        return false;
    }
    if (config.timing.thread_market_data_poll_interval_sec <= 0 || config.timing.thread_reconciliation_interval_sec <= 0 ||
        config.timing.thread_logging_poll_interval_sec <= 0) {
        errorMessage = "timing.* seconds must be > 0";
        return false;
    }
    if (config.timing.order_confirmation_timeout_ms <= 0 || config.timing.order_status_poll_interval_ms <= 0) {
        errorMessage = "timing.order_confirmation_timeout_ms and timing.order_status_poll_interval_ms must be > 0";
        return false;
    }
    return true;
}

} // namespace Config
} // namespace BybitTrader
