// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace BybitTrader {
namespace Config {

struct TimingConfig {
    // ========================================================================
    // THREAD POLLING INTERVALS
    // ========================================================================

    int thread_market_data_poll_interval_sec = 5;    // Kline polling interval in seconds
    int thread_reconciliation_interval_sec = 30;     // Exchange position reconciliation interval in seconds
    int thread_logging_poll_interval_sec = 1;        // Logging thread flush interval in seconds

    // ========================================================================
    // ORDER CONFIRMATION
    // ========================================================================

    int order_confirmation_timeout_ms = 10000;       // Bounded wait for a fill before querying the exchange
    int order_status_poll_interval_ms = 250;         // Order status polling interval while waiting

    // ========================================================================
    // THREAD LIFECYCLE MANAGEMENT
    // ========================================================================

    int thread_startup_sequence_delay_milliseconds = 500;  // Delay before worker loops start

    // ========================================================================
    // CONNECTIVITY BACKOFF
    // ========================================================================

    int connectivity_max_retry_delay_seconds = 60;   // Upper bound for the backoff delay
    int connectivity_degraded_threshold = 3;         // Consecutive failures before DEGRADED
    int connectivity_disconnected_threshold = 6;     // Consecutive failures before DISCONNECTED
    double connectivity_backoff_multiplier = 2.0;    // Backoff growth factor
};

} // namespace Config
} // namespace BybitTrader

#endif // TIMING_CONFIG_HPP
