#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <chrono>
#include <mutex>
#include <string>
#include "configs/timing_config.hpp"

namespace BybitTrader {
namespace Core {

/**
 * ConnectivityManager - Tracks exchange reachability shared by every REST caller.
 *
 * Consecutive transport failures move the status CONNECTED -> DEGRADED -> DISCONNECTED
 * and push the next permitted attempt out with exponential backoff. A single success
 * restores CONNECTED.
 */
class ConnectivityManager {
public:
    enum class ConnectionStatus {
        CONNECTED,          // Requests flowing normally
        DEGRADED,           // Some failures but still attempting
        DISCONNECTED        // Multiple failures, backing off
    };

    struct ConnectivityState {
        ConnectionStatus status = ConnectionStatus::CONNECTED;
        std::chrono::steady_clock::time_point last_success;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::steady_clock::time_point next_retry_time;
        int consecutive_failures = 0;
        int retry_delay_seconds = 1;
        std::string last_error_message;
    };

private:
    mutable std::mutex state_mutex_;
    ConnectivityState state_;
    int max_retry_delay_seconds;
    int degraded_threshold;
    int disconnected_threshold;
    double backoff_multiplier;

public:
    explicit ConnectivityManager(const Config::TimingConfig& timing_config);

    ConnectivityManager(const ConnectivityManager&) = delete;
    ConnectivityManager& operator=(const ConnectivityManager&) = delete;

    void report_success();
    void report_failure(const std::string& error_message);
    bool should_attempt_connection() const;
    int get_seconds_until_retry() const;
    bool is_connectivity_outage() const;
    ConnectionStatus get_status() const;
    ConnectivityState get_state() const;
    std::string get_status_string() const;
};

} // namespace Core
} // namespace BybitTrader

#endif // CONNECTIVITY_MANAGER_HPP
