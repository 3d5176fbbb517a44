#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace BybitTrader {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_startup_complete();
    static void log_configuration_validated(bool valid);
    static void log_shutdown_requested(int signal_number);
    static void log_shutdown_complete();

    // Thread management
    static void log_thread_started(const std::string& thread_name);
    static void log_thread_stopped(const std::string& thread_name, unsigned long iterations);
    static void log_thread_startup_error(const std::string& error_message);
    static void log_threads_started(int expected_count, int actual_count);

    // Health
    static void log_connectivity_issue(const std::string& status, int seconds_until_retry);
    static void log_fatal_error(const std::string& error_message);
};

} // namespace Logging
} // namespace BybitTrader

#endif // SYSTEM_LOGS_HPP
