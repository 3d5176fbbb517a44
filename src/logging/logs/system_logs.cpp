#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace BybitTrader {
namespace Logging {

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message(std::string("WARNING: ") + warning_message, "");
}

void SystemLogs::log_startup_complete() {
    log_message("SYSTEM_STARTUP: System startup completed successfully", "");
}

void SystemLogs::log_configuration_validated(bool valid) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED", "");
    }
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SYSTEM_SHUTDOWN: Shutdown requested by signal " + std::to_string(signal_number), "");
}

void SystemLogs::log_shutdown_complete() {
    log_message("SYSTEM_SHUTDOWN: All threads joined, shutdown complete", "");
}

void SystemLogs::log_thread_started(const std::string& thread_name) {
    log_message("THREAD_STARTUP: " + thread_name + " thread started", "");
}

void SystemLogs::log_thread_stopped(const std::string& thread_name, unsigned long iterations) {
    log_message("THREAD_SHUTDOWN: " + thread_name + " thread stopped after " + std::to_string(iterations) + " iterations", "");
}

void SystemLogs::log_thread_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error starting threads: ") + error_message, "");
}

void SystemLogs::log_threads_started(int expected_count, int actual_count) {
    if (actual_count == expected_count) {
        log_message("THREAD_STARTUP: All " + std::to_string(expected_count) + " threads started successfully", "");
    } else {
        log_message("THREAD_STARTUP: WARNING - Only " + std::to_string(actual_count) +
                    " of " + std::to_string(expected_count) + " threads started", "");
    }
}

void SystemLogs::log_connectivity_issue(const std::string& status, int seconds_until_retry) {
    log_message("CONNECTIVITY_ISSUE: Exchange connectivity " + status + ", next attempt in " +
                std::to_string(seconds_until_retry) + "s", "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

} // namespace Logging
} // namespace BybitTrader
