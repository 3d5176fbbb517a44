/**
 * Logging thread.
 * Drains the async log queue to the console and the run log file.
 */
#include "logging_thread.hpp"
#include <fstream>
#include <iostream>

using namespace BybitTrader::Threads;
using namespace BybitTrader::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    set_logging_context(logging_context);
    set_log_thread_tag("LOGGER");

    try {
        execute_logging_processing_loop();
    } catch (const std::exception& exception_error) {
        std::cerr << "Logging thread exited: " << exception_error.what() << std::endl;
    }
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "ERROR: Failed to open log file: " << logger_ptr->get_file_path() << std::endl;
    }

    while (logger_ptr->running.load()) {
        logger_ptr->process_logging_queue_with_timeout(log_file, config.timing.thread_logging_poll_interval_sec);
        if (logger_iterations) {
            logger_iterations->fetch_add(1);
        }
    }

    // Final flush of anything queued before stop()
    logger_ptr->drain_remaining_messages(log_file);
}
