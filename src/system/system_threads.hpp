#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

/**
 * @brief System thread handles and iteration counters
 */
struct SystemThreads {
    // =========================================================================
    // THREAD HANDLES
    // =========================================================================
    std::thread market_thread;          // Bar polling and processing
    std::thread reconciliation_thread;  // Periodic exchange reconciliation
    std::thread logger_thread;          // Logging system thread

    // =========================================================================
    // PERFORMANCE MONITORING
    // =========================================================================
    std::chrono::steady_clock::time_point start_time;  // System startup timestamp

    std::atomic<unsigned long> market_iterations{0};
    std::atomic<unsigned long> reconciliation_iterations{0};
    std::atomic<unsigned long> logger_iterations{0};

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    // Counters are referenced by running threads, so the handles stay put.
    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
};

#endif // SYSTEM_THREADS_HPP
