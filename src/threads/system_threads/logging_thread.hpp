#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <atomic>
#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/system_config.hpp"

namespace BybitTrader {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<Logging::AsyncLogger> logger,
                  Logging::LoggingContext& context,
                  const Config::SystemConfig& system_config)
        : logger_ptr(logger), logging_context(context), config(system_config) {}

    void operator()();
    void set_iteration_counter(std::atomic<unsigned long>& counter) { logger_iterations = &counter; }

private:
    std::shared_ptr<Logging::AsyncLogger> logger_ptr;
    Logging::LoggingContext& logging_context;
    const Config::SystemConfig& config;
    std::atomic<unsigned long>* logger_iterations {nullptr};

    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace BybitTrader

#endif // LOGGING_THREAD_HPP
