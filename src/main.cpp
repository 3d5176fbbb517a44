// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include "utils/http_utils.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>

using namespace BybitTrader::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    // Only async-signal-safe work: atomics. run() re-checks the flags on a short timed wait.
    void signal_handler(int signal_number) {
        if (signal_number != SIGINT && signal_number != SIGTERM) {
            return;
        }
        shutdown_requested_flag.store(true);
        SystemState* state = system_state_pointer.load();
        if (state) {
            state->shutdown_signal.store(signal_number);
            state->shutdown_requested.store(true);
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SystemInitializationResult initialization_result;
    try {
        BybitTrader::Core::initialize_http_transport();
        initialization_result = initialize();
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error during initialization: " << exception_error.what() << std::endl;
        return 1;
    }

    SystemState& system_state = *initialization_result.system_state;
    ShutdownHandler::get_instance().set_system_state(&system_state);

    SystemThreads thread_handles;
    int exit_code = 0;
    try {
        startup(system_state, thread_handles, initialization_result.logger);
        run(system_state);
    } catch (const std::exception& exception_error) {
        BybitTrader::Logging::SystemLogs::log_fatal_error(std::string("Fatal error: ") + exception_error.what());
        exit_code = 1;
    }

    // Always runs so worker threads are joined and the log queue is flushed.
    shutdown(system_state, thread_handles, initialization_result.logger);
    ShutdownHandler::get_instance().set_system_state(nullptr);
    BybitTrader::Core::shutdown_http_transport();
    return exit_code;
}
