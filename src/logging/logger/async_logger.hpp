#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include "configs/system_config.hpp"

namespace BybitTrader {
namespace Logging {

// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

class AsyncLogger {
private:
    std::string file_path;

    void output_log_line_internal(const std::string& log_line, std::ofstream& log_file);

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{true};

    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);
    void stop();

    // Called by the logging thread: waits up to the poll interval, then writes everything queued.
    void process_logging_queue_with_timeout(std::ofstream& log_file, int poll_interval_seconds);

    // Writes whatever is still queued without waiting (final flush on shutdown).
    void drain_remaining_messages(std::ofstream& log_file);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const {
        std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
        auto thread_tag_map_iterator = thread_tags.find(std::this_thread::get_id());
        if (thread_tag_map_iterator != thread_tags.end()) {
            return thread_tag_map_iterator->second;
        }
        return "MAIN  ";
    }

    void set_thread_tag(const std::string& tag_value) {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        std::string tag_string = tag_value;
        if (tag_string.size() < LOG_TAG_WIDTH) {
            tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        }
        if (tag_string.size() > LOG_TAG_WIDTH) {
            tag_string = tag_string.substr(0, LOG_TAG_WIDTH);
        }
        thread_tags[std::this_thread::get_id()] = tag_string;
    }
};

// Thread-local log tag (6 characters, padded/truncated) to appear after the timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function. Goes through the async queue when a logger is installed,
// otherwise straight to stdout (and to log_file_path when non-empty).
void log_message(const std::string& message, const std::string& log_file_path);

// Utility functions for log file naming
std::string generate_timestamped_log_filename(const std::string& base_filename);

// Creates runtime_logs/run_<DD-HH-MM>/, installs the async logger in the calling thread's context.
std::shared_ptr<AsyncLogger> initialize_application_foundation(const Config::SystemConfig& config);
void shutdown_global_logger(AsyncLogger& logger);

// Context access (throws if the calling thread has no context)
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace BybitTrader

#endif // ASYNC_LOGGER_HPP
