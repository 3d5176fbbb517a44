#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <filesystem>

namespace BybitTrader {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

namespace {

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string format_log_line(const std::string& message, const LoggingContext& context) {
    std::stringstream log_stream;
    log_stream << TimeUtils::get_current_human_readable_time() << " [" << context.get_thread_tag() << "]   "
               << message << '\n';
    return log_stream.str();
}

std::string create_unique_run_folder(const std::string& runtime_log_directory) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    // runtime_logs/run_DD-HH-MM
    std::stringstream ss;
    ss << runtime_log_directory << "/run_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME);
    std::string run_folder = ss.str();

    std::error_code create_error;
    std::filesystem::create_directories(run_folder, create_error);
    if (create_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder + ": " + create_error.message());
    }
    return run_folder;
}

std::string extract_base_filename(const std::string& full_path) {
    size_t last_slash = full_path.find_last_of('/');
    if (last_slash != std::string::npos) {
        return full_path.substr(last_slash + 1);
    }
    return full_path;
}

} // namespace

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return thread_logging_context_ptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        log_message_to_stderr("[no logging context] " + message);
        return;
    }

    std::string log_formatted_string;
    try {
        log_formatted_string = format_log_line(message, *thread_logging_context_ptr);
    } catch (const std::exception& format_exception_error) {
        log_message_to_stderr("ERROR: Log formatting failed: " + std::string(format_exception_error.what()));
        log_message_to_stderr(message);
        return;
    }

    if (thread_logging_context_ptr->async_logger && thread_logging_context_ptr->async_logger->running.load()) {
        thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
        return;
    }

    {
        std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
        std::cout << log_formatted_string << std::flush;
    }

    if (!log_file_path.empty()) {
        std::ofstream log_file_stream(log_file_path, std::ios::app);
        if (log_file_stream.is_open()) {
            log_file_stream << log_formatted_string;
        } else {
            log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
        }
    }
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    std::string base_name = base_filename;
    std::string extension;
    size_t dot_pos = base_filename.find_last_of('.');
    size_t slash_pos = base_filename.find_last_of('/');
    if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        base_name = base_filename.substr(0, dot_pos);
        extension = base_filename.substr(dot_pos);
    }

    // base_name_DD-HH-MM.extension
    std::stringstream ss;
    ss << base_name << "_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME) << extension;
    return ss.str();
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const Config::SystemConfig& config) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    thread_logging_context_ptr->run_folder = create_unique_run_folder(config.logging.runtime_log_directory);
    std::string base_filename_string = thread_logging_context_ptr->run_folder + "/" + extract_base_filename(config.logging.log_file);

    auto logger_instance = std::make_shared<AsyncLogger>(generate_timestamped_log_filename(base_filename_string));
    thread_logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN  ");
    return logger_instance;
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    {
        LoggingContext* thread_logging_context_ptr = get_logging_context();
        std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
        std::cout << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

void AsyncLogger::process_logging_queue_with_timeout(std::ofstream& log_file, int poll_interval_seconds) {
    std::unique_lock<std::mutex> lock(mtx);

    cv.wait_for(lock, std::chrono::seconds(poll_interval_seconds), [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        std::string line = std::move(queue.front());
        queue.pop();
        lock.unlock();

        output_log_line_internal(line, log_file);

        lock.lock();
    }
}

void AsyncLogger::drain_remaining_messages(std::ofstream& log_file) {
    std::vector<std::string> message_buffer;
    {
        std::lock_guard<std::mutex> lock(mtx);
        while (!queue.empty()) {
            message_buffer.push_back(std::move(queue.front()));
            queue.pop();
        }
    }
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
}

} // namespace Logging
} // namespace BybitTrader
