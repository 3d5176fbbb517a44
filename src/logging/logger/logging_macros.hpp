#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"

// Thread-agnostic macros
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " title, "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

// Specialized thread macros for common patterns
#define LOG_THREAD_SIGNAL_ANALYSIS_HEADER(symbol) LOG_THREAD_SECTION_HEADER("SIGNAL ANALYSIS - " + symbol)

#define TABLE_ROW_48(label, value) do { \
    std::string label_str = std::string(label).substr(0,17); \
    std::string value_str = std::string(value).substr(0,48); \
    LOG_THREAD_CONTENT("| " + label_str + std::string(17 - label_str.length(), ' ') + " | " + value_str + std::string(48 - value_str.length(), ' ') + " |"); \
} while(0)

#define TABLE_SEPARATOR_48() \
    LOG_THREAD_CONTENT("+-------------------+--------------------------------------------------+")

#endif // LOGGING_MACROS_HPP
