#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <cstdint>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MILLISECONDS_PER_MINUTE = MILLISECONDS_PER_SECOND * SECONDS_PER_MINUTE;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Local wall clock for log lines
std::string get_current_human_readable_time();

// Wall clock in epoch milliseconds (request signing timestamps)
std::int64_t get_current_epoch_milliseconds();

// Bar open times are epoch milliseconds in UTC
std::string format_epoch_milliseconds_utc(std::int64_t epoch_milliseconds);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
