#include "time_utils.hpp"
#include <ctime>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::int64_t get_current_epoch_milliseconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string format_epoch_milliseconds_utc(std::int64_t epoch_milliseconds) {
    time_t timestamp_seconds = static_cast<time_t>(epoch_milliseconds / MILLISECONDS_PER_SECOND);
    struct tm timeinfo;
    gmtime_r(&timestamp_seconds, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

} // namespace TimeUtils
