#include "utils/time.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace http_mock_server {
namespace utils {

namespace {

std::tm to_local_tm(std::time_t time) {
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    return tm;
}

} // namespace

uint64_t get_current_time_ms() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

uint64_t get_monotonic_time_ms() {
    auto duration = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_current_time(const char* format) {
    std::time_t time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = to_local_tm(time);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string format_time(uint64_t timestamp_ms, const char* format) {
    std::tm tm = to_local_tm(static_cast<std::time_t>(timestamp_ms / 1000));
    std::ostringstream oss;
    oss << std::put_time(&tm, format);

    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03u", static_cast<unsigned>(timestamp_ms % 1000));
    oss << millis;
    return oss.str();
}

// TimeoutChecker implementation
TimeoutChecker::TimeoutChecker(uint64_t timeout_ms)
    : timeout_ms_(timeout_ms)
    , start_time_ms_(get_monotonic_time_ms())
{
}

bool TimeoutChecker::is_timeout() const {
    return remaining_ms() == 0;
}

uint64_t TimeoutChecker::remaining_ms() const {
    uint64_t elapsed = get_monotonic_time_ms() - start_time_ms_;
    if (elapsed >= timeout_ms_) {
        return 0;
    }
    return timeout_ms_ - elapsed;
}

void TimeoutChecker::reset() {
    start_time_ms_ = get_monotonic_time_ms();
}

void TimeoutChecker::reset(uint64_t new_timeout_ms) {
    timeout_ms_ = new_timeout_ms;
    start_time_ms_ = get_monotonic_time_ms();
}

} // namespace utils
} // namespace http_mock_server
