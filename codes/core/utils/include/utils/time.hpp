#pragma once

#include <cstdint>
#include <string>

namespace http_mock_server {
namespace utils {

// ========== 时间获取函数 ==========

// 获取当前时间戳（毫秒）
// return: 自Unix纪元以来的毫秒数
uint64_t get_current_time_ms();

// 获取单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// ========== 时间格式化 ==========

// 格式化当前时间为字符串
// format: strftime格式字符串，默认 "%Y-%m-%d %H:%M:%S"
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// 格式化指定时间戳为字符串（附带毫秒部分）
// timestamp_ms: 毫秒时间戳
std::string format_time(uint64_t timestamp_ms, const char* format = "%Y-%m-%d %H:%M:%S");

// ========== 超时检测器 ==========

// 用于停止时的排空等待等有界等待场景
class TimeoutChecker {
public:
    // timeout_ms: 超时时间（毫秒）
    explicit TimeoutChecker(uint64_t timeout_ms);
    ~TimeoutChecker() = default;

    bool is_timeout() const;

    // 获取剩余时间（毫秒），返回0表示已超时
    uint64_t remaining_ms() const;

    void reset();
    void reset(uint64_t new_timeout_ms);

private:
    uint64_t timeout_ms_;
    uint64_t start_time_ms_;
};

} // namespace utils
} // namespace http_mock_server
