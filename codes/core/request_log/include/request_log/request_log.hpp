// =============================================================================
//  HTTP Mock Server - Request Log Module
//  文件: request_log.hpp
//  描述: 已接收请求的记录（按到达顺序）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstddef>
#include <mutex>
#include <vector>
#include "protocol/http_message.hpp"

namespace http_mock_server {
namespace request_log {

/**
 * @brief 请求记录
 *
 * 只记录成功解析的请求，传输层错误（400/413/501）不记录。
 * 记录可通过构造参数整体关闭，关闭后append()为空操作。
 */
class RequestLog {
public:
    explicit RequestLog(bool enabled = true);

    RequestLog(const RequestLog&) = delete;
    RequestLog& operator=(const RequestLog&) = delete;

    bool enabled() const { return enabled_; }

    void append(const protocol::HttpRequest& request);

    // 返回副本，调用方可在服务运行期间安全读取
    std::vector<protocol::HttpRequest> snapshot() const;

    size_t size() const;
    void clear();

private:
    const bool enabled_;
    mutable std::mutex mutex_;
    std::vector<protocol::HttpRequest> requests_;
};

} // namespace request_log
} // namespace http_mock_server
