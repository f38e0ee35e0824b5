// =============================================================================
//  HTTP Mock Server - Request Log Module
//  文件: request_log.cpp
//  描述: 请求记录实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "request_log/request_log.hpp"

namespace http_mock_server {
namespace request_log {

RequestLog::RequestLog(bool enabled)
    : enabled_(enabled)
{
}

void RequestLog::append(const protocol::HttpRequest& request) {
    if (!enabled_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
}

std::vector<protocol::HttpRequest> RequestLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

size_t RequestLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

void RequestLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.clear();
}

} // namespace request_log
} // namespace http_mock_server
