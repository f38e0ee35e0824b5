// =============================================================================
//  HTTP Mock Server - Server Module
//  文件: mock_server_options.hpp
//  描述: MockServer 构造参数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "protocol/protocol_types.hpp"

namespace http_mock_server {
namespace server {

struct MockServerOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 0;                  // 0表示由系统分配
    bool record_requests = true;
    uint32_t worker_threads = 4;        // 初始工作线程数
    uint32_t max_connections = 64;      // 工作线程上限，同时服务的连接数
    uint32_t drain_timeout_ms = 5000;   // stop()等待处理中请求的上限
    uint32_t idle_timeout_ms = 5000;    // keep-alive空闲超时，0表示不超时
    size_t max_body_size = protocol::DEFAULT_MAX_BODY_SIZE;
    int backlog = 128;
};

} // namespace server
} // namespace http_mock_server

// 文件结束
