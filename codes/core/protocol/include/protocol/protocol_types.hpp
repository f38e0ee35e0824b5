// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: protocol_types.hpp
//  描述: Protocol模块类型定义、枚举、常量
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cerrno>
#include <cstdint>
#include <cstddef>

namespace http_mock_server {
namespace protocol {

// ==================== 错误码定义 ====================
constexpr int PROTOCOL_OK = 0;
constexpr int PROTOCOL_ERROR_EAGAIN = -EAGAIN;  // 数据不足，需继续读取
constexpr int PROTOCOL_ERROR_INVALID = -1;
constexpr int PROTOCOL_ERROR_TOO_LONG = -2;
constexpr int PROTOCOL_ERROR_TOO_MANY = -3;
constexpr int PROTOCOL_ERROR_BUFFER = -4;
constexpr int PROTOCOL_ERROR_VERSION = -5;
constexpr int PROTOCOL_ERROR_BODY_TOO_LARGE = -6;
constexpr int PROTOCOL_ERROR_ENCODING = -7;

// ==================== HTTP解析相关常量 ====================
constexpr size_t MAX_LINE_LEN = 8192;
constexpr size_t MAX_HEADER_LINE_LEN = 8192;
constexpr size_t MAX_HEADERS = 100;
constexpr size_t MAX_HEADER_NAME_LEN = 256;
constexpr size_t MAX_HEADER_VALUE_LEN = 4096;
constexpr size_t MAX_HEAD_SIZE = 64 * 1024;
constexpr size_t DEFAULT_MAX_BODY_SIZE = 16 * 1024 * 1024;

// ==================== 通用缓冲区常量 ====================
constexpr size_t TEMP_BUFFER_SIZE = 4096;

// ==================== 默认响应 ====================
constexpr int DEFAULT_NOT_FOUND_STATUS = 404;

// ==================== HTTP/1.x解析状态枚举 ====================
enum class Http1ParseState {
    EXPECT_HEAD = 0,
    EXPECT_BODY = 1,
    EXPECT_COMPLETE = 2,
    ERROR = 3
};

} // namespace protocol
} // namespace http_mock_server

// 文件结束
