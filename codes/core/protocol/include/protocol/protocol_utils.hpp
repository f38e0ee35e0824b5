// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: protocol_utils.hpp
//  描述: Protocol模块公共工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace http_mock_server {
namespace protocol {

// 跨平台大小写不敏感字符串比较
int StrCaseCmp(const char* a, const char* b);

// 大小写不敏感相等比较（允许内嵌'\0'的完整比较）
bool EqualsIgnoreCase(const std::string& a, const std::string& b);

// ASCII小写转换
std::string ToLower(const std::string& s);

// 百分号解码（'+'解码为空格），非法转义按原样保留
std::string PercentDecode(const std::string& s);

// 字符串与字节序列互转
std::vector<uint8_t> ToBytes(const std::string& s);
std::string ToString(const std::vector<uint8_t>& bytes);

} // namespace protocol
} // namespace http_mock_server

// 文件结束
