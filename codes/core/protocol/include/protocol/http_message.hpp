// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: http_message.hpp
//  描述: HttpRequest（只读快照）和HttpResponse类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_headers.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace http_mock_server {
namespace protocol {

// ==================== HTTP请求类 ====================
// 接收时一次性构造，之后只读；请求日志与匹配器共享同一份快照。
class HttpRequest {
public:
    /**
     * @brief 默认构造函数（空请求，主要供容器使用）
     */
    HttpRequest();

    /**
     * @brief 构造请求快照，到达时间取构造时刻
     * @param method 请求方法，按原样保存
     * @param target 请求目标（path[?query]）
     * @param headers 头部集合
     * @param body 原始请求体
     * @param version HTTP版本
     * @param peer_address 对端地址 "ip:port"
     */
    HttpRequest(const std::string& method,
                const std::string& target,
                const HttpHeaders& headers = HttpHeaders(),
                const std::vector<uint8_t>& body = std::vector<uint8_t>(),
                const std::string& version = "HTTP/1.1",
                const std::string& peer_address = "");

    const std::string& method() const { return method_; }
    const std::string& target() const { return target_; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }
    const std::string& version() const { return version_; }
    const HttpHeaders& headers() const { return headers_; }
    const std::vector<uint8_t>& body() const { return body_; }
    const std::string& peer_address() const { return peer_address_; }
    uint64_t arrival_time_ms() const { return arrival_time_ms_; }

    // 请求体按字节转为字符串
    std::string body_string() const;

    /**
     * @brief 查找查询参数（名称与值均做百分号解码）
     * @param name 参数名
     * @param value 输出首个匹配的参数值（可为nullptr）
     * @return true找到
     */
    bool query_param(const std::string& name, std::string* value) const;

private:
    std::string method_;
    std::string target_;
    std::string path_;
    std::string query_;
    std::string version_;
    HttpHeaders headers_;
    std::vector<uint8_t> body_;
    std::string peer_address_;
    uint64_t arrival_time_ms_;
};

// ==================== HTTP响应类 ====================
class HttpResponse {
public:
    /**
     * @brief 默认构造函数（200 OK）
     */
    HttpResponse();

    /**
     * @brief 以状态码构造，状态文本取标准短语
     */
    explicit HttpResponse(int code);

    /**
     * @brief 重置响应对象到初始状态
     */
    void reset();

    /**
     * @brief 设置状态码和状态文本
     * @param code HTTP状态码
     * @param text 状态文本，为空时取标准短语
     */
    void set_status(int code, const std::string& text = "");

    /**
     * @brief 添加响应头
     * @param name 头部名称
     * @param value 头部值
     */
    void add_header(const std::string& name, const std::string& value);

    /**
     * @brief 设置响应体
     * @param data 数据指针
     * @param len 数据长度
     */
    void set_body(const uint8_t* data, size_t len);
    void set_body(const std::string& body);

    std::string body_string() const;

    // 公开属性
    int status_code;
    std::string status_text;
    HttpHeaders headers;
    std::vector<uint8_t> body;
};

/**
 * @brief 获取HTTP状态码对应的标准短语
 * @return 未知状态码返回 "Unknown"
 */
const char* reason_phrase(int status_code);

} // namespace protocol
} // namespace http_mock_server

// 文件结束
