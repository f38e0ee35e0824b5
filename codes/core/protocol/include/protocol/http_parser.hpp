// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: http_parser.hpp
//  描述: HttpParser类定义 - HTTP/1.x请求解析与响应构建工具类
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/http_headers.hpp"
#include "protocol/http_message.hpp"
#include "utils/buffer.hpp"
#include <string>

namespace http_mock_server {
namespace protocol {

// 请求头部解析结果（请求行 + 头部）
struct RequestHead {
    std::string method;
    std::string target;
    std::string version;
    HttpHeaders headers;
};

// ==================== HTTP解析器类 ====================
class HttpParser {
public:
    HttpParser();
    ~HttpParser();

    /**
     * @brief 初始化解析器，绑定缓冲区
     * @param buffer 缓冲区指针（不持有所有权）
     */
    void init(utils::Buffer* buffer);

    /**
     * @brief 检查缓冲区中是否已有完整的请求头部（以空行结束）
     * @return 0完整，-EAGAIN需要更多数据，PROTOCOL_ERROR_TOO_LONG头部超长
     */
    int check_head_complete();

    /**
     * @brief 解析完整的请求头部并从缓冲区消耗
     * @param head 输出请求行与头部
     * @return 0成功，负数失败（调用前需check_head_complete返回0）
     */
    int parse_head(RequestHead* head);

    /**
     * @brief 从缓冲区读取一行（以\r\n结尾）
     * @param out 输出缓冲区
     * @param max_len 输出缓冲区最大长度
     * @param out_len 输出实际读取长度
     * @return 0成功，-EAGAIN需要更多数据，负数失败
     */
    int read_line(char* out, size_t max_len, size_t* out_len);

    /**
     * @brief 解析HTTP请求行，支持HTTP/1.0与HTTP/1.1
     * @return 0成功，负数失败
     */
    int parse_request_line(const char* line, size_t len,
                           std::string* method,
                           std::string* target,
                           std::string* version);

    /**
     * @brief 解析所有HTTP头部直到空行，同名头部按顺序追加
     * @return 0成功，-EAGAIN需要更多数据，负数失败
     */
    int parse_headers(HttpHeaders* headers);

    /**
     * @brief 解析单条HTTP头部行
     * @return 0成功，负数失败
     */
    int parse_header(const char* line, size_t len,
                     std::string* key,
                     std::string* value);

    /**
     * @brief 根据头部计算请求体长度
     * @param headers 请求头部
     * @param max_body_size 允许的最大请求体
     * @param body_len 输出请求体长度
     * @return 0成功；PROTOCOL_ERROR_ENCODING 不支持的Transfer-Encoding；
     *         PROTOCOL_ERROR_BODY_TOO_LARGE 超限；PROTOCOL_ERROR_INVALID Content-Length非法
     */
    int get_body_length(const HttpHeaders& headers, size_t max_body_size, size_t* body_len);

    /**
     * @brief 判断请求处理完毕后是否保持连接
     */
    static bool is_keep_alive(const std::string& version, const HttpHeaders& headers);

    /**
     * @brief 构建HTTP响应报文，自动补齐Content-Length与Connection头
     * @param resp 响应对象
     * @param keep_alive 是否保持连接
     * @param include_body 是否写出响应体（HEAD请求为false）
     * @param out 输出缓冲区
     * @return 0成功，负数失败
     */
    int build_response(const HttpResponse& resp, bool keep_alive,
                       bool include_body, utils::Buffer* out);

    void set_error(int code, const std::string& msg);
    int get_error_code() const;
    const std::string& get_error_msg() const;

    /**
     * @brief 重置解析器状态（保留缓冲区绑定）
     */
    void reset();

private:
    utils::Buffer* buffer_;
    int error_code_;
    std::string error_msg_;
};

} // namespace protocol
} // namespace http_mock_server

// 文件结束
