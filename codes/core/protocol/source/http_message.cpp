// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: http_message.cpp
//  描述: HttpRequest和HttpResponse类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_message.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/time.hpp"
#include <algorithm>

namespace http_mock_server {
namespace protocol {

// ==================== HttpRequest实现 ====================

HttpRequest::HttpRequest()
    : version_("HTTP/1.1")
    , arrival_time_ms_(0)
{
}

HttpRequest::HttpRequest(const std::string& method,
                         const std::string& target,
                         const HttpHeaders& headers,
                         const std::vector<uint8_t>& body,
                         const std::string& version,
                         const std::string& peer_address)
    : method_(method)
    , target_(target)
    , version_(version)
    , headers_(headers)
    , body_(body)
    , peer_address_(peer_address)
    , arrival_time_ms_(utils::get_current_time_ms())
{
    // 拆分path和query，fragment不会出现在请求行中，这里不做处理
    size_t qpos = target_.find('?');
    if (qpos == std::string::npos) {
        path_ = target_;
    } else {
        path_ = target_.substr(0, qpos);
        query_ = target_.substr(qpos + 1);
    }
}

std::string HttpRequest::body_string() const {
    return ToString(body_);
}

bool HttpRequest::query_param(const std::string& name, std::string* value) const {
    size_t start = 0;
    while (start <= query_.size()) {
        size_t end = query_.find('&', start);
        if (end == std::string::npos) {
            end = query_.size();
        }
        std::string pair = query_.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = PercentDecode(pair.substr(0, eq));
            if (key == name) {
                if (value) {
                    *value = (eq == std::string::npos) ? std::string()
                                                       : PercentDecode(pair.substr(eq + 1));
                }
                return true;
            }
        }
        start = end + 1;
    }
    return false;
}

// ==================== HttpResponse实现 ====================

HttpResponse::HttpResponse()
    : status_code(200)
    , status_text("OK")
    , headers()
    , body()
{
}

HttpResponse::HttpResponse(int code)
    : status_code(code)
    , status_text(reason_phrase(code))
    , headers()
    , body()
{
}

void HttpResponse::reset() {
    status_code = 200;
    status_text = "OK";
    headers.clear();
    body.clear();
}

void HttpResponse::set_status(int code, const std::string& text) {
    status_code = code;
    status_text = text.empty() ? std::string(reason_phrase(code)) : text;
}

void HttpResponse::add_header(const std::string& name, const std::string& value) {
    headers.add(name, value);
}

void HttpResponse::set_body(const uint8_t* data, size_t len) {
    body.resize(len);
    if (len > 0 && data != nullptr) {
        std::copy(data, data + len, body.begin());
    }
}

void HttpResponse::set_body(const std::string& text) {
    body.assign(text.begin(), text.end());
}

std::string HttpResponse::body_string() const {
    return ToString(body);
}

const char* reason_phrase(int status_code) {
    switch (status_code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

} // namespace protocol
} // namespace http_mock_server

// 文件结束
