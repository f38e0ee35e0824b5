// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: http_parser.cpp
//  描述: HttpParser类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_parser.hpp"
#include "protocol/protocol_utils.hpp"
#include <cstring>
#include <cstdlib>
#include <cerrno>

namespace http_mock_server {
namespace protocol {

namespace {

bool IsTokenChar(char c) {
    // RFC 7230 tchar
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

} // namespace

// ==================== HttpParser实现 ====================

HttpParser::HttpParser()
    : buffer_(nullptr)
    , error_code_(0)
    , error_msg_()
{
}

HttpParser::~HttpParser() = default;

void HttpParser::init(utils::Buffer* buffer) {
    buffer_ = buffer;
    error_code_ = 0;
    error_msg_.clear();
}

int HttpParser::check_head_complete() {
    if (!buffer_) {
        set_error(PROTOCOL_ERROR_INVALID, "Buffer not initialized");
        return PROTOCOL_ERROR_INVALID;
    }

    // 丢弃请求之间多余的空行（RFC 7230 3.5）
    while (buffer_->readable_bytes() >= 2 &&
           buffer_->read_ptr()[0] == '\r' && buffer_->read_ptr()[1] == '\n') {
        buffer_->skip(2);
    }

    const uint8_t* data = buffer_->read_ptr();
    size_t readable = buffer_->readable_bytes();
    for (size_t pos = 0; pos + 3 < readable; ++pos) {
        if (data[pos] == '\r' && data[pos + 1] == '\n' &&
            data[pos + 2] == '\r' && data[pos + 3] == '\n') {
            return PROTOCOL_OK;
        }
    }

    if (readable > MAX_HEAD_SIZE) {
        set_error(PROTOCOL_ERROR_TOO_LONG, "Request head too large");
        return PROTOCOL_ERROR_TOO_LONG;
    }
    return PROTOCOL_ERROR_EAGAIN;
}

int HttpParser::parse_head(RequestHead* head) {
    char line[MAX_LINE_LEN];
    size_t line_len = 0;

    int ret = read_line(line, sizeof(line), &line_len);
    if (ret != PROTOCOL_OK) {
        return ret;
    }

    ret = parse_request_line(line, line_len, &head->method, &head->target, &head->version);
    if (ret != PROTOCOL_OK) {
        return ret;
    }
    return parse_headers(&head->headers);
}

int HttpParser::read_line(char* out, size_t max_len, size_t* out_len) {
    if (!buffer_) {
        set_error(PROTOCOL_ERROR_INVALID, "Buffer not initialized");
        return PROTOCOL_ERROR_INVALID;
    }

    size_t readable = buffer_->readable_bytes();
    if (readable == 0) {
        *out_len = 0;
        return PROTOCOL_ERROR_EAGAIN;
    }

    // 查找 "\r\n"
    const uint8_t* data = buffer_->read_ptr();
    size_t pos = 0;
    bool found = false;

    for (pos = 0; pos + 1 < readable; ++pos) {
        if (data[pos] == '\r' && data[pos + 1] == '\n') {
            found = true;
            break;
        }
    }

    if (!found) {
        *out_len = 0;
        return PROTOCOL_ERROR_EAGAIN;
    }

    // 检查输出缓冲区大小（留出null终止符空间）
    if (pos + 1 > max_len) {
        set_error(PROTOCOL_ERROR_TOO_LONG, "Line too long");
        return PROTOCOL_ERROR_TOO_LONG;
    }

    if (pos > 0) {
        memcpy(out, data, pos);
    }
    out[pos] = '\0';
    *out_len = pos;

    // 消耗缓冲区数据（包含\r\n）
    buffer_->skip(pos + 2);

    return PROTOCOL_OK;
}

int HttpParser::parse_request_line(const char* line, size_t len,
                                   std::string* method,
                                   std::string* target,
                                   std::string* version) {
    method->clear();
    target->clear();
    version->clear();

    // 第一部分: method（token）
    size_t pos = 0;
    while (pos < len && line[pos] != ' ') {
        if (!IsTokenChar(line[pos])) {
            set_error(PROTOCOL_ERROR_INVALID, "Invalid character in method");
            return PROTOCOL_ERROR_INVALID;
        }
        pos++;
    }
    if (pos == 0 || pos >= len) {
        set_error(PROTOCOL_ERROR_INVALID, "Invalid request line format");
        return PROTOCOL_ERROR_INVALID;
    }
    *method = std::string(line, pos);

    while (pos < len && line[pos] == ' ') {
        pos++;
    }

    // 第二部分: request target
    size_t target_start = pos;
    while (pos < len && line[pos] != ' ') {
        pos++;
    }
    if (pos == target_start || pos >= len) {
        set_error(PROTOCOL_ERROR_INVALID, "Invalid request line format");
        return PROTOCOL_ERROR_INVALID;
    }
    *target = std::string(line + target_start, pos - target_start);

    while (pos < len && line[pos] == ' ') {
        pos++;
    }
    if (pos >= len) {
        set_error(PROTOCOL_ERROR_INVALID, "Invalid request line format");
        return PROTOCOL_ERROR_INVALID;
    }

    // 第三部分: version
    *version = std::string(line + pos, len - pos);
    if (*version != "HTTP/1.1" && *version != "HTTP/1.0") {
        set_error(PROTOCOL_ERROR_VERSION, "HTTP version not supported");
        return PROTOCOL_ERROR_VERSION;
    }

    return PROTOCOL_OK;
}

int HttpParser::parse_headers(HttpHeaders* headers) {
    if (!buffer_) {
        set_error(PROTOCOL_ERROR_INVALID, "Buffer not initialized");
        return PROTOCOL_ERROR_INVALID;
    }

    headers->clear();
    char line[MAX_HEADER_LINE_LEN];
    size_t line_len = 0;
    size_t header_count = 0;

    while (true) {
        int ret = read_line(line, sizeof(line), &line_len);
        if (ret != PROTOCOL_OK) {
            return ret;
        }

        // 空行表示头部结束
        if (line_len == 0) {
            break;
        }

        if (header_count >= MAX_HEADERS) {
            set_error(PROTOCOL_ERROR_TOO_MANY, "Too many headers");
            return PROTOCOL_ERROR_TOO_MANY;
        }

        std::string key, value;
        ret = parse_header(line, line_len, &key, &value);
        if (ret != PROTOCOL_OK) {
            return ret;
        }

        headers->add(key, value);
        header_count++;
    }

    return PROTOCOL_OK;
}

int HttpParser::parse_header(const char* line, size_t len,
                             std::string* key,
                             std::string* value) {
    const char* colon = static_cast<const char*>(memchr(line, ':', len));
    if (!colon) {
        set_error(PROTOCOL_ERROR_INVALID, "Invalid header format");
        return PROTOCOL_ERROR_INVALID;
    }

    // 头部名称不允许前后空白（RFC 7230 3.2.4）
    const char* key_start = line;
    const char* key_end = colon;
    if (key_end == key_start) {
        set_error(PROTOCOL_ERROR_INVALID, "Empty header name");
        return PROTOCOL_ERROR_INVALID;
    }
    for (const char* p = key_start; p < key_end; ++p) {
        if (!IsTokenChar(*p)) {
            set_error(PROTOCOL_ERROR_INVALID, "Invalid character in header name");
            return PROTOCOL_ERROR_INVALID;
        }
    }
    if (static_cast<size_t>(key_end - key_start) > MAX_HEADER_NAME_LEN) {
        set_error(PROTOCOL_ERROR_TOO_LONG, "Header name too long");
        return PROTOCOL_ERROR_TOO_LONG;
    }

    *key = std::string(key_start, key_end - key_start);

    // 提取value（冒号之后，trim whitespace）
    const char* value_start = colon + 1;
    const char* value_end = line + len;
    while (value_start < value_end && (*value_start == ' ' || *value_start == '\t')) {
        value_start++;
    }
    while (value_end > value_start && (*(value_end - 1) == ' ' || *(value_end - 1) == '\t')) {
        value_end--;
    }

    if (static_cast<size_t>(value_end - value_start) > MAX_HEADER_VALUE_LEN) {
        set_error(PROTOCOL_ERROR_TOO_LONG, "Header value too long");
        return PROTOCOL_ERROR_TOO_LONG;
    }

    *value = std::string(value_start, value_end - value_start);

    return PROTOCOL_OK;
}

int HttpParser::get_body_length(const HttpHeaders& headers, size_t max_body_size,
                                size_t* body_len) {
    *body_len = 0;

    std::string encoding;
    if (headers.get("Transfer-Encoding", &encoding) &&
        !EqualsIgnoreCase(encoding, "identity")) {
        set_error(PROTOCOL_ERROR_ENCODING, "Transfer-Encoding not supported: " + encoding);
        return PROTOCOL_ERROR_ENCODING;
    }

    std::vector<std::string> lengths = headers.get_all("Content-Length");
    if (lengths.empty()) {
        return PROTOCOL_OK;
    }

    unsigned long long parsed = 0;
    for (size_t i = 0; i < lengths.size(); ++i) {
        const std::string& text = lengths[i];
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            set_error(PROTOCOL_ERROR_INVALID, "Invalid Content-Length: " + text);
            return PROTOCOL_ERROR_INVALID;
        }
        errno = 0;
        unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            set_error(PROTOCOL_ERROR_BODY_TOO_LARGE, "Content-Length out of range");
            return PROTOCOL_ERROR_BODY_TOO_LARGE;
        }
        // 多个Content-Length必须一致
        if (i > 0 && value != parsed) {
            set_error(PROTOCOL_ERROR_INVALID, "Conflicting Content-Length headers");
            return PROTOCOL_ERROR_INVALID;
        }
        parsed = value;
    }

    if (parsed > max_body_size) {
        set_error(PROTOCOL_ERROR_BODY_TOO_LARGE, "Request body too large");
        return PROTOCOL_ERROR_BODY_TOO_LARGE;
    }

    *body_len = static_cast<size_t>(parsed);
    return PROTOCOL_OK;
}

bool HttpParser::is_keep_alive(const std::string& version, const HttpHeaders& headers) {
    std::string connection;
    bool has_connection = headers.get("Connection", &connection);
    if (version == "HTTP/1.0") {
        return has_connection && EqualsIgnoreCase(connection, "keep-alive");
    }
    return !(has_connection && EqualsIgnoreCase(connection, "close"));
}

int HttpParser::build_response(const HttpResponse& resp, bool keep_alive,
                               bool include_body, utils::Buffer* out) {
    if (out == nullptr) {
        set_error(PROTOCOL_ERROR_BUFFER, "Output buffer is null");
        return PROTOCOL_ERROR_BUFFER;
    }

    std::string head;
    head.reserve(256);

    // 1. 状态行
    head += "HTTP/1.1 " + std::to_string(resp.status_code) + " ";
    head += resp.status_text.empty() ? std::string(reason_phrase(resp.status_code))
                                     : resp.status_text;
    head += "\r\n";

    // 2. 模板中的头部原样输出（Connection由连接状态决定，跳过模板值）
    bool has_content_length = false;
    for (const auto& header : resp.headers) {
        if (StrCaseCmp(header.first.c_str(), "Connection") == 0) {
            continue;
        }
        if (StrCaseCmp(header.first.c_str(), "Content-Length") == 0) {
            has_content_length = true;
        }
        head += header.first + ": " + header.second + "\r\n";
    }

    // 3. 补齐Content-Length（空body也写0，保证keep-alive下客户端能定界）
    if (!has_content_length) {
        head += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    }
    head += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";

    // 4. 头部结束
    head += "\r\n";

    if (out->write(head) != head.size()) {
        set_error(PROTOCOL_ERROR_BUFFER, "Buffer too small");
        return PROTOCOL_ERROR_BUFFER;
    }

    // 5. 响应体
    if (include_body && !resp.body.empty()) {
        if (out->write(resp.body.data(), resp.body.size()) != resp.body.size()) {
            set_error(PROTOCOL_ERROR_BUFFER, "Buffer too small");
            return PROTOCOL_ERROR_BUFFER;
        }
    }

    return PROTOCOL_OK;
}

void HttpParser::set_error(int code, const std::string& msg) {
    error_code_ = code;
    error_msg_ = msg;
}

int HttpParser::get_error_code() const {
    return error_code_;
}

const std::string& HttpParser::get_error_msg() const {
    return error_msg_;
}

void HttpParser::reset() {
    // 保留buffer_指针，只重置解析状态
    error_code_ = 0;
    error_msg_.clear();
}

} // namespace protocol
} // namespace http_mock_server

// 文件结束
