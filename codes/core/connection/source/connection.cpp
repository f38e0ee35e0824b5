// =============================================================================
//  HTTP Mock Server - Connection Module
//  文件: connection.cpp
//  描述: Connection 实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "connection/connection.hpp"
#include "protocol/http_parser.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace http_mock_server {
namespace connection {

namespace {

// 解析错误码到HTTP状态码
int status_for_parse_error(int code) {
    switch (code) {
        case protocol::PROTOCOL_ERROR_BODY_TOO_LARGE: return 413;
        case protocol::PROTOCOL_ERROR_ENCODING:       return 501;
        case protocol::PROTOCOL_ERROR_VERSION:        return 505;
        case protocol::PROTOCOL_ERROR_TOO_LONG:
        case protocol::PROTOCOL_ERROR_TOO_MANY:       return 431;
        default:                                      return 400;
    }
}

constexpr int CLOSE_SILENTLY = -1;
constexpr uint64_t LINGER_TIMEOUT_MS = 200;

} // namespace

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::RECEIVING:    return "RECEIVING";
        case ConnectionState::PROCESSING:   return "PROCESSING";
        case ConnectionState::SENDING:      return "SENDING";
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        default: return "UNKNOWN";
    }
}

Connection::Connection(uint64_t id, int fd, uint16_t server_port)
    : connection_id_(id)
    , fd_(fd)
    , state_(ConnectionState::CONNECTED)
    , draining_(false)
    , shut_down_(false)
    , read_buffer_(std::make_unique<utils::Buffer>())
    , write_buffer_(std::make_unique<utils::Buffer>())
    , request_count_(0)
{
    client_info_.connection_id = id;
    client_info_.server_port = server_port;
}

Connection::~Connection() {
    // Buffer由unique_ptr自动释放，确保fd已关闭
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint64_t Connection::get_id() const {
    return connection_id_;
}

ConnectionState Connection::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

const ClientInfo& Connection::get_client_info() const {
    return client_info_;
}

void Connection::set_client_info(const std::string& ip, uint16_t port) {
    client_info_.client_ip = ip;
    client_info_.client_port = port;
}

std::string Connection::get_peer_address() const {
    return client_info_.client_ip + ":" + std::to_string(client_info_.client_port);
}

bool Connection::transition_to(ConnectionState new_state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ConnectionState::DISCONNECTED) {
        return false;
    }
    if (new_state == ConnectionState::DISCONNECTED) {
        state_ = new_state;
        return true;
    }
    if (shut_down_) {
        return false;
    }
    // 排空模式下不再回到空闲状态
    if (draining_ && new_state == ConnectionState::CONNECTED) {
        return false;
    }
    state_ = new_state;
    return true;
}

bool Connection::drain() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    draining_ = true;
    if (state_ == ConnectionState::CONNECTED && !shut_down_) {
        shut_down_ = true;
        ::shutdown(fd_, SHUT_RDWR);
        return true;
    }
    return false;
}

void Connection::force_shutdown() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    draining_ = true;
    if (state_ != ConnectionState::DISCONNECTED && !shut_down_) {
        shut_down_ = true;
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool Connection::is_idle() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == ConnectionState::CONNECTED;
}

Connection::ReadResult Connection::read_more(uint32_t timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int poll_timeout = timeout_ms == 0 ? -1 : static_cast<int>(timeout_ms);
    int ret = 0;
    do {
        ret = ::poll(&pfd, 1, poll_timeout);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0) {
        return ReadResult::TIMEOUT;
    }
    if (ret < 0) {
        LOG_WARN("Connection", "poll failed on conn %llu: %s",
                 static_cast<unsigned long long>(connection_id_), std::strerror(errno));
        return ReadResult::ERROR;
    }

    // 空闲连接收到数据：先进入RECEIVING，已被排空关闭则放弃
    if (read_buffer_->readable_bytes() == 0 && !transition_to(ConnectionState::RECEIVING)) {
        return ReadResult::CLOSED;
    }

    uint8_t* dst = read_buffer_->reserve(protocol::TEMP_BUFFER_SIZE);
    if (dst == nullptr) {
        return ReadResult::ERROR;
    }

    ssize_t n = 0;
    do {
        n = ::recv(fd_, dst, protocol::TEMP_BUFFER_SIZE, 0);
    } while (n < 0 && errno == EINTR);

    if (n == 0) {
        return ReadResult::CLOSED;
    }
    if (n < 0) {
        if (errno == ECONNRESET || errno == ENOTCONN) {
            return ReadResult::CLOSED;
        }
        LOG_WARN("Connection", "recv failed on conn %llu: %s",
                 static_cast<unsigned long long>(connection_id_), std::strerror(errno));
        return ReadResult::ERROR;
    }

    read_buffer_->commit(static_cast<size_t>(n));
    return ReadResult::OK;
}

int Connection::read_request(const ConnectionOptions& options, protocol::HttpRequest* request) {
    protocol::HttpParser parser;
    parser.init(read_buffer_.get());

    // 1. 读取完整请求头
    int ret = parser.check_head_complete();
    while (ret == protocol::PROTOCOL_ERROR_EAGAIN) {
        bool idle = read_buffer_->readable_bytes() == 0;
        ReadResult rr = read_more(options.idle_timeout_ms);
        if (rr == ReadResult::TIMEOUT) {
            if (idle) {
                LOG_DEBUG("Connection", "Conn %llu idle timeout",
                          static_cast<unsigned long long>(connection_id_));
                return CLOSE_SILENTLY;
            }
            return 408;
        }
        if (rr != ReadResult::OK) {
            return CLOSE_SILENTLY;
        }
        ret = parser.check_head_complete();
    }
    if (ret != protocol::PROTOCOL_OK) {
        LOG_WARN("Connection", "Conn %llu bad request head: %s",
                 static_cast<unsigned long long>(connection_id_), parser.get_error_msg().c_str());
        return status_for_parse_error(ret);
    }

    protocol::RequestHead head;
    ret = parser.parse_head(&head);
    if (ret != protocol::PROTOCOL_OK) {
        LOG_WARN("Connection", "Conn %llu malformed request: %s",
                 static_cast<unsigned long long>(connection_id_), parser.get_error_msg().c_str());
        return status_for_parse_error(ret);
    }

    // 2. 读取请求体
    size_t body_len = 0;
    ret = parser.get_body_length(head.headers, options.max_body_size, &body_len);
    if (ret != protocol::PROTOCOL_OK) {
        LOG_WARN("Connection", "Conn %llu rejected %s %s: %s",
                 static_cast<unsigned long long>(connection_id_), head.method.c_str(),
                 head.target.c_str(), parser.get_error_msg().c_str());
        return status_for_parse_error(ret);
    }

    while (read_buffer_->readable_bytes() < body_len) {
        ReadResult rr = read_more(options.idle_timeout_ms);
        if (rr == ReadResult::TIMEOUT) {
            return 408;
        }
        if (rr != ReadResult::OK) {
            return CLOSE_SILENTLY;
        }
    }

    std::vector<uint8_t> body;
    read_buffer_->read_append(&body, body_len);
    read_buffer_->compact();

    *request = protocol::HttpRequest(head.method, head.target, head.headers, body,
                                     head.version, get_peer_address());
    return 0;
}

bool Connection::write_all() {
    while (write_buffer_->readable_bytes() > 0) {
        ssize_t n = ::send(fd_, write_buffer_->read_ptr(), write_buffer_->readable_bytes(),
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_DEBUG("Connection", "send failed on conn %llu: %s",
                      static_cast<unsigned long long>(connection_id_), std::strerror(errno));
            write_buffer_->clear();
            return false;
        }
        write_buffer_->skip(static_cast<size_t>(n));
    }
    write_buffer_->clear();
    return true;
}

bool Connection::send_response(const protocol::HttpResponse& response, bool keep_alive,
                               bool include_body) {
    protocol::HttpParser builder;
    int ret = builder.build_response(response, keep_alive, include_body, write_buffer_.get());
    if (ret != protocol::PROTOCOL_OK) {
        LOG_ERROR("Connection", "Conn %llu failed to encode response: %s",
                  static_cast<unsigned long long>(connection_id_), builder.get_error_msg().c_str());
        write_buffer_->clear();
        return false;
    }
    return write_all();
}

void Connection::send_error(int status_code, const std::string& reason) {
    protocol::HttpResponse response(status_code);
    if (!reason.empty()) {
        response.add_header("Content-Type", "text/plain");
        response.set_body(reason);
    }
    if (!transition_to(ConnectionState::SENDING)) {
        return;
    }
    if (send_response(response, false, true)) {
        linger_close();
    }
}

void Connection::linger_close() {
    // 先关闭写端，再丢弃对端未读完的数据，避免RST冲掉已发送的错误响应
    ::shutdown(fd_, SHUT_WR);

    char discard[protocol::TEMP_BUFFER_SIZE];
    utils::TimeoutChecker checker(LINGER_TIMEOUT_MS);
    while (!checker.is_timeout()) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, static_cast<int>(checker.remaining_ms()));
        if (ret <= 0) {
            break;
        }
        ssize_t n = ::recv(fd_, discard, sizeof(discard), 0);
        if (n <= 0) {
            break;
        }
    }
}

void Connection::serve(const RequestHandler& handler, const ConnectionOptions& options) {
    LOG_DEBUG("Connection", "Conn %llu serving %s",
              static_cast<unsigned long long>(connection_id_), get_peer_address().c_str());

    while (true) {
        // 有流水线残留数据时直接进入RECEIVING，否则回到空闲状态
        ConnectionState next = read_buffer_->readable_bytes() > 0 ? ConnectionState::RECEIVING
                                                                   : ConnectionState::CONNECTED;
        if (!transition_to(next)) {
            break;
        }

        protocol::HttpRequest request;
        int status = read_request(options, &request);
        if (status == CLOSE_SILENTLY) {
            break;
        }
        if (status != 0) {
            send_error(status, protocol::reason_phrase(status));
            break;
        }

        bool keep_alive = protocol::HttpParser::is_keep_alive(request.version(), request.headers());
        if (!transition_to(ConnectionState::PROCESSING)) {
            break;
        }

        protocol::HttpResponse response = handler(request);
        request_count_.fetch_add(1);

        if (!transition_to(ConnectionState::SENDING)) {
            break;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (draining_) {
                keep_alive = false;
            }
        }

        bool include_body = request.method() != "HEAD";
        if (!send_response(response, keep_alive, include_body) || !keep_alive) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::DISCONNECTED;
        if (!shut_down_) {
            shut_down_ = true;
            ::shutdown(fd_, SHUT_RDWR);
        }
    }
    LOG_DEBUG("Connection", "Conn %llu closed after %llu request(s)",
              static_cast<unsigned long long>(connection_id_),
              static_cast<unsigned long long>(request_count_.load()));
}

} // namespace connection
} // namespace http_mock_server

// 文件结束
