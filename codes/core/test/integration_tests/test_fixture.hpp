// =============================================================================
//  HTTP Mock Server - Integration Test Fixture
//  文件: test_fixture.hpp
//  描述: 集成测试通用夹具
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <gtest/gtest.h>
#include <fstream>
#include <thread>
#include <chrono>
#include <atomic>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cstring>
#include <cstdlib>
#include <sstream>
#include <map>
#include <string>
#include <vector>
#include "server/mock_server.hpp"
#include "config/config.hpp"
#include "matcher/matcher.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/time.hpp"

namespace http_mock_server {
namespace integration_test {

// 原子计数器，用于生成唯一临时文件名
static std::atomic<uint64_t> temp_file_counter{0};

// RAII临时文件包装器
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count();
        uint64_t counter = temp_file_counter.fetch_add(1);
        path_ = "/tmp/test_mock_server_config_" +
               std::to_string(timestamp) + "_" +
               std::to_string(counter) + ".json";
        std::ofstream file(path_);
        file << content;
        file.close();
    }

    ~TempFile() {
        if (!path_.empty()) {
            unlink(path_.c_str());
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// HTTP 响应结构（头部名称统一转小写）
struct HttpResponse {
    int status_code;
    std::string status_text;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() : status_code(0) {}

    std::string header(const std::string& name) const {
        auto it = headers.find(protocol::ToLower(name));
        return it == headers.end() ? "" : it->second;
    }
};

// 简单的测试客户端，按Content-Length定界响应，支持keep-alive
class TestClient {
public:
    TestClient(const std::string& server_ip, uint16_t server_port)
        : server_ip_(server_ip), server_port_(server_port), sock_fd_(-1) {}

    ~TestClient() {
        disconnect();
    }

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    // 连接到服务器
    bool connect() {
        sock_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (sock_fd_ < 0) {
            return false;
        }

        // 设置超时
        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        setsockopt(sock_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        struct sockaddr_in server_addr;
        memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin_family = AF_INET;
        server_addr.sin_port = htons(server_port_);
        inet_pton(AF_INET, server_ip_.c_str(), &server_addr.sin_addr);

        if (::connect(sock_fd_, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
            close(sock_fd_);
            sock_fd_ = -1;
            return false;
        }
        pending_.clear();
        return true;
    }

    bool send_raw(const std::string& data) {
        if (sock_fd_ < 0) {
            return false;
        }
        size_t sent_total = 0;
        while (sent_total < data.size()) {
            ssize_t sent = send(sock_fd_, data.data() + sent_total, data.size() - sent_total,
                                MSG_NOSIGNAL);
            if (sent <= 0) {
                return false;
            }
            sent_total += static_cast<size_t>(sent);
        }
        return true;
    }

    static std::string build_request(const std::string& method,
                                     const std::string& path,
                                     const std::map<std::string, std::string>& headers = {},
                                     const std::string& body = "",
                                     bool keep_alive = false) {
        std::ostringstream request;
        request << method << " " << path << " HTTP/1.1\r\n";
        request << "Host: 127.0.0.1\r\n";
        if (!keep_alive) {
            request << "Connection: close\r\n";
        }
        for (const auto& header : headers) {
            request << header.first << ": " << header.second << "\r\n";
        }
        if (!body.empty()) {
            request << "Content-Length: " << body.size() << "\r\n";
        }
        request << "\r\n" << body;
        return request.str();
    }

    // 发送请求并接收响应
    bool request(const std::string& method,
                 const std::string& path,
                 HttpResponse* response,
                 const std::map<std::string, std::string>& headers = {},
                 const std::string& body = "",
                 bool keep_alive = false) {
        if (!send_raw(build_request(method, path, headers, body, keep_alive))) {
            return false;
        }
        return receive_response(response, method != "HEAD");
    }

    // 接收一个完整响应，多余数据留给下一次读取
    bool receive_response(HttpResponse* response, bool expect_body = true) {
        size_t head_end;
        while ((head_end = pending_.find("\r\n\r\n")) == std::string::npos) {
            if (!fill()) {
                return false;
            }
        }
        parse_head(pending_.substr(0, head_end), response);
        pending_.erase(0, head_end + 4);

        size_t body_len = 0;
        if (expect_body) {
            body_len = static_cast<size_t>(std::strtoul(response->header("Content-Length").c_str(),
                                                        nullptr, 10));
        }
        while (pending_.size() < body_len) {
            if (!fill()) {
                return false;
            }
        }
        response->body = pending_.substr(0, body_len);
        pending_.erase(0, body_len);
        return true;
    }

    // 对端在超时前关闭连接返回true
    bool wait_for_close(int timeout_ms) {
        if (sock_fd_ < 0) {
            return true;
        }
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            struct pollfd pfd;
            pfd.fd = sock_fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            if (poll(&pfd, 1, 50) > 0) {
                char buf[1024];
                ssize_t n = recv(sock_fd_, buf, sizeof(buf), 0);
                if (n <= 0) {
                    return true;
                }
            }
        }
        return false;
    }

    void disconnect() {
        if (sock_fd_ >= 0) {
            close(sock_fd_);
            sock_fd_ = -1;
        }
    }

private:
    bool fill() {
        char buffer[8192];
        ssize_t n = recv(sock_fd_, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return false;
        }
        pending_.append(buffer, static_cast<size_t>(n));
        return true;
    }

    void parse_head(const std::string& head, HttpResponse* response) {
        std::istringstream iss(head);
        std::string line;

        // 解析状态行
        if (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            std::istringstream line_ss(line);
            std::string http_version;
            line_ss >> http_version >> response->status_code;
            std::getline(line_ss, response->status_text);
            if (!response->status_text.empty() && response->status_text[0] == ' ') {
                response->status_text = response->status_text.substr(1);
            }
        }

        // 解析 Headers
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            size_t colon_pos = line.find(':');
            if (colon_pos != std::string::npos) {
                std::string key = protocol::ToLower(line.substr(0, colon_pos));
                std::string value = line.substr(colon_pos + 1);
                if (!value.empty() && value[0] == ' ') {
                    value = value.substr(1);
                }
                response->headers[key] = value;
            }
        }
    }

    std::string server_ip_;
    uint16_t server_port_;
    int sock_fd_;
    std::string pending_;
};

// 集成测试夹具基类
class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.drain_timeout_ms = 1000;
        options_.idle_timeout_ms = 2000;
        options_.worker_threads = 2;
    }

    void TearDown() override {
    }

    // 等待指定毫秒
    void sleep_ms(int milliseconds) {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }

    // 启动 Server，返回绑定端口（失败返回0）
    uint16_t start_server(server::MockServer& server) {
        if (server.start().is_err()) {
            return 0;
        }
        return server.port().value();
    }

    static mock::Mock text_mock(matcher::MatcherPtr m, const std::string& body, int status = 200) {
        mock::ResponseTemplate response(status);
        response.set_body_string(body);
        return mock::Mock(m).respond_with(response);
    }

    server::MockServerOptions options_;
};

} // namespace integration_test
} // namespace http_mock_server

// 文件结束
