// =============================================================================
//  HTTP Mock Server - Connection Module
//  文件: connection.hpp
//  描述: 单个客户端连接（HTTP/1.x 请求读取、分发、响应写回）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <functional>
#include "utils/buffer.hpp"
#include "protocol/http_message.hpp"
#include "protocol/protocol_types.hpp"

namespace http_mock_server {
namespace connection {

// 连接状态枚举
enum class ConnectionState : uint8_t {
    CONNECTED = 1,      // 空闲，等待下一个请求
    RECEIVING = 2,      // 正在读取请求
    PROCESSING = 3,     // 正在匹配并生成响应
    SENDING = 4,        // 正在写回响应
    DISCONNECTED = 5
};

const char* connection_state_to_string(ConnectionState state);

// Client信息结构体
struct ClientInfo {
    uint64_t connection_id;
    std::string client_ip;
    uint16_t client_port;
    uint16_t server_port;

    ClientInfo()
        : connection_id(0)
        , client_port(0)
        , server_port(0)
    {}
};

// 连接读写参数
struct ConnectionOptions {
    size_t max_body_size;
    uint32_t idle_timeout_ms;   // 0表示不超时

    ConnectionOptions()
        : max_body_size(protocol::DEFAULT_MAX_BODY_SIZE)
        , idle_timeout_ms(5000)
    {}
};

// 请求处理函数：输入完整请求，返回待发送响应
using RequestHandler = std::function<protocol::HttpResponse(const protocol::HttpRequest&)>;

// 连接类
class Connection {
public:
    // 构造函数
    // id: 连接ID
    // fd: socket文件描述符（转移所有权，析构时关闭）
    // server_port: server监听端口
    Connection(uint64_t id, int fd, uint16_t server_port);

    ~Connection();

    // 禁止拷贝
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // ========== 基本属性 ==========

    uint64_t get_id() const;

    ConnectionState get_state() const;

    // ========== Client信息 ==========

    const ClientInfo& get_client_info() const;

    void set_client_info(const std::string& ip, uint16_t port);

    // "ip:port"
    std::string get_peer_address() const;

    // 已完成的请求数
    uint64_t get_request_count() const { return request_count_.load(); }

    // ========== 请求循环 ==========

    // 阻塞执行请求循环，直到对端关闭、空闲超时、协议错误或被关闭
    // 在工作线程中调用，同一连接上的请求按顺序处理
    void serve(const RequestHandler& handler, const ConnectionOptions& options);

    // ========== 关闭控制（可从其他线程调用） ==========

    // 进入排空模式：当前请求处理完成后关闭；
    // 连接处于空闲状态时立即关闭
    // return: true连接空闲并已关闭
    bool drain();

    // 立即关闭读写（不释放fd，fd在析构时关闭）
    void force_shutdown();

    bool is_idle() const;

private:
    enum class ReadResult {
        OK,
        CLOSED,
        TIMEOUT,
        ERROR
    };

    // 状态转换；已被关闭时返回false
    bool transition_to(ConnectionState new_state);

    // 从socket读取数据到read_buffer_，最多等待timeout_ms
    ReadResult read_more(uint32_t timeout_ms);

    // 读取完整请求
    // return: 0成功，其他为需要回写的错误状态码，-1直接关闭连接
    int read_request(const ConnectionOptions& options, protocol::HttpRequest* request);

    // 将write_buffer_全部写出
    bool write_all();

    bool send_response(const protocol::HttpResponse& response, bool keep_alive, bool include_body);

    // 传输层错误响应，发送后关闭连接
    void send_error(int status_code, const std::string& reason);

    // 错误响应发送后的延迟关闭
    void linger_close();

    uint64_t connection_id_;
    int fd_;
    ConnectionState state_;
    mutable std::mutex state_mutex_;
    bool draining_;
    bool shut_down_;
    ClientInfo client_info_;
    std::unique_ptr<utils::Buffer> read_buffer_;
    std::unique_ptr<utils::Buffer> write_buffer_;
    std::atomic<uint64_t> request_count_;
};

} // namespace connection
} // namespace http_mock_server
