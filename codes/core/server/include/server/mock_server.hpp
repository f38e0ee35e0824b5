// =============================================================================
//  HTTP Mock Server - Server Module
//  文件: mock_server.hpp
//  描述: MockServer类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "connection/connection_manager.hpp"
#include "mock/mock.hpp"
#include "mock/mount_table.hpp"
#include "mock/verification.hpp"
#include "msg_center/worker_pool.hpp"
#include "protocol/http_message.hpp"
#include "request_log/request_log.hpp"
#include "server/mock_server_options.hpp"
#include "server/scope_guard.hpp"
#include "utils/error.hpp"

namespace http_mock_server {

namespace config {
class Config;
}

namespace server {

// MockServer状态：CREATED -> RUNNING -> STOPPED（终态）
enum class ServerState : int {
    CREATED = 0,
    RUNNING = 1,
    STOPPING = 2,
    STOPPED = 3
};

const char* server_state_to_string(ServerState state);

// MockServer类
class MockServer {
public:
    /**
     * @brief 构造函数
     * @param options 构造参数（record_requests 只能在此设置）
     */
    explicit MockServer(const MockServerOptions& options = MockServerOptions());

    /**
     * @brief 析构函数，运行中则先stop()，违背的期望以ERROR级别记录
     */
    ~MockServer();

    // 禁止拷贝
    MockServer(const MockServer&) = delete;
    MockServer& operator=(const MockServer&) = delete;

    // ==================== 生命周期管理 ====================

    /**
     * @brief 按构造参数中的host/port启动
     * @return 失败返回 SERVER_INVALID_STATE / NETWORK_* 错误码
     */
    utils::Result<void> start();

    /**
     * @brief 在指定地址启动，port为0时由系统分配
     */
    utils::Result<void> start(const std::string& host, uint16_t port);

    /**
     * @brief 停止接受连接，排空处理中的请求，校验所有仍挂载的规则
     * @return 聚合校验报告；已停止返回 SERVER_ALREADY_STOPPED，未启动返回 SERVER_INVALID_STATE
     */
    utils::Result<mock::VerificationReport> stop();

    /**
     * @brief 校验当前挂载的规则，不卸载、不改变状态
     */
    mock::VerificationReport verify() const;

    /**
     * @brief 卸载全部规则（不校验）并清空请求记录
     */
    void reset();

    ServerState state() const;

    // ==================== 地址查询 ====================

    // "host:port"，启动前返回 SERVER_INVALID_STATE
    utils::Result<std::string> address() const;
    utils::Result<uint16_t> port() const;
    // "http://host:port"
    utils::Result<std::string> uri() const;

    // ==================== 规则管理 ====================

    /**
     * @brief 挂载全局规则
     * @return 规则ID；停止后返回 SERVER_INVALID_STATE，无匹配条件返回 INVALID_ARGUMENT
     */
    utils::Result<uint64_t> mount(const mock::Mock& mock);

    /**
     * @brief 挂载作用域规则
     * @return 规则句柄，调用方负责 release()
     */
    utils::Result<ScopeGuard> mount_as_scoped(const mock::Mock& mock);

    /**
     * @brief 将配置中的预置规则挂载为全局规则
     * @return 全部规则ID，任一规则挂载失败则返回错误（已挂载的规则保留）
     */
    utils::Result<std::vector<uint64_t>> mount_from_config(const config::Config& config);

    /**
     * @brief 规则当前调用次数
     * @return 规则未挂载返回 MOCK_RULE_NOT_FOUND
     */
    utils::Result<uint64_t> hits(uint64_t rule_id) const;

    size_t mounted_count() const;

    // ==================== 请求处理 ====================

    /**
     * @brief 请求记录副本
     */
    std::vector<protocol::HttpRequest> requests() const;

    /**
     * @brief 处理单个请求：记录、选择规则、计数、生成响应
     *
     * 每个连接的工作线程调用；也可直接调用以绕过网络层。
     */
    protocol::HttpResponse handle(const protocol::HttpRequest& request);

private:
    // ==================== 私有方法 ====================

    /**
     * @brief 创建、绑定并监听socket
     */
    utils::Result<void> init_listen_socket(const std::string& host, uint16_t port);

    /**
     * @brief 接收线程：轮询listen fd，新连接投递到线程池
     */
    void accept_loop();

    /**
     * @brief 单个连接的服务任务（在工作线程中运行）
     */
    void serve_connection(std::shared_ptr<connection::Connection> conn);

    /**
     * @brief 执行优雅关闭
     */
    void graceful_shutdown();

    /**
     * @brief 停止接受新连接
     */
    void stop_accepting();

    /**
     * @brief 等待现有请求处理完成
     */
    void wait_pending_requests();

    /**
     * @brief 强制关闭剩余连接
     */
    void close_all_connections();

    /**
     * @brief 可被stop()打断的响应延迟
     */
    void wait_delay(uint32_t delay_ms);

    // ==================== 成员变量 ====================

    MockServerOptions options_;

    std::shared_ptr<mock::MountTable> mount_table_;
    request_log::RequestLog request_log_;
    std::unique_ptr<connection::ConnectionManager> conn_manager_;
    std::unique_ptr<WorkerPool> worker_pool_;

    int listen_fd_;
    std::string bound_host_;
    uint16_t bound_port_;
    std::thread accept_thread_;

    ServerState state_;
    std::atomic<bool> accepting_;
    std::atomic<bool> stopping_;

    mutable std::mutex mutex_;          // 保护state_与地址
    std::mutex lifecycle_mutex_;        // 串行化start()/stop()
    std::mutex delay_mutex_;
    std::condition_variable delay_cv_;

    // 超时常量
    static constexpr int ACCEPT_POLL_INTERVAL_MS = 100;
    static constexpr uint32_t FORCE_CLOSE_WAIT_MS = 1000;
};

} // namespace server
} // namespace http_mock_server

// 文件结束
