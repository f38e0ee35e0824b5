// =============================================================================
//  HTTP Mock Server - Connection Module
//  文件: connection_manager.hpp
//  描述: ConnectionManager 类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "connection/connection.hpp"

namespace http_mock_server {
namespace connection {

// 连接管理器
// 持有所有活动连接，供停止流程排空和强制关闭
class ConnectionManager {
public:
    ConnectionManager();
    ~ConnectionManager();

    // 禁止拷贝
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // 创建连接
    // fd: socket文件描述符（所有权转移给Connection）
    // server_port: server监听端口
    std::shared_ptr<Connection> create_connection(int fd, uint16_t server_port);

    std::shared_ptr<Connection> get_connection(uint64_t conn_id);

    // 移除连接，唤醒wait_until_empty
    void remove_connection(uint64_t conn_id);

    uint32_t get_connection_count() const;

    // 遍历所有连接（锁内收集，锁外回调）
    void for_each_connection(std::function<void(Connection&)> func);

    // 所有连接进入排空模式，空闲连接立即关闭
    // return: 立即关闭的空闲连接数
    uint32_t drain_all();

    // 强制关闭所有连接的读写
    // return: 被关闭的连接数
    uint32_t shutdown_all();

    // 等待所有连接移除
    // return: true全部移除，false超时
    bool wait_until_empty(uint32_t timeout_ms);

    // 清空所有连接
    void clear_all();

private:
    uint64_t next_connection_id_;
    std::unordered_map<uint64_t, std::shared_ptr<Connection>> connections_;
    mutable std::mutex mutex_;
    std::condition_variable empty_cv_;
};

} // namespace connection
} // namespace http_mock_server

// 文件结束
