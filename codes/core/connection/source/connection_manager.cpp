// =============================================================================
//  HTTP Mock Server - Connection Module
//  文件: connection_manager.cpp
//  描述: ConnectionManager 实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "connection/connection_manager.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <vector>

namespace http_mock_server {
namespace connection {

ConnectionManager::ConnectionManager()
    : next_connection_id_(1)
{
}

ConnectionManager::~ConnectionManager() {
    clear_all();
}

std::shared_ptr<Connection> ConnectionManager::create_connection(int fd, uint16_t server_port) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_connection_id_++;
    auto conn = std::make_shared<Connection>(id, fd, server_port);
    connections_[id] = conn;
    return conn;
}

std::shared_ptr<Connection> ConnectionManager::get_connection(uint64_t conn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(conn_id);
    return (it != connections_.end()) ? it->second : nullptr;
}

void ConnectionManager::remove_connection(uint64_t conn_id) {
    // Connection可能在此析构（关闭fd），放到锁外
    std::shared_ptr<Connection> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(conn_id);
        if (it == connections_.end()) {
            return;
        }
        removed = std::move(it->second);
        connections_.erase(it);
        if (connections_.empty()) {
            empty_cv_.notify_all();
        }
    }
}

uint32_t ConnectionManager::get_connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(connections_.size());
}

void ConnectionManager::for_each_connection(std::function<void(Connection&)> func) {
    std::vector<std::shared_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conns.reserve(connections_.size());
        for (auto& pair : connections_) {
            conns.push_back(pair.second);
        }
    }
    for (auto& conn : conns) {
        func(*conn);
    }
}

uint32_t ConnectionManager::drain_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t closed = 0;
    for (auto& pair : connections_) {
        if (pair.second->drain()) {
            ++closed;
        }
    }
    LOG_DEBUG("ConnectionManager", "Drain: %u idle closed, %zu busy",
              closed, connections_.size() - closed);
    return closed;
}

uint32_t ConnectionManager::shutdown_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& pair : connections_) {
        pair.second->force_shutdown();
    }
    return static_cast<uint32_t>(connections_.size());
}

bool ConnectionManager::wait_until_empty(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return empty_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return connections_.empty();
    });
}

void ConnectionManager::clear_all() {
    std::unordered_map<uint64_t, std::shared_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conns.swap(connections_);
        empty_cv_.notify_all();
    }
}

} // namespace connection
} // namespace http_mock_server

// 文件结束
