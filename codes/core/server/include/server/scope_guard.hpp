// =============================================================================
//  HTTP Mock Server - Server Module
//  文件: scope_guard.hpp
//  描述: 作用域规则句柄
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <memory>
#include "mock/mount_table.hpp"
#include "mock/verification.hpp"

namespace http_mock_server {
namespace server {

/**
 * @brief 作用域规则句柄
 *
 * 由 MockServer::mount_as_scoped() 返回，只能移动不能拷贝。
 * release() 卸载规则并立即校验该规则的期望，重复调用返回首次结果。
 * 析构不会卸载规则：未释放的规则留在规则表中，由 stop() 统一校验。
 */
class ScopeGuard {
public:
    /**
     * @brief 空句柄，release() 返回空报告
     */
    ScopeGuard();

    /**
     * @brief 构造函数
     * @param table 规则表（弱引用，服务器销毁后句柄仍可安全释放）
     * @param rule_id 已挂载的作用域规则ID
     */
    ScopeGuard(std::weak_ptr<mock::MountTable> table, uint64_t rule_id);

    ~ScopeGuard();

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    ScopeGuard(ScopeGuard&& other) noexcept;
    ScopeGuard& operator=(ScopeGuard&& other) noexcept;

    uint64_t rule_id() const { return rule_id_; }
    bool is_released() const { return released_; }

    /**
     * @brief 卸载规则并校验
     *
     * 规则已被 stop()/reset() 移除时返回空的通过报告，
     * 该规则已在那一次校验（或重置）中处理过。
     * @return 只包含本规则的校验报告
     */
    mock::VerificationReport release();

private:
    void warn_if_unreleased() const;

    std::weak_ptr<mock::MountTable> table_;
    uint64_t rule_id_;
    bool released_;
    mock::VerificationReport report_;
};

} // namespace server
} // namespace http_mock_server

// 文件结束
