// =============================================================================
//  HTTP Mock Server - Mock Module
//  文件: mount_table.hpp
//  描述: 已挂载规则表（选择、计数、卸载、校验）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "mock/mock.hpp"
#include "mock/verification.hpp"
#include "utils/error.hpp"

namespace http_mock_server {
namespace mock {

/**
 * @brief 已挂载的规则
 *
 * 由Mock复制而来，挂载后定义不再变化，只有调用计数递增。
 */
class Rule {
public:
    Rule(uint64_t id, const Mock& mock, MountScope scope);

    uint64_t id() const { return id_; }
    MountScope scope() const { return scope_; }
    const Mock& definition() const { return mock_; }
    const std::string& name() const { return mock_.name(); }

    /**
     * @brief 所有匹配器均满足时返回true，匹配器异常按不匹配处理
     */
    bool matches(const protocol::HttpRequest& request) const;

    /**
     * @brief 已达到 up_to_n_times 上限，不再参与选择
     */
    bool is_exhausted() const;

    uint64_t call_count() const { return call_count_.load(); }
    void record_call() { call_count_.fetch_add(1); }

    /**
     * @brief 按期望校验调用次数
     * @param violation 不满足时输出违背记录（可为nullptr）
     * @return true满足期望
     */
    bool verify(ExpectationViolation* violation) const;

    std::string describe() const;

private:
    uint64_t id_;
    MountScope scope_;
    Mock mock_;
    std::atomic<uint64_t> call_count_;
};

using RulePtr = std::shared_ptr<Rule>;

/**
 * @brief 规则表
 *
 * 选择顺序为后挂载优先：多条规则同时匹配时，最近挂载的规则胜出。
 * dispatch() 在同一把锁内完成选择与计数，同一请求只会计入一条规则。
 */
class MountTable {
public:
    MountTable();
    ~MountTable() = default;

    MountTable(const MountTable&) = delete;
    MountTable& operator=(const MountTable&) = delete;

    /**
     * @brief 挂载规则
     * @return 新规则ID；匹配器为空或期望区间非法时返回 INVALID_ARGUMENT
     */
    utils::Result<uint64_t> mount(const Mock& mock, MountScope scope);

    /**
     * @brief 卸载规则
     * @return 被卸载的规则，不存在时返回nullptr
     */
    RulePtr unmount(uint64_t rule_id);

    /**
     * @brief 选择匹配规则并计数
     * @param request 请求快照
     * @param response 输出命中规则的响应模板（可为nullptr）
     * @param rule_id 输出命中规则ID（可为nullptr）
     * @return true命中，false无规则匹配
     */
    bool dispatch(const protocol::HttpRequest& request,
                  ResponseTemplate* response,
                  uint64_t* rule_id);

    utils::Result<uint64_t> call_count(uint64_t rule_id) const;

    bool contains(uint64_t rule_id) const;
    size_t size() const;

    /**
     * @brief 校验当前所有规则，不改变规则表
     */
    VerificationReport verify_all() const;

    /**
     * @brief 卸载全部规则并返回其校验结果
     */
    VerificationReport drain();

    /**
     * @brief 卸载全部规则，不做校验
     */
    void clear();

private:
    RulePtr select_locked(const protocol::HttpRequest& request) const;

    mutable std::mutex mutex_;
    std::vector<RulePtr> rules_;     // 按挂载顺序
    uint64_t next_id_;
};

} // namespace mock
} // namespace http_mock_server
