// =============================================================================
//  HTTP Mock Server - Server Module
//  文件: scope_guard.cpp
//  描述: 作用域规则句柄实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "server/scope_guard.hpp"
#include "utils/logger.hpp"
#include <utility>

namespace http_mock_server {
namespace server {

ScopeGuard::ScopeGuard()
    : rule_id_(0)
    , released_(true)
{
}

ScopeGuard::ScopeGuard(std::weak_ptr<mock::MountTable> table, uint64_t rule_id)
    : table_(std::move(table))
    , rule_id_(rule_id)
    , released_(false)
{
}

ScopeGuard::~ScopeGuard() {
    warn_if_unreleased();
}

ScopeGuard::ScopeGuard(ScopeGuard&& other) noexcept
    : table_(std::move(other.table_))
    , rule_id_(other.rule_id_)
    , released_(other.released_)
    , report_(std::move(other.report_))
{
    other.released_ = true;
}

ScopeGuard& ScopeGuard::operator=(ScopeGuard&& other) noexcept {
    if (this != &other) {
        warn_if_unreleased();
        table_ = std::move(other.table_);
        rule_id_ = other.rule_id_;
        released_ = other.released_;
        report_ = std::move(other.report_);
        other.released_ = true;
    }
    return *this;
}

mock::VerificationReport ScopeGuard::release() {
    if (released_) {
        return report_;
    }
    released_ = true;

    std::shared_ptr<mock::MountTable> table = table_.lock();
    if (!table) {
        LOG_DEBUG("ScopeGuard", "Rule #%llu released after server destruction",
                  static_cast<unsigned long long>(rule_id_));
        return report_;
    }

    mock::RulePtr rule = table->unmount(rule_id_);
    if (!rule) {
        // 已被stop()或reset()移除
        LOG_DEBUG("ScopeGuard", "Rule #%llu already removed",
                  static_cast<unsigned long long>(rule_id_));
        return report_;
    }

    mock::ExpectationViolation violation;
    report_.count_verified();
    if (!rule->verify(&violation)) {
        report_.add_violation(violation);
    }
    LOG_DEBUG("ScopeGuard", "Released rule %s, calls=%llu",
              rule->describe().c_str(), static_cast<unsigned long long>(rule->call_count()));
    return report_;
}

void ScopeGuard::warn_if_unreleased() const {
    if (released_) {
        return;
    }
    // 规则已被stop()或reset()移除时无需告警
    std::shared_ptr<mock::MountTable> table = table_.lock();
    if (table && table->contains(rule_id_)) {
        LOG_WARN("ScopeGuard", "Scoped rule #%llu dropped without release(), "
                 "it stays mounted until the server stops",
                 static_cast<unsigned long long>(rule_id_));
    }
}

} // namespace server
} // namespace http_mock_server
