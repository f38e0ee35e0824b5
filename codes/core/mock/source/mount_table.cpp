// =============================================================================
//  HTTP Mock Server - Mock Module
//  文件: mount_table.cpp
//  描述: 规则表实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "mock/mount_table.hpp"
#include "matcher/matcher.hpp"
#include "utils/logger.hpp"

namespace http_mock_server {
namespace mock {

// ==================== Rule实现 ====================

Rule::Rule(uint64_t id, const Mock& mock, MountScope scope)
    : id_(id)
    , scope_(scope)
    , mock_(mock)
    , call_count_(0)
{
}

bool Rule::matches(const protocol::HttpRequest& request) const {
    for (const auto& m : mock_.matchers()) {
        if (!matcher::evaluate(m.get(), request)) {
            return false;
        }
    }
    return true;
}

bool Rule::is_exhausted() const {
    return mock_.max_responses() > 0 && call_count_.load() >= mock_.max_responses();
}

bool Rule::verify(ExpectationViolation* violation) const {
    uint64_t observed = call_count_.load();
    if (mock_.expectation().is_satisfied_by(observed)) {
        return true;
    }
    if (violation) {
        violation->rule_id = id_;
        violation->rule_name = mock_.name();
        violation->matcher_description = matcher::describe_all(mock_.matchers());
        violation->scope = scope_;
        violation->expected = mock_.expectation();
        violation->observed = observed;
    }
    return false;
}

std::string Rule::describe() const {
    std::string out = "#" + std::to_string(id_);
    if (!mock_.name().empty()) {
        out += " '" + mock_.name() + "'";
    }
    return out + " [" + matcher::describe_all(mock_.matchers()) + "]";
}

namespace {

void verify_into(const Rule& rule, VerificationReport* report) {
    ExpectationViolation violation;
    report->count_verified();
    if (!rule.verify(&violation)) {
        report->add_violation(violation);
    }
}

} // namespace

// ==================== MountTable实现 ====================

MountTable::MountTable()
    : next_id_(1)
{
}

utils::Result<uint64_t> MountTable::mount(const Mock& mock, MountScope scope) {
    if (mock.matchers().empty()) {
        return utils::make_err<uint64_t>(utils::ErrorCode::INVALID_ARGUMENT,
                                         "mock must have at least one matcher");
    }
    if (!mock.expectation().is_valid()) {
        return utils::make_err<uint64_t>(utils::ErrorCode::INVALID_ARGUMENT,
                                         "expectation min greater than max: " +
                                         mock.expectation().to_string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    rules_.push_back(std::make_shared<Rule>(id, mock, scope));

    LOG_DEBUG("MountTable", "Mounted rule %s (%s), total %zu",
              rules_.back()->describe().c_str(), mount_scope_to_string(scope), rules_.size());
    return utils::make_ok(id);
}

RulePtr MountTable::unmount(uint64_t rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = rules_.begin(); it != rules_.end(); ++it) {
        if ((*it)->id() == rule_id) {
            RulePtr rule = *it;
            rules_.erase(it);
            LOG_DEBUG("MountTable", "Unmounted rule #%llu, remaining %zu",
                      static_cast<unsigned long long>(rule_id), rules_.size());
            return rule;
        }
    }
    return nullptr;
}

RulePtr MountTable::select_locked(const protocol::HttpRequest& request) const {
    // 后挂载优先
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        const RulePtr& rule = *it;
        if (rule->is_exhausted()) {
            continue;
        }
        if (rule->matches(request)) {
            return rule;
        }
    }
    return nullptr;
}

bool MountTable::dispatch(const protocol::HttpRequest& request,
                          ResponseTemplate* response,
                          uint64_t* rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    RulePtr rule = select_locked(request);
    if (!rule) {
        return false;
    }
    rule->record_call();
    if (response) {
        *response = rule->definition().response();
    }
    if (rule_id) {
        *rule_id = rule->id();
    }
    return true;
}

utils::Result<uint64_t> MountTable::call_count(uint64_t rule_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& rule : rules_) {
        if (rule->id() == rule_id) {
            return utils::make_ok(rule->call_count());
        }
    }
    return utils::make_err<uint64_t>(utils::ErrorCode::MOCK_RULE_NOT_FOUND,
                                     "rule #" + std::to_string(rule_id) + " is not mounted");
}

bool MountTable::contains(uint64_t rule_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& rule : rules_) {
        if (rule->id() == rule_id) {
            return true;
        }
    }
    return false;
}

size_t MountTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

VerificationReport MountTable::verify_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    VerificationReport report;
    for (const auto& rule : rules_) {
        verify_into(*rule, &report);
    }
    return report;
}

VerificationReport MountTable::drain() {
    std::vector<RulePtr> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules.swap(rules_);
    }

    VerificationReport report;
    for (const auto& rule : rules) {
        verify_into(*rule, &report);
    }
    return report;
}

void MountTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.clear();
}

} // namespace mock
} // namespace http_mock_server

// 文件结束
