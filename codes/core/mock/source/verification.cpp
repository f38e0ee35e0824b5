// =============================================================================
//  HTTP Mock Server - Mock Module
//  文件: verification.cpp
//  描述: 校验报告实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "mock/verification.hpp"
#include <sstream>

namespace http_mock_server {
namespace mock {

ExpectationViolation::ExpectationViolation()
    : rule_id(0)
    , scope(MountScope::GLOBAL)
    , observed(0)
{
}

std::string ExpectationViolation::to_string() const {
    std::ostringstream oss;
    oss << "#" << rule_id;
    if (!rule_name.empty()) {
        oss << " '" << rule_name << "'";
    }
    oss << " (" << mount_scope_to_string(scope) << ")"
        << " [" << matcher_description << "]"
        << " expected " << expected.to_string()
        << " got " << observed;
    return oss.str();
}

VerificationReport::VerificationReport()
    : verified_count_(0)
{
}

void VerificationReport::add_violation(const ExpectationViolation& violation) {
    violations_.push_back(violation);
}

void VerificationReport::merge(const VerificationReport& other) {
    violations_.insert(violations_.end(), other.violations_.begin(), other.violations_.end());
    verified_count_ += other.verified_count_;
}

std::string VerificationReport::to_string() const {
    std::ostringstream oss;
    if (passed()) {
        oss << "all " << verified_count_ << " mock expectation(s) satisfied";
        return oss.str();
    }
    oss << violations_.size() << " of " << verified_count_
        << " mock expectation(s) violated:";
    for (const auto& v : violations_) {
        oss << "\n  " << v.to_string();
    }
    return oss.str();
}

utils::Result<void> VerificationReport::to_result() const {
    if (passed()) {
        return utils::make_ok();
    }
    return utils::make_err(utils::ErrorCode::MOCK_EXPECTATION_VIOLATED, to_string());
}

} // namespace mock
} // namespace http_mock_server

// 文件结束
