// =============================================================================
//  HTTP Mock Server - Mock Module
//  文件: verification.hpp
//  描述: 调用次数校验结果
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "mock/mock.hpp"
#include "utils/error.hpp"

namespace http_mock_server {
namespace mock {

// 单条规则的期望违背记录
struct ExpectationViolation {
    uint64_t rule_id;
    std::string rule_name;
    std::string matcher_description;
    MountScope scope;
    Expectation expected;
    uint64_t observed;

    ExpectationViolation();

    // 例: "#3 'get hello' [method == GET AND path == /hello] expected [1, 1] got 0"
    std::string to_string() const;
};

class VerificationReport {
public:
    VerificationReport();

    void add_violation(const ExpectationViolation& violation);

    // 记录一条已校验规则
    void count_verified() { ++verified_count_; }

    // 合并另一份报告
    void merge(const VerificationReport& other);

    bool passed() const { return violations_.empty(); }
    size_t verified_count() const { return verified_count_; }
    const std::vector<ExpectationViolation>& violations() const { return violations_; }

    // 多行可读文本，通过时为 "all N mock expectation(s) satisfied"
    std::string to_string() const;

    // 通过返回OK，否则返回 MOCK_EXPECTATION_VIOLATED 并附带 to_string()
    utils::Result<void> to_result() const;

private:
    std::vector<ExpectationViolation> violations_;
    size_t verified_count_;
};

} // namespace mock
} // namespace http_mock_server
