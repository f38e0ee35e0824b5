// =============================================================================
//  HTTP Mock Server - Mock Module
//  文件: mock.hpp
//  描述: Mock规则定义（匹配器 + 响应模板 + 调用次数期望）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include "matcher/matcher.hpp"
#include "protocol/http_message.hpp"

namespace http_mock_server {
namespace mock {

// 规则挂载范围
enum class MountScope : uint8_t {
    GLOBAL = 0,   // 存活到Server停止
    SCOPED = 1    // 存活到ScopeGuard释放
};

const char* mount_scope_to_string(MountScope scope);

// ==================== 调用次数期望 ====================
// 闭区间 [min, max]，max可为无上限；默认不做约束 [0, 无上限]
class Expectation {
public:
    static constexpr uint64_t UNBOUNDED = std::numeric_limits<uint64_t>::max();

    Expectation();
    Expectation(uint64_t min, uint64_t max);

    static Expectation exactly(uint64_t count);
    static Expectation at_least(uint64_t count);
    static Expectation at_most(uint64_t count);
    static Expectation between(uint64_t min, uint64_t max);
    static Expectation never();

    uint64_t min() const { return min_; }
    uint64_t max() const { return max_; }
    bool is_unbounded() const { return max_ == UNBOUNDED; }

    // min <= max
    bool is_valid() const { return min_ <= max_; }

    // min <= count <= max
    bool is_satisfied_by(uint64_t count) const;

    // 形如 "[1, 3]"、"[2, unbounded]"
    std::string to_string() const;

    bool operator==(const Expectation& other) const {
        return min_ == other.min_ && max_ == other.max_;
    }

private:
    uint64_t min_;
    uint64_t max_;
};

// ==================== 响应模板 ====================
class ResponseTemplate {
public:
    ResponseTemplate();
    explicit ResponseTemplate(int status_code);

    ResponseTemplate& set_status(int status_code);

    // 追加响应头（同名头部可多次追加）
    ResponseTemplate& insert_header(const std::string& name, const std::string& value);

    ResponseTemplate& set_body(const std::vector<uint8_t>& body);
    ResponseTemplate& set_body_string(const std::string& body);

    // 设置JSON响应体，未指定Content-Type时补充 application/json
    ResponseTemplate& set_body_json(const std::string& json);

    // 写出响应前的固定延迟
    ResponseTemplate& set_delay_ms(uint32_t delay_ms);

    int status_code() const { return response_.status_code; }
    const protocol::HttpHeaders& headers() const { return response_.headers; }
    const std::vector<uint8_t>& body() const { return response_.body; }
    uint32_t delay_ms() const { return delay_ms_; }

    // 生成待发送的响应
    const protocol::HttpResponse& response() const { return response_; }

private:
    protocol::HttpResponse response_;
    uint32_t delay_ms_;
};

// 未匹配任何规则时的默认响应：404，空响应体
ResponseTemplate not_found_response();

// ==================== Mock规则定义 ====================
// 挂载前的规则描述，挂载时由MountTable复制为Rule
class Mock {
public:
    Mock();
    explicit Mock(matcher::MatcherPtr matcher);

    // 追加匹配条件（所有条件按AND组合）
    Mock& and_matcher(matcher::MatcherPtr matcher);

    Mock& respond_with(const ResponseTemplate& response);

    Mock& expect(const Expectation& expectation);

    // 精确期望次数的便捷写法
    Mock& expect(uint64_t exact_count);

    // 规则名称，用于日志和校验报告
    Mock& named(const std::string& name);

    // 响应n次后不再参与匹配（0表示不限）
    Mock& up_to_n_times(uint64_t n);

    const std::vector<matcher::MatcherPtr>& matchers() const { return matchers_; }
    const ResponseTemplate& response() const { return response_; }
    const Expectation& expectation() const { return expectation_; }
    const std::string& name() const { return name_; }
    uint64_t max_responses() const { return max_responses_; }

private:
    std::vector<matcher::MatcherPtr> matchers_;
    ResponseTemplate response_;
    Expectation expectation_;
    std::string name_;
    uint64_t max_responses_;
};

} // namespace mock
} // namespace http_mock_server

// 文件结束
