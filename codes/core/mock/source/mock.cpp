// =============================================================================
//  HTTP Mock Server - Mock Module
//  文件: mock.cpp
//  描述: Expectation / ResponseTemplate / Mock 实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "mock/mock.hpp"
#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"

namespace http_mock_server {
namespace mock {

constexpr uint64_t Expectation::UNBOUNDED;

const char* mount_scope_to_string(MountScope scope) {
    switch (scope) {
        case MountScope::GLOBAL: return "global";
        case MountScope::SCOPED: return "scoped";
        default: return "unknown";
    }
}

// ==================== Expectation实现 ====================

Expectation::Expectation()
    : min_(0)
    , max_(UNBOUNDED)
{
}

Expectation::Expectation(uint64_t min, uint64_t max)
    : min_(min)
    , max_(max)
{
}

Expectation Expectation::exactly(uint64_t count) {
    return Expectation(count, count);
}

Expectation Expectation::at_least(uint64_t count) {
    return Expectation(count, UNBOUNDED);
}

Expectation Expectation::at_most(uint64_t count) {
    return Expectation(0, count);
}

Expectation Expectation::between(uint64_t min, uint64_t max) {
    return Expectation(min, max);
}

Expectation Expectation::never() {
    return Expectation(0, 0);
}

bool Expectation::is_satisfied_by(uint64_t count) const {
    return min_ <= count && count <= max_;
}

std::string Expectation::to_string() const {
    std::string upper = is_unbounded() ? "unbounded" : std::to_string(max_);
    return "[" + std::to_string(min_) + ", " + upper + "]";
}

// ==================== ResponseTemplate实现 ====================

ResponseTemplate::ResponseTemplate()
    : response_(200)
    , delay_ms_(0)
{
}

ResponseTemplate::ResponseTemplate(int status_code)
    : response_(status_code)
    , delay_ms_(0)
{
}

ResponseTemplate& ResponseTemplate::set_status(int status_code) {
    response_.set_status(status_code);
    return *this;
}

ResponseTemplate& ResponseTemplate::insert_header(const std::string& name, const std::string& value) {
    response_.add_header(name, value);
    return *this;
}

ResponseTemplate& ResponseTemplate::set_body(const std::vector<uint8_t>& body) {
    response_.body = body;
    return *this;
}

ResponseTemplate& ResponseTemplate::set_body_string(const std::string& body) {
    response_.set_body(body);
    return *this;
}

ResponseTemplate& ResponseTemplate::set_body_json(const std::string& json) {
    response_.set_body(json);
    if (!response_.headers.contains("Content-Type")) {
        response_.add_header("Content-Type", "application/json");
    }
    return *this;
}

ResponseTemplate& ResponseTemplate::set_delay_ms(uint32_t delay_ms) {
    delay_ms_ = delay_ms;
    return *this;
}

ResponseTemplate not_found_response() {
    return ResponseTemplate(protocol::DEFAULT_NOT_FOUND_STATUS);
}

// ==================== Mock实现 ====================

Mock::Mock()
    : max_responses_(0)
{
}

Mock::Mock(matcher::MatcherPtr matcher)
    : max_responses_(0)
{
    and_matcher(std::move(matcher));
}

Mock& Mock::and_matcher(matcher::MatcherPtr matcher) {
    if (matcher) {
        matchers_.push_back(std::move(matcher));
    }
    return *this;
}

Mock& Mock::respond_with(const ResponseTemplate& response) {
    response_ = response;
    return *this;
}

Mock& Mock::expect(const Expectation& expectation) {
    expectation_ = expectation;
    return *this;
}

Mock& Mock::expect(uint64_t exact_count) {
    expectation_ = Expectation::exactly(exact_count);
    return *this;
}

Mock& Mock::named(const std::string& name) {
    name_ = name;
    return *this;
}

Mock& Mock::up_to_n_times(uint64_t n) {
    max_responses_ = n;
    return *this;
}

} // namespace mock
} // namespace http_mock_server

// 文件结束
