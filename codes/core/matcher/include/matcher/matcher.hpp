// =============================================================================
//  HTTP Mock Server - Matcher Module
//  文件: matcher.hpp
//  描述: 请求匹配器接口与内置匹配器工厂
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "protocol/http_message.hpp"

namespace http_mock_server {
namespace matcher {

// 匹配器接口
// matches() 只允许读取请求内容，不得修改任何共享状态；
// 实现可以抛出 std::exception，调用方按“不匹配”处理。
class Matcher {
public:
    virtual ~Matcher() = default;

    /**
     * @brief 判断请求是否满足条件
     */
    virtual bool matches(const protocol::HttpRequest& request) const = 0;

    /**
     * @brief 匹配条件的可读描述，用于校验报告
     */
    virtual std::string describe() const = 0;
};

using MatcherPtr = std::shared_ptr<const Matcher>;
using MatchFunction = std::function<bool(const protocol::HttpRequest&)>;

/**
 * @brief 安全执行匹配：匹配器抛出异常时记录DEBUG日志并返回false
 * @param matcher 匹配器，为nullptr时返回false
 * @param request 请求快照
 */
bool evaluate(const Matcher* matcher, const protocol::HttpRequest& request);

/**
 * @brief 多个匹配器的描述，以 " AND " 连接
 */
std::string describe_all(const std::vector<MatcherPtr>& matchers);

// ==================== 内置匹配器工厂 ====================

// 匹配任意请求
MatcherPtr any();

// 请求方法相等（大小写不敏感）
MatcherPtr method(const std::string& method);

// 请求路径（不含query）完全相等
MatcherPtr path(const std::string& path);

// 请求路径前缀匹配
MatcherPtr path_prefix(const std::string& prefix);

// 某个同名头部值与value完全相等（名称大小写不敏感）
MatcherPtr header(const std::string& name, const std::string& value);

// 存在指定头部
MatcherPtr header_exists(const std::string& name);

// 查询参数 name=value（百分号解码后比较）
MatcherPtr query_param(const std::string& name, const std::string& value);

// 请求体与给定字节完全相等
MatcherPtr body_bytes(const std::vector<uint8_t>& body);
MatcherPtr body_string(const std::string& body);

// 请求体包含子串
MatcherPtr body_contains(const std::string& needle);

// 请求体按JSON解析后与expected_json结构相等；请求体不是合法JSON时不匹配
MatcherPtr body_json(const std::string& expected_json);

// 自定义谓词
MatcherPtr custom(const std::string& description, MatchFunction func);

// 组合：全部满足（AND）/ 任一满足（OR）/ 取反（NOT）
MatcherPtr all_of(const std::vector<MatcherPtr>& matchers);
MatcherPtr any_of(const std::vector<MatcherPtr>& matchers);
MatcherPtr negate(MatcherPtr matcher);

} // namespace matcher
} // namespace http_mock_server

// 文件结束
