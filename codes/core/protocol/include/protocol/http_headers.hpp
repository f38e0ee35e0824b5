// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: http_headers.hpp
//  描述: HttpHeaders类定义 - 名称大小写不敏感、同名多值保序的头部集合
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace http_mock_server {
namespace protocol {

// ==================== HTTP头部集合类 ====================
// 按接收顺序保存所有头部行，保留原始名称写法；
// 查找时名称大小写不敏感，同名头部的多个值按出现顺序返回。
class HttpHeaders {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    HttpHeaders();

    /**
     * @brief 追加一个头部值（同名已存在时保留原值）
     */
    void add(const std::string& name, const std::string& value);

    /**
     * @brief 设置头部值，删除同名的所有旧值
     */
    void set(const std::string& name, const std::string& value);

    /**
     * @brief 删除同名的所有头部
     * @return 删除的条目数
     */
    size_t remove(const std::string& name);

    bool contains(const std::string& name) const;

    /**
     * @brief 获取首个同名头部值
     * @param name 头部名称（大小写不敏感）
     * @param value 输出头部值（可为nullptr）
     * @return true找到，false未找到
     */
    bool get(const std::string& name, std::string* value) const;

    /**
     * @brief 获取所有同名头部值，按出现顺序
     */
    std::vector<std::string> get_all(const std::string& name) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    const std::vector<Entry>& entries() const { return entries_; }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // 逐条比较（名称按原样比较）
    bool operator==(const HttpHeaders& other) const;
    bool operator!=(const HttpHeaders& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

} // namespace protocol
} // namespace http_mock_server

// 文件结束
