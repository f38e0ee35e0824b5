// =============================================================================
//  HTTP Mock Server - Protocol Module
//  文件: http_headers.cpp
//  描述: HttpHeaders类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_headers.hpp"
#include "protocol/protocol_utils.hpp"
#include <algorithm>

namespace http_mock_server {
namespace protocol {

HttpHeaders::HttpHeaders() = default;

void HttpHeaders::add(const std::string& name, const std::string& value) {
    entries_.emplace_back(name, value);
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    remove(name);
    entries_.emplace_back(name, value);
}

size_t HttpHeaders::remove(const std::string& name) {
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&name](const Entry& e) {
                                      return EqualsIgnoreCase(e.first, name);
                                  }),
                   entries_.end());
    return before - entries_.size();
}

bool HttpHeaders::contains(const std::string& name) const {
    return get(name, nullptr);
}

bool HttpHeaders::get(const std::string& name, std::string* value) const {
    for (const auto& entry : entries_) {
        if (EqualsIgnoreCase(entry.first, name)) {
            if (value) {
                *value = entry.second;
            }
            return true;
        }
    }
    return false;
}

std::vector<std::string> HttpHeaders::get_all(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& entry : entries_) {
        if (EqualsIgnoreCase(entry.first, name)) {
            values.push_back(entry.second);
        }
    }
    return values;
}

bool HttpHeaders::operator==(const HttpHeaders& other) const {
    return entries_ == other.entries_;
}

} // namespace protocol
} // namespace http_mock_server

// 文件结束
