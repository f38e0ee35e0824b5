// =============================================================================
//  HTTP Mock Server - Config Module
//  文件: config.hpp
//  描述: JSON配置（服务参数、日志、预置Mock规则）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "mock/mock.hpp"
#include "server/mock_server_options.hpp"
#include "utils/error.hpp"

namespace http_mock_server {
namespace config {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// ========== 配置数据结构 ==========

struct ServerConfig {
    std::string listen_ip = "127.0.0.1";
    uint16_t listen_port = 0;
    bool record_requests = true;
    uint32_t worker_threads = 4;
    uint32_t max_connections = 64;
    uint32_t drain_timeout_ms = 5000;
    uint32_t idle_timeout_ms = 5000;
    uint64_t max_body_size = 16 * 1024 * 1024;
    uint32_t backlog = 128;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    bool console_output = true;
};

// 预置规则的响应
struct ResponseConfig {
    int status = 200;
    HeaderList headers;
    std::string body;
    bool body_is_json = false;      // body字段为JSON对象/数组时为true
    uint32_t delay_ms = 0;
};

// 预置规则的调用次数期望，未配置时不做约束
struct ExpectConfig {
    uint64_t min = 0;
    bool has_max = false;
    uint64_t max = 0;
};

// 预置规则：所有已配置的条件按AND组合，均未配置时匹配任意请求
struct MockConfig {
    std::string name;
    std::string method;
    std::string path;
    std::string path_prefix;
    HeaderList headers;
    HeaderList query;
    std::string body_contains;
    std::string body_json;
    ResponseConfig response;
    ExpectConfig expect;
    uint64_t up_to_n_times = 0;
};

// ========== Config主类 ==========
// 注意：头文件不包含nlohmann/json.hpp，JSON解析只在config.cpp中完成

class Config {
public:
    Config();
    ~Config();

    // 从文件加载配置
    // file_path: JSON配置文件路径
    // return: 失败返回 FILE_NOT_FOUND / CONFIG_PARSE_ERROR / CONFIG_INVALID_VALUE 等
    utils::Result<void> load_from_file(const std::string& file_path);

    // 从JSON字符串加载配置，未出现的字段保持原值
    utils::Result<void> load_from_string(const std::string& json_str);

    // 验证配置合法性
    utils::Result<void> validate() const;

    // ========== 获取配置项 ==========

    const ServerConfig& get_server() const { return server_; }
    const LoggingConfig& get_logging() const { return logging_; }
    const std::vector<MockConfig>& get_mocks() const { return mocks_; }

    // ========== 设置配置项 ==========

    void set_server(const ServerConfig& cfg) { server_ = cfg; }
    void set_logging(const LoggingConfig& cfg) { logging_ = cfg; }
    void set_mocks(const std::vector<MockConfig>& mocks) { mocks_ = mocks; }
    void add_mock(const MockConfig& mock) { mocks_.push_back(mock); }

    // ========== 转换 ==========

    // 按logging段初始化全局Logger
    utils::Result<void> apply_logging() const;

    // 生成MockServer构造参数
    server::MockServerOptions to_server_options() const;

    // 将预置规则转换为Mock定义
    std::vector<mock::Mock> build_mocks() const;

    // 导出为JSON字符串
    utils::Result<std::string> to_json_string() const;

    // 重置为默认配置
    void reset();

private:
    ServerConfig server_;
    LoggingConfig logging_;
    std::vector<MockConfig> mocks_;
};

// 单条预置规则转换为Mock定义
mock::Mock build_mock(const MockConfig& cfg);

} // namespace config
} // namespace http_mock_server

// 文件结束
