// =============================================================================
//  HTTP Mock Server - Config Module
//  文件: config.cpp
//  描述: Config 实现（nlohmann/json）
//  版权: Copyright (c) 2026
// =============================================================================
#include "config/config.hpp"
#include "matcher/matcher.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <limits>
#include <sstream>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace http_mock_server {
namespace config {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

// 读取非负整数字段，超出[0, max_value]返回range_code
Result<void> read_uint(const json& obj, const char* key, uint64_t max_value,
                       ErrorCode range_code, uint64_t* out) {
    if (!obj.contains(key)) {
        return make_ok();
    }
    const json& v = obj[key];
    if (!v.is_number_integer()) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        std::string("'") + key + "' must be an integer");
    }
    if (v.is_number_unsigned()) {
        uint64_t value = v.get<uint64_t>();
        if (value > max_value) {
            return make_err(range_code, std::string("'") + key + "' out of range: " + v.dump());
        }
        *out = value;
        return make_ok();
    }
    int64_t value = v.get<int64_t>();
    if (value < 0 || static_cast<uint64_t>(value) > max_value) {
        return make_err(range_code, std::string("'") + key + "' out of range: " + v.dump());
    }
    *out = static_cast<uint64_t>(value);
    return make_ok();
}

template<typename T>
Result<void> read_uint_as(const json& obj, const char* key, ErrorCode range_code, T* out) {
    uint64_t value = *out;
    Result<void> r = read_uint(obj, key, std::numeric_limits<T>::max(), range_code, &value);
    if (r.is_ok()) {
        *out = static_cast<T>(value);
    }
    return r;
}

// 读取 {"name": "value"} 形式的键值表
Result<void> read_headers(const json& obj, const char* key, HeaderList* out) {
    if (!obj.contains(key)) {
        return make_ok();
    }
    const json& table = obj[key];
    if (!table.is_object()) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        std::string("'") + key + "' must be an object of strings");
    }
    out->clear();
    for (auto it = table.begin(); it != table.end(); ++it) {
        out->emplace_back(it.key(), it.value().get<std::string>());
    }
    return make_ok();
}

json headers_to_json(const HeaderList& headers) {
    json j = json::object();
    for (const auto& h : headers) {
        j[h.first] = h.second;
    }
    return j;
}

Result<void> parse_server(const json& s, ServerConfig* server) {
    if (s.contains("listen_ip")) server->listen_ip = s["listen_ip"].get<std::string>();
    if (s.contains("record_requests")) server->record_requests = s["record_requests"].get<bool>();

    Result<void> r = read_uint_as(s, "listen_port", ErrorCode::CONFIG_INVALID_PORT,
                                  &server->listen_port);
    if (r.is_err()) return r;
    r = read_uint_as(s, "worker_threads", ErrorCode::CONFIG_INVALID_THREAD_COUNT,
                     &server->worker_threads);
    if (r.is_err()) return r;
    r = read_uint_as(s, "max_connections", ErrorCode::CONFIG_INVALID_VALUE,
                     &server->max_connections);
    if (r.is_err()) return r;
    r = read_uint_as(s, "drain_timeout_ms", ErrorCode::CONFIG_INVALID_VALUE,
                     &server->drain_timeout_ms);
    if (r.is_err()) return r;
    r = read_uint_as(s, "idle_timeout_ms", ErrorCode::CONFIG_INVALID_VALUE,
                     &server->idle_timeout_ms);
    if (r.is_err()) return r;
    r = read_uint_as(s, "max_body_size", ErrorCode::CONFIG_INVALID_VALUE,
                     &server->max_body_size);
    if (r.is_err()) return r;
    return read_uint_as(s, "backlog", ErrorCode::CONFIG_INVALID_VALUE, &server->backlog);
}

void parse_logging(const json& l, LoggingConfig* logging) {
    if (l.contains("level")) logging->level = l["level"].get<std::string>();
    if (l.contains("file")) logging->file = l["file"].get<std::string>();
    if (l.contains("console_output")) logging->console_output = l["console_output"].get<bool>();
}

Result<void> parse_mock(const json& m, MockConfig* mock) {
    if (!m.is_object()) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "mock entry must be an object");
    }
    if (m.contains("name")) mock->name = m["name"].get<std::string>();
    if (m.contains("method")) mock->method = m["method"].get<std::string>();
    if (m.contains("path")) mock->path = m["path"].get<std::string>();
    if (m.contains("path_prefix")) mock->path_prefix = m["path_prefix"].get<std::string>();
    Result<void> r = read_headers(m, "headers", &mock->headers);
    if (r.is_err()) return r;
    r = read_headers(m, "query", &mock->query);
    if (r.is_err()) return r;
    if (m.contains("body_contains")) mock->body_contains = m["body_contains"].get<std::string>();
    if (m.contains("body_json")) {
        const json& bj = m["body_json"];
        mock->body_json = bj.is_string() ? bj.get<std::string>() : bj.dump();
    }

    r = read_uint_as(m, "up_to_n_times", ErrorCode::CONFIG_INVALID_VALUE,
                                  &mock->up_to_n_times);
    if (r.is_err()) return r;

    if (m.contains("response")) {
        const json& resp = m["response"];
        r = read_uint_as(resp, "status", ErrorCode::CONFIG_INVALID_VALUE, &mock->response.status);
        if (r.is_err()) return r;
        r = read_headers(resp, "headers", &mock->response.headers);
        if (r.is_err()) return r;
        if (resp.contains("body")) {
            const json& body = resp["body"];
            if (body.is_string()) {
                mock->response.body = body.get<std::string>();
                mock->response.body_is_json = false;
            } else {
                mock->response.body = body.dump();
                mock->response.body_is_json = true;
            }
        }
        r = read_uint_as(resp, "delay_ms", ErrorCode::CONFIG_INVALID_VALUE,
                         &mock->response.delay_ms);
        if (r.is_err()) return r;
    }

    // expect: 整数表示精确次数，对象表示 {min, max}
    if (m.contains("expect")) {
        const json& e = m["expect"];
        if (e.is_object()) {
            r = read_uint(e, "min", std::numeric_limits<uint64_t>::max(),
                          ErrorCode::CONFIG_INVALID_VALUE, &mock->expect.min);
            if (r.is_err()) return r;
            if (e.contains("max")) {
                mock->expect.has_max = true;
                r = read_uint(e, "max", std::numeric_limits<uint64_t>::max(),
                              ErrorCode::CONFIG_INVALID_VALUE, &mock->expect.max);
                if (r.is_err()) return r;
            }
        } else {
            json wrapper;
            wrapper["expect"] = e;
            uint64_t exact = 0;
            r = read_uint(wrapper, "expect", std::numeric_limits<uint64_t>::max(),
                          ErrorCode::CONFIG_INVALID_VALUE, &exact);
            if (r.is_err()) return r;
            mock->expect.min = exact;
            mock->expect.has_max = true;
            mock->expect.max = exact;
        }
    }
    return make_ok();
}

// 解析JSON到配置各段；出错时不修改输出
Result<void> parse_json_to_config(const json& j,
                                  ServerConfig& server,
                                  LoggingConfig& logging,
                                  std::vector<MockConfig>& mocks) {
    if (!j.is_object()) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, "config root must be a JSON object");
    }

    ServerConfig new_server = server;
    LoggingConfig new_logging = logging;
    std::vector<MockConfig> new_mocks = mocks;

    try {
        // server (可选，有默认值)
        if (j.contains("server")) {
            Result<void> r = parse_server(j["server"], &new_server);
            if (r.is_err()) return r;
        }

        // logging
        if (j.contains("logging")) {
            parse_logging(j["logging"], &new_logging);
        }

        // mocks
        if (j.contains("mocks")) {
            const json& arr = j["mocks"];
            if (!arr.is_array()) {
                return make_err(ErrorCode::CONFIG_INVALID_VALUE, "'mocks' must be an array");
            }
            new_mocks.clear();
            for (size_t i = 0; i < arr.size(); ++i) {
                MockConfig mock;
                Result<void> r = parse_mock(arr[i], &mock);
                if (r.is_err()) {
                    return make_err(r.error_code(),
                                    "mocks[" + std::to_string(i) + "]: " + r.error_message());
                }
                new_mocks.push_back(mock);
            }
        }
    } catch (const json::type_error& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    }

    server = new_server;
    logging = new_logging;
    mocks.swap(new_mocks);
    return make_ok();
}

json mock_to_json(const MockConfig& mock) {
    json m;
    if (!mock.name.empty()) m["name"] = mock.name;
    if (!mock.method.empty()) m["method"] = mock.method;
    if (!mock.path.empty()) m["path"] = mock.path;
    if (!mock.path_prefix.empty()) m["path_prefix"] = mock.path_prefix;
    if (!mock.headers.empty()) m["headers"] = headers_to_json(mock.headers);
    if (!mock.query.empty()) m["query"] = headers_to_json(mock.query);
    if (!mock.body_contains.empty()) m["body_contains"] = mock.body_contains;
    if (!mock.body_json.empty()) m["body_json"] = mock.body_json;

    json resp;
    resp["status"] = mock.response.status;
    resp["headers"] = headers_to_json(mock.response.headers);
    if (mock.response.body_is_json) {
        resp["body"] = json::parse(mock.response.body, nullptr, false);
    } else {
        resp["body"] = mock.response.body;
    }
    resp["delay_ms"] = mock.response.delay_ms;
    m["response"] = resp;

    json expect;
    expect["min"] = mock.expect.min;
    if (mock.expect.has_max) {
        expect["max"] = mock.expect.max;
    }
    m["expect"] = expect;
    m["up_to_n_times"] = mock.up_to_n_times;
    return m;
}

} // namespace details

Config::Config() = default;
Config::~Config() = default;

Result<void> Config::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return make_err(ErrorCode::FILE_READ_ERROR, "Failed to read config file: " + file_path);
    }
    return load_from_string(buffer.str());
}

Result<void> Config::load_from_string(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    }
    return details::parse_json_to_config(j, server_, logging_, mocks_);
}

Result<void> Config::validate() const {
    if (server_.listen_ip.empty()) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "listen_ip must not be empty");
    }

    // 验证线程数
    if (server_.worker_threads == 0 || server_.worker_threads > 256) {
        return make_err(ErrorCode::CONFIG_INVALID_THREAD_COUNT,
                        "Invalid worker_threads: " + std::to_string(server_.worker_threads));
    }
    if (server_.max_connections < server_.worker_threads) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        "max_connections must not be less than worker_threads");
    }
    if (server_.max_body_size == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "max_body_size must be positive");
    }
    if (server_.backlog == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "backlog must be positive");
    }

    // 验证日志级别
    if (!utils::is_valid_log_level(logging_.level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    for (size_t i = 0; i < mocks_.size(); ++i) {
        const MockConfig& m = mocks_[i];
        std::string where = "mocks[" + std::to_string(i) + "]";
        if (m.response.status < 100 || m.response.status > 599) {
            return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                            where + ": invalid response status " + std::to_string(m.response.status));
        }
        if (m.expect.has_max && m.expect.min > m.expect.max) {
            return make_err(ErrorCode::CONFIG_INVALID_VALUE, where + ": expect.min greater than expect.max");
        }
        if (!m.body_json.empty() && !json::accept(m.body_json)) {
            return make_err(ErrorCode::CONFIG_INVALID_VALUE, where + ": body_json is not valid JSON");
        }
    }

    return make_ok();
}

Result<void> Config::apply_logging() const {
    if (!utils::is_valid_log_level(logging_.level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }
    int ret = utils::Logger::instance().init(logging_.level, logging_.file, logging_.console_output);
    if (ret != 0) {
        return make_err(ErrorCode::OPERATION_FAILED, "Cannot open log file: " + logging_.file);
    }
    return make_ok();
}

server::MockServerOptions Config::to_server_options() const {
    server::MockServerOptions options;
    options.host = server_.listen_ip;
    options.port = server_.listen_port;
    options.record_requests = server_.record_requests;
    options.worker_threads = server_.worker_threads;
    options.max_connections = server_.max_connections;
    options.drain_timeout_ms = server_.drain_timeout_ms;
    options.idle_timeout_ms = server_.idle_timeout_ms;
    options.max_body_size = static_cast<size_t>(server_.max_body_size);
    options.backlog = static_cast<int>(server_.backlog);
    return options;
}

mock::Mock build_mock(const MockConfig& cfg) {
    mock::Mock m;
    if (!cfg.method.empty()) m.and_matcher(matcher::method(cfg.method));
    if (!cfg.path.empty()) m.and_matcher(matcher::path(cfg.path));
    if (!cfg.path_prefix.empty()) m.and_matcher(matcher::path_prefix(cfg.path_prefix));
    for (const auto& h : cfg.headers) {
        m.and_matcher(matcher::header(h.first, h.second));
    }
    for (const auto& q : cfg.query) {
        m.and_matcher(matcher::query_param(q.first, q.second));
    }
    if (!cfg.body_contains.empty()) m.and_matcher(matcher::body_contains(cfg.body_contains));
    if (!cfg.body_json.empty()) m.and_matcher(matcher::body_json(cfg.body_json));
    if (m.matchers().empty()) {
        m.and_matcher(matcher::any());
    }

    mock::ResponseTemplate response(cfg.response.status);
    for (const auto& h : cfg.response.headers) {
        response.insert_header(h.first, h.second);
    }
    if (cfg.response.body_is_json) {
        response.set_body_json(cfg.response.body);
    } else {
        response.set_body_string(cfg.response.body);
    }
    response.set_delay_ms(cfg.response.delay_ms);

    m.respond_with(response)
     .expect(mock::Expectation(cfg.expect.min,
                               cfg.expect.has_max ? cfg.expect.max : mock::Expectation::UNBOUNDED))
     .named(cfg.name)
     .up_to_n_times(cfg.up_to_n_times);
    return m;
}

std::vector<mock::Mock> Config::build_mocks() const {
    std::vector<mock::Mock> mocks;
    mocks.reserve(mocks_.size());
    for (const auto& cfg : mocks_) {
        mocks.push_back(build_mock(cfg));
    }
    return mocks;
}

Result<std::string> Config::to_json_string() const {
    json j;
    // server
    j["server"]["listen_ip"] = server_.listen_ip;
    j["server"]["listen_port"] = server_.listen_port;
    j["server"]["record_requests"] = server_.record_requests;
    j["server"]["worker_threads"] = server_.worker_threads;
    j["server"]["max_connections"] = server_.max_connections;
    j["server"]["drain_timeout_ms"] = server_.drain_timeout_ms;
    j["server"]["idle_timeout_ms"] = server_.idle_timeout_ms;
    j["server"]["max_body_size"] = server_.max_body_size;
    j["server"]["backlog"] = server_.backlog;

    // logging
    j["logging"]["level"] = logging_.level;
    j["logging"]["file"] = logging_.file;
    j["logging"]["console_output"] = logging_.console_output;

    // mocks
    j["mocks"] = json::array();
    for (const auto& mock : mocks_) {
        j["mocks"].push_back(details::mock_to_json(mock));
    }

    try {
        return make_ok(j.dump(4));
    } catch (const json::type_error& e) {
        // 非UTF-8字符串无法序列化
        return make_err<std::string>(ErrorCode::OPERATION_FAILED,
                                     std::string("Failed to serialize config to JSON: ") + e.what());
    }
}

void Config::reset() {
    server_ = ServerConfig();
    logging_ = LoggingConfig();
    mocks_.clear();
}

} // namespace config
} // namespace http_mock_server

// 文件结束
