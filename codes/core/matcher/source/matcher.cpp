// =============================================================================
//  HTTP Mock Server - Matcher Module
//  文件: matcher.cpp
//  描述: 内置匹配器实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "matcher/matcher.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <exception>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace http_mock_server {
namespace matcher {

using Json = nlohmann::json;
using protocol::HttpRequest;

namespace {

class AnyMatcher : public Matcher {
public:
    bool matches(const HttpRequest&) const override {
        return true;
    }
    std::string describe() const override {
        return "any request";
    }
};

class MethodMatcher : public Matcher {
public:
    explicit MethodMatcher(const std::string& method) : method_(method) {}

    bool matches(const HttpRequest& request) const override {
        return protocol::EqualsIgnoreCase(request.method(), method_);
    }
    std::string describe() const override {
        return "method == " + method_;
    }

private:
    std::string method_;
};

class PathMatcher : public Matcher {
public:
    explicit PathMatcher(const std::string& path) : path_(path) {}

    bool matches(const HttpRequest& request) const override {
        return request.path() == path_;
    }
    std::string describe() const override {
        return "path == " + path_;
    }

private:
    std::string path_;
};

class PathPrefixMatcher : public Matcher {
public:
    explicit PathPrefixMatcher(const std::string& prefix) : prefix_(prefix) {}

    bool matches(const HttpRequest& request) const override {
        return request.path().compare(0, prefix_.size(), prefix_) == 0;
    }
    std::string describe() const override {
        return "path starts with " + prefix_;
    }

private:
    std::string prefix_;
};

class HeaderMatcher : public Matcher {
public:
    HeaderMatcher(const std::string& name, const std::string& value)
        : name_(name), value_(value) {}

    bool matches(const HttpRequest& request) const override {
        std::vector<std::string> values = request.headers().get_all(name_);
        return std::find(values.begin(), values.end(), value_) != values.end();
    }
    std::string describe() const override {
        return "header " + name_ + " == " + value_;
    }

private:
    std::string name_;
    std::string value_;
};

class HeaderExistsMatcher : public Matcher {
public:
    explicit HeaderExistsMatcher(const std::string& name) : name_(name) {}

    bool matches(const HttpRequest& request) const override {
        return request.headers().contains(name_);
    }
    std::string describe() const override {
        return "header " + name_ + " exists";
    }

private:
    std::string name_;
};

class QueryParamMatcher : public Matcher {
public:
    QueryParamMatcher(const std::string& name, const std::string& value)
        : name_(name), value_(value) {}

    bool matches(const HttpRequest& request) const override {
        std::string actual;
        return request.query_param(name_, &actual) && actual == value_;
    }
    std::string describe() const override {
        return "query " + name_ + " == " + value_;
    }

private:
    std::string name_;
    std::string value_;
};

class BodyMatcher : public Matcher {
public:
    explicit BodyMatcher(const std::vector<uint8_t>& body) : body_(body) {}

    bool matches(const HttpRequest& request) const override {
        return request.body() == body_;
    }
    std::string describe() const override {
        return "body == <" + std::to_string(body_.size()) + " bytes>";
    }

private:
    std::vector<uint8_t> body_;
};

class BodyContainsMatcher : public Matcher {
public:
    explicit BodyContainsMatcher(const std::string& needle)
        : needle_(needle), needle_bytes_(protocol::ToBytes(needle)) {}

    // 按字节比较，非ASCII内容同样适用
    bool matches(const HttpRequest& request) const override {
        const auto& body = request.body();
        return std::search(body.begin(), body.end(),
                           needle_bytes_.begin(), needle_bytes_.end()) != body.end();
    }
    std::string describe() const override {
        return "body contains \"" + needle_ + "\"";
    }

private:
    std::string needle_;
    std::vector<uint8_t> needle_bytes_;
};

class BodyJsonMatcher : public Matcher {
public:
    explicit BodyJsonMatcher(const std::string& expected_json)
        : source_(expected_json)
        , valid_(false)
    {
        try {
            expected_ = Json::parse(expected_json);
            valid_ = true;
        } catch (const Json::parse_error& e) {
            LOG_WARN("Matcher", "body_json expectation is not valid JSON, rule will never match: %s",
                     e.what());
        }
    }

    // 请求体解析失败时 Json::parse 抛出 parse_error，由 evaluate() 按不匹配处理
    bool matches(const HttpRequest& request) const override {
        if (!valid_) {
            return false;
        }
        const auto& body = request.body();
        Json actual = Json::parse(body.begin(), body.end());
        return actual == expected_;
    }
    std::string describe() const override {
        return "body json == " + (valid_ ? expected_.dump() : "<invalid: " + source_ + ">");
    }

private:
    std::string source_;
    Json expected_;
    bool valid_;
};

class FunctionMatcher : public Matcher {
public:
    FunctionMatcher(const std::string& description, MatchFunction func)
        : description_(description), func_(std::move(func)) {}

    bool matches(const HttpRequest& request) const override {
        return func_ ? func_(request) : false;
    }
    std::string describe() const override {
        return description_;
    }

private:
    std::string description_;
    MatchFunction func_;
};

class AllOfMatcher : public Matcher {
public:
    explicit AllOfMatcher(const std::vector<MatcherPtr>& matchers) : matchers_(matchers) {}

    bool matches(const HttpRequest& request) const override {
        for (const auto& m : matchers_) {
            if (!evaluate(m.get(), request)) {
                return false;
            }
        }
        return true;
    }
    std::string describe() const override {
        return "(" + describe_all(matchers_) + ")";
    }

private:
    std::vector<MatcherPtr> matchers_;
};

class AnyOfMatcher : public Matcher {
public:
    explicit AnyOfMatcher(const std::vector<MatcherPtr>& matchers) : matchers_(matchers) {}

    bool matches(const HttpRequest& request) const override {
        for (const auto& m : matchers_) {
            if (evaluate(m.get(), request)) {
                return true;
            }
        }
        return false;
    }
    std::string describe() const override {
        std::string out = "(";
        for (size_t i = 0; i < matchers_.size(); ++i) {
            if (i > 0) {
                out += " OR ";
            }
            out += matchers_[i] ? matchers_[i]->describe() : "<null>";
        }
        return out + ")";
    }

private:
    std::vector<MatcherPtr> matchers_;
};

class NotMatcher : public Matcher {
public:
    explicit NotMatcher(MatcherPtr inner) : inner_(std::move(inner)) {}

    bool matches(const HttpRequest& request) const override {
        return inner_ && !evaluate(inner_.get(), request);
    }
    std::string describe() const override {
        return "NOT " + (inner_ ? inner_->describe() : std::string("<null>"));
    }

private:
    MatcherPtr inner_;
};

} // namespace

bool evaluate(const Matcher* matcher, const HttpRequest& request) {
    if (matcher == nullptr) {
        return false;
    }
    try {
        return matcher->matches(request);
    } catch (const std::exception& e) {
        LOG_DEBUG("Matcher", "Matcher [%s] failed on %s %s, treated as no match: %s",
                  matcher->describe().c_str(), request.method().c_str(),
                  request.target().c_str(), e.what());
        return false;
    }
}

std::string describe_all(const std::vector<MatcherPtr>& matchers) {
    std::string out;
    for (size_t i = 0; i < matchers.size(); ++i) {
        if (i > 0) {
            out += " AND ";
        }
        out += matchers[i] ? matchers[i]->describe() : "<null>";
    }
    return out;
}

MatcherPtr any() {
    return std::make_shared<AnyMatcher>();
}

MatcherPtr method(const std::string& method) {
    return std::make_shared<MethodMatcher>(method);
}

MatcherPtr path(const std::string& path) {
    return std::make_shared<PathMatcher>(path);
}

MatcherPtr path_prefix(const std::string& prefix) {
    return std::make_shared<PathPrefixMatcher>(prefix);
}

MatcherPtr header(const std::string& name, const std::string& value) {
    return std::make_shared<HeaderMatcher>(name, value);
}

MatcherPtr header_exists(const std::string& name) {
    return std::make_shared<HeaderExistsMatcher>(name);
}

MatcherPtr query_param(const std::string& name, const std::string& value) {
    return std::make_shared<QueryParamMatcher>(name, value);
}

MatcherPtr body_bytes(const std::vector<uint8_t>& body) {
    return std::make_shared<BodyMatcher>(body);
}

MatcherPtr body_string(const std::string& body) {
    return std::make_shared<BodyMatcher>(protocol::ToBytes(body));
}

MatcherPtr body_contains(const std::string& needle) {
    return std::make_shared<BodyContainsMatcher>(needle);
}

MatcherPtr body_json(const std::string& expected_json) {
    return std::make_shared<BodyJsonMatcher>(expected_json);
}

MatcherPtr custom(const std::string& description, MatchFunction func) {
    return std::make_shared<FunctionMatcher>(description, std::move(func));
}

MatcherPtr all_of(const std::vector<MatcherPtr>& matchers) {
    return std::make_shared<AllOfMatcher>(matchers);
}

MatcherPtr any_of(const std::vector<MatcherPtr>& matchers) {
    return std::make_shared<AnyOfMatcher>(matchers);
}

MatcherPtr negate(MatcherPtr matcher) {
    return std::make_shared<NotMatcher>(std::move(matcher));
}

} // namespace matcher
} // namespace http_mock_server

// 文件结束
