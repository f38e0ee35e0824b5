// =============================================================================
//  HTTP Mock Server - Integration Tests
//  文件: test_basic_requests.cpp
//  描述: 基础请求匹配与记录集成测试
//  版权: Copyright (c) 2026
// =============================================================================
#include "test_fixture.hpp"

namespace http_mock_server {
namespace integration_test {

class BasicRequestTest : public IntegrationTest {};

// IT001: 后挂载的具体规则覆盖先挂载的兜底规则
TEST_F(BasicRequestTest, IT001_SpecificRuleOverridesCatchAll) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    ASSERT_TRUE(server.mount(text_mock(matcher::any(), "fallback", 500)).is_ok());
    ASSERT_TRUE(server.mount(text_mock(matcher::all_of({matcher::method("GET"),
                                                        matcher::path("/hello")}),
                                       "world")).is_ok());

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    HttpResponse response;
    ASSERT_TRUE(client.request("GET", "/hello", &response));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "world");

    TestClient other("127.0.0.1", port);
    ASSERT_TRUE(other.connect());
    ASSERT_TRUE(other.request("POST", "/hello", &response, {}, "x"));
    EXPECT_EQ(response.status_code, 500);
    EXPECT_EQ(response.body, "fallback");

    auto report = server.stop();
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().passed());
}

// IT002: 无匹配规则返回404且响应体为空
TEST_F(BasicRequestTest, IT002_UnmatchedRequestGets404) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    ASSERT_TRUE(server.mount(text_mock(matcher::path("/known"), "ok")).is_ok());

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    HttpResponse response;
    ASSERT_TRUE(client.request("GET", "/unknown", &response));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.status_text, "Not Found");
    EXPECT_EQ(response.header("Content-Length"), "0");
    EXPECT_TRUE(response.body.empty());

    // 未匹配的请求同样被记录
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].path(), "/unknown");
}

// IT003: 请求日志保留方法、路径、重复头部及二进制请求体
TEST_F(BasicRequestTest, IT003_RequestLogKeepsWireRequest) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    std::string body("a\0b\xff\r\n", 6);
    std::string raw = "PUT /items/7?tag=x%20y HTTP/1.1\r\n"
                      "Host: 127.0.0.1\r\n"
                      "X-Tag: one\r\n"
                      "X-Tag: two\r\n"
                      "Connection: close\r\n"
                      "Content-Length: 6\r\n"
                      "\r\n" + body;

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw(raw));
    HttpResponse response;
    ASSERT_TRUE(client.receive_response(&response));
    EXPECT_EQ(response.status_code, 404);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    const protocol::HttpRequest& recorded = requests[0];
    EXPECT_EQ(recorded.method(), "PUT");
    EXPECT_EQ(recorded.path(), "/items/7");
    EXPECT_EQ(recorded.query(), "tag=x%20y");
    EXPECT_EQ(recorded.headers().get_all("x-tag"), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(recorded.body_string(), body);
    EXPECT_FALSE(recorded.peer_address().empty());

    std::string tag;
    EXPECT_TRUE(recorded.query_param("tag", &tag));
    EXPECT_EQ(tag, "x y");
}

// IT004: 关闭记录后请求正常响应但日志为空
TEST_F(BasicRequestTest, IT004_RecordingDisabled) {
    options_.record_requests = false;
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    auto id = server.mount(text_mock(matcher::any(), "ok").expect(1));
    ASSERT_TRUE(id.is_ok());

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    HttpResponse response;
    ASSERT_TRUE(client.request("GET", "/", &response));
    EXPECT_EQ(response.status_code, 200);

    EXPECT_TRUE(server.requests().empty());
    EXPECT_EQ(server.hits(id.value()).value(), 1u);

    auto report = server.stop();
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().passed());
}

// IT005: 作用域规则释放时校验并卸载，之后同一请求落到旧规则
TEST_F(BasicRequestTest, IT005_ScopedRuleReleasedOverTcp) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    ASSERT_TRUE(server.mount(text_mock(matcher::path("/item"), "global")).is_ok());

    HttpResponse response;
    {
        auto guard = server.mount_as_scoped(text_mock(matcher::path("/item"), "scoped").expect(2));
        ASSERT_TRUE(guard.is_ok());

        for (int i = 0; i < 2; ++i) {
            TestClient client("127.0.0.1", port);
            ASSERT_TRUE(client.connect());
            ASSERT_TRUE(client.request("GET", "/item", &response));
            EXPECT_EQ(response.body, "scoped");
        }

        mock::VerificationReport report = guard.value().release();
        EXPECT_TRUE(report.passed());
        EXPECT_EQ(report.verified_count(), 1u);
    }

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.request("GET", "/item", &response));
    EXPECT_EQ(response.body, "global");
    EXPECT_EQ(server.mounted_count(), 1u);
}

// IT006: 响应模板的状态码、头部、JSON体按原样发送
TEST_F(BasicRequestTest, IT006_ResponseTemplateOnWire) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    mock::ResponseTemplate created(201);
    created.insert_header("Location", "/users/42")
           .insert_header("X-Request-Id", "abc")
           .set_body_json("{\"id\":42}");
    ASSERT_TRUE(server.mount(mock::Mock(matcher::all_of({matcher::method("POST"),
                                                         matcher::path("/users")}))
                                 .respond_with(created)).is_ok());

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    HttpResponse response;
    ASSERT_TRUE(client.request("POST", "/users", &response,
                               {{"Content-Type", "application/json"}}, "{\"name\":\"x\"}"));
    EXPECT_EQ(response.status_code, 201);
    EXPECT_EQ(response.status_text, "Created");
    EXPECT_EQ(response.header("Location"), "/users/42");
    EXPECT_EQ(response.header("X-Request-Id"), "abc");
    EXPECT_EQ(response.header("Content-Type"), "application/json");
    EXPECT_EQ(response.body, "{\"id\":42}");
}

// IT007: 请求体匹配（JSON语义相等、子串）与查询参数匹配
TEST_F(BasicRequestTest, IT007_BodyAndQueryMatching) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    ASSERT_TRUE(server.mount(text_mock(matcher::body_json("{\"a\":1,\"b\":[1,2]}"), "json"))
                    .is_ok());
    ASSERT_TRUE(server.mount(text_mock(matcher::query_param("q", "a b"), "query")).is_ok());

    HttpResponse response;
    {
        TestClient client("127.0.0.1", port);
        ASSERT_TRUE(client.connect());
        ASSERT_TRUE(client.request("POST", "/x", &response, {}, "{ \"b\": [1, 2], \"a\": 1 }"));
        EXPECT_EQ(response.body, "json");
    }
    {
        TestClient client("127.0.0.1", port);
        ASSERT_TRUE(client.connect());
        ASSERT_TRUE(client.request("GET", "/search?q=a+b", &response));
        EXPECT_EQ(response.body, "query");
    }
    {
        TestClient client("127.0.0.1", port);
        ASSERT_TRUE(client.connect());
        ASSERT_TRUE(client.request("POST", "/x", &response, {}, "not json"));
        EXPECT_EQ(response.status_code, 404);
    }
}

// IT008: 头部匹配名称大小写不敏感
TEST_F(BasicRequestTest, IT008_HeaderNameCaseInsensitive) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    ASSERT_TRUE(server.mount(text_mock(matcher::header("x-token", "secret"), "ok")).is_ok());

    TestClient client("127.0.0.1", port);
    ASSERT_TRUE(client.connect());
    HttpResponse response;
    ASSERT_TRUE(client.request("GET", "/", &response, {{"X-TOKEN", "secret"}}));
    EXPECT_EQ(response.status_code, 200);
}

} // namespace integration_test
} // namespace http_mock_server
