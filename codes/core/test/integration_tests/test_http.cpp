// =============================================================================
//  HTTP Mock Server - Integration Tests
//  文件: test_http.cpp
//  描述: HTTP/1.1 连接语义与错误请求集成测试
//  版权: Copyright (c) 2026
// =============================================================================
#include "test_fixture.hpp"

namespace http_mock_server {
namespace integration_test {

class HttpTest : public IntegrationTest {
protected:
    void SetUp() override {
        IntegrationTest::SetUp();
        server_.reset(new server::MockServer(options_));
        port_ = start_server(*server_);
        ASSERT_NE(port_, 0);
        rule_id_ = server_->mount(text_mock(matcher::any(), "abc")).value();
    }

    void TearDown() override {
        server_->stop();
        server_.reset();
    }

    std::unique_ptr<server::MockServer> server_;
    uint16_t port_ = 0;
    uint64_t rule_id_ = 0;
};

// IT020: keep-alive 连接上连续处理多个请求
TEST_F(HttpTest, IT020_KeepAliveMultipleRequests) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());

    for (int i = 0; i < 3; ++i) {
        HttpResponse response;
        ASSERT_TRUE(client.request("GET", "/r" + std::to_string(i), &response, {}, "", true));
        EXPECT_EQ(response.status_code, 200);
        EXPECT_EQ(response.body, "abc");
        EXPECT_NE(response.header("Connection"), "close");
    }

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].path(), "/r0");
    EXPECT_EQ(requests[2].path(), "/r2");
    EXPECT_EQ(server_->hits(rule_id_).value(), 3u);
}

// IT021: 一次写入的两个流水线请求按顺序响应
TEST_F(HttpTest, IT021_PipelinedRequests) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());

    std::string both = TestClient::build_request("GET", "/first", {}, "", true) +
                       TestClient::build_request("POST", "/second", {}, "xy", false);
    ASSERT_TRUE(client.send_raw(both));

    HttpResponse first;
    HttpResponse second;
    ASSERT_TRUE(client.receive_response(&first));
    ASSERT_TRUE(client.receive_response(&second));
    EXPECT_EQ(first.status_code, 200);
    EXPECT_EQ(second.status_code, 200);
    EXPECT_TRUE(client.wait_for_close(2000));

    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].path(), "/first");
    EXPECT_EQ(requests[1].path(), "/second");
    EXPECT_EQ(requests[1].body_string(), "xy");
}

// IT022: HTTP/1.0 默认短连接
TEST_F(HttpTest, IT022_Http10ClosesConnection) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("GET /old HTTP/1.0\r\nHost: x\r\n\r\n"));

    HttpResponse response;
    ASSERT_TRUE(client.receive_response(&response));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "abc");
    EXPECT_TRUE(client.wait_for_close(2000));
    ASSERT_EQ(server_->requests().size(), 1u);
    EXPECT_EQ(server_->requests()[0].version(), "HTTP/1.0");
}

// IT023: HEAD 响应带Content-Length但不带响应体
TEST_F(HttpTest, IT023_HeadRequestHasNoBody) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());

    HttpResponse head;
    ASSERT_TRUE(client.request("HEAD", "/", &head, {}, "", true));
    EXPECT_EQ(head.status_code, 200);
    EXPECT_EQ(head.header("Content-Length"), "3");
    EXPECT_TRUE(head.body.empty());

    // 同一连接上的下一个响应能被正确定界
    HttpResponse get;
    ASSERT_TRUE(client.request("GET", "/", &get, {}, "", true));
    EXPECT_EQ(get.status_code, 200);
    EXPECT_EQ(get.body, "abc");
}

// IT024: 语法错误请求返回400，不记录不计数
TEST_F(HttpTest, IT024_MalformedRequestGets400) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("garbage\r\n\r\n"));

    HttpResponse response;
    ASSERT_TRUE(client.receive_response(&response));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.header("Connection"), "close");
    EXPECT_TRUE(client.wait_for_close(2000));

    EXPECT_TRUE(server_->requests().empty());
    EXPECT_EQ(server_->hits(rule_id_).value(), 0u);
}

// IT025: chunked 请求体返回501
TEST_F(HttpTest, IT025_ChunkedBodyGets501) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("POST /c HTTP/1.1\r\nHost: x\r\n"
                                "Transfer-Encoding: chunked\r\n\r\n"
                                "3\r\nabc\r\n0\r\n\r\n"));

    HttpResponse response;
    ASSERT_TRUE(client.receive_response(&response));
    EXPECT_EQ(response.status_code, 501);
    EXPECT_TRUE(server_->requests().empty());
}

// IT026: 不支持的协议版本返回505
TEST_F(HttpTest, IT026_UnsupportedVersionGets505) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("GET / HTTP/2.0\r\nHost: x\r\n\r\n"));

    HttpResponse response;
    ASSERT_TRUE(client.receive_response(&response));
    EXPECT_EQ(response.status_code, 505);
    EXPECT_TRUE(server_->requests().empty());
}

// IT027: 冲突的Content-Length返回400
TEST_F(HttpTest, IT027_ConflictingContentLengthGets400) {
    TestClient client("127.0.0.1", port_);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.send_raw("POST / HTTP/1.1\r\nHost: x\r\n"
                                "Content-Length: 2\r\nContent-Length: 3\r\n\r\nabc"));

    HttpResponse response;
    ASSERT_TRUE(client.receive_response(&response));
    EXPECT_EQ(response.status_code, 400);
}

class BodyLimitTest : public IntegrationTest {};

// IT028: 超过请求体上限返回413
TEST_F(BodyLimitTest, IT028_BodyTooLargeGets413) {
    options_.max_body_size = 16;
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);
    ASSERT_TRUE(server.mount(text_mock(matcher::any(), "ok")).is_ok());

    HttpResponse response;
    {
        TestClient client("127.0.0.1", port);
        ASSERT_TRUE(client.connect());
        ASSERT_TRUE(client.request("POST", "/big", &response, {}, std::string(17, 'x')));
        EXPECT_EQ(response.status_code, 413);
    }
    {
        TestClient client("127.0.0.1", port);
        ASSERT_TRUE(client.connect());
        ASSERT_TRUE(client.request("POST", "/fits", &response, {}, std::string(16, 'x')));
        EXPECT_EQ(response.status_code, 200);
    }

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].path(), "/fits");
}

} // namespace integration_test
} // namespace http_mock_server
