// =============================================================================
//  HTTP Mock Server - Integration Tests
//  文件: test_stress.cpp
//  描述: 并发请求集成测试
//  版权: Copyright (c) 2026
// =============================================================================
#include "test_fixture.hpp"

namespace http_mock_server {
namespace integration_test {

class StressTest : public IntegrationTest {};

// IT040: 并发客户端的每个请求恰好计数一次
TEST_F(StressTest, IT040_ConcurrentRequestsCountedOnce) {
    const int kClients = 8;
    const int kRequestsPerClient = 25;
    options_.worker_threads = 4;
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);

    auto id = server.mount(text_mock(matcher::method("GET"), "ok")
                               .expect(kClients * kRequestsPerClient));
    ASSERT_TRUE(id.is_ok());

    std::atomic<int> ok_count{0};
    std::vector<std::thread> clients;
    for (int c = 0; c < kClients; ++c) {
        clients.emplace_back([&, c]() {
            TestClient client("127.0.0.1", port);
            if (!client.connect()) {
                return;
            }
            for (int i = 0; i < kRequestsPerClient; ++i) {
                HttpResponse response;
                std::string path = "/c" + std::to_string(c) + "/" + std::to_string(i);
                if (client.request("GET", path, &response, {}, "", true) &&
                    response.status_code == 200) {
                    ok_count.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    EXPECT_EQ(ok_count.load(), kClients * kRequestsPerClient);
    EXPECT_EQ(server.hits(id.value()).value(),
              static_cast<uint64_t>(kClients * kRequestsPerClient));
    EXPECT_EQ(server.requests().size(), static_cast<size_t>(kClients * kRequestsPerClient));

    auto report = server.stop();
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().passed()) << report.value().to_string();
}

// IT041: 同时打开的连接数超过初始工作线程数时仍全部得到服务
TEST_F(StressTest, IT041_MoreConnectionsThanWorkers) {
    options_.worker_threads = 2;
    options_.max_connections = 16;
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);
    ASSERT_TRUE(server.mount(text_mock(matcher::any(), "ok")).is_ok());

    const int kConnections = 6;
    std::vector<std::unique_ptr<TestClient>> clients;
    for (int i = 0; i < kConnections; ++i) {
        clients.emplace_back(new TestClient("127.0.0.1", port));
        ASSERT_TRUE(clients.back()->connect());
    }

    // 先全部建立连接再逐个发请求，空闲连接占住工作线程
    for (int i = kConnections - 1; i >= 0; --i) {
        HttpResponse response;
        ASSERT_TRUE(clients[i]->request("GET", "/", &response, {}, "", true));
        EXPECT_EQ(response.status_code, 200);
    }
}

// IT042: 请求处理中并发挂载与释放作用域规则
TEST_F(StressTest, IT042_ConcurrentMountAndDispatch) {
    server::MockServer server(options_);
    uint16_t port = start_server(server);
    ASSERT_NE(port, 0);
    ASSERT_TRUE(server.mount(text_mock(matcher::any(), "base")).is_ok());

    std::atomic<bool> done{false};
    std::atomic<int> unexpected{0};

    std::thread mounter([&]() {
        while (!done.load()) {
            auto guard = server.mount_as_scoped(text_mock(matcher::path("/x"), "scoped"));
            if (guard.is_err()) {
                unexpected.fetch_add(1);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            guard.value().release();
        }
    });

    std::vector<std::thread> clients;
    for (int c = 0; c < 4; ++c) {
        clients.emplace_back([&]() {
            TestClient client("127.0.0.1", port);
            if (!client.connect()) {
                unexpected.fetch_add(1);
                return;
            }
            for (int i = 0; i < 20; ++i) {
                HttpResponse response;
                if (!client.request("GET", "/x", &response, {}, "", true) ||
                    response.status_code != 200 ||
                    (response.body != "base" && response.body != "scoped")) {
                    unexpected.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }
    done.store(true);
    mounter.join();

    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_EQ(server.mounted_count(), 1u);
    EXPECT_EQ(server.requests().size(), 80u);
}

} // namespace integration_test
} // namespace http_mock_server
