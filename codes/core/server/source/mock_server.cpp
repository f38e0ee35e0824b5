// =============================================================================
//  HTTP Mock Server - Server Module
//  文件: mock_server.cpp
//  描述: MockServer类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "server/mock_server.hpp"
#include "config/config.hpp"
#include "utils/logger.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <utility>

namespace http_mock_server {
namespace server {

constexpr int MockServer::ACCEPT_POLL_INTERVAL_MS;
constexpr uint32_t MockServer::FORCE_CLOSE_WAIT_MS;

const char* server_state_to_string(ServerState state) {
    switch (state) {
        case ServerState::CREATED: return "CREATED";
        case ServerState::RUNNING: return "RUNNING";
        case ServerState::STOPPING: return "STOPPING";
        case ServerState::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
    }
}

MockServer::MockServer(const MockServerOptions& options)
    : options_(options)
    , mount_table_(std::make_shared<mock::MountTable>())
    , request_log_(options.record_requests)
    , listen_fd_(-1)
    , bound_port_(0)
    , state_(ServerState::CREATED)
    , accepting_(false)
    , stopping_(false)
{
}

MockServer::~MockServer()
{
    if (state() != ServerState::RUNNING) {
        return;
    }
    // 析构时已无调用方接收报告，只能记录日志
    auto result = stop();
    if (result.is_ok() && !result.value().passed()) {
        LOG_ERROR("MockServer", "Mock server destroyed with unmet expectations: %s",
                  result.value().to_string().c_str());
    }
}

utils::Result<void> MockServer::start()
{
    return start(options_.host, options_.port);
}

utils::Result<void> MockServer::start(const std::string& host, uint16_t port)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    // 步骤1: 检查当前状态
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ServerState::CREATED) {
            return utils::make_err(utils::ErrorCode::SERVER_INVALID_STATE,
                                   std::string("Cannot start server in state ") +
                                   server_state_to_string(state_));
        }
    }

    // 步骤2: 初始化监听socket，失败时保持CREATED状态，允许重试
    auto ret = init_listen_socket(host, port);
    if (ret.is_err()) {
        return ret;
    }

    // 步骤3: 创建子模块
    conn_manager_ = std::make_unique<connection::ConnectionManager>();
    worker_pool_ = std::make_unique<WorkerPool>(options_.worker_threads, options_.max_connections);
    worker_pool_->start();

    // 步骤4: 设置状态并启动接收线程
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ServerState::RUNNING;
    }
    accepting_ = true;
    accept_thread_ = std::thread(&MockServer::accept_loop, this);

    LOG_INFO("MockServer", "Mock server listening on %s:%u",
             bound_host_.c_str(), static_cast<unsigned>(bound_port_));
    return utils::make_ok();
}

utils::Result<mock::VerificationReport> MockServer::stop()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    // 步骤1: 检查当前状态，进入STOPPING后不再接受挂载
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ServerState::STOPPED) {
            return utils::make_err<mock::VerificationReport>(utils::ErrorCode::SERVER_ALREADY_STOPPED);
        }
        if (state_ != ServerState::RUNNING) {
            return utils::make_err<mock::VerificationReport>(utils::ErrorCode::SERVER_INVALID_STATE,
                                                             "Server was never started");
        }
        state_ = ServerState::STOPPING;
    }

    // 步骤2: 排空连接
    graceful_shutdown();

    // 步骤3: 排空后校验仍挂载的全部规则
    mock::VerificationReport report = mount_table_->drain();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ServerState::STOPPED;
    }

    LOG_INFO("MockServer", "Mock server on %s:%u stopped, %zu rule(s) verified",
             bound_host_.c_str(), static_cast<unsigned>(bound_port_), report.verified_count());
    return utils::make_ok(std::move(report));
}

mock::VerificationReport MockServer::verify() const
{
    return mount_table_->verify_all();
}

void MockServer::reset()
{
    mount_table_->clear();
    request_log_.clear();
    LOG_DEBUG("MockServer", "Rules and request log reset");
}

ServerState MockServer::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

utils::Result<std::string> MockServer::address() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ServerState::CREATED) {
        return utils::make_err<std::string>(utils::ErrorCode::SERVER_INVALID_STATE,
                                            "Server has not been started");
    }
    return utils::make_ok(bound_host_ + ":" + std::to_string(bound_port_));
}

utils::Result<uint16_t> MockServer::port() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ServerState::CREATED) {
        return utils::make_err<uint16_t>(utils::ErrorCode::SERVER_INVALID_STATE,
                                         "Server has not been started");
    }
    return utils::make_ok(bound_port_);
}

utils::Result<std::string> MockServer::uri() const
{
    auto addr = address();
    if (addr.is_err()) {
        return addr;
    }
    return utils::make_ok("http://" + addr.value());
}

utils::Result<uint64_t> MockServer::mount(const mock::Mock& mock)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ServerState::STOPPING || state_ == ServerState::STOPPED) {
        return utils::make_err<uint64_t>(utils::ErrorCode::SERVER_INVALID_STATE,
                                         "Cannot mount on a stopped server");
    }
    return mount_table_->mount(mock, mock::MountScope::GLOBAL);
}

utils::Result<ScopeGuard> MockServer::mount_as_scoped(const mock::Mock& mock)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ServerState::STOPPING || state_ == ServerState::STOPPED) {
        return utils::make_err<ScopeGuard>(utils::ErrorCode::SERVER_INVALID_STATE,
                                           "Cannot mount on a stopped server");
    }
    auto id = mount_table_->mount(mock, mock::MountScope::SCOPED);
    if (id.is_err()) {
        return utils::make_err<ScopeGuard>(id.error_code(), id.error_message());
    }
    return utils::Result<ScopeGuard>(ScopeGuard(mount_table_, id.value()));
}

utils::Result<std::vector<uint64_t>> MockServer::mount_from_config(const config::Config& config)
{
    std::vector<mock::Mock> mocks = config.build_mocks();
    std::vector<uint64_t> ids;
    ids.reserve(mocks.size());
    for (size_t i = 0; i < mocks.size(); ++i) {
        auto id = mount(mocks[i]);
        if (id.is_err()) {
            return utils::make_err<std::vector<uint64_t>>(
                id.error_code(), "mocks[" + std::to_string(i) + "]: " + id.error_message());
        }
        ids.push_back(id.value());
    }
    LOG_INFO("MockServer", "Mounted %zu mock(s) from config", ids.size());
    return utils::make_ok(std::move(ids));
}

utils::Result<uint64_t> MockServer::hits(uint64_t rule_id) const
{
    return mount_table_->call_count(rule_id);
}

size_t MockServer::mounted_count() const
{
    return mount_table_->size();
}

std::vector<protocol::HttpRequest> MockServer::requests() const
{
    return request_log_.snapshot();
}

protocol::HttpResponse MockServer::handle(const protocol::HttpRequest& request)
{
    request_log_.append(request);

    mock::ResponseTemplate response;
    uint64_t rule_id = 0;
    if (!mount_table_->dispatch(request, &response, &rule_id)) {
        LOG_DEBUG("MockServer", "%s %s matched no rule, responding 404",
                  request.method().c_str(), request.target().c_str());
        return mock::not_found_response().response();
    }

    LOG_DEBUG("MockServer", "%s %s matched rule #%llu, responding %d",
              request.method().c_str(), request.target().c_str(),
              static_cast<unsigned long long>(rule_id), response.status_code());

    // 延迟在锁外执行
    if (response.delay_ms() > 0) {
        wait_delay(response.delay_ms());
    }
    return response.response();
}

utils::Result<void> MockServer::init_listen_socket(const std::string& host, uint16_t port)
{
    // 填充sockaddr_in结构
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string ip = (host == "localhost") ? "127.0.0.1" : host;
    int ret = inet_pton(AF_INET, ip.c_str(), &addr.sin_addr);
    if (ret != 1) {
        LOG_ERROR("MockServer", "Invalid IP address format: %s", host.c_str());
        return utils::make_err(utils::ErrorCode::INVALID_ARGUMENT, "Invalid IPv4 address: " + host);
    }

    // 创建socket
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        LOG_ERROR("MockServer", "Failed to create socket, errno=%d", errno);
        return utils::make_err(utils::ErrorCode::NETWORK_SOCKET_ERROR,
                               std::string("socket() failed: ") + std::strerror(errno));
    }

    // 设置SO_REUSEADDR选项
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_WARN("MockServer", "Failed to set SO_REUSEADDR, errno=%d", errno);
    }

    // 绑定
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        LOG_ERROR("MockServer", "Failed to bind to %s:%u", ip.c_str(), static_cast<unsigned>(port));
        ::close(fd);
        return utils::make_err(utils::ErrorCode::NETWORK_BIND_ERROR,
                               "Cannot bind " + ip + ":" + std::to_string(port) + ": " +
                               std::strerror(err));
    }

    // 监听
    int backlog = options_.backlog > 0 ? options_.backlog : SOMAXCONN;
    if (listen(fd, backlog) < 0) {
        int err = errno;
        LOG_ERROR("MockServer", "Failed to listen on %s:%u", ip.c_str(), static_cast<unsigned>(port));
        ::close(fd);
        return utils::make_err(utils::ErrorCode::NETWORK_LISTEN_ERROR,
                               std::string("listen() failed: ") + std::strerror(err));
    }

    // 端口为0时取系统分配的端口
    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) < 0) {
        int err = errno;
        ::close(fd);
        return utils::make_err(utils::ErrorCode::NETWORK_SOCKET_ERROR,
                               std::string("getsockname() failed: ") + std::strerror(err));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    listen_fd_ = fd;
    bound_host_ = ip;
    bound_port_ = ntohs(bound.sin_port);
    return utils::make_ok();
}

void MockServer::accept_loop()
{
    while (accepting_) {
        struct pollfd pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, ACCEPT_POLL_INTERVAL_MS);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("MockServer", "poll() on listen socket failed, errno=%d", errno);
            break;
        }
        if (ret == 0) {
            continue;
        }

        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int fd = ::accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &addr_len);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
                continue;
            }
            // 文件描述符耗尽等情况，稍后重试
            LOG_WARN("MockServer", "accept() failed, errno=%d", errno);
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_INTERVAL_MS));
            continue;
        }

        if (!accepting_) {
            ::close(fd);
            break;
        }

        auto conn = conn_manager_->create_connection(fd, bound_port_);
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        conn->set_client_info(ip, ntohs(client_addr.sin_port));

        LOG_DEBUG("MockServer", "Accepted connection %llu from %s",
                  static_cast<unsigned long long>(conn->get_id()), conn->get_peer_address().c_str());

        if (!worker_pool_->post_task([this, conn]() { serve_connection(conn); })) {
            LOG_WARN("MockServer", "Worker pool rejected connection %llu",
                     static_cast<unsigned long long>(conn->get_id()));
            conn_manager_->remove_connection(conn->get_id());
        }
    }
}

void MockServer::serve_connection(std::shared_ptr<connection::Connection> conn)
{
    connection::ConnectionOptions conn_options;
    conn_options.max_body_size = options_.max_body_size;
    conn_options.idle_timeout_ms = options_.idle_timeout_ms;

    conn->serve([this](const protocol::HttpRequest& request) { return handle(request); },
                conn_options);
    conn_manager_->remove_connection(conn->get_id());
}

void MockServer::graceful_shutdown()
{
    // 步骤1: 停止接受新连接
    stop_accepting();

    // 步骤2: 等待处理中的请求（最多drain_timeout_ms）
    wait_pending_requests();

    // 步骤3: 强制关闭剩余连接
    close_all_connections();

    // 步骤4: 停止线程池
    if (worker_pool_) {
        worker_pool_->stop();
    }
}

void MockServer::stop_accepting()
{
    accepting_ = false;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void MockServer::wait_pending_requests()
{
    if (!conn_manager_) {
        return;
    }

    uint32_t idle = conn_manager_->drain_all();
    LOG_DEBUG("MockServer", "Draining: closed %u idle connection(s), %u remaining",
              idle, conn_manager_->get_connection_count());

    if (!conn_manager_->wait_until_empty(options_.drain_timeout_ms)) {
        LOG_WARN("MockServer", "Wait pending requests timeout after %u ms, %u connection(s) left",
                 options_.drain_timeout_ms, conn_manager_->get_connection_count());
    }
}

void MockServer::close_all_connections()
{
    if (!conn_manager_ || conn_manager_->get_connection_count() == 0) {
        return;
    }

    // 打断正在等待的响应延迟
    {
        std::lock_guard<std::mutex> lock(delay_mutex_);
        stopping_ = true;
    }
    delay_cv_.notify_all();

    uint32_t closed = conn_manager_->shutdown_all();
    LOG_WARN("MockServer", "Forcibly closed %u connection(s)", closed);

    if (!conn_manager_->wait_until_empty(FORCE_CLOSE_WAIT_MS)) {
        LOG_ERROR("MockServer", "Close all connections timeout after %u ms", FORCE_CLOSE_WAIT_MS);
    }
}

void MockServer::wait_delay(uint32_t delay_ms)
{
    std::unique_lock<std::mutex> lock(delay_mutex_);
    delay_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                       [this] { return stopping_.load(); });
}

} // namespace server
} // namespace http_mock_server

// 文件结束
