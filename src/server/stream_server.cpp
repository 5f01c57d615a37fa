#include "server/stream_server.hpp"
#include "server/stream_session.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <netdb.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace streamgate {

namespace {

std::string format_peer(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return std::format("[{}]:{}", host, ntohs(in6->sin6_port));
    }
    const auto* in4 = reinterpret_cast<const sockaddr_in*>(&addr);
    inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
    return std::format("{}:{}", host, ntohs(in4->sin_port));
}

uint16_t local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

} // anonymous namespace

StreamServer::StreamServer(StreamServerConfig config,
                           std::shared_ptr<const HealthReporter> health)
    : config_(std::move(config)),
      health_(std::move(health)) {}

StreamServer::~StreamServer() {
    stop();
}

void StreamServer::start() {
    if (running_.load()) return;

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    struct addrinfo* result = nullptr;
    const std::string port_str = std::to_string(config_.address.port);
    const int rc = getaddrinfo(config_.address.host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0) {
        throw std::runtime_error(std::format("Stream: cannot resolve {}: {}",
            config_.address.to_string(), gai_strerror(rc)));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> result_guard(result, &freeaddrinfo);

    server_fd_ = socket(result->ai_family, SOCK_STREAM | SOCK_CLOEXEC, result->ai_protocol);
    if (server_fd_ < 0) {
        throw std::runtime_error(std::format("Stream: socket() failed: {}", strerror(errno)));
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (result->ai_family == AF_INET6) {
        // Dual-stack: "[::]" also accepts IPv4 clients
        int v6only = 0;
        setsockopt(server_fd_, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }

    if (bind(server_fd_, result->ai_addr, result->ai_addrlen) < 0) {
        const std::string reason = strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error(std::format("Stream: bind({}) failed: {}",
            config_.address.to_string(), reason));
    }

    if (listen(server_fd_, 128) < 0) {
        const std::string reason = strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error(std::format("Stream: listen() failed: {}", reason));
    }

    bound_port_.store(local_port(server_fd_));
    running_.store(true);
    accepting_.store(true);

    accept_thread_ = std::jthread([this](std::stop_token) { accept_loop(); });

    utils::log::info(std::format("Stream server listening on {} (max {} connections)",
        ListenAddress{config_.address.host, bound_port()}.to_string(),
        config_.max_connections));
}

void StreamServer::stop() {
    if (!running_.exchange(false)) return;

    stop_accepting();
    if (tracker_.live_count() > 0) {
        tracker_.force_close_all();
    }

    std::vector<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }

    utils::log::info("Stream server stopped");
}

void StreamServer::stop_accepting() {
    tracker_.stop_accepting();
    if (!accepting_.exchange(false)) return;

    // Wakes the blocked accept() on Linux
    shutdown(server_fd_, SHUT_RDWR);

    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }

    close(server_fd_);
    server_fd_ = -1;

    utils::log::info("Stream server: no longer accepting connections");
}

void StreamServer::begin_graceful_close() {
    utils::log::info(std::format("Stream server: sending GOAWAY to {} live streams",
                                  tracker_.live_count()));
    tracker_.begin_graceful_close();
}

std::shared_future<void> StreamServer::drained() {
    return tracker_.drained();
}

void StreamServer::force_close_all() {
    tracker_.force_close_all();
}

void StreamServer::accept_loop() {
    while (accepting_.load()) {
        sockaddr_storage client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        const int client_fd = accept4(server_fd_,
            reinterpret_cast<sockaddr*>(&client_addr), &addr_len, SOCK_CLOEXEC);

        if (client_fd < 0) {
            if (!accepting_.load()) break;  // Shutting down
            if (errno == EMFILE || errno == ENFILE) {
                utils::log::warn(std::format("Stream: accept() failed: {}", strerror(errno)));
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
            continue;
        }

        reap_finished_workers();

        // Check connection limit
        if (tracker_.live_count() >= config_.max_connections) {
            close(client_fd);
            utils::log::warn(std::format("Stream: rejected {}, {} connections open",
                format_peer(client_addr), config_.max_connections));
            continue;
        }

        auto session = std::make_shared<StreamSession>(client_fd, format_peer(client_addr), health_);
        auto opened = tracker_.try_open({
            .on_close_requested = [session] { session->request_close(); },
            .on_abort = [session] { session->abort(); },
        });
        if (!opened) {
            continue;  // Shutdown began after accept(); session closes the socket
        }

        utils::log::info(std::format("Stream: {} connected", session->remote_addr()));

        // Spawn worker thread for this connection
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard lock(workers_mutex_);
        workers_.push_back(Worker{
            std::jthread([session, lease = std::move(*opened), done]() mutable {
                session->run();
                lease.release();
                done->store(true);
            }),
            done});
    }
}

void StreamServer::reap_finished_workers() {
    std::lock_guard lock(workers_mutex_);
    std::erase_if(workers_, [](Worker& w) {
        if (!w.done->load()) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    });
}

} // namespace streamgate
