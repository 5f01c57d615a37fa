#include "server/health_server.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace streamgate {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpServiceUnavailable = 503;

// Service names are client-supplied; keep the JSON well-formed.
std::string escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

} // anonymous namespace

HealthServer::HealthServer(ListenAddress address, std::shared_ptr<const HealthReporter> health)
    : address_(std::move(address)),
      health_(std::move(health)),
      server_(std::make_unique<httplib::Server>()) {
    server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::start() {
    if (running_.load()) return;

    int port = address_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(address_.host);
        if (port < 0) {
            throw std::runtime_error(std::format("Health: failed to bind {}", address_.to_string()));
        }
    } else if (!server_->bind_to_port(address_.host, port)) {
        throw std::runtime_error(std::format("Health: failed to bind {}", address_.to_string()));
    }
    bound_port_.store(static_cast<uint16_t>(port));
    running_.store(true);

    listen_thread_ = std::jthread([this](std::stop_token) {
        if (!server_->listen_after_bind()) {
            utils::log::error("Health: server loop exited with an error");
        }
    });
    // stop() is a no-op until the loop runs
    server_->wait_until_ready();

    utils::log::info(std::format("Health endpoint listening on {}",
        ListenAddress{address_.host, bound_port()}.to_string()));
}

void HealthServer::stop() {
    if (!running_.exchange(false)) return;
    server_->stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    utils::log::info("Health endpoint stopped");
}

void HealthServer::handle_health(const httplib::Request& req, httplib::Response& res) const {
    const std::string service = req.has_param("service") ? req.get_param_value("service") : "";
    const auto status = health_ ? health_->status(service) : ServingStatus::SERVICE_UNKNOWN;

    res.status = (status == ServingStatus::SERVING) ? kHttpOk : kHttpServiceUnavailable;
    res.set_content(std::format(R"({{"service":"{}","status":"{}"}})",
                                escape_json(service), serving_status_to_string(status)),
                    "application/json");
}

} // namespace streamgate
