#include "server/stream_session.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <sys/socket.h>
#include <unistd.h>

namespace streamgate {

namespace {

constexpr std::string_view kGoaway = "GOAWAY\n";

bool send_all(int fd, std::string_view data, int flags) {
    while (!data.empty()) {
        const ssize_t n = ::send(fd, data.data(), data.size(), flags | MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

} // anonymous namespace

StreamSession::StreamSession(int fd, std::string remote_addr,
                             std::shared_ptr<const HealthReporter> health)
    : fd_(fd),
      remote_addr_(std::move(remote_addr)),
      health_(std::move(health)) {}

StreamSession::~StreamSession() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void StreamSession::run() {
    std::string line;
    while (read_line(line)) {
        ++lines_handled_;
        const auto reply = handle_line(line, health_.get());
        if (!reply) {
            send_line("BYE");
            break;
        }
        if (!send_line(*reply)) break;
    }
    state_.store(State::CLOSED, std::memory_order_release);

    utils::log::info(std::format("Stream: {} closed after {} lines{}",
        remote_addr_, lines_handled_, aborted_.load() ? " (aborted)" : ""));
}

void StreamSession::request_close() {
    auto expected = State::OPEN;
    if (!state_.compare_exchange_strong(expected, State::CLOSING,
                                        std::memory_order_acq_rel)) {
        return;
    }
    // The session thread flushes GOAWAY after its current write if it holds the lock.
    std::unique_lock lock(write_mutex_, std::try_to_lock);
    if (lock.owns_lock()) {
        flush_goaway_locked();
    }
}

void StreamSession::abort() {
    aborted_.store(true);
    ::shutdown(fd_, SHUT_RDWR);
}

void StreamSession::flush_goaway_locked() {
    if (goaway_sent_ || state_.load(std::memory_order_acquire) != State::CLOSING) return;
    goaway_sent_ = true;
    if (!send_all(fd_, kGoaway, MSG_DONTWAIT)) {
        // Full send buffer or dead peer; the grace deadline still applies
        utils::log::debug(std::format("Stream: GOAWAY to {} not delivered: {}",
                                      remote_addr_, strerror(errno)));
    }
}

bool StreamSession::read_line(std::string& line) {
    while (true) {
        const auto nl = read_buffer_.find('\n');
        if (nl != std::string::npos) {
            line.assign(read_buffer_, 0, nl);
            read_buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (read_buffer_.size() > kMaxLineLength) {
            send_line("ERROR line too long");
            return false;
        }

        // Covers a request_close() whose try_lock lost to the last write
        if (state() == State::CLOSING) {
            std::lock_guard lock(write_mutex_);
            flush_goaway_locked();
        }

        char buf[4096];
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            read_buffer_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;  // EOF, reset, or aborted
    }
}

bool StreamSession::send_line(std::string_view line) {
    std::string out;
    out.reserve(line.size() + 1);
    out.append(line);
    out.push_back('\n');

    std::lock_guard lock(write_mutex_);
    if (!send_all(fd_, out, 0)) {
        return false;
    }
    flush_goaway_locked();
    return true;
}

std::optional<std::string> StreamSession::handle_line(std::string_view line,
                                                      const HealthReporter* health) {
    const std::string trimmed = utils::trim(line);
    const auto space = trimmed.find(' ');
    const std::string command = utils::to_upper(std::string_view(trimmed).substr(0, space));

    if (command == "PING") {
        return "PONG";
    }
    if (command == "QUIT") {
        return std::nullopt;
    }
    if (command == "HEALTH") {
        const std::string service = (space == std::string::npos)
            ? std::string{} : utils::trim(std::string_view(trimmed).substr(space + 1));
        const auto status = health ? health->status(service) : ServingStatus::SERVICE_UNKNOWN;
        return serving_status_to_string(status);
    }
    return std::string(line);
}

} // namespace streamgate
