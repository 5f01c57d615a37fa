#include <catch2/catch_test_macros.hpp>
#include "server/stream_session.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <thread>

using namespace streamgate;

namespace {

// Test side of a socketpair: write a line, read a line
struct PeerEnd {
    int fd;

    void write_line(const std::string& line) const {
        const std::string out = line + "\n";
        REQUIRE(::send(fd, out.data(), out.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(out.size()));
    }

    std::string read_line() const {
        std::string line;
        char c = 0;
        while (::recv(fd, &c, 1, 0) == 1 && c != '\n') {
            line.push_back(c);
        }
        return line;
    }
};

void set_read_timeout(int fd) {
    timeval timeout{};
    timeout.tv_sec = 2;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
}

} // anonymous namespace

TEST_CASE("StreamSession: PING and QUIT", "[stream_session]") {
    CHECK(StreamSession::handle_line("PING", nullptr) == "PONG");
    CHECK(StreamSession::handle_line("ping", nullptr) == "PONG");
    CHECK_FALSE(StreamSession::handle_line("QUIT", nullptr).has_value());
    CHECK_FALSE(StreamSession::handle_line("  quit  ", nullptr).has_value());
}

TEST_CASE("StreamSession: other lines are echoed", "[stream_session]") {
    CHECK(StreamSession::handle_line("hello world", nullptr) == "hello world");
    CHECK(StreamSession::handle_line("", nullptr) == "");
    CHECK(StreamSession::handle_line("PINGS", nullptr) == "PINGS");
}

TEST_CASE("StreamSession: HEALTH reports the reporter's status", "[stream_session][health]") {
    HealthReporter health;
    health.set_status("", ServingStatus::SERVING);
    health.set_status("echo", ServingStatus::NOT_SERVING);

    CHECK(StreamSession::handle_line("HEALTH", &health) == "SERVING");
    CHECK(StreamSession::handle_line("health echo", &health) == "NOT_SERVING");
    CHECK(StreamSession::handle_line("HEALTH missing", &health) == "SERVICE_UNKNOWN");
    CHECK(StreamSession::handle_line("HEALTH", nullptr) == "SERVICE_UNKNOWN");
}

TEST_CASE("StreamSession: runs a conversation over a socket", "[stream_session]") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    set_read_timeout(fds[1]);
    PeerEnd peer{fds[1]};

    auto session = std::make_shared<StreamSession>(fds[0], "socketpair", nullptr);
    std::thread worker([session] { session->run(); });

    peer.write_line("PING");
    CHECK(peer.read_line() == "PONG");
    peer.write_line("hello\r");
    CHECK(peer.read_line() == "hello");
    peer.write_line("QUIT");
    CHECK(peer.read_line() == "BYE");

    worker.join();
    CHECK(session->state() == StreamSession::State::CLOSED);
    CHECK(session->lines_handled() == 3);
    ::close(fds[1]);
}

TEST_CASE("StreamSession: request_close sends GOAWAY once", "[stream_session]") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    set_read_timeout(fds[1]);
    PeerEnd peer{fds[1]};

    auto session = std::make_shared<StreamSession>(fds[0], "socketpair", nullptr);
    std::thread worker([session] { session->run(); });

    peer.write_line("PING");
    CHECK(peer.read_line() == "PONG");

    session->request_close();
    session->request_close();
    CHECK(session->state() == StreamSession::State::CLOSING);
    CHECK(peer.read_line() == "GOAWAY");

    // The stream keeps working until the peer finishes
    peer.write_line("PING");
    CHECK(peer.read_line() == "PONG");
    peer.write_line("QUIT");
    CHECK(peer.read_line() == "BYE");

    worker.join();
    ::close(fds[1]);
}

TEST_CASE("StreamSession: abort ends run", "[stream_session]") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    auto session = std::make_shared<StreamSession>(fds[0], "socketpair", nullptr);
    std::thread worker([session] { session->run(); });

    session->abort();
    worker.join();
    CHECK(session->state() == StreamSession::State::CLOSED);
    ::close(fds[1]);
}

TEST_CASE("StreamSession: request_close with a full send buffer does not block", "[stream_session]") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    // Fill the session's send buffer so the GOAWAY write hits EAGAIN
    const std::string filler(4096, 'x');
    while (::send(fds[0], filler.data(), filler.size(), MSG_DONTWAIT | MSG_NOSIGNAL) > 0) {}

    auto session = std::make_shared<StreamSession>(fds[0], "socketpair", nullptr);
    session->request_close();
    CHECK(session->state() == StreamSession::State::CLOSING);

    // Only filler arrives; the dropped GOAWAY is not retried
    std::string received;
    char buf[4096];
    ssize_t n = 0;
    while ((n = ::recv(fds[1], buf, sizeof(buf), MSG_DONTWAIT)) > 0) {
        received.append(buf, static_cast<size_t>(n));
    }
    CHECK_FALSE(received.empty());
    CHECK(received.find("GOAWAY") == std::string::npos);
    ::close(fds[1]);
}
