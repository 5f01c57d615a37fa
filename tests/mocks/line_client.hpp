#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace streamgate::testing {

/**
 * @brief Blocking loopback client for the newline-delimited stream protocol
 *
 * Reads time out after two seconds so a broken server fails the test
 * instead of hanging it.
 */
class LineClient {
public:
    explicit LineClient(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) return;

        timeval timeout{};
        timeout.tv_sec = 2;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ~LineClient() {
        if (fd_ >= 0) ::close(fd_);
    }

    LineClient(const LineClient&) = delete;
    LineClient& operator=(const LineClient&) = delete;

    [[nodiscard]] bool connected() const { return fd_ >= 0; }

    bool send_line(std::string_view line) {
        std::string out(line);
        out.push_back('\n');
        return ::send(fd_, out.data(), out.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(out.size());
    }

    /// std::nullopt on EOF, reset or timeout
    [[nodiscard]] std::optional<std::string> read_line() {
        std::string line;
        char c = 0;
        while (true) {
            const ssize_t n = ::recv(fd_, &c, 1, 0);
            if (n <= 0) return std::nullopt;
            if (c == '\n') return line;
            line.push_back(c);
        }
    }

    [[nodiscard]] std::optional<std::string> request(std::string_view line) {
        if (!send_line(line)) return std::nullopt;
        return read_line();
    }

private:
    int fd_ = -1;
};

} // namespace streamgate::testing
