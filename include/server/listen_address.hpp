#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace streamgate {

/**
 * @brief host:port pair for listening sockets
 *
 * Accepted forms: "0.0.0.0:8081", "localhost:9000", "[::]:50051", "[::1]:0".
 * IPv6 hosts must be bracketed. Port 0 asks the kernel for an ephemeral port.
 */
struct ListenAddress {
    std::string host = "::";
    uint16_t port = 50051;

    /// @throws std::invalid_argument on malformed input
    [[nodiscard]] static ListenAddress parse(std::string_view text);

    [[nodiscard]] bool is_ipv6() const {
        return host.find(':') != std::string::npos;
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ListenAddress& other) const = default;
};

} // namespace streamgate
