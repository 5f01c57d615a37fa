#include "server/listen_address.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace streamgate {

ListenAddress ListenAddress::parse(std::string_view text) {
    const std::string trimmed = utils::trim(text);
    std::string_view sv = trimmed;

    ListenAddress addr;
    std::string_view port_part;

    if (sv.starts_with('[')) {
        const auto close = sv.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument(std::format("Unterminated '[' in address '{}'", text));
        }
        addr.host = std::string(sv.substr(1, close - 1));
        const auto rest = sv.substr(close + 1);
        if (!rest.starts_with(':')) {
            throw std::invalid_argument(std::format("Missing port in address '{}'", text));
        }
        port_part = rest.substr(1);
    } else {
        const auto colon = sv.rfind(':');
        if (colon == std::string_view::npos) {
            throw std::invalid_argument(std::format("Missing port in address '{}'", text));
        }
        addr.host = std::string(sv.substr(0, colon));
        if (addr.host.find(':') != std::string::npos) {
            throw std::invalid_argument(
                std::format("IPv6 host must be bracketed in address '{}'", text));
        }
        port_part = sv.substr(colon + 1);
    }

    if (addr.host.empty()) {
        throw std::invalid_argument(std::format("Empty host in address '{}'", text));
    }

    const auto port = utils::try_parse_int<uint32_t>(port_part);
    if (!port || *port > 65535) {
        throw std::invalid_argument(
            std::format("Invalid port '{}' in address '{}'", port_part, text));
    }
    addr.port = static_cast<uint16_t>(*port);
    return addr;
}

std::string ListenAddress::to_string() const {
    if (is_ipv6()) {
        return std::format("[{}]:{}", host, port);
    }
    return std::format("{}:{}", host, port);
}

} // namespace streamgate
