#include <catch2/catch_test_macros.hpp>
#include "server/listen_address.hpp"

#include <stdexcept>

using namespace streamgate;

TEST_CASE("ListenAddress: IPv4 host and port", "[listen_address]") {
    const auto addr = ListenAddress::parse("0.0.0.0:8081");
    CHECK(addr.host == "0.0.0.0");
    CHECK(addr.port == 8081);
    CHECK_FALSE(addr.is_ipv6());
    CHECK(addr.to_string() == "0.0.0.0:8081");
}

TEST_CASE("ListenAddress: bracketed IPv6", "[listen_address]") {
    const auto addr = ListenAddress::parse("[::]:50051");
    CHECK(addr.host == "::");
    CHECK(addr.port == 50051);
    CHECK(addr.is_ipv6());
    CHECK(addr.to_string() == "[::]:50051");
    CHECK(ListenAddress::parse(addr.to_string()) == addr);
}

TEST_CASE("ListenAddress: hostname and ephemeral port", "[listen_address]") {
    const auto addr = ListenAddress::parse(" localhost:0 ");
    CHECK(addr.host == "localhost");
    CHECK(addr.port == 0);
}

TEST_CASE("ListenAddress: malformed input", "[listen_address]") {
    CHECK_THROWS_AS(ListenAddress::parse("localhost"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse(":8080"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse("host:"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse("host:70000"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse("host:80x"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse("::1:8080"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse("[::1"), std::invalid_argument);
    CHECK_THROWS_AS(ListenAddress::parse("[::1]8080"), std::invalid_argument);
}
