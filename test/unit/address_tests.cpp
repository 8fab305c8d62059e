// Copyright (c) 2025 The Raftwire Developers
// Tests for transport addresses

#include <catch2/catch_test_macros.hpp>
#include "network/address.hpp"
#include <boost/system/system_error.hpp>

using namespace raftwire::network;

TEST_CASE("Address - construction and formatting", "[network][address]") {
    SECTION("IPv4") {
        Address a("127.0.0.1", 19200);
        CHECK(a.host() == "127.0.0.1");
        CHECK(a.port() == 19200);
        CHECK(a.to_string() == "127.0.0.1:19200");
    }

    SECTION("IPv6 is normalized and bracketed") {
        Address a("0:0:0:0:0:0:0:1", 80);
        CHECK(a.host() == "::1");
        CHECK(a.to_string() == "[::1]:80");
    }

    SECTION("Hostnames are kept verbatim") {
        Address a("localhost", 1);
        CHECK(a.host() == "localhost");
    }

    SECTION("Equality") {
        CHECK(Address("::ffff:127.0.0.1", 5) == Address("127.0.0.1", 5));
        CHECK_FALSE(Address("127.0.0.1", 5) == Address("127.0.0.1", 6));
    }
}

TEST_CASE("Address::Parse", "[network][address]") {
    auto a = Address::Parse("[::1]:19200");
    REQUIRE(a.has_value());
    CHECK(a->host() == "::1");
    CHECK(a->port() == 19200);

    auto b = Address::Parse("journal-1:0");
    REQUIRE(b.has_value());
    CHECK(b->port() == 0);

    CHECK_FALSE(Address::Parse("19200").has_value());
    CHECK_FALSE(Address::Parse("host:port").has_value());
}

TEST_CASE("Address - wildcard detection", "[network][address]") {
    CHECK(Address("0.0.0.0", 0).is_wildcard());
    CHECK(Address("::", 0).is_wildcard());
    CHECK_FALSE(Address("127.0.0.1", 0).is_wildcard());
    CHECK_FALSE(Address("localhost", 0).is_wildcard());
}

TEST_CASE("Address::socket_address", "[network][address]") {
    SECTION("IP literal resolves without lookup") {
        auto ep = Address("127.0.0.1", 19200).socket_address();
        CHECK(ep.address().to_string() == "127.0.0.1");
        CHECK(ep.port() == 19200);
    }

    SECTION("localhost resolves to a loopback address") {
        auto ep = Address("localhost", 7).socket_address();
        CHECK(ep.address().is_loopback());
        CHECK(ep.port() == 7);
    }

    SECTION("Unresolvable name throws") {
        CHECK_THROWS_AS(Address("no-such-host.invalid", 1).socket_address(),
                        boost::system::system_error);
    }
}
