#include "catch.hpp"

#include "net/ipv4_network.hpp"

using ipv4_address = ipam::net::ipv4_address;
using ipv4_network = ipam::net::ipv4_network;

TEST_CASE("ipv4_network functionality checks", "[ipv4_network]")
{
    SECTION("constructor functionality checks")
    {
        ipv4_network test(ipv4_address("172.18.40.40"), 24);

        REQUIRE(test.address() == ipv4_address("172.18.40.0"));
        REQUIRE(test.prefix_length() == 24);
        REQUIRE(ipv4_network(ipv4_address("172.18.40.40"), 32).address()
                == ipv4_address("172.18.40.40"));
        REQUIRE(ipv4_network(ipv4_address("172.18.40.40"), 0).address()
                == ipv4_address("0.0.0.0"));
        REQUIRE_THROWS(ipv4_network(ipv4_address("172.18.40.40"), 33));
    }

    SECTION("comparison operator checks")
    {
        REQUIRE(ipv4_network(ipv4_address("198.18.1.1"), 16)
                == ipv4_network(ipv4_address("198.18.2.2"), 16));
        REQUIRE(ipv4_network(ipv4_address("198.18.1.1"), 16)
                != ipv4_network(ipv4_address("198.18.1.1"), 24));
        REQUIRE(ipv4_network(ipv4_address("198.18.1.1"), 24)
                < ipv4_network(ipv4_address("198.18.2.1"), 24));
    }

    SECTION("containment checks")
    {
        ipv4_network outer(ipv4_address("172.18.40.0"), 24);
        ipv4_network inner(ipv4_address("172.18.40.0"), 25);

        REQUIRE(contains(outer, ipv4_address("172.18.40.1")));
        REQUIRE(contains(outer, ipv4_address("172.18.40.255")));
        REQUIRE(!contains(outer, ipv4_address("172.18.41.0")));

        REQUIRE(contains(outer, outer));
        REQUIRE(contains(outer, inner));
        REQUIRE(!contains(inner, outer));
        REQUIRE(contains(ipv4_network(ipv4_address("0.0.0.0"), 0), outer));
    }

    SECTION("overlap checks")
    {
        ipv4_network a(ipv4_address("172.18.40.0"), 24);
        ipv4_network b(ipv4_address("172.18.40.128"), 25);
        ipv4_network c(ipv4_address("172.18.41.0"), 24);

        REQUIRE(overlaps(a, b));
        REQUIRE(overlaps(b, a));
        REQUIRE(!overlaps(a, c));
        REQUIRE(!overlaps(c, b));
    }

    SECTION("check string conversion")
    {
        REQUIRE(to_string(ipv4_network(ipv4_address("172.18.40.40"), 24))
                == "172.18.40.0/24");
    }
}
