#include <algorithm>
#include <vector>

#include "catch.hpp"

#include "net/ip_address.hpp"

using namespace ipam::net;

TEST_CASE("ip_address comparison checks", "[ip_address]")
{
    SECTION("same family addresses compare by bytes")
    {
        ip_address a = ipv4_address("172.18.40.40");
        ip_address b = ipv4_address("172.18.40.41");

        REQUIRE(compare(a, b) < 0);
        REQUIRE(compare(b, a) > 0);
        REQUIRE(compare(a, a) == 0);

        ip_address c = ipv6_address("abcd:1234::1");
        ip_address d = ipv6_address("abcd:1234::");
        REQUIRE(compare(c, d) > 0);
        REQUIRE(compare(d, c) < 0);
    }

    SECTION("an IPv4 address equals its mapped IPv6 form")
    {
        ip_address v4 = ipv4_address("172.18.40.40");
        ip_address mapped = ipv6_address("::ffff:172.18.40.40");

        REQUIRE(compare(v4, mapped) == 0);
        REQUIRE(compare(mapped, v4) == 0);
        REQUIRE(compare(ip_address(ipv4_address("172.18.40.41")), mapped) > 0);
        REQUIRE(compare(mapped, ip_address(ipv4_address("172.18.40.41"))) < 0);
    }

    SECTION("mixed families compare by mapped bytes")
    {
        ip_address v4_low = ipv4_address("0.0.0.0");
        ip_address v4_high = ipv4_address("255.255.255.255");

        /* ::ffff:0.0.0.0 sorts after every address below ::ffff:0:0 */
        REQUIRE(compare(v4_low, ip_address(ipv6_address("::"))) > 0);
        REQUIRE(compare(ip_address(ipv4_address("172.18.40.40")),
                        ip_address(ipv6_address("::1")))
                > 0);
        REQUIRE(compare(ip_address(ipv6_address("::1")),
                        ip_address(ipv4_address("172.18.40.40")))
                < 0);

        /* and before every address above ::ffff:ffff:ffff */
        REQUIRE(compare(v4_high, ip_address(ipv6_address("::1:0:0:0"))) < 0);
        REQUIRE(compare(v4_high, ip_address(ipv6_address("abcd::"))) < 0);
        REQUIRE(compare(ip_address(ipv6_address("abcd::")), v4_high) > 0);
    }

    SECTION("sorting a mixed list")
    {
        std::vector<ip_address> addrs = {ipv6_address("abcd::1"),
                                         ipv4_address("172.18.40.2"),
                                         ipv6_address("::1"),
                                         ipv4_address("10.0.0.1")};
        std::sort(addrs.begin(), addrs.end(), [](const auto& l, const auto& r) {
            return (compare(l, r) < 0);
        });

        REQUIRE(to_string(addrs[0]) == "::1");
        REQUIRE(to_string(addrs[1]) == "10.0.0.1");
        REQUIRE(to_string(addrs[2]) == "172.18.40.2");
        REQUIRE(to_string(addrs[3]) == "abcd::1");
    }

    SECTION("family checks")
    {
        REQUIRE(family(ip_address(ipv4_address())) == ip_family::v4);
        REQUIRE(family(ip_address(ipv6_address())) == ip_family::v6);
    }
}

TEST_CASE("ip_address stepping checks", "[ip_address]")
{
    SECTION("successor and predecessor")
    {
        REQUIRE(to_string(next_ip(ipv4_address("172.18.40.40"))) == "172.18.40.41");
        REQUIRE(to_string(prev_ip(ipv6_address("abcd:1234::1"))) == "abcd:1234::");
        REQUIRE(family(next_ip(ipv6_address("::"))) == ip_family::v6);
    }

    SECTION("stepping wraps at the family edges")
    {
        REQUIRE(to_string(next_ip(ipv4_address("255.255.255.255"))) == "0.0.0.0");
        REQUIRE(to_string(prev_ip(ipv4_address("0.0.0.0"))) == "255.255.255.255");
        REQUIRE(to_string(next_ip(ipv6_address("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff")))
                == "::");
        REQUIRE(to_string(prev_ip(ipv6_address("::")))
                == "ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff");
    }

    SECTION("next undoes prev")
    {
        auto addr = GENERATE(ip_address(ipv4_address("0.0.0.0")),
                             ip_address(ipv4_address("172.18.40.0")),
                             ip_address(ipv4_address("255.255.255.255")),
                             ip_address(ipv6_address("::")),
                             ip_address(ipv6_address("abcd:1234::1:0")),
                             ip_address(ipv6_address("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff")));

        REQUIRE(compare(next_ip(prev_ip(addr)), addr) == 0);
        REQUIRE(compare(prev_ip(next_ip(addr)), addr) == 0);
    }
}
