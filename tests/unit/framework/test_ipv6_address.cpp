#include "catch.hpp"

#include "net/ipv6_address.hpp"

using namespace ipam::net;
using namespace std::string_literals;

TEST_CASE("ipv6_address functionality checks", "[ipv6_address]")
{
    SECTION("constructor functionality checks") {
        ipv6_address ref(ipv6_address::data_u8_t{0xab, 0xcd, 0x12, 0x34, 0, 0, 0, 0,
                                                 0, 0, 0, 0, 0, 0, 0, 0x01});
        REQUIRE(ipv6_address("abcd:1234::1") == ref);
        REQUIRE(ipv6_address("ABCD:1234:0:0:0:0:0:1") == ref);
        REQUIRE(ipv6_address(ref.data()) == ref);
        REQUIRE(ipv6_address() == ipv6_address("::"));

        REQUIRE_THROWS(ipv6_address("abcd:1234::1::2"));
        REQUIRE_THROWS(ipv6_address("abcd:12345::1"));
        REQUIRE_THROWS(ipv6_address("172.18.40.40"));
    }

    SECTION("literal parsing checks") {
        REQUIRE(parse_ipv6_address("::"));
        REQUIRE(parse_ipv6_address("::1"));
        REQUIRE(parse_ipv6_address("64:ff9b::192.0.2.33"));

        auto invalid = GENERATE(as<std::string> {},
                                "",
                                "invalid",
                                "fe80::1%eth0",
                                "abcd:1234::1\0junk"s,
                                "abcd:1234::/120",
                                "1:2:3:4:5:6:7:8:9",
                                ":::1");
        REQUIRE(!parse_ipv6_address(invalid));
    }

    SECTION("v4 mapped recognition check") {
        REQUIRE(ipv6_address("::ffff:172.18.40.40").is_v4_mapped());
        REQUIRE(ipv6_address("::ffff:ac12:2828").is_v4_mapped());
        REQUIRE(!ipv6_address("::172.18.40.40").is_v4_mapped());
        REQUIRE(!ipv6_address("64:ff9b::192.0.2.33").is_v4_mapped());
    }

    SECTION("prefix mask checks") {
        REQUIRE(ipv6_address::make_prefix_mask(0) == ipv6_address("::"));
        REQUIRE(ipv6_address::make_prefix_mask(20) == ipv6_address("ffff:f000::"));
        REQUIRE(ipv6_address::make_prefix_mask(128)
                == ipv6_address("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"));
        REQUIRE_THROWS(ipv6_address::make_prefix_mask(129));
    }

    SECTION("check comparison operators") {
        ipv6_address a("2001:db8::1");
        ipv6_address b("2001:db8::1:0");
        ipv6_address c("2001:0db8:0:0:0:0:1:0");

        REQUIRE(a < b);
        REQUIRE(a <= b);
        REQUIRE(b <= c);
        REQUIRE(b > a);
        REQUIRE(b >= c);
        REQUIRE(b == c);
        REQUIRE(a != b);
        REQUIRE(ipv6_address("8000::") > ipv6_address("7fff:ffff::"));
    }

    SECTION("successor and predecessor checks") {
        REQUIRE(prev(ipv6_address("abcd:1234::1")) == ipv6_address("abcd:1234::"));
        REQUIRE(next(ipv6_address("abcd:1234::ffff")) == ipv6_address("abcd:1234::1:0"));
        REQUIRE(prev(ipv6_address("abcd:1234::1:0")) == ipv6_address("abcd:1234::ffff"));
        REQUIRE(next(ipv6_address("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"))
                == ipv6_address("::"));
        REQUIRE(prev(ipv6_address("::"))
                == ipv6_address("ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"));
    }

    SECTION("check string conversion") {
        REQUIRE(to_string(ipv6_address("ABCD:1234:0:0:0:0:0:1")) == "abcd:1234::1");
        REQUIRE(to_string(ipv6_address("::")) == "::");
        REQUIRE(to_string(ipv6_address("2001:db8:0:0:1:0:0:1")) == "2001:db8::1:0:0:1");
    }
}
