#include "net/ip_network.hpp"
#include "utils/overloaded_visitor.hpp"

namespace ipam::net {

ip_family family(const ip_network& network)
{
    return (std::holds_alternative<ipv4_network>(network) ? ip_family::v4
                                                          : ip_family::v6);
}

ip_address address(const ip_network& network)
{
    return (std::visit(
        [](const auto& value) -> ip_address { return (value.address()); },
        network));
}

uint8_t prefix_length(const ip_network& network)
{
    return (std::visit(
        [](const auto& value) { return (value.prefix_length()); }, network));
}

std::string to_string(const ip_network& network)
{
    return (std::visit(
        [](const auto& value) -> std::string { return (to_string(value)); },
        network));
}

bool contains(const ip_network& network, const ip_address& addr)
{
    return (std::visit(
        utils::overloaded_visitor(
            [](const ipv4_network& n, const ipv4_address& a) {
                return (contains(n, a));
            },
            [](const ipv6_network& n, const ipv6_address& a) {
                return (contains(n, a));
            },
            [](const ipv4_network&, const ipv6_address&) { return (false); },
            [](const ipv6_network&, const ipv4_address&) { return (false); }),
        network,
        addr));
}

bool contains(const ip_network& outer, const ip_network& inner)
{
    return (std::visit(
        utils::overloaded_visitor(
            [](const ipv4_network& o, const ipv4_network& i) {
                return (contains(o, i));
            },
            [](const ipv6_network& o, const ipv6_network& i) {
                return (contains(o, i));
            },
            [](const ipv4_network&, const ipv6_network&) { return (false); },
            [](const ipv6_network&, const ipv4_network&) { return (false); }),
        outer,
        inner));
}

bool overlaps(const ip_network& lhs, const ip_network& rhs)
{
    return (std::visit(
        utils::overloaded_visitor(
            [](const ipv4_network& l, const ipv4_network& r) {
                return (overlaps(l, r));
            },
            [](const ipv6_network& l, const ipv6_network& r) {
                return (overlaps(l, r));
            },
            [](const ipv4_network&, const ipv6_network&) { return (false); },
            [](const ipv6_network&, const ipv4_network&) { return (false); }),
        lhs,
        rhs));
}

} // namespace ipam::net
