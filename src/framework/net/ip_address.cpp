#include <algorithm>

#include "net/ip_address.hpp"
#include "utils/overloaded_visitor.hpp"

namespace ipam::net {

/* ::ffff:a.b.c.d */
static ipv6_address to_v4_mapped(const ipv4_address& addr)
{
    auto data = ipv6_address::data_u8_t{};
    data[10] = 0xff;
    data[11] = 0xff;
    std::copy(addr.data().begin(), addr.data().end(), data.begin() + 12);
    return (ipv6_address(data));
}

ip_family family(const ip_address& addr)
{
    return (std::holds_alternative<ipv4_address>(addr) ? ip_family::v4
                                                       : ip_family::v6);
}

std::string to_string(const ip_address& addr)
{
    return (std::visit(
        [](const auto& value) -> std::string { return (to_string(value)); },
        addr));
}

int compare(const ip_address& lhs, const ip_address& rhs)
{
    return (std::visit(
        utils::overloaded_visitor(
            [](const ipv4_address& l, const ipv4_address& r) {
                return (compare(l, r));
            },
            [](const ipv6_address& l, const ipv6_address& r) {
                return (compare(l, r));
            },
            [](const ipv4_address& l, const ipv6_address& r) {
                return (compare(to_v4_mapped(l), r));
            },
            [](const ipv6_address& l, const ipv4_address& r) {
                return (compare(l, to_v4_mapped(r)));
            }),
        lhs,
        rhs));
}

ip_address next_ip(const ip_address& addr)
{
    return (std::visit(
        [](const auto& value) -> ip_address { return (next(value)); }, addr));
}

ip_address prev_ip(const ip_address& addr)
{
    return (std::visit(
        [](const auto& value) -> ip_address { return (prev(value)); }, addr));
}

} // namespace ipam::net
