#include "net/ip_parse.hpp"
#include "net/ip_predicates.hpp"

namespace ipam::net {

tl::expected<bool, ip_error>
contains_cidr(ip_family family, std::string_view outer, std::string_view inner)
{
    auto outer_net = parse_cidr(family, outer);
    if (!outer_net) { return (tl::make_unexpected(outer_net.error())); }

    auto inner_net = parse_cidr(family, inner);
    if (!inner_net) { return (tl::make_unexpected(inner_net.error())); }

    return (contains(*outer_net, *inner_net));
}

tl::expected<bool, ip_error> contains_ip(ip_family family,
                                         std::string_view subnet,
                                         std::string_view address)
{
    auto network = parse_cidr(family, subnet);
    if (!network) { return (tl::make_unexpected(network.error())); }

    auto host = parse_ip(family, address, false);
    if (!host) { return (tl::make_unexpected(host.error())); }

    return (contains(*network, net::address(*host)));
}

tl::expected<bool, ip_error>
is_cidr_overlap(ip_family family, std::string_view lhs, std::string_view rhs)
{
    auto lhs_net = parse_cidr(family, lhs);
    if (!lhs_net) { return (tl::make_unexpected(lhs_net.error())); }

    auto rhs_net = parse_cidr(family, rhs);
    if (!rhs_net) { return (tl::make_unexpected(rhs_net.error())); }

    return (overlaps(*lhs_net, *rhs_net));
}

} // namespace ipam::net
