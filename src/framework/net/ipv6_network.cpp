#include <algorithm>
#include <stdexcept>

#include "net/ipv6_network.hpp"

namespace ipam {
namespace net {

ipv6_network::ipv6_network(const ipv6_address& addr, uint8_t prefix)
    : m_addr(addr & ipv6_address::make_prefix_mask(prefix))
    , m_prefix(prefix)
{}

const ipv6_address& ipv6_network::address() const { return (m_addr); }

uint8_t ipv6_network::prefix_length() const { return (m_prefix); }

std::string to_string(const ipv6_network& network)
{
    return (to_string(network.address()) + "/"
            + std::to_string(network.prefix_length()));
}

int compare(const ipv6_network& lhs, const ipv6_network& rhs)
{
    if (lhs.address() < rhs.address())
        return (-1);
    else if (lhs.address() > rhs.address())
        return (1);
    else if (lhs.prefix_length() < rhs.prefix_length())
        return (-1);
    else if (lhs.prefix_length() > rhs.prefix_length())
        return (1);
    else
        return (0);
}

bool contains(const ipv6_network& network, const ipv6_address& addr)
{
    return ((addr & ipv6_address::make_prefix_mask(network.prefix_length()))
            == network.address());
}

bool contains(const ipv6_network& outer, const ipv6_network& inner)
{
    if (inner.prefix_length() < outer.prefix_length()) { return (false); }
    return (contains(outer, inner.address()));
}

bool overlaps(const ipv6_network& lhs, const ipv6_network& rhs)
{
    auto mask = ipv6_address::make_prefix_mask(
        std::min(lhs.prefix_length(), rhs.prefix_length()));
    return ((lhs.address() & mask) == (rhs.address() & mask));
}

} // namespace net
} // namespace ipam
