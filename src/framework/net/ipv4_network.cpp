#include <algorithm>
#include <stdexcept>

#include "net/ipv4_network.hpp"

namespace ipam {
namespace net {

ipv4_network::ipv4_network(const ipv4_address& addr, uint8_t prefix)
    : m_prefix(prefix)
{
    if (m_prefix > max_prefix_length) {
        throw std::out_of_range(std::to_string(m_prefix) + " is larger than "
                                + std::to_string(max_prefix_length));
    }
    m_addr = addr & ipv4_address::make_prefix_mask(m_prefix);
}

const ipv4_address& ipv4_network::address() const
{
    return (m_addr);
}

uint8_t ipv4_network::prefix_length() const
{
    return (m_prefix);
}

std::string to_string(const ipv4_network& network)
{
    return (to_string(network.address()) + "/" + std::to_string(network.prefix_length()));
}

int compare(const ipv4_network& lhs, const ipv4_network& rhs)
{
    if      (lhs.address()       < rhs.address()      ) return (-1);
    else if (lhs.address()       > rhs.address()      ) return (1);
    else if (lhs.prefix_length() < rhs.prefix_length()) return (-1);
    else if (lhs.prefix_length() > rhs.prefix_length()) return (1);
    else return (0);
}

bool contains(const ipv4_network& network, const ipv4_address& addr)
{
    return ((addr & ipv4_address::make_prefix_mask(network.prefix_length()))
            == network.address());
}

bool contains(const ipv4_network& outer, const ipv4_network& inner)
{
    /* A broader prefix can never fit inside a narrower one */
    if (inner.prefix_length() < outer.prefix_length()) { return (false); }
    return (contains(outer, inner.address()));
}

bool overlaps(const ipv4_network& lhs, const ipv4_network& rhs)
{
    auto mask = ipv4_address::make_prefix_mask(
        std::min(lhs.prefix_length(), rhs.prefix_length()));
    return ((lhs.address() & mask) == (rhs.address() & mask));
}

} // namespace net
} // namespace ipam
