#ifndef _IPAM_FRAMEWORK_NET_IP_NETWORK_HPP_
#define _IPAM_FRAMEWORK_NET_IP_NETWORK_HPP_

#include <string>
#include <variant>

#include "net/ip_address.hpp"
#include "net/ipv4_network.hpp"
#include "net/ipv6_network.hpp"

namespace ipam::net {

/**
 * Family tagged CIDR block
 */
using ip_network = std::variant<ipv4_network, ipv6_network>;

ip_family family(const ip_network&);

ip_address address(const ip_network&);

uint8_t prefix_length(const ip_network&);

std::string to_string(const ip_network&);

/*
 * Containment and overlap on blocks of either family.  Blocks and
 * addresses of different families never contain or overlap each other.
 */
bool contains(const ip_network&, const ip_address&);
bool contains(const ip_network& outer, const ip_network& inner);
bool overlaps(const ip_network&, const ip_network&);

inline std::ostream& operator<<(std::ostream& os, const ip_network& value)
{
    os << to_string(value);
    return os;
}

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_NETWORK_HPP_ */
