#ifndef _IPAM_FRAMEWORK_NET_IP_ADDRESS_HPP_
#define _IPAM_FRAMEWORK_NET_IP_ADDRESS_HPP_

#include <string>
#include <variant>

#include "net/ip_family.hpp"
#include "net/ipv4_address.hpp"
#include "net/ipv6_address.hpp"

namespace ipam::net {

/**
 * Family tagged address. Each alternative keeps its own canonical width,
 * so an IPv4 address is never held in a 16 byte mapped form.
 */
using ip_address = std::variant<ipv4_address, ipv6_address>;

ip_family family(const ip_address&);

std::string to_string(const ip_address&);

/**
 * Total order over addresses of either family.
 *
 * Addresses compare as unsigned big-endian byte strings of one canonical
 * width: an IPv4 address is projected to its mapped form ::ffff:a.b.c.d
 * when its peer is IPv6, so the two forms of one address compare equal.
 *
 * @return
 *   negative, zero or positive, like memcmp
 */
int compare(const ip_address&, const ip_address&);

/**
 * Arithmetic successor and predecessor within the address's own family.
 * The all-ones address wraps to all-zeros and vice versa; callers that
 * care about range edges must check for it themselves.
 */
ip_address next_ip(const ip_address&);
ip_address prev_ip(const ip_address&);

inline std::ostream& operator<<(std::ostream& os, const ip_address& value)
{
    os << to_string(value);
    return os;
}

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_ADDRESS_HPP_ */
