#ifndef _IPAM_FRAMEWORK_NET_IPV4_NETWORK_HPP_
#define _IPAM_FRAMEWORK_NET_IPV4_NETWORK_HPP_

#include "net/ipv4_address.hpp"

namespace ipam {
namespace net {

/**
 * Immutable IPv4 Network; the address is always masked to the prefix
 */
class ipv4_network
{
public:
    ipv4_network(const ipv4_address&, uint8_t);

    const ipv4_address& address() const;
    uint8_t prefix_length() const;

    constexpr static uint8_t max_prefix_length = 32;

private:
    ipv4_address m_addr;
    uint8_t m_prefix;
};

std::string to_string(const ipv4_network&);

int compare(const ipv4_network&, const ipv4_network&);

/* True if the address falls within the network */
bool contains(const ipv4_network&, const ipv4_address&);

/* True if every address of inner is also an address of outer */
bool contains(const ipv4_network& outer, const ipv4_network& inner);

/* True if the two networks share at least one address */
bool overlaps(const ipv4_network&, const ipv4_network&);

inline bool operator==(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) == 0;
}
inline bool operator!=(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) != 0;
}
inline bool operator<(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ipv4_network& value)
{
    os << to_string(value);
    return os;
}

} // namespace net
} // namespace ipam

#endif /* _IPAM_FRAMEWORK_NET_IPV4_NETWORK_HPP_ */
