#ifndef _IPAM_FRAMEWORK_NET_IPV6_ADDRESS_HPP_
#define _IPAM_FRAMEWORK_NET_IPV6_ADDRESS_HPP_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <array>

namespace ipam {
namespace net {

/**
 * Immutable IPv6 Address
 */
class ipv6_address
{
public:
    static constexpr size_t SIZE = 16;
    static constexpr size_t SIZE_IN_BITS = SIZE * 8;

    typedef std::array<uint8_t, SIZE> data_u8_t;

    ipv6_address();
    ipv6_address(const std::string& str);
    ipv6_address(data_u8_t data);

    /* ::ffff:0:0/96, i.e. an IPv4 address in IPv6 clothing */
    bool is_v4_mapped() const;

    const data_u8_t& data() const { return m_data; }

    /**
     * Create an IPv6 address mask from the specified prefix length.
     * @param[in] prefix_length
     *   Prefix length in bits
     * @return
     *   IPv6 adddress mask
     */
    static ipv6_address make_prefix_mask(uint8_t prefix_length);

    friend ipv6_address operator&(const ipv6_address& lhs,
                                  const ipv6_address& rhs);

private:
    data_u8_t m_data;
};

/**
 * Parse a colon-hex IPv6 literal, with or without zero compression.
 * @return
 *   the address, or std::nullopt if the input is not a valid literal
 */
std::optional<ipv6_address> parse_ipv6_address(std::string_view input);

std::string to_string(const ipv6_address&);

int compare(const ipv6_address&, const ipv6_address&);

ipv6_address next(const ipv6_address&);
ipv6_address prev(const ipv6_address&);

inline bool operator==(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) == 0;
}
inline bool operator!=(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) != 0;
}
inline bool operator<(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ipv6_address& value)
{
    os << to_string(value);
    return os;
}

} // namespace net
} // namespace ipam

#endif /* _IPAM_FRAMEWORK_NET_IPV6_ADDRESS_HPP_ */
