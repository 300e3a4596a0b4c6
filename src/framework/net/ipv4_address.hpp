#ifndef _IPAM_FRAMEWORK_NET_IPV4_ADDRESS_HPP_
#define _IPAM_FRAMEWORK_NET_IPV4_ADDRESS_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ipam {
namespace net {

/**
 * Immutable IPv4 Address, stored in network byte order
 */
class ipv4_address
{
public:
    static constexpr size_t SIZE = 4;
    static constexpr size_t SIZE_IN_BITS = SIZE * 8;

    typedef std::array<uint8_t, SIZE> data_u8_t;

    ipv4_address();
    ipv4_address(const std::string&);
    ipv4_address(data_u8_t);

    const data_u8_t& data() const { return m_data; }

    /**
     * Create an IPv4 address mask from the specified prefix length.
     * @param[in] prefix_length
     *   Prefix length in bits
     * @return
     *   IPv4 address mask
     */
    static ipv4_address make_prefix_mask(uint8_t prefix_length);

    friend ipv4_address operator&(const ipv4_address& lhs,
                                  const ipv4_address& rhs);

private:
    data_u8_t m_data;
};

/**
 * Parse a dotted-decimal IPv4 literal.
 * @return
 *   the address, or std::nullopt if the input is not a valid literal
 */
std::optional<ipv4_address> parse_ipv4_address(std::string_view input);

std::string to_string(const ipv4_address&);

int compare(const ipv4_address&, const ipv4_address&);

/* Arithmetic successor/predecessor; both wrap at the address space edges */
ipv4_address next(const ipv4_address&);
ipv4_address prev(const ipv4_address&);

inline bool operator==(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) == 0;
}
inline bool operator!=(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) != 0;
}
inline bool operator<(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ipv4_address& value)
{
    os << to_string(value);
    return os;
}

} // namespace net
} // namespace ipam

#endif /* _IPAM_FRAMEWORK_NET_IPV4_ADDRESS_HPP_ */
