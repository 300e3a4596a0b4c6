#include <algorithm>
#include <stdexcept>
#include <arpa/inet.h>

#include "net/address_bytes.hpp"
#include "net/ipv6_address.hpp"

namespace ipam::net {

ipv6_address::ipv6_address()
    : m_data{}
{}

ipv6_address::ipv6_address(const std::string& str)
{
    auto addr = parse_ipv6_address(str);
    if (!addr) { throw std::runtime_error("Invalid IPv6 address: " + str); }
    m_data = addr->m_data;
}

ipv6_address::ipv6_address(ipv6_address::data_u8_t data)
    : m_data(data)
{}

bool ipv6_address::is_v4_mapped() const
{
    return (std::all_of(m_data.begin(),
                        m_data.begin() + 10,
                        [](uint8_t octet) { return (octet == 0); })
            && m_data[10] == 0xff && m_data[11] == 0xff);
}

std::optional<ipv6_address> parse_ipv6_address(std::string_view input)
{
    if (input.find('\0') != std::string_view::npos) { return (std::nullopt); }

    auto data = ipv6_address::data_u8_t{};
    if (inet_pton(AF_INET6, std::string(input).c_str(), data.data()) != 1) {
        return (std::nullopt);
    }
    return (ipv6_address(data));
}

std::string to_string(const ipv6_address& addr)
{
    char buffer[INET6_ADDRSTRLEN];
    const char* p =
        inet_ntop(AF_INET6, addr.data().data(), buffer, INET6_ADDRSTRLEN);
    return (std::string(p));
}

int compare(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return (bytes::compare(lhs.data(), rhs.data()));
}

ipv6_address next(const ipv6_address& addr)
{
    return (ipv6_address(bytes::increment(addr.data())));
}

ipv6_address prev(const ipv6_address& addr)
{
    return (ipv6_address(bytes::decrement(addr.data())));
}

ipv6_address operator&(const ipv6_address& lhs, const ipv6_address& rhs)
{
    return (ipv6_address(bytes::mask(lhs.m_data, rhs.m_data)));
}

ipv6_address ipv6_address::make_prefix_mask(uint8_t prefix_length)
{
    return (ipv6_address(bytes::make_prefix_mask<SIZE>(prefix_length)));
}

} // namespace ipam::net
