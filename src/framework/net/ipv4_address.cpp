#include <algorithm>
#include <stdexcept>

#include <arpa/inet.h>

#include "net/address_bytes.hpp"
#include "net/ipv4_address.hpp"

namespace ipam {
namespace net {

ipv4_address::ipv4_address()
    : m_data{}
{}

ipv4_address::ipv4_address(const std::string& input)
{
    auto addr = parse_ipv4_address(input);
    if (!addr) { throw std::runtime_error("Invalid IPv4 address: " + input); }
    m_data = addr->m_data;
}

ipv4_address::ipv4_address(ipv4_address::data_u8_t data)
    : m_data(data)
{}

ipv4_address ipv4_address::make_prefix_mask(uint8_t prefix_length)
{
    return (ipv4_address(bytes::make_prefix_mask<SIZE>(prefix_length)));
}

ipv4_address operator&(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return (ipv4_address(bytes::mask(lhs.m_data, rhs.m_data)));
}

std::optional<ipv4_address> parse_ipv4_address(std::string_view input)
{
    /* inet_pton needs a terminated string and stops at the first NUL */
    if (input.find('\0') != std::string_view::npos) { return (std::nullopt); }

    auto data = ipv4_address::data_u8_t{};
    if (inet_pton(AF_INET, std::string(input).c_str(), data.data()) != 1) {
        return (std::nullopt);
    }
    return (ipv4_address(data));
}

std::string to_string(const ipv4_address& addr)
{
    char buffer[INET_ADDRSTRLEN];
    const char* p =
        inet_ntop(AF_INET, addr.data().data(), buffer, INET_ADDRSTRLEN);
    return (std::string(p));
}

int compare(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return (bytes::compare(lhs.data(), rhs.data()));
}

ipv4_address next(const ipv4_address& addr)
{
    return (ipv4_address(bytes::increment(addr.data())));
}

ipv4_address prev(const ipv4_address& addr)
{
    return (ipv4_address(bytes::decrement(addr.data())));
}

} // namespace net
} // namespace ipam
