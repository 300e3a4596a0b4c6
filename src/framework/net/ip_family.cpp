#include "net/ip_family.hpp"
#include "net/ipv4_network.hpp"
#include "net/ipv6_network.hpp"

namespace ipam::net {

tl::expected<void, ip_error> validate_family(ip_family family)
{
    switch (family) {
    case ip_family::v4:
    case ip_family::v6:
        return {};
    default:
        return (tl::make_unexpected(ip_error::invalid_ip_version));
    }
}

uint8_t max_prefix_length(ip_family family)
{
    return (family == ip_family::v4 ? ipv4_network::max_prefix_length
                                    : ipv6_network::max_prefix_length);
}

const char* to_string(ip_family family)
{
    switch (family) {
    case ip_family::v4:
        return ("IPv4");
    case ip_family::v6:
        return ("IPv6");
    default:
        return ("unknown");
    }
}

} // namespace ipam::net
