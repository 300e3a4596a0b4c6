#ifndef _IPAM_FRAMEWORK_NET_IP_ERROR_HPP_
#define _IPAM_FRAMEWORK_NET_IP_ERROR_HPP_

#include <cstdint>
#include <ostream>

namespace ipam::net {

enum class ip_error : uint8_t {
    invalid_ip_version = 1, /**< family tag is neither IPv4 nor IPv6 */
    invalid_ip_format,      /**< not an address literal of the family */
    invalid_cidr_format,    /**< not a CIDR literal of the family */
};

const char* to_string(ip_error);

inline std::ostream& operator<<(std::ostream& os, ip_error error)
{
    os << to_string(error);
    return os;
}

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_ERROR_HPP_ */
