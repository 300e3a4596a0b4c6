#ifndef _IPAM_FRAMEWORK_NET_IP_FAMILY_HPP_
#define _IPAM_FRAMEWORK_NET_IP_FAMILY_HPP_

#include <cstdint>
#include <ostream>

#include "tl/expected.hpp"

#include "net/ip_error.hpp"

namespace ipam::net {

/*
 * Address family tag supplied by callers. The enumerator values match
 * the IP header version numbers.
 */
enum class ip_family : uint8_t {
    v4 = 4,
    v6 = 6,
};

/**
 * Check that a family tag names one of the supported families.
 *
 * @param[in] family
 *   caller supplied family tag; may hold any value of the underlying type
 *
 * @return
 *   nothing on success, ip_error::invalid_ip_version otherwise
 */
tl::expected<void, ip_error> validate_family(ip_family family);

/* Width of an address of the family, in bits */
uint8_t max_prefix_length(ip_family family);

const char* to_string(ip_family);

inline std::ostream& operator<<(std::ostream& os, ip_family family)
{
    os << to_string(family);
    return os;
}

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_FAMILY_HPP_ */
