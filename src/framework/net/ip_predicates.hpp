#ifndef _IPAM_FRAMEWORK_NET_IP_PREDICATES_HPP_
#define _IPAM_FRAMEWORK_NET_IP_PREDICATES_HPP_

#include <string_view>

#include "tl/expected.hpp"

#include "net/ip_error.hpp"
#include "net/ip_family.hpp"

namespace ipam::net {

/*
 * Block predicates on textual input.  The family is checked first, then
 * each input in argument order; the first failure is returned as is and
 * no boolean is produced.  Blocks are CIDR literals, the address of
 * contains_ip is a bare address literal.
 */

/**
 * Check whether the outer block holds every address of the inner block.
 * A block contains itself but never a block with a shorter prefix.
 */
tl::expected<bool, ip_error>
contains_cidr(ip_family family, std::string_view outer, std::string_view inner);

/**
 * Check whether the subnet holds the address.
 *
 * @return
 *   invalid_cidr_format for a bad subnet, invalid_ip_format for a bad
 *   address
 */
tl::expected<bool, ip_error> contains_ip(ip_family family,
                                         std::string_view subnet,
                                         std::string_view address);

/**
 * Check whether two blocks share at least one address.  Symmetric.
 */
tl::expected<bool, ip_error>
is_cidr_overlap(ip_family family, std::string_view lhs, std::string_view rhs);

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_PREDICATES_HPP_ */
