#ifndef _IPAM_FRAMEWORK_NET_IP_PARSE_HPP_
#define _IPAM_FRAMEWORK_NET_IP_PARSE_HPP_

#include <optional>
#include <string_view>

#include "tl/expected.hpp"

#include "net/ip_error.hpp"
#include "net/ip_family.hpp"
#include "net/ip_network.hpp"

namespace ipam::net {

/*
 * Every function here validates the family tag before looking at the
 * text, so ip_error::invalid_ip_version always wins over a format error.
 * Text that is only valid for the other family is a format error; it is
 * never reinterpreted.
 */

/**
 * Parse an address or CIDR literal of the given family.
 *
 * @param[in] family
 *   expected address family
 * @param[in] text
 *   `address` when as_cidr is false, `address/prefix` otherwise
 * @param[in] as_cidr
 *   selects the expected syntax
 *
 * @return
 *   For a bare address, a block with the full family prefix whose address
 *   is the input address. For a CIDR, the block masked to its network
 *   address. On failure, invalid_ip_version, invalid_ip_format (bare
 *   address) or invalid_cidr_format (CIDR).
 */
tl::expected<ip_network, ip_error>
parse_ip(ip_family family, std::string_view text, bool as_cidr);

/**
 * Parse a CIDR literal of the given family.
 *
 * @return
 *   the masked block, or invalid_ip_version / invalid_cidr_format
 */
tl::expected<ip_network, ip_error> parse_cidr(ip_family family,
                                              std::string_view text);

/* Validation only; same rules as parse_cidr */
tl::expected<void, ip_error> is_cidr(ip_family family, std::string_view text);

/* Validation only; same rules as parse_ip with as_cidr == false */
tl::expected<void, ip_error> is_ip(ip_family family, std::string_view text);

/*
 * Classification predicates; these never report an error, any malformed
 * or wrong family text is simply not a match.
 */
bool is_ipv4_cidr(std::string_view text);
bool is_ipv6_cidr(std::string_view text);

/* Parse a bare address literal of the family; no logging */
std::optional<ip_address> parse_address(ip_family family,
                                        std::string_view text);

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_PARSE_HPP_ */
