#include <charconv>
#include <type_traits>
#include <variant>

#include "core/ipam_log.h"
#include "net/ip_parse.hpp"

namespace ipam::net {

static constexpr char prefix_delimiter = '/';

/* Decimal, no sign, no leading zeros, at most 3 digits */
static std::optional<uint8_t> parse_prefix_length(std::string_view text,
                                                  uint8_t max_length)
{
    if (text.empty() || text.size() > 3) { return (std::nullopt); }
    if (text.size() > 1 && text.front() == '0') { return (std::nullopt); }

    unsigned value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return (std::nullopt);
    }
    if (value > max_length) { return (std::nullopt); }

    return (static_cast<uint8_t>(value));
}

static ip_network make_network(const ip_address& addr, uint8_t prefix_length)
{
    return (std::visit(
        [&](const auto& value) -> ip_network {
            using address_type = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<address_type, ipv4_address>) {
                return (ipv4_network(value, prefix_length));
            } else {
                return (ipv6_network(value, prefix_length));
            }
        },
        addr));
}

static std::optional<ip_network> parse_network(ip_family family,
                                               std::string_view text)
{
    auto cursor = text.rfind(prefix_delimiter);
    if (cursor == std::string_view::npos) { return (std::nullopt); }

    auto addr = parse_address(family, text.substr(0, cursor));
    if (!addr) { return (std::nullopt); }

    auto prefix =
        parse_prefix_length(text.substr(cursor + 1), max_prefix_length(family));
    if (!prefix) { return (std::nullopt); }

    return (make_network(*addr, *prefix));
}

std::optional<ip_address> parse_address(ip_family family,
                                        std::string_view text)
{
    switch (family) {
    case ip_family::v4:
        if (auto addr = parse_ipv4_address(text)) { return (*addr); }
        break;
    case ip_family::v6:
        /* A mapped address is an IPv4 address; it is not ours to take */
        if (auto addr = parse_ipv6_address(text);
            addr && !addr->is_v4_mapped()) {
            return (*addr);
        }
        break;
    default:
        break;
    }

    return (std::nullopt);
}

tl::expected<ip_network, ip_error> parse_cidr(ip_family family,
                                              std::string_view text)
{
    if (auto valid = validate_family(family); !valid) {
        return (tl::make_unexpected(valid.error()));
    }

    auto network = parse_network(family, text);
    if (!network) {
        IPAM_LOG(IPAM_LOG_DEBUG,
                 "Invalid %s CIDR: %.*s\n",
                 to_string(family),
                 static_cast<int>(text.size()),
                 text.data());
        return (tl::make_unexpected(ip_error::invalid_cidr_format));
    }

    return (*network);
}

tl::expected<ip_network, ip_error>
parse_ip(ip_family family, std::string_view text, bool as_cidr)
{
    if (as_cidr) { return (parse_cidr(family, text)); }

    if (auto valid = validate_family(family); !valid) {
        return (tl::make_unexpected(valid.error()));
    }

    auto addr = parse_address(family, text);
    if (!addr) {
        IPAM_LOG(IPAM_LOG_DEBUG,
                 "Invalid %s address: %.*s\n",
                 to_string(family),
                 static_cast<int>(text.size()),
                 text.data());
        return (tl::make_unexpected(ip_error::invalid_ip_format));
    }

    return (make_network(*addr, max_prefix_length(family)));
}

tl::expected<void, ip_error> is_cidr(ip_family family, std::string_view text)
{
    return (parse_cidr(family, text).map([](auto&&) {}));
}

tl::expected<void, ip_error> is_ip(ip_family family, std::string_view text)
{
    return (parse_ip(family, text, false).map([](auto&&) {}));
}

bool is_ipv4_cidr(std::string_view text)
{
    return (parse_network(ip_family::v4, text).has_value());
}

bool is_ipv6_cidr(std::string_view text)
{
    return (parse_network(ip_family::v6, text).has_value());
}

} // namespace ipam::net
