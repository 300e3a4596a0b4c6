#ifndef _IPAM_FRAMEWORK_NET_ADDRESS_BYTES_HPP_
#define _IPAM_FRAMEWORK_NET_ADDRESS_BYTES_HPP_

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Fixed width, big-endian byte array helpers shared by the IPv4 and IPv6
 * address types.  All arithmetic is done a byte at a time so that 128 bit
 * addresses need no native 128 bit integer.
 */

namespace ipam::net::bytes {

template <size_t N> using byte_array = std::array<uint8_t, N>;

/**
 * Create a network mask with the leading prefix_length bits set.
 * @param[in] prefix_length
 *   Prefix length in bits; must not exceed N * 8
 * @return
 *   byte array mask
 */
template <size_t N> byte_array<N> make_prefix_mask(unsigned prefix_length)
{
    if (prefix_length > N * 8) {
        throw std::out_of_range(std::to_string(prefix_length)
                                + " is larger than " + std::to_string(N * 8));
    }

    auto mask = byte_array<N>{};
    size_t full = prefix_length / 8;
    size_t bits_rem = prefix_length % 8;

    std::fill_n(mask.begin(), full, 0xff);
    if (bits_rem) { mask[full] = static_cast<uint8_t>(0xff << (8 - bits_rem)); }

    return (mask);
}

template <size_t N>
byte_array<N> mask(const byte_array<N>& lhs, const byte_array<N>& rhs)
{
    auto result = byte_array<N>{};
    std::transform(lhs.begin(),
                   lhs.end(),
                   rhs.begin(),
                   result.begin(),
                   [](uint8_t lv, uint8_t rv) { return (lv & rv); });
    return (result);
}

/* Add one, carrying towards the most significant byte. Wraps to zero. */
template <size_t N> byte_array<N> increment(byte_array<N> data)
{
    for (auto it = data.rbegin(); it != data.rend(); ++it) {
        if (++(*it) != 0) { break; }
    }
    return (data);
}

/* Subtract one, borrowing from the most significant byte. Wraps to max. */
template <size_t N> byte_array<N> decrement(byte_array<N> data)
{
    for (auto it = data.rbegin(); it != data.rend(); ++it) {
        if ((*it)-- != 0) { break; }
    }
    return (data);
}

/* Unsigned, lexicographic comparison; returns -1, 0 or 1 */
template <size_t N>
int compare(const byte_array<N>& lhs, const byte_array<N>& rhs)
{
    auto cursor = std::mismatch(lhs.begin(), lhs.end(), rhs.begin());
    if (cursor.first == lhs.end()) { return (0); }
    return (*cursor.first < *cursor.second ? -1 : 1);
}

} // namespace ipam::net::bytes

#endif /* _IPAM_FRAMEWORK_NET_ADDRESS_BYTES_HPP_ */
