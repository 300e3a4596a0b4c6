#ifndef _IPAM_FRAMEWORK_NET_IP_SET_HPP_
#define _IPAM_FRAMEWORK_NET_IP_SET_HPP_

#include <set>
#include <utility>
#include <vector>

#include "net/ip_address.hpp"

namespace ipam::net {

/*
 * Set operations over address lists.  Two addresses are the same element
 * when compare() says they are equal.  Results never hold duplicates and
 * keep the order in which each element was first seen; the inputs are
 * left untouched.
 *
 * Works for ipv4_address, ipv6_address and ip_address lists.
 */

namespace detail {

template <typename Address> struct address_less
{
    bool operator()(const Address& lhs, const Address& rhs) const
    {
        return (compare(lhs, rhs) < 0);
    }
};

template <typename Address>
using address_index = std::set<Address, address_less<Address>>;

/*
 * Ordered output plus a membership index, so that each element is
 * emitted at most once, in first seen order.
 */
template <typename Address> class ordered_address_set
{
public:
    bool insert(const Address& addr)
    {
        if (!m_index.insert(addr).second) { return (false); }
        m_items.push_back(addr);
        return (true);
    }

    std::vector<Address> release() { return (std::move(m_items)); }

private:
    address_index<Address> m_index;
    std::vector<Address> m_items;
};

} // namespace detail

/**
 * Elements of lhs that do not appear in rhs.
 */
template <typename Address>
std::vector<Address> ips_diff_set(const std::vector<Address>& lhs,
                                  const std::vector<Address>& rhs)
{
    auto exclude = detail::address_index<Address>(rhs.begin(), rhs.end());
    auto output = detail::ordered_address_set<Address>{};
    for (const auto& addr : lhs) {
        if (exclude.count(addr) == 0) { output.insert(addr); }
    }
    return (output.release());
}

/**
 * Elements of lhs, then the elements of rhs not already in lhs.
 */
template <typename Address>
std::vector<Address> ips_union_set(const std::vector<Address>& lhs,
                                   const std::vector<Address>& rhs)
{
    auto output = detail::ordered_address_set<Address>{};
    for (const auto& addr : lhs) { output.insert(addr); }
    for (const auto& addr : rhs) { output.insert(addr); }
    return (output.release());
}

/**
 * Elements of lhs that also appear in rhs.
 */
template <typename Address>
std::vector<Address> ips_intersection_set(const std::vector<Address>& lhs,
                                          const std::vector<Address>& rhs)
{
    auto include = detail::address_index<Address>(rhs.begin(), rhs.end());
    auto output = detail::ordered_address_set<Address>{};
    for (const auto& addr : lhs) {
        if (include.count(addr) != 0) { output.insert(addr); }
    }
    return (output.release());
}

} // namespace ipam::net

#endif /* _IPAM_FRAMEWORK_NET_IP_SET_HPP_ */
