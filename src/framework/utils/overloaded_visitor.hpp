#ifndef _IPAM_UTILS_OVERLOADED_VISITOR_HPP_
#define _IPAM_UTILS_OVERLOADED_VISITOR_HPP_

namespace ipam::utils {

/**
 * Build a std::visit visitor out of a set of lambdas, one per alternative
 * (or per alternative pair, when visiting two variants at once).
 */
template <typename... Ts> struct overloaded_visitor : Ts...
{
    overloaded_visitor(const Ts&... args)
        : Ts(args)...
    {}

    using Ts::operator()...;
};

} // namespace ipam::utils

#endif /* _IPAM_UTILS_OVERLOADED_VISITOR_HPP_ */
