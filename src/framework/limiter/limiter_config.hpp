#ifndef _IPAM_LIMITER_CONFIG_HPP_
#define _IPAM_LIMITER_CONFIG_HPP_

#include <chrono>
#include <optional>
#include <string>

#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"

namespace ipam::limiter {

inline constexpr int default_max_queue_size = 1000;
inline constexpr std::chrono::milliseconds default_max_wait_time =
    std::chrono::seconds(15);

/*
 * Tunables for an allocation request limiter.  An empty value means
 * "use the default".
 */
struct limiter_config
{
    std::optional<int> max_queue_size;
    std::optional<std::chrono::milliseconds> max_wait_time;
};

/**
 * Fill every unset tunable with its default.  Set values, including
 * zero, are kept.
 */
limiter_config set_defaults(limiter_config config);

/**
 * Build a config from a YAML map with the optional integer keys
 * `max_queue_size` and `max_wait_time` (milliseconds), then apply
 * defaults.  A null or undefined node yields the defaults.
 *
 * @return
 *   the defaulted config, or a description of the first invalid value
 */
tl::expected<limiter_config, std::string> from_yaml(const YAML::Node& node);

/* Read the `limiter` section of a configuration document */
tl::expected<limiter_config, std::string> load(const YAML::Node& root);

inline bool operator==(const limiter_config& lhs, const limiter_config& rhs)
{
    return (lhs.max_queue_size == rhs.max_queue_size
            && lhs.max_wait_time == rhs.max_wait_time);
}

inline bool operator!=(const limiter_config& lhs, const limiter_config& rhs)
{
    return (!(lhs == rhs));
}

} // namespace ipam::limiter

#endif /* _IPAM_LIMITER_CONFIG_HPP_ */
