#include <limits>

#include "config/ipam_config_file.hpp"
#include "core/ipam_log.h"
#include "limiter/limiter_config.hpp"

namespace ipam::limiter {

static tl::expected<std::optional<long long>, std::string>
get_non_negative(const YAML::Node& node, const std::string& key)
{
    const auto value = node[key];
    if (!value || value.IsNull()) { return (std::nullopt); }

    if (!value.IsScalar()) {
        return (tl::make_unexpected(key + " must be an integer"));
    }

    long long result = 0;
    try {
        result = value.as<long long>();
    } catch (const YAML::BadConversion&) {
        return (tl::make_unexpected(key + " must be an integer, not "
                                    + value.Scalar()));
    }

    if (result < 0) {
        return (tl::make_unexpected(key + " must not be negative"));
    }

    return (result);
}

limiter_config set_defaults(limiter_config config)
{
    if (!config.max_queue_size) {
        config.max_queue_size = default_max_queue_size;
    }
    if (!config.max_wait_time) { config.max_wait_time = default_max_wait_time; }

    return (config);
}

tl::expected<limiter_config, std::string> from_yaml(const YAML::Node& node)
{
    if (!node || node.IsNull()) { return (set_defaults({})); }

    if (!node.IsMap()) {
        return (tl::make_unexpected(
            std::string("limiter configuration must be a map")));
    }

    auto config = limiter_config{};

    auto queue_size = get_non_negative(node, "max_queue_size");
    if (!queue_size) { return (tl::make_unexpected(queue_size.error())); }
    if (*queue_size) {
        if (**queue_size > std::numeric_limits<int>::max()) {
            return (tl::make_unexpected(
                std::string("max_queue_size is out of range")));
        }
        config.max_queue_size = static_cast<int>(**queue_size);
    }

    auto wait_time = get_non_negative(node, "max_wait_time");
    if (!wait_time) { return (tl::make_unexpected(wait_time.error())); }
    if (*wait_time) {
        config.max_wait_time = std::chrono::milliseconds(**wait_time);
    }

    return (set_defaults(config));
}

tl::expected<limiter_config, std::string> load(const YAML::Node& root)
{
    auto section = config::file::get_param(root, "limiter");
    if (!section) {
        IPAM_LOG(IPAM_LOG_DEBUG,
                 "No limiter configuration found; using defaults\n");
        return (set_defaults({}));
    }

    auto config = from_yaml(*section);
    if (!config) {
        IPAM_LOG(IPAM_LOG_ERROR,
                 "Invalid limiter configuration: %s\n",
                 config.error().c_str());
    }

    return (config);
}

} // namespace ipam::limiter
