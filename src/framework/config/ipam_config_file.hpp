#ifndef _IPAM_CONFIG_FILE_HPP_
#define _IPAM_CONFIG_FILE_HPP_

#include <optional>
#include <string>
#include <string_view>

#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"

namespace ipam::config::file {

/*
 * Load and parse a YAML configuration file.  Unknown top-level nodes are
 * logged and otherwise ignored.
 *
 * @return
 *  the document root, or a description of why it could not be loaded.
 */
tl::expected<YAML::Node, std::string> load_file(std::string_view file_name);

/* As load_file, but from an in-memory document */
tl::expected<YAML::Node, std::string> load_string(std::string_view document);

/*
 * Get configuration parameter(s) for the specified path.
 * @param[in] root
 *   document root
 * @param[in] path
 *   period-delimited path to the requested parameter node
 *
 * @return
 *  a YAML::Node object representing configuration parameters, if any.
 */
std::optional<YAML::Node> get_param(const YAML::Node& root,
                                    std::string_view path);

/*
 * Get a specific configuration parameter.
 *
 * @note this will throw on any type conversion error. YAML::BadConversion.
 *
 * @return
 *  std::optional<> object that contains the requested value if it exists,
 *  otherwise empty.
 */
template <typename T>
std::optional<T> get_param(const YAML::Node& root, std::string_view path)
{
    auto res = get_param(root, path);
    if (!res) { return (std::nullopt); }

    auto node = *res;
    if (node.IsNull()) { return (std::nullopt); }

    return (node.as<T>());
}

/*
 * Set the library log level from the `log.level` parameter, if present.
 * The value may be a level name or number.
 */
tl::expected<void, std::string> apply_log_level(const YAML::Node& root);

} // namespace ipam::config::file

#endif /* _IPAM_CONFIG_FILE_HPP_ */
