#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <numeric>
#include <vector>

#include <unistd.h>

#include "core/ipam_log.h"
#include "config/ipam_config_file.hpp"

namespace ipam::config::file {

using path_iterator = std::vector<std::string>::const_iterator;

constexpr static std::string_view path_delimiter(".");

static constexpr std::array<std::string_view, 2> top_level_nodes = {
    "log", "limiter"};

static std::vector<std::string> split_string(std::string_view input,
                                             std::string_view delimiters)
{
    std::vector<std::string> output;
    size_t beg = 0, pos = 0;
    while ((beg = input.find_first_not_of(delimiters, pos))
           != std::string::npos) {
        pos = input.find_first_of(delimiters, beg + 1);

        output.emplace_back(input.substr(beg, pos - beg));
    }
    return (output);
}

static std::optional<YAML::Node> get_param_by_path(
    const YAML::Node& parent_node, path_iterator pos, const path_iterator end)
{
    if (pos == end) { return (parent_node); }

    if (!parent_node.IsMap()) { return (std::nullopt); }

    if (parent_node[*pos]) {
        const YAML::Node child_node = parent_node[*pos];
        return (get_param_by_path(child_node, ++pos, end));
    }

    return (std::nullopt);
}

static void warn_unknown_nodes(const YAML::Node& root_node,
                               std::string_view source)
{
    if (!root_node.IsMap()) { return; }

    std::vector<std::string> unknown_nodes;
    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        if (std::find(top_level_nodes.begin(), top_level_nodes.end(), key)
            == top_level_nodes.end()) {
            unknown_nodes.push_back(std::move(key));
        }
    }

    if (unknown_nodes.empty()) { return; }

    auto names = std::accumulate(
        std::next(std::begin(unknown_nodes)),
        std::end(unknown_nodes),
        unknown_nodes.front(),
        [](const std::string& a, const std::string& b) { return (a + ", " + b); });

    IPAM_LOG(IPAM_LOG_WARNING,
             "Ignoring %zu unrecognized top-level node%s in %.*s: %s\n",
             unknown_nodes.size(),
             unknown_nodes.size() == 1 ? "" : "s",
             static_cast<int>(source.size()),
             source.data(),
             names.c_str());
}

tl::expected<YAML::Node, std::string> load_file(std::string_view file_name)
{
    auto name = std::string(file_name);

    // Make sure the file exists and is readable.
    if (access(name.c_str(), R_OK) == -1) {
        return (tl::make_unexpected("Error (" + std::string(strerror(errno))
                                    + ") while attempting to access config file: "
                                    + name));
    }

    // yaml-cpp throws exceptions when the parser runs into invalid YAML.
    YAML::Node root_node;
    try {
        root_node = YAML::LoadFile(name);
    } catch (const std::exception& e) {
        return (tl::make_unexpected("Error parsing configuration file "
                                    + name + ": " + e.what()));
    }

    IPAM_LOG(IPAM_LOG_DEBUG, "Read configuration file %s\n", name.c_str());

    warn_unknown_nodes(root_node, file_name);

    return (root_node);
}

tl::expected<YAML::Node, std::string> load_string(std::string_view document)
{
    YAML::Node root_node;
    try {
        root_node = YAML::Load(std::string(document));
    } catch (const std::exception& e) {
        return (tl::make_unexpected("Error parsing configuration: "
                                    + std::string(e.what())));
    }

    warn_unknown_nodes(root_node, "configuration string");

    return (root_node);
}

std::optional<YAML::Node> get_param(const YAML::Node& root,
                                    std::string_view path)
{
    auto path_components = split_string(path, path_delimiter);

    return (get_param_by_path(
        root, path_components.begin(), path_components.end()));
}

tl::expected<void, std::string> apply_log_level(const YAML::Node& root)
{
    auto level = std::optional<std::string>{};
    try {
        level = get_param<std::string>(root, "log.level");
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected("Invalid log.level value: "
                                    + std::string(e.what())));
    }

    if (!level) { return {}; }

    auto value = parse_log_optarg(level->c_str());
    if (value == IPAM_LOG_NONE) {
        return (tl::make_unexpected("Unrecognized log level: " + *level));
    }

    ipam_log_level_set(value);
    return {};
}

} // namespace ipam::config::file
