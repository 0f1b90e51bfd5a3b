#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <map>
#include <numeric>
#include <vector>

#include <unistd.h>

#include "core/oui_log.h"
#include "oui_config_file.hpp"

namespace oui::config::file {

using path_iterator = std::vector<std::string>::const_iterator;

static std::string config_file_name;
static std::map<std::string, std::string, std::less<>> cli_params;
constexpr static std::string_view path_delimiter(".");

/* We currently support two top level nodes: `core` and `registry`. */
constexpr static std::string_view top_level_nodes[] = {"core", "registry"};

std::string_view oui_config_get_file_name() { return (config_file_name); }

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

/*
 * Recursive function to create a new YAML tree path by the given
 * path component strings of the range [pos, end).
 */
static YAML::Node create_param_by_path(path_iterator pos,
                                       const path_iterator end,
                                       const std::string& value)
{
    if (pos == end) { return (YAML::Node(value)); }

    YAML::Node output;
    auto key = pos;
    output[*key] = create_param_by_path(++pos, end, value);

    return (output);
}

/*
 * Recursive function to traverse an existing YAML tree path by the
 * given path component strings of the range [pos, end). If the entire
 * path exists the base case will assign the requested value. Else,
 * function will switch over to creating a new path.
 */
static void update_param_by_path(YAML::Node& parent_node,
                                 path_iterator pos,
                                 const path_iterator end,
                                 const std::string& value)
{
    if (pos == end) {
        parent_node = value;
        return;
    }

    if (parent_node[*pos]) {
        YAML::Node child_node = parent_node[*pos];
        update_param_by_path(child_node, ++pos, end, value);
    } else {
        // Make a copy, else the ++pos operation on the right side will
        // be reflected on the left side.
        auto key = pos;
        parent_node[*key] = create_param_by_path(++pos, end, value);
    }
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

static void merge_cli_params(YAML::Node& node)
{
    for (auto& [path, value] : cli_params) {
        auto arg_path = split_string(path, path_delimiter);
        if (arg_path.empty()) { continue; }

        update_param_by_path(node, arg_path.begin(), arg_path.end(), value);
    }
}

void oui_config_set_cli_param(std::string_view param, std::string_view value)
{
    cli_params.insert_or_assign(std::string(param), std::string(value));
}

void oui_config_file_reset()
{
    config_file_name.clear();
    cli_params.clear();
}

std::optional<YAML::Node> oui_config_get_param(std::string_view path)
{
    YAML::Node root_node;
    if (!config_file_name.empty()) {
        // If this throws it's a bug or weird environment issue.
        // File is loaded and checked by oui_config_file_load() below.
        root_node = YAML::LoadFile(config_file_name);
    }

    // Does the user want to override any config file settings
    // from the command line?
    merge_cli_params(root_node);

    auto path_components = split_string(path, path_delimiter);

    return (get_param_by_path(
        root_node, path_components.begin(), path_components.end()));
}

tl::expected<void, std::string> oui_config_file_load(std::string_view file_name)
{
    auto name = std::string(file_name);

    // Make sure the file exists and is readable.
    if (access(name.c_str(), R_OK) == -1) {
        return (tl::make_unexpected("Error (" + std::string(strerror(errno))
                                    + ") while attempting to access config file: "
                                    + name));
    }

    // This will do an initial parse. yaml-cpp throws exceptions when
    // the parser runs into invalid YAML.
    YAML::Node root_node;
    try {
        root_node = YAML::LoadFile(name);
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected("Error parsing configuration file "
                                    + name + ": " + e.what()));
    }

    if (!root_node.IsNull() && !root_node.IsMap()) {
        return (tl::make_unexpected("Configuration file " + name
                                    + " does not contain a YAML map"));
    }

    config_file_name = std::move(name);

    OUI_LOG(OUI_LOG_DEBUG,
            "Reading from configuration file %s",
            config_file_name.c_str());

    // Generate a warning if the config file contains unrecognized nodes.
    std::vector<std::string> unknown_nodes;
    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        if (std::find(std::begin(top_level_nodes),
                      std::end(top_level_nodes),
                      key)
            == std::end(top_level_nodes)) {
            unknown_nodes.push_back(std::move(key));
        }
    }

    if (!unknown_nodes.empty()) {
        OUI_LOG(
            OUI_LOG_WARNING,
            "Ignoring %zu unrecognized top-level node%s in %s: %s\n",
            unknown_nodes.size(),
            unknown_nodes.size() == 1 ? "" : "s",
            config_file_name.c_str(),
            std::accumulate(
                std::begin(unknown_nodes),
                std::end(unknown_nodes),
                std::string(),
                [&](const std::string& a, const std::string& b) -> std::string {
                    return (a + (a.length() > 0 ? ", " : "") + b);
                })
                .c_str());
    }

    return {};
}

static char* find_config_file_option(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--config") == 0
            || strcmp(argv[idx], "-c") == 0) {
            return (argv[idx + 1]);
        }
    }

    return (nullptr);
}

int oui_config_file_find(int argc, char* const argv[])
{
    char* file_name = find_config_file_option(argc, argv);

    if (!file_name) { return (0); }

    auto result = oui_config_file_load(file_name);
    if (!result) {
        std::cerr << result.error() << std::endl;
        return (access(file_name, R_OK) == -1 ? ENOENT : EINVAL);
    }

    return (0);
}

} // namespace oui::config::file
