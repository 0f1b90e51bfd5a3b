#ifndef _OUI_CONFIG_FILE_HPP_
#define _OUI_CONFIG_FILE_HPP_

#include <optional>
#include <string>
#include <string_view>

#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"

namespace oui::config::file {

/*
 * Find configuration file CLI argument and, if found, set in-memory
 * configuration file name value.
 * Function will load, parse, and run some sanity checks on the file.
 *
 * @param[in] argc
 *   number of cli arguments
 * @param[in] argv
 *   array of cli strings
 *
 * @return
 *  If no errors occur return 0, an errno value otherwise.
 *
 * @note users are allowed to not specify a configuration file.
 *   In this case the function returns 0.
 */
int oui_config_file_find(int argc, char* const argv[]);

/*
 * Load and sanity check the specified configuration file and make it the
 * source for subsequent parameter queries.
 *
 * @return
 *  nothing on success, a description of the problem otherwise.
 */
tl::expected<void, std::string> oui_config_file_load(std::string_view file_name);

/*
 * Get configuration file name.
 *
 * @return
 *  configuration file name as passed in on the command line.
 */
std::string_view oui_config_get_file_name();

/*
 * Override a configuration parameter with a value from the command line.
 * Overrides take precedence over any configuration file value.
 */
void oui_config_set_cli_param(std::string_view param, std::string_view value);

/*
 * Forget the configuration file and any command line overrides.
 */
void oui_config_file_reset();

/*
 * Get configuration parameter(s) for the specified path.
 * @param[in]  period-deliniated path to the requested parameter node
 *
 * @return
 *  a YAML::Node object representing configuration prameters, if any.
 */
std::optional<YAML::Node> oui_config_get_param(std::string_view param);

/*
 * Get a specific configuration parameter.
 * @param[in]  period-deliniated path to the requested parameter.
 *
 * @note this will throw on any type conversion error. YAML::BadConversion.
 *
 * @return
 *  std::optional<> object that contains the requested value if it exists,
 *  otherwise empty.
 */
template <typename T>
std::optional<T> oui_config_get_param(std::string_view param)
{
    auto res = oui_config_get_param(param);
    if (!res) { return (std::nullopt); }

    auto node = *res;
    if (node.IsNull()) { return (std::nullopt); }

    /* This can throw a YAML::BadConversion exception. */
    return (std::make_optional(node.as<T>()));
}

} // namespace oui::config::file

#endif /* _OUI_CONFIG_FILE_HPP_ */
