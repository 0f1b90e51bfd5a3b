#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <getopt.h>

#include "config/oui_config_file.hpp"
#include "core/oui_log.h"
#include "oui/lookup/engine.hpp"
#include "oui/type/mac_address.hpp"
#include "utils/overloaded_visitor.hpp"

using namespace oui::config::file;

/**
 * Global parameters
 */

static constexpr std::string_view default_registry_path = "assets/IEEE_OUI.csv";
static bool verbose = false;

static const std::unordered_map<std::string_view, char> delimiter_names = {
    {"tab", '\t'}, {"\\t", '\t'}, {"comma", ','}, {"semicolon", ';'}};

/**
 * Command-line argument handling.
 */

struct cli_option
{
    struct option opt;
    std::string_view description;
};

static struct cli_option cli_options[] = {
    {{"config", required_argument, 0, 'c'}, "YAML configuration file"},
    {{"registry.path", required_argument, 0, 'r'},
     "registry file to load (default assets/IEEE_OUI.csv)"},
    {{"registry.delimiter", required_argument, 0, 'd'},
     "registry field delimiter (default ';'; also 'tab' or 'comma')"},
    {{"registry.lenient", no_argument, 0, 'k'},
     "skip malformed registry lines instead of failing"},
    {{"core.log.level", required_argument, 0, 'l'},
     "log level, by number (1-6) or name (critical ... trace)"},
    {{"verbose", no_argument, 0, 'v'},
     "print matched prefix and registered address"},
    {{"help", no_argument, 0, 'h'}, "display this help text"},
    {{0, 0, 0, 0}, ""}};

static void print_usage(const char* program)
{
    std::cout << std::endl
              << "Resolve MAC addresses to the organization that registered "
                 "the address block."
              << std::endl
              << std::endl;

    // How much extra space to insert after the long options.
    static constexpr size_t space_fudge = 3;
    size_t max_len = 0;
    for (auto& opt : cli_options) {
        if (opt.opt.name == nullptr) break;

        max_len = std::max(max_len, strlen(opt.opt.name));
    }

    std::cout << "Usage: " << program << " [options] MAC..." << std::endl;

    for (auto& opt : cli_options) {
        if (opt.opt.name == nullptr) break;
        std::cout << "  "
                  << "-" << static_cast<unsigned char>(opt.opt.val) << ",  "
                  << "--" << std::left << std::setw(max_len + space_fudge)
                  << opt.opt.name << " " << opt.description << std::endl;
    }
}

static std::string make_shortopts()
{
    std::string to_return;

    for (auto& opt : cli_options) {
        if (opt.opt.name != 0) {
            to_return.push_back(static_cast<char>(opt.opt.val));
            if (opt.opt.has_arg != no_argument) { to_return.append(":"); }
        }
    }

    return (to_return);
}

static void process_options(int argc, char* argv[])
{
    auto short_opts = make_shortopts();

    std::vector<struct option> options;
    std::transform(std::begin(cli_options),
                   std::end(cli_options),
                   std::back_inserter(options),
                   [](const struct cli_option& opt) { return opt.opt; });

    int opt_index = 0;
    while (true) {
        int opt = getopt_long(
            argc, argv, short_opts.c_str(), options.data(), &opt_index);

        if (opt == -1) { break; }

        switch (opt) {
        case 'h':
            print_usage(argv[0]);
            exit(EXIT_SUCCESS);
        case 'c':
            /* Already loaded by oui_config_file_find() */
            break;
        case 'r':
            oui_config_set_cli_param("registry.path", optarg);
            break;
        case 'd':
            oui_config_set_cli_param("registry.delimiter", optarg);
            break;
        case 'k':
            oui_config_set_cli_param("registry.lenient", "true");
            break;
        case 'l':
            if (parse_log_optarg(optarg) == OUI_LOG_NONE) {
                std::cerr << "Invalid log level: " << optarg << std::endl;
                exit(EXIT_FAILURE);
            }
            oui_config_set_cli_param("core.log.level", optarg);
            break;
        case 'v':
            verbose = true;
            break;
        default:
            print_usage(argv[0]);
            exit(EXIT_FAILURE);
        }
    }
}

static std::optional<char> to_delimiter(std::string_view value)
{
    if (auto found = delimiter_names.find(value);
        found != delimiter_names.end()) {
        return (found->second);
    }

    if (value.length() == 1) { return (value.front()); }

    return (std::nullopt);
}

static liboui::registry::load_options make_load_options()
{
    auto options = liboui::registry::load_options{};

    if (auto value = oui_config_get_param<std::string>("registry.delimiter")) {
        auto delimiter = to_delimiter(*value);
        if (!delimiter) {
            throw std::runtime_error("Invalid registry delimiter: " + *value);
        }
        options.delimiter = *delimiter;
    }

    options.strict =
        !oui_config_get_param<bool>("registry.lenient").value_or(false);

    return (options);
}

/* Explain why an unmatched address has no registered owner */
static std::string_view unregistered_kind(std::string_view mac_text)
{
    auto mac = liboui::type::parse_mac_address(mac_text);
    if (!mac) { return (""); }

    if (mac->is_broadcast()) { return (" (broadcast)"); }
    if (mac->is_multicast()) { return (" (multicast)"); }
    if (mac->is_local_admin()) { return (" (locally administered)"); }

    return ("");
}

static void print_result(std::string_view mac_text,
                         const liboui::lookup::lookup_result& result)
{
    std::visit(
        oui::utils::overloaded_visitor(
            [&](const liboui::lookup::resolved& r) {
                if (!verbose) {
                    std::cout << r.organization << std::endl;
                    return;
                }
                auto width = liboui::registry::to_prefix_width(
                    r.matched_prefix_bits);
                std::cout << mac_text << "\t" << r.organization << "\t"
                          << (width ? liboui::registry::to_string(*width) : "")
                          << " (" << r.matched_prefix_bits << " bits)";
                if (r.registered_address) {
                    std::cout << "\t" << *r.registered_address;
                }
                std::cout << std::endl;
            },
            [&](const liboui::lookup::unresolved&) {
                if (!verbose) {
                    std::cout << "No match." << std::endl;
                    return;
                }
                std::cout << mac_text << "\t"
                          << "No match." << unregistered_kind(mac_text)
                          << std::endl;
            },
            [&](const liboui::lookup::invalid_address_format& e) {
                std::cerr << "Invalid MAC Address: " << e.reason << std::endl;
            }),
        result);
}

int main(int argc, char* argv[])
{
    if (auto level = oui_log_level_find(argc, argv); level != OUI_LOG_NONE) {
        oui_log_level_set(level);
    }

    if (oui_config_file_find(argc, argv) != 0) { return (EXIT_FAILURE); }

    process_options(argc, argv);

    if (optind >= argc) {
        std::cerr << "No MAC address given." << std::endl;
        print_usage(argv[0]);
        return (EXIT_FAILURE);
    }

    auto engine = liboui::lookup::engine{};
    try {
        if (auto level = oui_config_get_param<std::string>("core.log.level")) {
            if (auto parsed = parse_log_optarg(level->c_str());
                parsed != OUI_LOG_NONE) {
                oui_log_level_set(parsed);
            } else {
                OUI_LOG(OUI_LOG_WARNING,
                        "Ignoring invalid log level %s\n",
                        level->c_str());
            }
        }

        auto path = oui_config_get_param<std::string>("registry.path")
                        .value_or(std::string(default_registry_path));

        auto loaded = engine.reload(path, make_load_options());
        if (!loaded) {
            std::cerr << "Error loading registry " << path << ": "
                      << liboui::registry::to_string(loaded.error())
                      << std::endl;
            return (EXIT_FAILURE);
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return (EXIT_FAILURE);
    }

    int status = EXIT_SUCCESS;
    for (int idx = optind; idx < argc; idx++) {
        auto result = engine.resolve(argv[idx]);
        if (std::holds_alternative<liboui::lookup::invalid_address_format>(
                result)) {
            status = EXIT_FAILURE;
        }
        print_result(argv[idx], result);
    }

    return (status);
}
