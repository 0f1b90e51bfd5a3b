#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include "core/oui_log.h"
#include "oui/registry/loader.hpp"

namespace liboui::registry {

std::string to_string(const load_error& error)
{
    switch (error.reason) {
    case load_error::reason_type::io_error:
    case load_error::reason_type::duplicate_prefix:
    case load_error::reason_type::empty_registry:
        return (error.message);
    case load_error::reason_type::malformed_record:
        return ("malformed record on line " + std::to_string(error.line_number)
                + ": " + error.message + " (" + std::to_string(error.failed_lines)
                + " malformed line" + (error.failed_lines == 1 ? "" : "s") + ", "
                + std::to_string(error.skipped_lines) + " skipped)");
    }

    return ("unknown load error");
}

static bool is_comment(std::string_view line)
{
    auto pos = line.find_first_not_of(" \t\r");
    return (pos == std::string_view::npos || line[pos] == '#');
}

/*
 * A header names its columns, so its prefix field is not a hex value.
 * Failures on a hex prefix are corrupt records, even on the first line.
 */
static bool is_header(const parse_error& error)
{
    return (error.reason == parse_error::reason_type::invalid_prefix
            || error.reason == parse_error::reason_type::missing_field);
}

tl::expected<prefix_index, load_error> load_stream(std::istream& input,
                                                   const load_options& options)
{
    auto parse_opts = parse_options{options.delimiter};
    auto records = std::vector<oui_record>{};
    auto first_error = std::optional<load_error>{};
    size_t line_number = 0, skipped = 0, failed = 0;
    bool header_checked = false;

    std::string line;
    while (std::getline(input, line)) {
        line_number++;

        if (is_comment(line)) {
            skipped++;
            continue;
        }

        auto result = parse_record(line, parse_opts);
        if (!header_checked) {
            header_checked = true;
            if (!result && is_header(result.error())) {
                OUI_LOG(OUI_LOG_DEBUG,
                        "Skipping registry header on line %zu: %s\n",
                        line_number,
                        line.c_str());
                skipped++;
                continue;
            }
        }

        if (!result) {
            failed++;
            if (!first_error) {
                first_error = load_error{load_error::reason_type::malformed_record,
                                         result.error().message,
                                         line_number,
                                         line};
            }
            if (!options.strict) {
                OUI_LOG(OUI_LOG_WARNING,
                        "Ignoring malformed registry line %zu: %s\n",
                        line_number,
                        result.error().message.c_str());
            }
            continue;
        }

        records.push_back(std::move(*result));
    }

    if (input.bad()) {
        return (tl::make_unexpected(
            load_error{load_error::reason_type::io_error,
                       "Read error in registry after line "
                           + std::to_string(line_number)}));
    }

    if (first_error && options.strict) {
        first_error->failed_lines = failed;
        first_error->skipped_lines = skipped;
        OUI_LOG(OUI_LOG_ERROR, "%s\n", to_string(*first_error).c_str());
        return (tl::make_unexpected(std::move(*first_error)));
    }

    if (records.empty()) {
        auto error = load_error{load_error::reason_type::empty_registry,
                                "Registry contains no records"};
        error.failed_lines = failed;
        error.skipped_lines = skipped;
        return (tl::make_unexpected(std::move(error)));
    }

    auto record_count = records.size();
    auto index = prefix_index::build(std::move(records));
    if (!index) {
        auto error = load_error{load_error::reason_type::duplicate_prefix,
                                to_string(index.error())};
        error.failed_lines = failed;
        error.skipped_lines = skipped;
        OUI_LOG(OUI_LOG_ERROR, "%s\n", error.message.c_str());
        return (tl::make_unexpected(std::move(error)));
    }

    OUI_LOG(OUI_LOG_INFO,
            "Loaded %zu registry records (%zu MA-L, %zu MA-M, %zu MA-S); "
            "%zu lines skipped, %zu malformed\n",
            record_count,
            index->size(prefix_width::ma_l),
            index->size(prefix_width::ma_m),
            index->size(prefix_width::ma_s),
            skipped,
            failed);

    return (std::move(*index));
}

tl::expected<prefix_index, load_error> load_string(std::string_view data,
                                                   const load_options& options)
{
    auto input = std::istringstream(std::string(data));
    return (load_stream(input, options));
}

tl::expected<prefix_index, load_error> load_file(std::string_view path,
                                                 const load_options& options)
{
    auto name = std::string(path);
    errno = 0;
    auto input = std::ifstream(name);
    if (!input.is_open()) {
        return (tl::make_unexpected(load_error{
            load_error::reason_type::io_error,
            "Could not open registry file " + name
                + (errno ? std::string(": ") + strerror(errno) : "")}));
    }

    OUI_LOG(OUI_LOG_DEBUG, "Loading registry from %s\n", name.c_str());

    return (load_stream(input, options));
}

} // namespace liboui::registry
