#include <algorithm>
#include <cstdio>
#include <iterator>
#include <strings.h>
#include <vector>

#include "oui/registry/record.hpp"

namespace liboui::registry {

static constexpr std::string_view whitespace = " \t\r\n";
static constexpr std::string_view prefix_separators = "-:.";

/* Registry names used by the IEEE CSV files, mapped to block size */
static constexpr std::pair<std::string_view, prefix_width> registry_names[] = {
    {"MA-L", prefix_width::ma_l},
    {"MA-M", prefix_width::ma_m},
    {"MA-S", prefix_width::ma_s},
    {"IAB", prefix_width::ma_s},
};

std::optional<prefix_width> to_prefix_width(unsigned bits)
{
    switch (bits) {
    case 24:
        return (prefix_width::ma_l);
    case 28:
        return (prefix_width::ma_m);
    case 36:
        return (prefix_width::ma_s);
    default:
        return (std::nullopt);
    }
}

std::string_view to_string(prefix_width width)
{
    switch (width) {
    case prefix_width::ma_l:
        return ("MA-L");
    case prefix_width::ma_m:
        return ("MA-M");
    case prefix_width::ma_s:
        return ("MA-S");
    }

    return ("unknown");
}

std::string_view to_string(parse_error::reason_type reason)
{
    switch (reason) {
    case parse_error::reason_type::empty_line:
        return ("empty line");
    case parse_error::reason_type::missing_field:
        return ("missing field");
    case parse_error::reason_type::invalid_prefix:
        return ("invalid prefix");
    case parse_error::reason_type::unsupported_width:
        return ("unsupported prefix width");
    case parse_error::reason_type::width_mismatch:
        return ("prefix width mismatch");
    case parse_error::reason_type::empty_organization:
        return ("empty organization");
    }

    return ("unknown");
}

std::string to_string(const oui_record& record)
{
    auto digits = static_cast<int>(prefix_bits(record.width) / 4);
    char buffer[16];
    snprintf(buffer,
             sizeof(buffer),
             "%0*llX/%u",
             digits,
             static_cast<unsigned long long>(
                 record.prefix >> (address_bits - prefix_bits(record.width))),
             prefix_bits(record.width));
    return (std::string(buffer) + " " + record.organization);
}

bool operator==(const oui_record& lhs, const oui_record& rhs)
{
    return (lhs.width == rhs.width && lhs.prefix == rhs.prefix
            && lhs.organization == rhs.organization
            && lhs.address == rhs.address);
}

static std::string trim(std::string_view input)
{
    auto beg = input.find_first_not_of(whitespace);
    if (beg == std::string_view::npos) { return (std::string()); }
    auto end = input.find_last_not_of(whitespace);
    return (std::string(input.substr(beg, end - beg + 1)));
}

/*
 * Split a line on the delimiter, honoring CSV style double quotes.
 * Quotes are removed and "" inside a quoted field yields a single quote.
 */
static std::vector<std::string> split_fields(std::string_view line,
                                             char delimiter)
{
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (size_t i = 0; i < line.length(); i++) {
        auto c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.length() && line[i + 1] == '"') {
                field.push_back('"');
                i++;
            } else {
                quoted = !quoted;
            }
        } else if (c == delimiter && !quoted) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(trim(field));

    return (fields);
}

static std::optional<prefix_width> find_registry_name(std::string_view field)
{
    for (auto& [name, width] : registry_names) {
        if (name.length() == field.length()
            && strncasecmp(name.data(), field.data(), name.length()) == 0) {
            return (width);
        }
    }

    return (std::nullopt);
}

static tl::unexpected<parse_error> make_error(parse_error::reason_type reason,
                                              std::string message)
{
    return (tl::make_unexpected(parse_error{reason, std::move(message)}));
}

tl::expected<oui_record, parse_error> parse_record(std::string_view line,
                                                   const parse_options& options)
{
    using reason = parse_error::reason_type;

    if (line.find_first_not_of(whitespace) == std::string_view::npos) {
        return (make_error(reason::empty_line, "line is empty"));
    }

    auto fields = split_fields(line, options.delimiter);

    /* Skip the registry name, if present, and remember what it says */
    size_t idx = 0;
    auto named_width = find_registry_name(fields.front());
    if (named_width) { idx++; }

    if (fields.size() < idx + 2) {
        return (make_error(reason::missing_field,
                           "expected prefix and organization fields"));
    }

    auto& prefix_field = fields[idx];
    std::string digits;
    std::copy_if(prefix_field.begin(),
                 prefix_field.end(),
                 std::back_inserter(digits),
                 [](char c) {
                     return (prefix_separators.find(c)
                             == std::string_view::npos);
                 });

    if (digits.empty()
        || digits.find_first_not_of("0123456789abcdefABCDEF")
               != std::string::npos) {
        return (make_error(reason::invalid_prefix,
                           "prefix " + prefix_field
                               + " is not a hexadecimal value"));
    }

    auto width = to_prefix_width(static_cast<unsigned>(digits.length() * 4));
    if (!width) {
        return (make_error(reason::unsupported_width,
                           "prefix " + prefix_field + " has "
                               + std::to_string(digits.length())
                               + " hex digits; expected 6, 7, or 9"));
    }

    if (named_width && *named_width != *width) {
        return (make_error(reason::width_mismatch,
                           "prefix " + prefix_field + " is not a "
                               + std::string(to_string(*named_width))
                               + " assignment"));
    }

    auto& organization = fields[idx + 1];
    if (organization.empty()) {
        return (make_error(reason::empty_organization,
                           "organization for prefix " + prefix_field
                               + " is empty"));
    }

    /* Anything left over belongs to the address */
    std::string address;
    for (auto cursor = idx + 2; cursor < fields.size(); cursor++) {
        if (!address.empty() && !fields[cursor].empty()) {
            address.push_back(options.delimiter);
        }
        address += fields[cursor];
    }

    auto value = std::stoull(digits, nullptr, 16);

    return (oui_record{
        *width,
        value << (address_bits - prefix_bits(*width)),
        std::move(organization),
        address.empty() ? std::nullopt : std::make_optional(std::move(address))});
}

} // namespace liboui::registry
