#ifndef _LIB_OUI_REGISTRY_RECORD_HPP_
#define _LIB_OUI_REGISTRY_RECORD_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tl/expected.hpp"

namespace liboui::registry {

/*
 * IEEE assignment block sizes.  The enumerator value is the number of
 * significant bits in the block prefix.
 */
enum class prefix_width : uint8_t {
    ma_l = 24, /**< MA-L, 6 hex digits */
    ma_m = 28, /**< MA-M, 7 hex digits */
    ma_s = 36, /**< MA-S (and legacy IAB), 9 hex digits */
};

/* Number of bits in the 48-bit address space covered by a MAC address */
constexpr unsigned address_bits = 48;

constexpr unsigned prefix_bits(prefix_width width)
{
    return (static_cast<unsigned>(width));
}

/* Mask selecting the top prefix_bits(width) bits of a 48-bit address */
constexpr uint64_t prefix_mask(prefix_width width)
{
    return (((uint64_t{1} << prefix_bits(width)) - 1)
            << (address_bits - prefix_bits(width)));
}

std::optional<prefix_width> to_prefix_width(unsigned bits);

std::string_view to_string(prefix_width);

/*
 * One registry assignment.  The prefix is left-justified in the 48-bit
 * address space, e.g. AC-DE-48/24 is stored as 0xacde48000000.
 */
struct oui_record
{
    prefix_width width;
    uint64_t prefix;
    std::string organization;
    std::optional<std::string> address;
};

std::string to_string(const oui_record&);

bool operator==(const oui_record&, const oui_record&);
inline bool operator!=(const oui_record& lhs, const oui_record& rhs)
{
    return (!(lhs == rhs));
}

struct parse_options
{
    char delimiter = ';';
};

struct parse_error
{
    enum class reason_type {
        empty_line,
        missing_field,
        invalid_prefix,
        unsupported_width,
        width_mismatch,
        empty_organization,
    };

    reason_type reason;
    std::string message;
};

std::string_view to_string(parse_error::reason_type);

/**
 * Parse a single registry line.
 *
 * Fields are `prefix <delim> organization [<delim> address...]`, optionally
 * preceded by a registry name field (MA-L, MA-M, MA-S or IAB) as found in
 * the IEEE published CSV files.  Fields may be double-quoted.
 *
 * @param[in] line
 *   registry line, with or without trailing newline
 * @param[in] options
 *   field delimiter
 *
 * @return
 *   the parsed record or a description of why the line is malformed
 */
tl::expected<oui_record, parse_error>
parse_record(std::string_view line, const parse_options& options = {});

} // namespace liboui::registry

#endif /* _LIB_OUI_REGISTRY_RECORD_HPP_ */
