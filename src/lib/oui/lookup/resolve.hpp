#ifndef _LIB_OUI_LOOKUP_RESOLVE_HPP_
#define _LIB_OUI_LOOKUP_RESOLVE_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "oui/registry/prefix_index.hpp"

namespace liboui::lookup {

/* The address falls inside a registered block */
struct resolved
{
    std::string organization;
    std::optional<std::string> registered_address;
    unsigned matched_prefix_bits;
    uint64_t prefix;
};

/* The address is well formed but no block covers it */
struct unresolved
{};

/* The input text is not a MAC address */
struct invalid_address_format
{
    std::string reason;
};

using lookup_result = std::variant<resolved, unresolved, invalid_address_format>;

/**
 * Resolve MAC address text to the organization owning the most specific
 * block that contains it.
 *
 * Bad input and unknown addresses are ordinary results; this function
 * does not throw for either.
 */
lookup_result resolve(const registry::prefix_index& index,
                      std::string_view mac_text);

std::string to_string(const lookup_result&);

} // namespace liboui::lookup

#endif /* _LIB_OUI_LOOKUP_RESOLVE_HPP_ */
