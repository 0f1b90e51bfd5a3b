#include "oui/lookup/resolve.hpp"
#include "oui/type/mac_address.hpp"
#include "utils/overloaded_visitor.hpp"

namespace liboui::lookup {

lookup_result resolve(const registry::prefix_index& index,
                      std::string_view mac_text)
{
    auto mac = type::parse_mac_address(mac_text);
    if (!mac) { return (invalid_address_format{mac.error()}); }

    auto record = index.lookup(mac->to_uint64());
    if (!record) { return (unresolved{}); }

    return (resolved{record->organization,
                     record->address,
                     registry::prefix_bits(record->width),
                     record->prefix});
}

std::string to_string(const lookup_result& result)
{
    return (std::visit(
        oui::utils::overloaded_visitor(
            [](const resolved& r) {
                return (r.organization + " (/"
                        + std::to_string(r.matched_prefix_bits) + ")");
            },
            [](const unresolved&) { return (std::string("No match.")); },
            [](const invalid_address_format& e) { return (e.reason); }),
        result));
}

} // namespace liboui::lookup
