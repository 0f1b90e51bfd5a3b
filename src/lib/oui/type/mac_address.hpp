#ifndef _LIB_OUI_TYPE_MAC_ADDRESS_HPP_
#define _LIB_OUI_TYPE_MAC_ADDRESS_HPP_

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "tl/expected.hpp"

namespace liboui::type {

/**
 * Immutable 48-bit MAC address
 */

class mac_address
{
public:
    mac_address();
    mac_address(std::string_view);
    mac_address(std::initializer_list<uint8_t>);
    explicit mac_address(uint64_t);

    bool is_multicast() const;
    bool is_broadcast() const;
    bool is_local_admin() const;

    uint8_t operator[](size_t idx) const;

    /* Address as the low 48 bits of an integer, first octet most significant */
    uint64_t to_uint64() const;

    static constexpr size_t octet_count = 6;
    static constexpr uint64_t max_value = 0xffffffffffff;

    static constexpr uint8_t group_addr_bit = (1 << 0);
    static constexpr uint8_t local_admin_bit = (1 << 1);

private:
    std::array<uint8_t, octet_count> m_octets;
};

/**
 * Parse MAC address text without throwing.
 *
 * Accepted forms, case-insensitive, surrounding whitespace ignored:
 *   - six octets of two hex digits, all separated by one of ':', '-' or '.'
 *   - three groups of four hex digits separated by '.', e.g. acde.4800.0001
 *   - twelve bare hex digits
 */
tl::expected<mac_address, std::string> parse_mac_address(std::string_view);

std::string to_string(const mac_address&);

int compare(const mac_address&, const mac_address&);

inline bool operator==(const mac_address& lhs, const mac_address& rhs)
{
    return compare(lhs, rhs) == 0;
}

inline bool operator!=(const mac_address& lhs, const mac_address& rhs)
{
    return compare(lhs, rhs) != 0;
}

inline bool operator<(const mac_address& lhs, const mac_address& rhs)
{
    return compare(lhs, rhs) < 0;
}

inline bool operator>(const mac_address& lhs, const mac_address& rhs)
{
    return compare(lhs, rhs) > 0;
}

inline bool operator<=(const mac_address& lhs, const mac_address& rhs)
{
    return compare(lhs, rhs) <= 0;
}

inline bool operator>=(const mac_address& lhs, const mac_address& rhs)
{
    return compare(lhs, rhs) >= 0;
}

} // namespace liboui::type

#endif /* _LIB_OUI_TYPE_MAC_ADDRESS_HPP_ */
