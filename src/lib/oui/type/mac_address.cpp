#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <vector>

#include "oui/type/mac_address.hpp"

namespace liboui::type {

static constexpr std::string_view delimiters = "-:.";
static constexpr std::string_view whitespace = " \t\r\n";

static int hex_value(char c)
{
    if ('0' <= c && c <= '9') { return (c - '0'); }
    if ('a' <= c && c <= 'f') { return (c - 'a' + 10); }
    if ('A' <= c && c <= 'F') { return (c - 'A' + 10); }
    return (-1);
}

/* Append a run of already validated hex digits to value */
static void accumulate_hex(std::string_view digits, uint64_t& value)
{
    for (auto c : digits) { value = (value << 4) | hex_value(c); }
}

static std::vector<std::string_view> split_groups(std::string_view input)
{
    std::vector<std::string_view> groups;
    size_t beg = 0;
    while (true) {
        auto pos = input.find_first_of(delimiters, beg);
        groups.push_back(input.substr(beg, pos - beg));
        if (pos == std::string_view::npos) { break; }
        beg = pos + 1;
    }
    return (groups);
}

tl::expected<mac_address, std::string> parse_mac_address(std::string_view input)
{
    auto beg = input.find_first_not_of(whitespace);
    if (beg == std::string_view::npos) {
        return (tl::make_unexpected(std::string("MAC address is empty")));
    }
    auto end = input.find_last_not_of(whitespace);
    auto text = input.substr(beg, end - beg + 1);

    auto invalid = [&](std::string_view why) {
        return (tl::make_unexpected(std::string(text) + " is not a valid MAC address: "
                                    + std::string(why)));
    };

    if (auto bad = std::find_if(text.begin(),
                                text.end(),
                                [](char c) {
                                    return (hex_value(c) < 0
                                            && delimiters.find(c)
                                                   == std::string_view::npos);
                                });
        bad != text.end()) {
        return (invalid(std::string(1, *bad)
                        + " is not a valid hexadecimal character"));
    }

    /* Only one kind of delimiter per address */
    if (auto first = text.find_first_of(delimiters);
        first != std::string_view::npos) {
        auto delimiter = text[first];
        if (std::any_of(text.begin(), text.end(), [&](char c) {
                return (c != delimiter
                        && delimiters.find(c) != std::string_view::npos);
            })) {
            return (invalid("mixed delimiters"));
        }
    }

    auto groups = split_groups(text);
    uint64_t value = 0;

    if (groups.size() == 1) {
        /* bare form */
        if (text.length() != 2 * mac_address::octet_count) {
            return (invalid("expected 12 hexadecimal digits"));
        }
        accumulate_hex(text, value);
    } else if (groups.size() == 3) {
        /* dotted quad-nibble form */
        if (text.find_first_of("-:") != std::string_view::npos) {
            return (invalid("groups of 4 digits must be separated by '.'"));
        }
        for (auto& group : groups) {
            if (group.length() != 4) {
                return (invalid("expected groups of 4 hexadecimal digits"));
            }
            accumulate_hex(group, value);
        }
    } else if (groups.size() == mac_address::octet_count) {
        for (auto& group : groups) {
            if (group.empty()) { return (invalid("empty octet")); }
            if (group.length() != 2) {
                return (invalid("octet " + std::string(group)
                                + " is not 2 hexadecimal digits"));
            }
            accumulate_hex(group, value);
        }
    } else if (groups.size() > mac_address::octet_count) {
        return (invalid("too many octets"));
    } else {
        return (invalid("too few octets"));
    }

    return (mac_address(value));
}

mac_address::mac_address()
    : m_octets{}
{}

mac_address::mac_address(std::string_view input)
{
    auto result = parse_mac_address(input);
    if (!result) { throw std::runtime_error(result.error()); }
    m_octets = result->m_octets;
}

mac_address::mac_address(std::initializer_list<uint8_t> octets)
    : m_octets{}
{
    if (octets.size() != octet_count) {
        throw std::runtime_error("MAC address requires exactly 6 octets");
    }
    std::copy(octets.begin(), octets.end(), m_octets.begin());
}

mac_address::mac_address(uint64_t value)
{
    for (size_t i = 0; i < octet_count; i++) {
        m_octets[i] = (value >> (8 * (octet_count - 1 - i))) & 0xff;
    }
}

bool mac_address::is_multicast() const
{
    return ((m_octets[0] & group_addr_bit) == group_addr_bit);
}

bool mac_address::is_broadcast() const
{
    return (std::all_of(m_octets.begin(), m_octets.end(), [](uint8_t octet) {
        return (octet == 0xff);
    }));
}

bool mac_address::is_local_admin() const
{
    return ((m_octets[0] & local_admin_bit) == local_admin_bit);
}

uint8_t mac_address::operator[](size_t idx) const { return (m_octets[idx]); }

uint64_t mac_address::to_uint64() const
{
    uint64_t value = 0;
    for (auto octet : m_octets) { value = (value << 8) | octet; }
    return (value);
}

int compare(const mac_address& lhs, const mac_address& rhs)
{
    auto left = lhs.to_uint64(), right = rhs.to_uint64();
    return (left < right ? -1 : (left > right ? 1 : 0));
}

std::string to_string(const mac_address& mac)
{
    char buffer[18];
    snprintf(buffer,
             sizeof(buffer),
             "%02x:%02x:%02x:%02x:%02x:%02x",
             mac[0],
             mac[1],
             mac[2],
             mac[3],
             mac[4],
             mac[5]);
    return (std::string(buffer));
}

} // namespace liboui::type
