#ifndef _LIB_OUI_REGISTRY_PREFIX_INDEX_HPP_
#define _LIB_OUI_REGISTRY_PREFIX_INDEX_HPP_

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

#include "tl/expected.hpp"

#include "oui/registry/record.hpp"

namespace liboui::registry {

struct build_error
{
    enum class reason_type {
        duplicate_prefix,  /**< two records of one width share a prefix */
        misaligned_prefix, /**< prefix has bits outside of its width */
    };

    reason_type reason;
    prefix_width width;
    uint64_t prefix;
    std::string existing_organization;
    std::string organization;
};

std::string to_string(const build_error&);

/**
 * Immutable longest-prefix-match index over the three IEEE block sizes.
 *
 * Records are partitioned by width into three hash tables.  Lookups probe
 * the MA-S, MA-M and MA-L tables in that order, so a sub-assignment always
 * takes precedence over the block it was carved from.
 *
 * A built index is never modified; it may be shared between any number of
 * reader threads without synchronization.
 */
class prefix_index
{
public:
    /**
     * Build an index from a batch of records.
     *
     * @return
     *   the complete index, or the first integrity problem found.  No
     *   partial index is ever returned.
     */
    static tl::expected<prefix_index, build_error>
    build(std::vector<oui_record>&& records);

    /**
     * Find the most specific record covering the address.  Only the low
     * 48 bits of the address are considered.
     *
     * @return
     *   pointer to the matching record, owned by the index, or nullptr
     */
    const oui_record* lookup(uint64_t address) const;

    size_t size() const;
    size_t size(prefix_width) const;

    prefix_index(prefix_index&&) = default;
    prefix_index& operator=(prefix_index&&) = default;

    prefix_index(const prefix_index&) = delete;
    prefix_index& operator=(const prefix_index&) = delete;

private:
    prefix_index() = default;

    using partition = std::unordered_map<uint64_t, oui_record>;

    /* Probe order: narrowest block first */
    static constexpr std::array<prefix_width, 3> probe_order = {
        prefix_width::ma_s, prefix_width::ma_m, prefix_width::ma_l};

    static size_t partition_index(prefix_width);

    std::array<partition, probe_order.size()> m_partitions;
};

} // namespace liboui::registry

#endif /* _LIB_OUI_REGISTRY_PREFIX_INDEX_HPP_ */
