#include <numeric>
#include <utility>

#include "oui/registry/prefix_index.hpp"

namespace liboui::registry {

std::string to_string(const build_error& error)
{
    auto record = to_string(
        oui_record{error.width, error.prefix, error.organization, std::nullopt});
    switch (error.reason) {
    case build_error::reason_type::duplicate_prefix:
        return ("duplicate " + std::string(to_string(error.width))
                + " assignment " + record + " (already assigned to "
                + error.existing_organization + ")");
    case build_error::reason_type::misaligned_prefix:
        return ("prefix of " + record + " has bits set outside of its "
                + std::to_string(prefix_bits(error.width)) + "-bit width");
    }

    return ("unknown build error");
}

size_t prefix_index::partition_index(prefix_width width)
{
    switch (width) {
    case prefix_width::ma_s:
        return (0);
    case prefix_width::ma_m:
        return (1);
    case prefix_width::ma_l:
        return (2);
    }

    return (probe_order.size());
}

tl::expected<prefix_index, build_error>
prefix_index::build(std::vector<oui_record>&& records)
{
    auto index = prefix_index{};

    for (auto& record : records) {
        auto idx = partition_index(record.width);
        if (idx >= index.m_partitions.size()
            || (record.prefix & ~prefix_mask(record.width)) != 0) {
            return (tl::make_unexpected(
                build_error{build_error::reason_type::misaligned_prefix,
                            record.width,
                            record.prefix,
                            std::string(),
                            record.organization}));
        }

        auto& partition = index.m_partitions[idx];
        auto found = partition.find(record.prefix);
        if (found != partition.end()) {
            return (tl::make_unexpected(
                build_error{build_error::reason_type::duplicate_prefix,
                            record.width,
                            record.prefix,
                            found->second.organization,
                            record.organization}));
        }

        auto prefix = record.prefix;
        partition.emplace(prefix, std::move(record));
    }

    records.clear();

    return (std::move(index));
}

const oui_record* prefix_index::lookup(uint64_t address) const
{
    for (auto width : probe_order) {
        auto& partition = m_partitions[partition_index(width)];
        auto found = partition.find(address & prefix_mask(width));
        if (found != partition.end()) { return (&found->second); }
    }

    return (nullptr);
}

size_t prefix_index::size() const
{
    return (std::accumulate(
        m_partitions.begin(),
        m_partitions.end(),
        size_t{0},
        [](size_t total, const partition& p) { return (total + p.size()); }));
}

size_t prefix_index::size(prefix_width width) const
{
    auto idx = partition_index(width);
    return (idx < m_partitions.size() ? m_partitions[idx].size() : 0);
}

} // namespace liboui::registry
