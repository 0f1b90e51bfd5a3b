#include <atomic>

#include "core/oui_log.h"
#include "oui/lookup/engine.hpp"

namespace liboui::lookup {

index_not_ready::index_not_ready()
    : std::logic_error("registry index queried before it was loaded")
{}

engine::engine(std::shared_ptr<const registry::prefix_index> index)
    : m_index(std::move(index))
{}

engine::engine(registry::prefix_index&& index)
    : m_index(std::make_shared<const registry::prefix_index>(std::move(index)))
{}

void engine::publish(std::shared_ptr<const registry::prefix_index> index)
{
    if (index) {
        OUI_LOG(OUI_LOG_DEBUG,
                "Publishing registry index with %zu records\n",
                index->size());
    }
    std::atomic_store(&m_index, std::move(index));
}

tl::expected<void, registry::load_error>
engine::reload(std::string_view path, const registry::load_options& options)
{
    auto result = registry::load_file(path, options);
    if (!result) {
        OUI_LOG(OUI_LOG_ERROR,
                "Registry reload failed; keeping current index: %s\n",
                registry::to_string(result.error()).c_str());
        return (tl::make_unexpected(std::move(result.error())));
    }

    publish(std::make_shared<const registry::prefix_index>(std::move(*result)));
    return {};
}

bool engine::ready() const { return (std::atomic_load(&m_index) != nullptr); }

std::shared_ptr<const registry::prefix_index> engine::index() const
{
    return (std::atomic_load(&m_index));
}

lookup_result engine::resolve(std::string_view mac_text) const
{
    auto snapshot = std::atomic_load(&m_index);
    if (!snapshot) { throw index_not_ready(); }

    return (lookup::resolve(*snapshot, mac_text));
}

} // namespace liboui::lookup
