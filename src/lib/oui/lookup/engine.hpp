#ifndef _LIB_OUI_LOOKUP_ENGINE_HPP_
#define _LIB_OUI_LOOKUP_ENGINE_HPP_

#include <memory>
#include <stdexcept>
#include <string_view>

#include "tl/expected.hpp"

#include "oui/lookup/resolve.hpp"
#include "oui/registry/loader.hpp"

namespace liboui::lookup {

/* Thrown when an engine is queried before any index has been published */
class index_not_ready : public std::logic_error
{
public:
    index_not_ready();
};

/**
 * Shared query surface over a swappable registry index.
 *
 * Queries take a snapshot of the current index; publishing a new index
 * never disturbs queries already running against the old one.  All
 * member functions are safe to call concurrently.
 */
class engine
{
public:
    engine() = default;
    explicit engine(std::shared_ptr<const registry::prefix_index> index);
    explicit engine(registry::prefix_index&& index);

    /* Replace the index used by subsequent queries */
    void publish(std::shared_ptr<const registry::prefix_index> index);

    /*
     * Load a registry and publish it.  On failure, the current index
     * remains in service.
     */
    tl::expected<void, registry::load_error>
    reload(std::string_view path, const registry::load_options& options = {});

    bool ready() const;

    std::shared_ptr<const registry::prefix_index> index() const;

    /* @throws index_not_ready if no index has been published */
    lookup_result resolve(std::string_view mac_text) const;

private:
    std::shared_ptr<const registry::prefix_index> m_index;
};

} // namespace liboui::lookup

#endif /* _LIB_OUI_LOOKUP_ENGINE_HPP_ */
