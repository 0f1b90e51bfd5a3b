#ifndef _LIB_OUI_REGISTRY_LOADER_HPP_
#define _LIB_OUI_REGISTRY_LOADER_HPP_

#include <iosfwd>
#include <string>
#include <string_view>

#include "tl/expected.hpp"

#include "oui/registry/prefix_index.hpp"

namespace liboui::registry {

struct load_options
{
    char delimiter = ';';

    /*
     * Strict loads fail on any malformed line.  Otherwise malformed lines
     * are logged, counted, and skipped.
     */
    bool strict = true;
};

struct load_error
{
    enum class reason_type {
        io_error,
        malformed_record,
        duplicate_prefix,
        empty_registry,
    };

    reason_type reason;
    std::string message;

    /* First offending line, 1-based; 0 if the error isn't tied to a line */
    size_t line_number = 0;
    std::string line;

    size_t failed_lines = 0;
    size_t skipped_lines = 0;
};

std::string to_string(const load_error&);

/*
 * Read a complete registry and build an index from it.
 *
 * Blank lines and '#' comments are skipped, as is the first remaining line
 * when it does not parse as a record (the column header).
 */
tl::expected<prefix_index, load_error>
load_stream(std::istream& input, const load_options& options = {});

tl::expected<prefix_index, load_error>
load_string(std::string_view data, const load_options& options = {});

tl::expected<prefix_index, load_error>
load_file(std::string_view path, const load_options& options = {});

} // namespace liboui::registry

#endif /* _LIB_OUI_REGISTRY_LOADER_HPP_ */
