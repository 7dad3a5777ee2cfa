#ifndef REACTIVE_PATH_H
#define REACTIVE_PATH_H

#include <reactive/types/watcher.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reactive {
    /**
     * Splits a simple dot-delimited path ("a.b.c") into its segments. Returns nullopt if the path contains anything
     * other than word characters, '$' and '.'.
     */
    [[nodiscard]] REACTIVE_EXPORT std::optional<std::vector<std::string>> split_path(std::string_view path);

    /**
     * Builds a getter resolving the path against a component: the first segment is looked up on the component, the
     * remaining ones on the resulting values. A falsy intermediate value stops the walk and yields undefined.
     */
    [[nodiscard]] REACTIVE_EXPORT std::optional<Watcher::getter_type> parse_path(std::string_view path);
} // namespace reactive

#endif // REACTIVE_PATH_H
