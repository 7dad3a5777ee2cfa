/*
 * The core imports for reactive. Use this to ensure the correct import order is maintained and that
 * the formatting support for the value model is visible wherever diagnostics are produced.
 */

#ifndef REACTIVE_BASE_H
#define REACTIVE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string>
#include <string_view>

#include <reactive/reactive_export.h>
#include <reactive/reactive_forward_declarations.h>

namespace reactive {
    // Identity keyed sets and maps used throughout the dependency graph
    using IdSet = ankerl::unordered_dense::set<std::uint64_t>;

    template<typename V>
    using IdMap = ankerl::unordered_dense::map<std::uint64_t, V>;

    // Transparent hash so string keyed maps can be probed with a string_view
    struct StringHash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] auto operator()(std::string_view str) const noexcept -> std::uint64_t {
            return ankerl::unordered_dense::hash<std::string_view>{}(str);
        }
    };

    template<typename V>
    using StringMap = ankerl::unordered_dense::map<std::string, V, StringHash, std::equal_to<>>;
} // namespace reactive

#endif // REACTIVE_BASE_H
