#ifndef REACTIVE_UTIL_ERRORS
#define REACTIVE_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string_view>

namespace reactive {

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Raised for misuse of the reactive API (null owners, invalid targets) as opposed to failures of user code,
     * which are routed through handle_error instead.
     */
    struct ReactiveError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

} // namespace reactive

#endif // REACTIVE_UTIL_ERRORS
