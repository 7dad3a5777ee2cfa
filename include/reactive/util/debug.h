#ifndef REACTIVE_UTIL_DEBUG_H
#define REACTIVE_UTIL_DEBUG_H

#include <reactive/reactive_base.h>

#include <exception>
#include <string>
#include <string_view>

namespace reactive {
    /**
     * Report a runtime warning. Routed to Config::warn_handler when set, otherwise written to stderr as
     * "[reactive warn]: <msg>" followed by the component trace, unless Config::silent is set.
     */
    REACTIVE_EXPORT void warn(std::string_view msg, const Component *vm = nullptr);

    template<typename... Ts>
        requires (sizeof...(Ts) > 0)
    void warn(const Component *vm, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        warn(std::string_view{fmt::format(fmt_str, std::forward<Ts>(xs)...)}, vm);
    }

    /**
     * Report a hint, written to stderr as "[reactive tip]: <msg>" unless Config::silent is set.
     */
    REACTIVE_EXPORT void tip(std::string_view msg, const Component *vm = nullptr);

    /**
     * "<Anonymous>" or "<Name>".
     */
    [[nodiscard]] REACTIVE_EXPORT std::string format_component_name(const Component *vm);

    /**
     * The parent chain of a component rendered for diagnostics, e.g. "\n\nfound in\n\n---> <Child>\n       <Root>".
     */
    [[nodiscard]] REACTIVE_EXPORT std::string generate_component_trace(const Component *vm);

    /**
     * Report an error raised by user code. The error_captured hooks of the component's ancestors are offered the
     * error first (a hook returning false stops the propagation), then Config::error_handler, and when no handler
     * is installed the error is logged to stderr.
     */
    REACTIVE_EXPORT void handle_error(const std::exception &error, Component *vm, std::string_view info);

    REACTIVE_EXPORT void log_error(const std::exception &error, const Component *vm, std::string_view info);
} // namespace reactive

#endif // REACTIVE_UTIL_DEBUG_H
