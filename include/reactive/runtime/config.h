#ifndef REACTIVE_CONFIG_H
#define REACTIVE_CONFIG_H

#include <reactive/reactive_base.h>

#include <exception>
#include <functional>
#include <string_view>

namespace reactive {
    /**
     * Runtime configuration, one instance per ReactiveContext.
     */
    struct Config {
        using error_handler_type = std::function<void(const std::exception &error, component_ptr vm,
                                                      std::string_view info)>;
        using warn_handler_type = std::function<void(std::string_view msg, const Component *vm,
                                                     std::string_view trace)>;

        static constexpr std::size_t DEFAULT_MAX_UPDATE_COUNT{100};

        /**
         * Suppress all warnings and tips written to stderr.
         */
        bool silent{false};

        /**
         * Perform updates asynchronously (through the tick queue). When false the scheduler flushes synchronously as
         * soon as a watcher is queued.
         */
        bool async{true};

        /**
         * Number of times a watcher may be re-queued within one flush before it is reported as an infinite update
         * loop.
         */
        std::size_t max_update_count{DEFAULT_MAX_UPDATE_COUNT};

        /**
         * Handler for errors raised by user code (watch getters and callbacks, hooks, data factories). When not set
         * errors are logged to stderr.
         */
        error_handler_type error_handler{};

        /**
         * Handler for runtime warnings. When not set warnings are written to stderr.
         */
        warn_handler_type warn_handler{};
    };
} // namespace reactive

#endif // REACTIVE_CONFIG_H
