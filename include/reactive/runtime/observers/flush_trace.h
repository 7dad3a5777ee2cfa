#ifndef REACTIVE_FLUSH_TRACE_H
#define REACTIVE_FLUSH_TRACE_H

#include <reactive/runtime/flush_observer.h>

#include <cstdio>
#include <optional>
#include <string>

namespace reactive {
    /**
     * Prints one line per flush event, useful when following why and in which order watchers re-run.
     *
     * The filter (if set) restricts watcher level output to watchers whose expression contains the filter text.
     */
    struct REACTIVE_EXPORT FlushTrace : FlushObserver {
        explicit FlushTrace(std::optional<std::string> filter = std::nullopt, bool flush = true, bool watcher = true,
                            std::FILE *out = stderr);

        void on_before_flush(std::size_t queue_size) override;

        void on_before_watcher_run(const Watcher &watcher) override;

        void on_after_watcher_run(const Watcher &watcher) override;

        void on_circular_update(const Watcher &watcher, std::size_t count) override;

        void on_after_flush(std::size_t watchers_run) override;

        [[nodiscard]] std::size_t flush_count() const noexcept { return _flush_count; }

    private:
        [[nodiscard]] bool _filter_watcher(const Watcher &watcher) const;

        [[nodiscard]] std::string _watcher_name(const Watcher &watcher) const;

        void _print(const std::string &msg) const;

        std::optional<std::string> _filter;
        bool _flush;
        bool _watcher;
        std::FILE *_out;
        std::size_t _flush_count{0};
    };
} // namespace reactive

#endif // REACTIVE_FLUSH_TRACE_H
