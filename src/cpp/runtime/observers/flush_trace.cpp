#include <reactive/runtime/observers/flush_trace.h>
#include <reactive/types/component.h>
#include <reactive/types/watcher.h>
#include <reactive/util/debug.h>

#include <fmt/format.h>

namespace reactive {
    FlushTrace::FlushTrace(std::optional<std::string> filter, bool flush, bool watcher, std::FILE *out)
        : _filter{std::move(filter)}, _flush{flush}, _watcher{watcher}, _out{out} {}

    void FlushTrace::_print(const std::string &msg) const {
        fmt::print(_out, "[flush {}] {}\n", _flush_count, msg);
    }

    std::string FlushTrace::_watcher_name(const Watcher &watcher) const {
        std::string kind = watcher.is_computed() ? "computed"
                           : watcher.vm().render_watcher() == &watcher ? "render"
                           : watcher.is_user() ? "user"
                           : "watcher";
        return fmt::format("{}<{}>({}) {}", kind, watcher.id(), watcher.expression(),
                           format_component_name(&watcher.vm()));
    }

    bool FlushTrace::_filter_watcher(const Watcher &watcher) const {
        if (!_filter.has_value()) { return true; }
        return watcher.expression().find(*_filter) != std::string::npos;
    }

    void FlushTrace::on_before_flush(std::size_t queue_size) {
        ++_flush_count;
        if (_flush) { _print(fmt::format("{} Flush Start ({} queued) {}", std::string(20, '>'), queue_size,
                                         std::string(20, '>'))); }
    }

    void FlushTrace::on_before_watcher_run(const Watcher &watcher) {
        if (_watcher && _filter_watcher(watcher)) { _print(fmt::format("{} [IN]", _watcher_name(watcher))); }
    }

    void FlushTrace::on_after_watcher_run(const Watcher &watcher) {
        if (_watcher && _filter_watcher(watcher)) {
            _print(fmt::format("{} [OUT] -> {}", _watcher_name(watcher), watcher.value()));
        }
    }

    void FlushTrace::on_circular_update(const Watcher &watcher, std::size_t count) {
        // Always reported, a runaway loop is the reason to trace in the first place
        _print(fmt::format("{} re-queued {} times", _watcher_name(watcher), count));
    }

    void FlushTrace::on_after_flush(std::size_t watchers_run) {
        if (_flush) { _print(fmt::format("{} Flush Done ({} run) {}", std::string(20, '<'), watchers_run,
                                         std::string(20, '<'))); }
    }
} // namespace reactive
