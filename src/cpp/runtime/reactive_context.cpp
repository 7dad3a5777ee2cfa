#include <reactive/runtime/reactive_context.h>

namespace reactive {
    ReactiveContext &ReactiveContext::instance() {
        thread_local ReactiveContext context;
        return context;
    }

    bool ReactiveContext::run_pending_ticks() { return _ticks.run_pending(); }

    void ReactiveContext::reset() {
        _ticks.clear();
        _ticks.set_timer_function({});
        _scheduler.reset();
        _scheduler.clear_flush_observers();
        _targets.clear();
        _config = Config{};
        _should_observe = true;
    }
} // namespace reactive
