#include <reactive/runtime/next_tick.h>
#include <reactive/runtime/reactive_context.h>
#include <reactive/util/debug.h>

#include <utility>

namespace reactive {
    void TickQueue::next_tick(callback_type cb, component_ptr ctx) {
        _callbacks.emplace_back(std::move(cb), ctx);
        if (_pending) { return; }
        _pending = true;
        if (_timer_function) {
            _timer_function([this] { flush_callbacks(); });
        } else {
            _drain_due = true;
        }
    }

    bool TickQueue::run_pending() {
        bool ran{false};
        while (_drain_due) {
            _drain_due = false;
            ran = true;
            flush_callbacks();
        }
        return ran;
    }

    void TickQueue::set_timer_function(timer_function_type timer_function) {
        _timer_function = std::move(timer_function);
    }

    void TickQueue::clear() {
        _callbacks.clear();
        _pending = false;
        _drain_due = false;
    }

    void TickQueue::flush_callbacks() {
        _pending = false;
        // Callbacks registered from here on belong to the next batch
        auto copies = std::exchange(_callbacks, {});
        for (auto &[cb, ctx] : copies) {
            try {
                cb();
            } catch (const std::exception &e) {
                handle_error(e, ctx, "nextTick");
            }
        }
    }

    void next_tick(TickQueue::callback_type cb, component_ptr ctx) {
        ReactiveContext::instance().ticks().next_tick(std::move(cb), ctx);
    }
} // namespace reactive
