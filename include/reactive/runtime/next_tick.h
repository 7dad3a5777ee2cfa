#ifndef REACTIVE_NEXT_TICK_H
#define REACTIVE_NEXT_TICK_H

#include <reactive/reactive_base.h>

#include <functional>
#include <utility>
#include <vector>

namespace reactive {
    /**
     * The deferral primitive used by the scheduler. Callbacks registered with next_tick are run in one batch the next
     * time the queue is drained; the first callback of a batch arms the timer function exactly once.
     *
     * The default timer function only records that a drain is due, the host drains at its cooperative yield point by
     * calling run_pending (an event loop would call it once per turn). A host with its own loop can install a timer
     * function that posts the supplied flush callback instead.
     */
    struct REACTIVE_EXPORT TickQueue {
        using callback_type = std::function<void()>;
        using timer_function_type = std::function<void(callback_type flush)>;

        TickQueue() = default;

        TickQueue(const TickQueue &) = delete;

        TickQueue &operator=(const TickQueue &) = delete;

        /**
         * Defer a callback. Failures raised by the callback are reported through handle_error with ctx as the
         * component, they do not prevent the other callbacks of the batch from running.
         */
        void next_tick(callback_type cb, component_ptr ctx = nullptr);

        /**
         * Drain the queue, including callbacks registered while draining, until nothing is due. Returns true if any
         * callback ran.
         */
        bool run_pending();

        [[nodiscard]] bool has_pending() const noexcept { return _pending; }

        [[nodiscard]] std::size_t size() const noexcept { return _callbacks.size(); }

        void set_timer_function(timer_function_type timer_function);

        /**
         * Drop every pending callback.
         */
        void clear();

    private:
        void flush_callbacks();

        std::vector<std::pair<callback_type, component_ptr>> _callbacks;
        bool _pending{false};
        bool _drain_due{false};
        timer_function_type _timer_function;
    };

    /**
     * next_tick on the tick queue of the current ReactiveContext.
     */
    REACTIVE_EXPORT void next_tick(TickQueue::callback_type cb, component_ptr ctx = nullptr);
} // namespace reactive

#endif // REACTIVE_NEXT_TICK_H
