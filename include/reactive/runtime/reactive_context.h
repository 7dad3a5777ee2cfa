#ifndef REACTIVE_CONTEXT_H
#define REACTIVE_CONTEXT_H

#include <reactive/runtime/config.h>
#include <reactive/runtime/next_tick.h>
#include <reactive/runtime/scheduler.h>
#include <reactive/types/subject.h>

namespace reactive {
    /**
     * The process state of the reactive runtime for the current thread: the active-computation stack, the scheduler,
     * the tick queue, the observation switch and the configuration. The model is single-threaded and cooperative, each
     * thread that uses the library gets an independent context.
     */
    struct REACTIVE_EXPORT ReactiveContext {
        ReactiveContext() = default;

        ReactiveContext(const ReactiveContext &) = delete;

        ReactiveContext &operator=(const ReactiveContext &) = delete;

        [[nodiscard]] static ReactiveContext &instance();

        [[nodiscard]] TargetStack &targets() noexcept { return _targets; }

        [[nodiscard]] Scheduler &scheduler() noexcept { return _scheduler; }

        [[nodiscard]] TickQueue &ticks() noexcept { return _ticks; }

        [[nodiscard]] Config &config() noexcept { return _config; }

        [[nodiscard]] bool should_observe() const noexcept { return _should_observe; }

        void set_should_observe(bool value) noexcept { _should_observe = value; }

        /**
         * Drain the tick queue, running any pending scheduler flush. Returns true if anything ran.
         */
        bool run_pending_ticks();

        /**
         * Drop all pending work and restore the default configuration.
         */
        void reset();

    private:
        TargetStack _targets;
        Scheduler _scheduler;
        TickQueue _ticks;
        Config _config;
        bool _should_observe{true};
    };
} // namespace reactive

#endif // REACTIVE_CONTEXT_H
