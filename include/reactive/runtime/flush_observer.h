#ifndef REACTIVE_FLUSH_OBSERVER_H
#define REACTIVE_FLUSH_OBSERVER_H

#include <reactive/reactive_base.h>

namespace reactive {
    /**
     * Observer of the scheduler's flush life-cycle. Observers are registered on the Scheduler (non-owning), every
     * call-back has a no-op default so an observer only overrides what it needs.
     */
    struct FlushObserver {
        using ptr = FlushObserver *;

        virtual ~FlushObserver() = default;

        virtual void on_before_flush(std::size_t /*queue_size*/) {
        };

        virtual void on_before_watcher_run(const Watcher &) {
        };

        virtual void on_after_watcher_run(const Watcher &) {
        };

        virtual void on_circular_update(const Watcher &, std::size_t /*count*/) {
        };

        virtual void on_after_flush(std::size_t /*watchers_run*/) {
        };
    };
} // namespace reactive

#endif // REACTIVE_FLUSH_OBSERVER_H
