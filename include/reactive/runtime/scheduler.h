#ifndef REACTIVE_SCHEDULER_H
#define REACTIVE_SCHEDULER_H

#include <reactive/runtime/flush_observer.h>

#include <vector>

namespace reactive {
    /**
     * The batched run queue for Watchers.
     *
     * Watchers queued during a tick are collected (once each) and run together by a single deferred flush, sorted by
     * creation id. This ensures that:
     *
     * 1. Components are updated from parent to child (a parent is always created before its children).
     * 2. A component's user watchers run before its render watcher (they are created first).
     * 3. If a component is destroyed during a parent's watcher run, its watchers are skipped (run is a no-op on an
     *    inactive watcher).
     */
    struct REACTIVE_EXPORT Scheduler {
        Scheduler() = default;

        Scheduler(const Scheduler &) = delete;

        Scheduler &operator=(const Scheduler &) = delete;

        /**
         * Push a watcher into the watcher queue. Jobs with duplicate ids are skipped unless they are pushed while
         * the queue is being flushed, in which case the watcher is spliced into the remaining part of the queue at
         * its id position.
         */
        void queue_watcher(Watcher &watcher);

        /**
         * Queue a component re-activated while inactive, its activated hook is called after the next flush.
         */
        void queue_activated_component(Component &vm);

        /**
         * Drop any reference to the component from the activated queue (the component is going away).
         */
        void forget_component(const Component &vm);

        /**
         * Flush the queue and run the watchers.
         */
        void flush_scheduler_queue();

        /**
         * Reset the scheduler's state.
         */
        void reset();

        [[nodiscard]] bool is_flushing() const noexcept { return _flushing; }

        [[nodiscard]] bool is_waiting() const noexcept { return _waiting; }

        [[nodiscard]] std::size_t size() const noexcept { return _queue.size(); }

        [[nodiscard]] bool has(watcher_id_t id) const noexcept { return _has.contains(id); }

        void add_flush_observer(flush_observer_ptr observer);

        void remove_flush_observer(flush_observer_ptr observer);

        void clear_flush_observers() noexcept { _observers.clear(); }

    private:
        void request_flush();

        static void call_updated_hooks(const std::vector<watcher_s_ptr> &queue);

        static void call_activated_hooks(const std::vector<component_ptr> &queue);

        std::vector<watcher_s_ptr> _queue;
        std::vector<component_ptr> _activated_children;
        IdSet _has;
        IdMap<std::size_t> _circular;
        bool _waiting{false};
        bool _flushing{false};
        std::size_t _index{0};
        std::vector<flush_observer_ptr> _observers;
    };

    /**
     * queue_watcher on the scheduler of the current ReactiveContext.
     */
    REACTIVE_EXPORT void queue_watcher(Watcher &watcher);
} // namespace reactive

#endif // REACTIVE_SCHEDULER_H
