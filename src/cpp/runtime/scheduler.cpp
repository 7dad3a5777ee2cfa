#include <reactive/runtime/reactive_context.h>
#include <reactive/runtime/scheduler.h>
#include <reactive/types/component.h>
#include <reactive/types/watcher.h>
#include <reactive/util/debug.h>
#include <reactive/util/scope.h>

#include <algorithm>

namespace reactive {
    void Scheduler::queue_watcher(Watcher &watcher) {
        auto id = watcher.id();
        if (_has.contains(id)) { return; }
        _has.insert(id);
        auto ptr = watcher.shared_from_this();
        if (!_flushing) {
            _queue.push_back(std::move(ptr));
        } else {
            // if already flushing, splice the watcher based on its id
            // if already past its id, it will be run next immediately.
            auto pos = _queue.size();
            while (pos > _index + 1 && _queue[pos - 1]->id() > id) { --pos; }
            _queue.insert(_queue.begin() + static_cast<std::ptrdiff_t>(pos), std::move(ptr));
        }
        request_flush();
    }

    void Scheduler::queue_activated_component(Component &vm) {
        if (std::find(_activated_children.begin(), _activated_children.end(), &vm) == _activated_children.end()) {
            _activated_children.push_back(&vm);
        }
        request_flush();
    }

    void Scheduler::forget_component(const Component &vm) { std::erase(_activated_children, &vm); }

    void Scheduler::request_flush() {
        if (_waiting) { return; }
        _waiting = true;
        auto &ctx = ReactiveContext::instance();
        if (!ctx.config().async) {
            flush_scheduler_queue();
            return;
        }
        ctx.ticks().next_tick([this] { flush_scheduler_queue(); });
    }

    void Scheduler::flush_scheduler_queue() {
        _flushing = true;
        // An internal watcher failure propagates, the queue must not be left half flushed
        auto guard = make_scope_exit([this] { reset(); });

        // Sort queue before flush, creation order is parent before child and user watchers before render
        std::sort(_queue.begin(), _queue.end(), [](const watcher_s_ptr &lhs, const watcher_s_ptr &rhs) {
            return lhs->id() < rhs->id();
        });

        auto observers = _observers;
        for (auto observer : observers) { observer->on_before_flush(_queue.size()); }

        auto max_update_count = ReactiveContext::instance().config().max_update_count;
        std::size_t watchers_run{0};
        // do not cache length because more watchers might be pushed as we run existing watchers
        for (_index = 0; _index < _queue.size(); ++_index) {
            auto watcher = _queue[_index];
            if (watcher->is_active()) { watcher->before(); }
            auto id = watcher->id();
            _has.erase(id);
            // A torn down watcher may have outlived its owner, run is a no-op and it is not reported
            if (watcher->is_active()) {
                for (auto observer : observers) { observer->on_before_watcher_run(*watcher); }
                watcher->run();
                ++watchers_run;
                if (watcher->is_active()) {
                    for (auto observer : observers) { observer->on_after_watcher_run(*watcher); }
                }
            }
            // the watcher was re-queued by its own run
            if (_has.contains(id)) {
                auto count = ++_circular[id];
                if (count > max_update_count) {
                    for (auto observer : observers) { observer->on_circular_update(*watcher, count); }
                    if (watcher->is_user()) {
                        warn(&watcher->vm(), "You may have an infinite update loop in watcher with expression \"{}\"",
                             watcher->expression());
                    } else {
                        warn("You may have an infinite update loop in a component render function.", &watcher->vm());
                    }
                    break;
                }
            }
        }

        // keep copies of post queues before resetting state
        auto activated_queue = _activated_children;
        auto updated_queue = _queue;
        guard.release();
        reset();

        call_activated_hooks(activated_queue);
        call_updated_hooks(updated_queue);

        for (auto observer : observers) { observer->on_after_flush(watchers_run); }
    }

    void Scheduler::reset() {
        _index = 0;
        _queue.clear();
        _activated_children.clear();
        _has.clear();
        _circular.clear();
        _waiting = false;
        _flushing = false;
    }

    void Scheduler::add_flush_observer(flush_observer_ptr observer) {
        if (std::find(_observers.begin(), _observers.end(), observer) == _observers.end()) {
            _observers.push_back(observer);
        }
    }

    void Scheduler::remove_flush_observer(flush_observer_ptr observer) { std::erase(_observers, observer); }

    void Scheduler::call_updated_hooks(const std::vector<watcher_s_ptr> &queue) {
        for (auto it = queue.rbegin(); it != queue.rend(); ++it) {
            const auto &watcher = *it;
            if (!watcher->is_active()) { continue; }
            auto &vm = watcher->vm();
            if (vm.render_watcher() == watcher.get() && vm.is_mounted() && !vm.is_destroyed()) {
                vm.call_hook(LifecycleHook::UPDATED);
            }
        }
    }

    void Scheduler::call_activated_hooks(const std::vector<component_ptr> &queue) {
        for (auto vm : queue) { vm->activate(); }
    }

    void queue_watcher(Watcher &watcher) { ReactiveContext::instance().scheduler().queue_watcher(watcher); }
} // namespace reactive
