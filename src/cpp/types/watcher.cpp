#include <reactive/runtime/scheduler.h>
#include <reactive/types/component.h>
#include <reactive/types/path.h>
#include <reactive/types/traverse.h>
#include <reactive/types/watcher.h>
#include <reactive/util/debug.h>
#include <reactive/util/errors.h>
#include <reactive/util/scope.h>

#include <atomic>
#include <utility>

namespace reactive {
    namespace {
        // Ids start at 1, creation order is the flush order
        std::atomic<watcher_id_t> next_watcher_id{0};
    }

    Watcher::Watcher(PrivateTag, Component &vm, getter_type getter, callback_type cb, WatcherOptions options,
                     std::string expression)
        : _vm{&vm}, _id{++next_watcher_id}, _getter{std::move(getter)}, _cb{std::move(cb)},
          _expression{std::move(expression)}, _deep{options.deep}, _user{options.user}, _computed{options.computed},
          _sync{options.sync}, _dirty{options.computed}, _before{std::move(options.before)},
          _dep{options.computed ? Subject::make() : nullptr} {}

    Watcher::~Watcher() { unsubscribe_all(); }

    Watcher::s_ptr Watcher::make(Component &vm, getter_type getter, callback_type cb, WatcherOptions options,
                                 bool is_render_watcher, std::string expression) {
        auto computed = options.computed;
        auto watcher = std::make_shared<Watcher>(PrivateTag{}, vm, std::move(getter), std::move(cb),
                                                 std::move(options), std::move(expression));
        vm.add_watcher(watcher, is_render_watcher);
        if (!computed) { watcher->_value = watcher->get(); }
        return watcher;
    }

    Watcher::s_ptr Watcher::create(Component &vm, getter_type getter, callback_type cb, WatcherOptions options,
                                   bool is_render_watcher) {
        if (!getter) { throw_error<ReactiveError>("A watcher requires a getter"); }
        return make(vm, std::move(getter), std::move(cb), std::move(options), is_render_watcher, "<function>");
    }

    Watcher::s_ptr Watcher::create(Component &vm, const std::string &expression, callback_type cb,
                                   WatcherOptions options, bool is_render_watcher) {
        auto getter = parse_path(expression);
        if (!getter) {
            warn(&vm,
                 "Failed watching path: \"{}\" Watcher only accepts simple dot-delimited paths. For full control, "
                 "use a function instead.",
                 expression);
            getter = [](Component &) { return Value{}; };
        }
        return make(vm, std::move(*getter), std::move(cb), std::move(options), is_render_watcher, expression);
    }

    Value Watcher::get() {
        // Declared before the target scope so the target is popped first, then the dependency sets are swapped
        auto cleanup = make_scope_exit([this] { cleanup_deps(); });
        TargetScope target{this};
        Value value;
        try {
            value = _getter(*_vm);
        } catch (const std::exception &e) {
            if (!_user) { throw; }
            handle_error(e, _vm, fmt::format("getter for watcher \"{}\"", _expression));
        }
        // Read every nested property so that each one is recorded as a dependency
        if (_deep) { traverse(value); }
        return value;
    }

    void Watcher::add_dep(Subject &dep) {
        auto id = dep.id();
        if (_new_dep_ids.contains(id)) { return; }
        _new_dep_ids.insert(id);
        _new_deps.push_back({id, dep.weak_from_this()});
        if (!_dep_ids.contains(id)) { dep.add_sub(this); }
    }

    void Watcher::cleanup_deps() {
        for (const auto &ref : _deps) {
            if (_new_dep_ids.contains(ref.id)) { continue; }
            if (auto subject = ref.subject.lock()) { subject->remove_sub(this); }
        }
        std::swap(_dep_ids, _new_dep_ids);
        _new_dep_ids.clear();
        std::swap(_deps, _new_deps);
        _new_deps.clear();
    }

    template<typename Callback>
    void Watcher::get_and_invoke(Callback &&cb) {
        auto value = get();
        // Containers may have been mutated in place, so they (and deep watchers) always fire
        if (same_value(value, _value) && !is_object(value) && !_deep) { return; }
        auto old_value = std::exchange(_value, value);
        _dirty = false;
        if (!_user) {
            cb(value, old_value);
            return;
        }
        try {
            cb(value, old_value);
        } catch (const std::exception &e) {
            handle_error(e, _vm, fmt::format("callback for watcher \"{}\"", _expression));
        }
    }

    void Watcher::update() {
        if (_computed) {
            // Nobody depends on the result: stay lazy, evaluate() recomputes on the next read
            if (!_dep->has_subscribers()) {
                _dirty = true;
            } else {
                // Subscribed: recompute now, subscribers are only notified if the result changed
                get_and_invoke([this](const Value &, const Value &) {
                    auto dep = _dep;
                    dep->notify();
                });
            }
        } else if (_sync) {
            run();
        } else {
            queue_watcher(*this);
        }
    }

    void Watcher::run() {
        if (!_active) { return; }
        get_and_invoke([this](const Value &new_value, const Value &old_value) {
            if (_cb) { _cb(new_value, old_value); }
        });
    }

    const Value &Watcher::evaluate() {
        if (_dirty) {
            _value = get();
            _dirty = false;
        }
        return _value;
    }

    void Watcher::depend() {
        if (_dep && current_target() != nullptr) { _dep->depend(); }
    }

    void Watcher::teardown() {
        if (!_active) { return; }
        // The owner list may hold the last reference
        auto self = weak_from_this().lock();
        // The owner clears its whole list when it is being destroyed
        if (!_vm->is_being_destroyed()) { _vm->remove_watcher(*this); }
        unsubscribe_all();
        _active = false;
    }

    void Watcher::unsubscribe_all() noexcept {
        for (const auto &ref : _deps) {
            if (auto subject = ref.subject.lock()) { subject->remove_sub(this); }
        }
        for (const auto &ref : _new_deps) {
            if (auto subject = ref.subject.lock()) { subject->remove_sub(this); }
        }
        _deps.clear();
        _new_deps.clear();
        _dep_ids.clear();
        _new_dep_ids.clear();
    }
} // namespace reactive
