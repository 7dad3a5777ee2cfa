#include <reactive/runtime/reactive_context.h>
#include <reactive/types/component.h>
#include <reactive/types/observer.h>
#include <reactive/util/debug.h>
#include <reactive/util/scope.h>

#include <algorithm>
#include <atomic>

namespace reactive {
    namespace {
        std::atomic<std::uint64_t> next_component_uid{0};
    }

    std::string_view to_string(LifecycleHook hook) {
        switch (hook) {
            case LifecycleHook::MOUNTED: return "mounted";
            case LifecycleHook::BEFORE_UPDATE: return "beforeUpdate";
            case LifecycleHook::UPDATED: return "updated";
            case LifecycleHook::ACTIVATED: return "activated";
            case LifecycleHook::DEACTIVATED: return "deactivated";
            case LifecycleHook::BEFORE_DESTROY: return "beforeDestroy";
            case LifecycleHook::DESTROYED: return "destroyed";
            case LifecycleHook::_COUNT: break;
        }
        return "unknown";
    }

    Component::Component(ComponentOptions options)
        : _options{std::move(options)}, _uid{next_component_uid++}, _parent{_options.parent},
          _data{Object::make()}, _props{Object::make()} {
        if (_parent != nullptr) { _parent->_children.push_back(this); }
    }

    Component::~Component() {
        // No hooks from here, only the graph references are released
        ReactiveContext::instance().scheduler().forget_component(*this);
        _is_being_destroyed = true;
        teardown_watchers();
        for (auto child : _children) { child->_parent = nullptr; }
        if (_parent != nullptr) { std::erase(_parent->_children, this); }
    }

    Component &Component::root() noexcept {
        auto cur = this;
        while (cur->_parent != nullptr) { cur = cur->_parent; }
        return *cur;
    }

    void Component::initialise() {
        init_props();
        init_data();
        init_computed();
        init_watch();
    }

    void Component::start() {
        if (_is_mounted) {
            // Started again after a stop, the activated hook follows the next flush
            ReactiveContext::instance().scheduler().queue_activated_component(*this);
            return;
        }
        if (_options.render) {
            auto render = [this](Component &vm) -> Value {
                try {
                    return _options.render(vm);
                } catch (const std::exception &e) {
                    handle_error(e, this, "render");
                    return rendered();
                }
            };
            WatcherOptions options;
            options.before = [this] {
                if (_is_mounted && !_is_destroyed) { call_hook(LifecycleHook::BEFORE_UPDATE); }
            };
            (void)Watcher::create(*this, std::move(render), {}, std::move(options), true);
        }
        _is_mounted = true;
        call_hook(LifecycleHook::MOUNTED);
    }

    void Component::stop() { deactivate(); }

    void Component::dispose() {
        if (_is_being_destroyed) { return; }
        call_hook(LifecycleHook::BEFORE_DESTROY);
        _is_being_destroyed = true;
        // remove self from parent
        bool detached{false};
        if (_parent != nullptr && !_parent->_is_being_destroyed) {
            std::erase(_parent->_children, this);
            detached = true;
        }
        teardown_watchers();
        // remove reference from the root data object
        if (auto ob = _data->observer(); ob != nullptr) { ob->decrement_vm_count(); }
        _is_destroyed = true;
        for (auto child : std::vector<Component *>{_children}) { dispose_component(*child); }
        call_hook(LifecycleHook::DESTROYED);
        ReactiveContext::instance().scheduler().forget_component(*this);
        if (detached) { _parent = nullptr; }
    }

    void Component::activate() {
        if (!_inactive) { return; }
        _inactive = false;
        for (auto child : std::vector<Component *>{_children}) { child->activate(); }
        call_hook(LifecycleHook::ACTIVATED);
    }

    void Component::deactivate() {
        if (_inactive) { return; }
        _inactive = true;
        for (auto child : std::vector<Component *>{_children}) { child->deactivate(); }
        call_hook(LifecycleHook::DEACTIVATED);
    }

    void Component::call_hook(LifecycleHook hook) {
        // disable dependency collection when invoking lifecycle hooks
        TargetScope target{nullptr};
        auto handlers = _options.hooks[static_cast<std::size_t>(hook)];
        for (const auto &handler : handlers) {
            try {
                handler(*this);
            } catch (const std::exception &e) {
                handle_error(e, this, fmt::format("{} hook", to_string(hook)));
            }
        }
    }

    Value Component::get(std::string_view key) {
        if (is_prop(key)) { return _props->get(key); }
        if (!is_reserved(key) && _data->has_own(key)) { return _data->get(key); }
        if (computed_options(key) != nullptr) { return computed_getter(key); }
        return {};
    }

    void Component::set(std::string_view key, Value value) {
        if (is_prop(key)) {
            _props->set(key, std::move(value));
            return;
        }
        if (!is_reserved(key) && _data->has_own(key)) {
            _data->set(key, std::move(value));
            return;
        }
        if (auto computed = computed_options(key); computed != nullptr) {
            if (computed->set) {
                computed->set(*this, value);
            } else {
                warn(this, "Computed property \"{}\" was assigned to but it has no setter.", key);
            }
            return;
        }
        warn(this, "Property \"{}\" is not defined on the component, declare it in the data option.", key);
    }

    void Component::update_props(const std::vector<std::pair<std::string, Value>> &values) {
        flag_guard updating{_updating_props, true};
        ObservingScope observing{false};
        for (const auto &[key, value] : values) {
            if (is_prop(key)) { _props->set(key, value); }
        }
    }

    Component::unwatch_type Component::watch(const std::string &expression, Watcher::callback_type cb,
                                             WatchOptions options) {
        WatcherOptions watcher_options;
        watcher_options.deep = options.deep;
        watcher_options.user = true;
        watcher_options.sync = options.sync;
        auto watcher = Watcher::create(*this, expression, cb, std::move(watcher_options));
        return register_watch(watcher, cb, options.immediate);
    }

    Component::unwatch_type Component::watch(Watcher::getter_type getter, Watcher::callback_type cb,
                                             WatchOptions options) {
        WatcherOptions watcher_options;
        watcher_options.deep = options.deep;
        watcher_options.user = true;
        watcher_options.sync = options.sync;
        auto watcher = Watcher::create(*this, std::move(getter), cb, std::move(watcher_options));
        return register_watch(watcher, cb, options.immediate);
    }

    Component::unwatch_type Component::register_watch(const watcher_s_ptr &watcher, const Watcher::callback_type &cb,
                                                      bool immediate) {
        if (immediate && cb) {
            try {
                cb(watcher->value(), Value{});
            } catch (const std::exception &e) {
                handle_error(e, this, fmt::format("callback for immediate watcher \"{}\"", watcher->expression()));
            }
        }
        return [weak = std::weak_ptr<Watcher>{watcher}] {
            if (auto w = weak.lock()) { w->teardown(); }
        };
    }

    Value Component::rendered() const { return _render_watcher != nullptr ? _render_watcher->value() : Value{}; }

    watcher_ptr Component::computed_watcher(std::string_view key) const {
        auto it = std::find_if(_computed_watchers.begin(), _computed_watchers.end(),
                               [key](const auto &entry) { return entry.first == key; });
        return it == _computed_watchers.end() ? nullptr : it->second.get();
    }

    void Component::add_watcher(watcher_s_ptr watcher, bool is_render_watcher) {
        if (is_render_watcher) { _render_watcher = watcher.get(); }
        _watchers.push_back(std::move(watcher));
    }

    void Component::remove_watcher(const Watcher &watcher) {
        if (_render_watcher == &watcher) { _render_watcher = nullptr; }
        std::erase_if(_watchers, [&watcher](const watcher_s_ptr &w) { return w.get() == &watcher; });
    }

    void Component::init_props() {
        auto is_root = _parent == nullptr;
        // root instance props should be converted
        std::optional<ObservingScope> observing;
        if (!is_root) { observing.emplace(false); }
        for (const auto &[key, options] : _options.props) {
            _prop_keys.push_back(key);
            Value value{_options.props_data ? _options.props_data->peek(key) : Value{}};
            if (value.is_undefined()) {
                if (options.default_factory) {
                    TargetScope target{nullptr};
                    value = options.default_factory(*this);
                } else if (options.default_value) {
                    value = *options.default_value;
                }
                // a default has not been observed by a parent, observe it regardless of the suspension above
                ObservingScope observe_default{true};
                observe(value);
            }
            define_reactive(*_props, key, std::move(value), [this, prop_key = key] {
                if (_parent != nullptr && !_updating_props) {
                    warn(this,
                         "Avoid mutating a prop directly since the value will be overwritten whenever the parent "
                         "component re-renders. Instead, use a data or computed property based on the prop's value. "
                         "Prop being mutated: \"{}\"",
                         prop_key);
                }
            });
        }
    }

    Value Component::get_data() {
        // disable dependency collection while the data factory runs
        TargetScope target{nullptr};
        try {
            return _options.data(*this);
        } catch (const std::exception &e) {
            handle_error(e, this, "data()");
            return make_object();
        }
    }

    void Component::init_data() {
        Value data{_options.data ? get_data() : make_object()};
        if (!data.is_plain_object()) {
            data = make_object();
            warn("data functions should return an object", this);
        }
        _data = data.as_object();
        for (const auto &key : _data->keys()) {
            if (is_prop(key)) {
                warn(this, "The data property \"{}\" is already declared as a prop. Use prop default value instead.",
                     key);
            }
        }
        // observe data
        observe(data, true);
    }

    void Component::init_computed() {
        for (const auto &[key, options] : _options.computed) {
            Watcher::getter_type getter{options.get};
            if (!getter) {
                warn(this, "Getter is missing for computed property \"{}\".", key);
                getter = [](Component &) { return Value{}; };
            }
            WatcherOptions watcher_options;
            watcher_options.computed = true;
            // create internal watcher for the computed property.
            _computed_watchers.emplace_back(key, Watcher::create(*this, std::move(getter), {}, watcher_options));

            if (_data->has_own(key)) {
                warn(this, "The computed property \"{}\" is already defined in data.", key);
            } else if (is_prop(key)) {
                warn(this, "The computed property \"{}\" is already defined as a prop.", key);
            }
        }
    }

    void Component::init_watch() {
        for (const auto &[key, handlers] : _options.watch) {
            for (const auto &handler : handlers) { watch(key, handler.handler, handler.options); }
        }
    }

    Value Component::computed_getter(std::string_view key) {
        auto options = computed_options(key);
        if (!options->cache) { return options->get ? options->get(*this) : Value{}; }
        auto watcher = computed_watcher(key);
        if (watcher == nullptr) { return {}; }
        watcher->depend();
        return watcher->evaluate();
    }

    bool Component::is_prop(std::string_view key) const {
        return std::find(_prop_keys.begin(), _prop_keys.end(), key) != _prop_keys.end();
    }

    const ComputedOptions *Component::computed_options(std::string_view key) const {
        auto it = std::find_if(_options.computed.begin(), _options.computed.end(),
                               [key](const auto &entry) { return entry.first == key; });
        return it == _options.computed.end() ? nullptr : &it->second;
    }

    void Component::teardown_watchers() {
        if (_render_watcher != nullptr) { _render_watcher->teardown(); }
        for (auto i = _watchers.size(); i-- > 0;) { _watchers[i]->teardown(); }
    }

    bool Component::is_reserved(std::string_view key) {
        return !key.empty() && (key.front() == '$' || key.front() == '_');
    }
} // namespace reactive
