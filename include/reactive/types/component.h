#ifndef REACTIVE_COMPONENT_H
#define REACTIVE_COMPONENT_H

#include <reactive/types/object.h>
#include <reactive/types/watcher.h>
#include <reactive/util/lifecycle.h>

#include <array>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reactive {

    enum class LifecycleHook : std::uint8_t {
        MOUNTED = 0,
        BEFORE_UPDATE,
        UPDATED,
        ACTIVATED,
        DEACTIVATED,
        BEFORE_DESTROY,
        DESTROYED,
        _COUNT
    };

    [[nodiscard]] REACTIVE_EXPORT std::string_view to_string(LifecycleHook hook);

    struct PropOptions {
        std::optional<Value> default_value{};
        /**
         * Evaluated (with dependency tracking suspended) when the prop is not supplied, takes precedence over
         * default_value. Use this for container defaults so that each component receives its own instance.
         */
        std::function<Value(Component &)> default_factory{};
    };

    struct ComputedOptions {
        std::function<Value(Component &)> get{};
        std::function<void(Component &, const Value &)> set{};
        bool cache{true};
    };

    struct WatchOptions {
        bool deep{false};
        bool immediate{false};
        bool sync{false};
    };

    struct WatchHandler {
        Watcher::callback_type handler{};
        WatchOptions options{};
    };

    /**
     * The declaration of a component: its inputs (props), its own state (data), derived state (computed), watches
     * and the primary render computation, plus the life-cycle hooks.
     */
    struct ComponentOptions {
        using hook_type = std::function<void(Component &)>;
        using error_captured_type = std::function<bool(const std::exception &error, Component &source,
                                                       std::string_view info)>;

        std::string name{};
        Component *parent{nullptr};
        std::vector<std::pair<std::string, PropOptions>> props{};
        object_s_ptr props_data{};
        std::function<Value(Component &)> data{};
        std::vector<std::pair<std::string, ComputedOptions>> computed{};
        std::vector<std::pair<std::string, std::vector<WatchHandler>>> watch{};
        std::function<Value(Component &)> render{};
        std::array<std::vector<hook_type>, static_cast<std::size_t>(LifecycleHook::_COUNT)> hooks{};
        std::vector<error_captured_type> error_captured{};

        ComponentOptions &on(LifecycleHook hook, hook_type fn) {
            hooks[static_cast<std::size_t>(hook)].push_back(std::move(fn));
            return *this;
        }
    };

    /**
     * The owner context of a set of Watchers. A component installs its reactive state on initialise, mounts its
     * primary render computation on start, is deactivated on stop (and re-activated by the next start), and tears
     * down every Watcher it owns on dispose.
     */
    struct REACTIVE_EXPORT Component : ComponentLifeCycle {
        using ptr = Component *;
        using s_ptr = std::shared_ptr<Component>;
        using unwatch_type = std::function<void()>;

        explicit Component(ComponentOptions options = {});

        Component(const Component &) = delete;

        Component &operator=(const Component &) = delete;

        ~Component() override;

        [[nodiscard]] std::uint64_t uid() const noexcept { return _uid; }

        [[nodiscard]] const std::string &name() const noexcept { return _options.name; }

        [[nodiscard]] Component *parent() const noexcept { return _parent; }

        [[nodiscard]] Component &root() noexcept;

        [[nodiscard]] const std::vector<Component *> &children() const noexcept { return _children; }

        /**
         * The root data object (observed as root data), an empty object until initialise has run.
         */
        [[nodiscard]] const object_s_ptr &data() const noexcept { return _data; }

        [[nodiscard]] const object_s_ptr &props() const noexcept { return _props; }

        /**
         * Read a key by name, resolved against props, then data, then computed. Unknown keys yield undefined.
         */
        [[nodiscard]] Value get(std::string_view key);

        /**
         * Write a key by name, resolved against props, then data, then computed (through its setter).
         */
        void set(std::string_view key, Value value);

        /**
         * Update props from the parent: writes made here do not raise the "avoid mutating a prop" warning.
         */
        void update_props(const std::vector<std::pair<std::string, Value>> &values);

        /**
         * Register a user watch, returns a function that cancels it.
         */
        unwatch_type watch(const std::string &expression, Watcher::callback_type cb, WatchOptions options = {});

        unwatch_type watch(Watcher::getter_type getter, Watcher::callback_type cb, WatchOptions options = {});

        void call_hook(LifecycleHook hook);

        [[nodiscard]] bool is_mounted() const noexcept { return _is_mounted; }

        [[nodiscard]] bool is_being_destroyed() const noexcept { return _is_being_destroyed; }

        [[nodiscard]] bool is_destroyed() const noexcept { return _is_destroyed; }

        [[nodiscard]] bool is_inactive() const noexcept { return _inactive; }

        [[nodiscard]] bool is_updating_props() const noexcept { return _updating_props; }

        /**
         * The primary (render) watcher, nullptr until mounted or when the component has no render function.
         */
        [[nodiscard]] watcher_ptr render_watcher() const noexcept { return _render_watcher; }

        /**
         * The value produced by the last evaluation of the render function.
         */
        [[nodiscard]] Value rendered() const;

        [[nodiscard]] const std::vector<watcher_s_ptr> &watchers() const noexcept { return _watchers; }

        [[nodiscard]] watcher_ptr computed_watcher(std::string_view key) const;

        [[nodiscard]] const std::vector<ComponentOptions::error_captured_type> &error_captured_hooks() const noexcept {
            return _options.error_captured;
        }

        /**
         * Called by Watcher on construction / teardown.
         */
        void add_watcher(watcher_s_ptr watcher, bool is_render_watcher);

        void remove_watcher(const Watcher &watcher);

        /**
         * Leave the inactive state and call the activated hook, recursively for the children. Called by the scheduler
         * after a flush for components queued with queue_activated_component.
         */
        void activate();

        void deactivate();

    protected:
        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        void init_props();

        void init_data();

        void init_computed();

        void init_watch();

        Value get_data();

        Value computed_getter(std::string_view key);

        [[nodiscard]] bool is_prop(std::string_view key) const;

        [[nodiscard]] const ComputedOptions *computed_options(std::string_view key) const;

        unwatch_type register_watch(const watcher_s_ptr &watcher, const Watcher::callback_type &cb, bool immediate);

        void teardown_watchers();

        static bool is_reserved(std::string_view key);

        ComponentOptions _options;
        std::uint64_t _uid;
        Component *_parent;
        std::vector<Component *> _children;
        object_s_ptr _data;
        object_s_ptr _props;
        std::vector<std::string> _prop_keys;
        std::vector<watcher_s_ptr> _watchers;
        std::vector<std::pair<std::string, watcher_s_ptr>> _computed_watchers;
        watcher_ptr _render_watcher{nullptr};
        bool _is_mounted{false};
        bool _is_being_destroyed{false};
        bool _is_destroyed{false};
        bool _inactive{false};
        bool _updating_props{false};
    };

} // namespace reactive

#endif // REACTIVE_COMPONENT_H
