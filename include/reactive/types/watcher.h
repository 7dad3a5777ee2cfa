#ifndef REACTIVE_WATCHER_H
#define REACTIVE_WATCHER_H

#include <reactive/types/subject.h>
#include <reactive/types/value.h>

#include <functional>
#include <string>
#include <vector>

namespace reactive {

    /**
     * Flavour flags of a Watcher. A single Watcher type covers every flavour, update() dispatches on these:
     *
     * * deep     - traverse the getter result so every nested property is a dependency, and always fire the callback.
     * * user     - a user registered watch: getter and callback failures are reported through handle_error rather than
     *              propagated.
     * * computed - lazy and memoized, owns a Subject so that other watchers can depend on its result.
     * * sync     - bypass the scheduler and run in-line with the write that triggered it.
     * * before   - invoked by the scheduler right before the watcher runs during a flush.
     */
    struct WatcherOptions {
        bool deep{false};
        bool user{false};
        bool computed{false};
        bool sync{false};
        std::function<void()> before{};
    };

    /**
     * A Watcher parses an expression, collects dependencies, and fires its callback when the expression value
     * changes. This is used for both the watch api and the directive like consumers (render and computed).
     */
    struct REACTIVE_EXPORT Watcher : std::enable_shared_from_this<Watcher> {
        using ptr = Watcher *;
        using s_ptr = std::shared_ptr<Watcher>;
        using getter_type = std::function<Value(Component &)>;
        using callback_type = std::function<void(const Value &new_value, const Value &old_value)>;

        /**
         * Construct a watcher over a getter function. Non computed watchers are evaluated immediately. The watcher is
         * registered in the owner's watcher list, and becomes the owner's primary render watcher if is_render_watcher
         * is set.
         */
        [[nodiscard]] static s_ptr create(Component &vm, getter_type getter, callback_type cb = {},
                                          WatcherOptions options = {}, bool is_render_watcher = false);

        /**
         * Construct a watcher over a dot-delimited path into the owner (e.g. "a.b.c"). A path that is not a simple
         * dot-delimited path produces a getter that always yields undefined, and a warning.
         */
        [[nodiscard]] static s_ptr create(Component &vm, const std::string &expression, callback_type cb = {},
                                          WatcherOptions options = {}, bool is_render_watcher = false);

        Watcher(const Watcher &) = delete;

        Watcher &operator=(const Watcher &) = delete;

        ~Watcher();

        /**
         * Evaluate the getter, and re-collect dependencies.
         */
        Value get();

        /**
         * Add a dependency to this watcher.
         */
        void add_dep(Subject &dep);

        /**
         * Clean up for dependency collection.
         */
        void cleanup_deps();

        /**
         * Subscriber interface. Will be called when a dependency changes.
         */
        void update();

        /**
         * Scheduler job interface. Will be called by the scheduler.
         */
        void run();

        /**
         * Evaluate and return the value of the watcher. This only gets called for computed property watchers.
         */
        const Value &evaluate();

        /**
         * Depend on this watcher. Only for computed property watchers.
         */
        void depend();

        /**
         * Remove self from all dependencies' subscriber list.
         */
        void teardown();

        [[nodiscard]] watcher_id_t id() const noexcept { return _id; }

        [[nodiscard]] Component &vm() const noexcept { return *_vm; }

        [[nodiscard]] const Value &value() const noexcept { return _value; }

        [[nodiscard]] const std::string &expression() const noexcept { return _expression; }

        [[nodiscard]] bool is_active() const noexcept { return _active; }

        [[nodiscard]] bool is_dirty() const noexcept { return _dirty; }

        [[nodiscard]] bool is_deep() const noexcept { return _deep; }

        [[nodiscard]] bool is_user() const noexcept { return _user; }

        [[nodiscard]] bool is_computed() const noexcept { return _computed; }

        [[nodiscard]] bool is_sync() const noexcept { return _sync; }

        [[nodiscard]] bool has_before() const noexcept { return static_cast<bool>(_before); }

        void before() const {
            if (_before) { _before(); }
        }

        /**
         * The Subject of a computed watcher (other watchers depend on the computed result through it), nullptr for
         * other flavours.
         */
        [[nodiscard]] subject_ptr dep() const noexcept { return _dep.get(); }

        [[nodiscard]] std::size_t dep_count() const noexcept { return _deps.size(); }

        [[nodiscard]] bool depends_on(const Subject &subject) const noexcept { return _dep_ids.contains(subject.id()); }

    private:
        struct PrivateTag {};

    public:
        Watcher(PrivateTag, Component &vm, getter_type getter, callback_type cb, WatcherOptions options,
                std::string expression);

    private:
        struct DepRef {
            subject_id_t id;
            subject_w_ptr subject;
        };

        static s_ptr make(Component &vm, getter_type getter, callback_type cb, WatcherOptions options,
                          bool is_render_watcher, std::string expression);

        template<typename Callback>
        void get_and_invoke(Callback &&cb);

        void unsubscribe_all() noexcept;

        Component *_vm;
        watcher_id_t _id;
        getter_type _getter;
        callback_type _cb;
        std::string _expression;
        bool _deep;
        bool _user;
        bool _computed;
        bool _sync;
        bool _dirty;
        bool _active{true};
        std::function<void()> _before;
        subject_s_ptr _dep;
        std::vector<DepRef> _deps;
        std::vector<DepRef> _new_deps;
        IdSet _dep_ids;
        IdSet _new_dep_ids;
        Value _value;
    };

} // namespace reactive

#endif // REACTIVE_WATCHER_H
