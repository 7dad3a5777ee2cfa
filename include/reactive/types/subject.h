#pragma once

/**
 * @file subject.h
 * @brief Subject - notification hub of the dependency graph, and the active-computation stack.
 *
 * A Subject is created per reactive property and per wrapped container. Watchers reading the property register
 * against its Subject (depend), writes notify every registered Watcher (notify).
 *
 * Key characteristics:
 * - Maintains an ordered list of Watcher pointers (non-owning, insertion order, no duplicates)
 * - Watchers remove themselves on teardown, the Subject never releases a Watcher
 * - notify iterates a snapshot so subscribers may unsubscribe while being notified
 */

#include <reactive/reactive_base.h>

#include <memory>
#include <vector>

namespace reactive {

    struct REACTIVE_EXPORT Subject : std::enable_shared_from_this<Subject> {
        using ptr = Subject *;
        using s_ptr = std::shared_ptr<Subject>;

    private:
        struct PrivateTag {};

    public:
        /**
         * Subjects are always shared (watchers hold weak references to them), use make().
         */
        explicit Subject(PrivateTag);

        Subject(const Subject &) = delete;

        Subject &operator=(const Subject &) = delete;

        [[nodiscard]] static s_ptr make();

        [[nodiscard]] subject_id_t id() const noexcept { return _id; }

        /**
         * @brief Add a subscriber, a Watcher already present is not added twice.
         */
        void add_sub(watcher_ptr sub);

        /**
         * @brief Remove a subscriber, no-op if absent.
         */
        void remove_sub(watcher_ptr sub);

        /**
         * @brief Record a read: the currently evaluating Watcher (if any) registers this Subject as a dependency.
         */
        void depend();

        /**
         * @brief Record a write: every subscriber is asked to react, in subscription order.
         */
        void notify();

        [[nodiscard]] bool has_subscribers() const noexcept { return !_subs.empty(); }

        [[nodiscard]] std::size_t size() const noexcept { return _subs.size(); }

        [[nodiscard]] const std::vector<watcher_ptr> &subscribers() const noexcept { return _subs; }

    private:
        subject_id_t _id;
        std::vector<watcher_ptr> _subs;
    };

    /**
     * The stack of Watchers currently evaluating their getter. The top of the stack receives the reads, a nullptr
     * entry suspends dependency recording (used while evaluating defaults and data factories).
     */
    struct REACTIVE_EXPORT TargetStack {
        void push(watcher_ptr target);

        void pop();

        [[nodiscard]] watcher_ptr current() const noexcept { return _stack.empty() ? nullptr : _stack.back(); }

        [[nodiscard]] std::size_t depth() const noexcept { return _stack.size(); }

        void clear() noexcept { _stack.clear(); }

    private:
        std::vector<watcher_ptr> _stack;
    };

    REACTIVE_EXPORT void push_target(watcher_ptr target);

    REACTIVE_EXPORT void pop_target();

    [[nodiscard]] REACTIVE_EXPORT watcher_ptr current_target();

    /**
     * Pushes the target for the life of the scope, the previous target is restored even if the scope exits by
     * exception.
     */
    struct REACTIVE_EXPORT TargetScope {
        explicit TargetScope(watcher_ptr target);

        TargetScope(const TargetScope &) = delete;

        TargetScope &operator=(const TargetScope &) = delete;

        ~TargetScope();
    };

} // namespace reactive
