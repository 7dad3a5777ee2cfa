#pragma once

/**
 * @file observer.h
 * @brief The reactive store: Observer (per container wrapper) and property interception.
 *
 * observe() attaches an Observer to a plain Object or Array. For objects every existing key becomes a reactive
 * property (define_reactive); for arrays the intercepted mutating operations become active and every element is
 * observed in turn. Additions and removals the interception cannot see go through set() / del().
 */

#include <reactive/types/array.h>
#include <reactive/types/object.h>
#include <reactive/types/subject.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reactive {

    struct REACTIVE_EXPORT Observer {
        using ptr = Observer *;

        explicit Observer(Container &value);

        Observer(const Observer &) = delete;

        Observer &operator=(const Observer &) = delete;

        [[nodiscard]] Container &value() const noexcept { return _value; }

        [[nodiscard]] bool is_array() const noexcept { return _value.is_array(); }

        /**
         * The structural Subject: key addition/removal and sequence length/order changes.
         */
        [[nodiscard]] Subject &dep() const noexcept { return *_dep; }

        [[nodiscard]] const subject_s_ptr &dep_ptr() const noexcept { return _dep; }

        /**
         * Number of root bindings (components) that use this container as their top-level data.
         */
        [[nodiscard]] std::size_t vm_count() const noexcept { return _vm_count; }

        void increment_vm_count() noexcept { ++_vm_count; }

        void decrement_vm_count() noexcept {
            if (_vm_count > 0) { --_vm_count; }
        }

        /**
         * Walk through each key and install a reactive property.
         */
        void walk(Object &obj);

        /**
         * Observe a list of array items.
         */
        static void observe_array(const std::vector<Value> &items);

    private:
        Container &_value;
        subject_s_ptr _dep;
        std::size_t _vm_count{0};
    };

    /**
     * Attempt to create an observer for a value, returns the existing observer if the value already has one. Returns
     * nullptr for primitives, non-extensible or raw containers, and while observation is suspended.
     */
    REACTIVE_EXPORT observer_ptr observe(const Value &value, bool as_root_data = false);

    /**
     * Attach a new Observer to the container, used by observe once all the checks have passed.
     */
    REACTIVE_EXPORT observer_ptr attach_observer(Container &container);

    /**
     * Install a reactive property on an object. Without an explicit value the current value of the key is used. The
     * custom setter is a diagnostic hook invoked before an accepted write; shallow properties do not observe their
     * value. Keys with a non-configurable slot are skipped, as are new keys on a
     * non-extensible object.
     */
    REACTIVE_EXPORT void define_reactive(Object &obj, std::string_view key, std::optional<Value> val = std::nullopt,
                                         std::function<void()> custom_setter = {}, bool shallow = false);

    /**
     * The getter half of a reactive property (Object::get routes here for reactive keys).
     */
    [[nodiscard]] REACTIVE_EXPORT Value reactive_get(const Slot &slot);

    /**
     * The setter half of a reactive property (Object::set routes here for reactive keys).
     */
    REACTIVE_EXPORT void reactive_set(Object &obj, std::string_view key, Value new_val);

    /**
     * Set a property on an object or array. Adds the new property and triggers change notification if the property
     * doesn't already exist. For arrays the key must be a valid index.
     */
    REACTIVE_EXPORT Value set(const Value &target, std::string_view key, Value val);

    REACTIVE_EXPORT Value set(Object &target, std::string_view key, Value val);

    REACTIVE_EXPORT Value set(Array &target, std::size_t index, Value val);

    /**
     * Delete a property and trigger change if necessary.
     */
    REACTIVE_EXPORT void del(const Value &target, std::string_view key);

    REACTIVE_EXPORT void del(Object &target, std::string_view key);

    REACTIVE_EXPORT void del(Array &target, std::size_t index);

    /**
     * Collect dependencies on array elements when the array is touched, since element reads cannot be intercepted
     * like property getters.
     */
    REACTIVE_EXPORT void depend_array(const Array &value);

    /**
     * Suspend (false) or resume (true) the wrapping of new values.
     */
    REACTIVE_EXPORT void toggle_observing(bool value);

    [[nodiscard]] REACTIVE_EXPORT bool should_observe();

    /**
     * Suspends observation for the life of the scope and restores the previous state on exit.
     */
    struct REACTIVE_EXPORT ObservingScope {
        explicit ObservingScope(bool value);

        ObservingScope(const ObservingScope &) = delete;

        ObservingScope &operator=(const ObservingScope &) = delete;

        ~ObservingScope();

    private:
        bool _previous;
    };

} // namespace reactive
