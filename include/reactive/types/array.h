#pragma once

/**
 * @file array.h
 * @brief Array - the sequence container of the value model.
 *
 * Element assignment by index cannot be intercepted (set_raw is a plain store), so structural change of a sequence
 * is observed through its mutating operations instead. Once the store wraps an array, the seven length/order
 * mutating operations (push, pop, shift, unshift, splice, sort, reverse) perform the mutation, observe any inserted
 * elements and notify the wrapper's structural Subject. This applies to the wrapped instance only; unwrapped arrays
 * mutate silently.
 */

#include <reactive/types/container.h>
#include <reactive/types/value.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <vector>

namespace reactive {

    struct REACTIVE_EXPORT Array final : Container, std::enable_shared_from_this<Array> {
        using ptr = Array *;
        using s_ptr = std::shared_ptr<Array>;
        using comparator_type = std::function<bool(const Value &, const Value &)>;

        Array() = default;

        explicit Array(std::vector<Value> values) : _values{std::move(values)} {}

        [[nodiscard]] static s_ptr make(std::initializer_list<Value> values = {});

        [[nodiscard]] static s_ptr make(std::vector<Value> values);

        [[nodiscard]] bool is_array() const noexcept override { return true; }

        [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }

        [[nodiscard]] bool empty() const noexcept { return _values.empty(); }

        /**
         * Index read, out of range yields undefined. Not tracked.
         */
        [[nodiscard]] Value at(std::size_t index) const;

        [[nodiscard]] const std::vector<Value> &values() const noexcept { return _values; }

        [[nodiscard]] auto begin() const noexcept { return _values.begin(); }

        [[nodiscard]] auto end() const noexcept { return _values.end(); }

        /**
         * Index assignment, grows the array (filling with undefined) when the index is past the end. Not intercepted.
         */
        void set_raw(std::size_t index, Value value);

        /**
         * Length assignment. Not intercepted.
         */
        void resize(std::size_t length);

        // Intercepted operations

        std::size_t push(Value value);

        std::size_t push(std::vector<Value> values);

        Value pop();

        Value shift();

        std::size_t unshift(std::vector<Value> values);

        /**
         * Removes delete_count elements from start (negative start counts from the end, both are clamped) and inserts
         * items in their place. Without a delete_count everything from start onward is removed. Returns the removed
         * elements as a new array.
         */
        s_ptr splice(std::ptrdiff_t start, std::optional<std::size_t> delete_count = std::nullopt,
                     std::vector<Value> items = {});

        /**
         * Stable in-place sort. Without a comparator elements are ordered by their string conversion with undefined
         * values moved to the end.
         */
        void sort(const comparator_type &less = {});

        void reverse();

        void freeze() override;

    private:
        void notify_structural(const std::vector<Value> &inserted);

        void check_mutable() const;

        std::vector<Value> _values;
    };

    [[nodiscard]] inline Value make_array(std::initializer_list<Value> values = {}) {
        return Value{Array::make(values)};
    }

} // namespace reactive
