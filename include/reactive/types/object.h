#pragma once

/**
 * @file object.h
 * @brief Object - insertion ordered, string keyed record, the map-like container of the value model.
 *
 * Each key is a Slot, slot pointers are invalidated when keys are added or removed. A slot either stores its value
 * plainly, or, once the store has installed a reactive property for the key, holds a ReactiveCell. Reads and writes
 * through get/set are routed through the cell when present, which is the C++ rendition of accessor-pair
 * interception: the cell records reads against its Subject and notifies the Subject on change.
 */

#include <reactive/types/container.h>
#include <reactive/types/value.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reactive {

    /**
     * The reactive state of a single key: the Subject readers subscribe to, the wrapper of the current value (when
     * the value is itself a wrapped container) and the optional external write diagnostic.
     */
    struct ReactiveCell {
        subject_s_ptr dep;
        observer_ptr child_ob{nullptr};
        bool shallow{false};
        std::function<void()> custom_setter;
    };

    struct Slot {
        Value value;
        bool configurable{true};
        bool writable{true};
        std::unique_ptr<ReactiveCell> cell;
    };

    struct SlotFlags {
        bool configurable{true};
        bool writable{true};
    };

    struct REACTIVE_EXPORT Object final : Container, std::enable_shared_from_this<Object> {
        using ptr = Object *;
        using s_ptr = std::shared_ptr<Object>;

        Object() = default;

        [[nodiscard]] static s_ptr make();

        [[nodiscard]] static s_ptr make(std::initializer_list<std::pair<std::string, Value>> entries);

        [[nodiscard]] bool is_array() const noexcept override { return false; }

        /**
         * Read a key, routed through the reactive cell if the key is reactive. Missing keys yield undefined.
         */
        [[nodiscard]] Value get(std::string_view key) const;

        /**
         * Write a key, routed through the reactive cell if the key is reactive. A missing key is added as a plain
         * slot (not reactive, not notified) when the object is extensible; writes to read-only slots and additions
         * to non-extensible objects are ignored.
         */
        void set(std::string_view key, Value value);

        /**
         * Read without recording a dependency.
         */
        [[nodiscard]] Value peek(std::string_view key) const;

        [[nodiscard]] bool has_own(std::string_view key) const;

        [[nodiscard]] bool is_reactive(std::string_view key) const;

        [[nodiscard]] std::vector<std::string> keys() const { return _keys; }

        [[nodiscard]] std::size_t size() const noexcept { return _keys.size(); }

        [[nodiscard]] bool empty() const noexcept { return _keys.empty(); }

        /**
         * Define or redefine a plain slot, replacing any reactive cell. Fails (returns false) if the existing slot is
         * non-configurable or the key is new and the object is not extensible.
         */
        bool define_property(std::string_view key, Value value, SlotFlags flags = {});

        /**
         * Remove a key without any notification. Returns false if the key is absent or non-configurable.
         */
        bool erase(std::string_view key);

        void freeze() override;

        [[nodiscard]] Slot *slot(std::string_view key);

        [[nodiscard]] const Slot *slot(std::string_view key) const;

        /**
         * Ensure a slot exists for the key (added at the end of the key order), used when installing reactive
         * properties.
         */
        Slot &ensure_slot(std::string_view key);

    private:
        std::vector<std::string> _keys;
        StringMap<Slot> _slots;
    };

    [[nodiscard]] inline Value make_object(std::initializer_list<std::pair<std::string, Value>> entries = {}) {
        return Value{Object::make(entries)};
    }

} // namespace reactive
