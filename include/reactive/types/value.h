#pragma once

/**
 * @file value.h
 * @brief Value - the dynamically typed datum flowing through the reactive store.
 *
 * A Value is one of: undefined, null, boolean, number, string, object reference or array reference.
 * Containers (Object / Array) are reference types: copying a Value shares the container, and equality of
 * containers is identity. This mirrors the behaviour of plain data in the dynamic environments reactive state
 * is usually modelled on, which the dependency tracker relies on (a reassigned container is a change, a
 * mutated container is not).
 */

#include <reactive/reactive_base.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reactive {

    struct Undefined {
        constexpr bool operator==(const Undefined &) const noexcept { return true; }
    };

    struct Null {
        constexpr bool operator==(const Null &) const noexcept { return true; }
    };

    inline constexpr Undefined undefined{};
    inline constexpr Null null{};

    enum class ValueKind : std::uint8_t { UNDEFINED = 0, NUL, BOOLEAN, NUMBER, STRING, OBJECT, ARRAY };

    [[nodiscard]] REACTIVE_EXPORT std::string_view to_string(ValueKind kind);

    struct REACTIVE_EXPORT Value {
        using variant_type = std::variant<Undefined, Null, bool, double, std::string, object_s_ptr, array_s_ptr>;

        Value() noexcept = default;

        Value(Undefined) noexcept {}

        Value(Null) noexcept : _data{Null{}} {}

        Value(std::nullptr_t) noexcept : _data{Null{}} {}

        Value(bool v) noexcept : _data{v} {}

        Value(int v) noexcept : _data{static_cast<double>(v)} {}

        Value(std::int64_t v) noexcept : _data{static_cast<double>(v)} {}

        Value(std::size_t v) noexcept : _data{static_cast<double>(v)} {}

        Value(double v) noexcept : _data{v} {}

        Value(const char *v) : _data{std::string{v}} {}

        Value(std::string_view v) : _data{std::string{v}} {}

        Value(std::string v) noexcept : _data{std::move(v)} {}

        Value(object_s_ptr v) noexcept;

        Value(array_s_ptr v) noexcept;

        [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(_data.index()); }

        [[nodiscard]] bool is_undefined() const noexcept { return kind() == ValueKind::UNDEFINED; }

        [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::NUL; }

        [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::BOOLEAN; }

        [[nodiscard]] bool is_number() const noexcept { return kind() == ValueKind::NUMBER; }

        [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::STRING; }

        [[nodiscard]] bool is_plain_object() const noexcept { return kind() == ValueKind::OBJECT; }

        [[nodiscard]] bool is_array() const noexcept { return kind() == ValueKind::ARRAY; }

        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] double as_number() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] const object_s_ptr &as_object() const;

        [[nodiscard]] const array_s_ptr &as_array() const;

        /**
         * The container backing this value, or nullptr for primitives.
         */
        [[nodiscard]] container_ptr container() const noexcept;

        /**
         * JavaScript-like truthiness: undefined, null, false, 0, NaN and "" are falsy, everything else is truthy.
         */
        [[nodiscard]] bool truthy() const noexcept;

        /**
         * Property read through the reactive layer: object keys go through their reactive cell (and so record a
         * dependency), array reads accept an index or "length" and are not tracked. Primitives yield undefined.
         */
        [[nodiscard]] Value get(std::string_view key) const;

        /**
         * String conversion following the platform rules used for default sorting (arrays join with ',', objects
         * render as "[object Object]").
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Human readable rendering used by diagnostics, nested containers are expanded up to a fixed depth.
         */
        [[nodiscard]] std::string inspect(int depth = 3) const;

        [[nodiscard]] const variant_type &data() const noexcept { return _data; }

    private:
        variant_type _data{};
    };

    /**
     * Strict equality with the NaN exception: primitives compare by value, containers by identity, and two NaN values
     * are considered identical so that writing NaN over NaN is not reported as a change.
     */
    [[nodiscard]] REACTIVE_EXPORT bool same_value(const Value &lhs, const Value &rhs) noexcept;

    /**
     * true for object and array references.
     */
    [[nodiscard]] inline bool is_object(const Value &value) noexcept {
        return value.is_plain_object() || value.is_array();
    }

    [[nodiscard]] inline bool is_undef(const Value &value) noexcept { return value.is_undefined() || value.is_null(); }

    [[nodiscard]] inline bool is_primitive(const Value &value) noexcept {
        return value.is_string() || value.is_number() || value.is_bool();
    }

    /**
     * Parses a canonical non-negative integer index ("0", "12"), rejecting signs, fractions and leading zeros.
     */
    [[nodiscard]] REACTIVE_EXPORT std::optional<std::size_t> parse_array_index(std::string_view key) noexcept;

    [[nodiscard]] REACTIVE_EXPORT std::string format_number(double value);

} // namespace reactive

template<>
struct fmt::formatter<reactive::Value> : fmt::formatter<std::string_view> {
    auto format(const reactive::Value &value, format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(value.inspect(), ctx);
    }
};

template<>
struct fmt::formatter<reactive::ValueKind> : fmt::formatter<std::string_view> {
    auto format(reactive::ValueKind kind, format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(reactive::to_string(kind), ctx);
    }
};
