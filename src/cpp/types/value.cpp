#include <reactive/types/array.h>
#include <reactive/types/object.h>
#include <reactive/types/value.h>
#include <reactive/util/errors.h>

#include <charconv>
#include <cmath>

namespace reactive {
    std::string_view to_string(ValueKind kind) {
        switch (kind) {
            case ValueKind::UNDEFINED: return "undefined";
            case ValueKind::NUL: return "null";
            case ValueKind::BOOLEAN: return "boolean";
            case ValueKind::NUMBER: return "number";
            case ValueKind::STRING: return "string";
            case ValueKind::OBJECT: return "object";
            case ValueKind::ARRAY: return "array";
        }
        return "unknown";
    }

    Value::Value(object_s_ptr v) noexcept {
        if (v) {
            _data = std::move(v);
        } else {
            _data = Null{};
        }
    }

    Value::Value(array_s_ptr v) noexcept {
        if (v) {
            _data = std::move(v);
        } else {
            _data = Null{};
        }
    }

    bool Value::as_bool() const {
        if (!is_bool()) { throw_error<ReactiveError>("Expected a boolean, got: {}", kind()); }
        return std::get<bool>(_data);
    }

    double Value::as_number() const {
        if (!is_number()) { throw_error<ReactiveError>("Expected a number, got: {}", kind()); }
        return std::get<double>(_data);
    }

    const std::string &Value::as_string() const {
        if (!is_string()) { throw_error<ReactiveError>("Expected a string, got: {}", kind()); }
        return std::get<std::string>(_data);
    }

    const object_s_ptr &Value::as_object() const {
        if (!is_plain_object()) { throw_error<ReactiveError>("Expected an object, got: {}", kind()); }
        return std::get<object_s_ptr>(_data);
    }

    const array_s_ptr &Value::as_array() const {
        if (!is_array()) { throw_error<ReactiveError>("Expected an array, got: {}", kind()); }
        return std::get<array_s_ptr>(_data);
    }

    container_ptr Value::container() const noexcept {
        if (auto obj = std::get_if<object_s_ptr>(&_data)) { return obj->get(); }
        if (auto arr = std::get_if<array_s_ptr>(&_data)) { return arr->get(); }
        return nullptr;
    }

    bool Value::truthy() const noexcept {
        switch (kind()) {
            case ValueKind::UNDEFINED:
            case ValueKind::NUL: return false;
            case ValueKind::BOOLEAN: return std::get<bool>(_data);
            case ValueKind::NUMBER: {
                auto v = std::get<double>(_data);
                return v != 0.0 && !std::isnan(v);
            }
            case ValueKind::STRING: return !std::get<std::string>(_data).empty();
            case ValueKind::OBJECT:
            case ValueKind::ARRAY: return true;
        }
        return false;
    }

    Value Value::get(std::string_view key) const {
        if (is_plain_object()) { return std::get<object_s_ptr>(_data)->get(key); }
        if (is_array()) {
            const auto &arr = std::get<array_s_ptr>(_data);
            if (key == "length") { return Value{arr->size()}; }
            if (auto index = parse_array_index(key)) { return arr->at(*index); }
            return {};
        }
        if (is_string() && key == "length") { return Value{std::get<std::string>(_data).size()}; }
        return {};
    }

    std::string format_number(double value) {
        if (std::isnan(value)) { return "NaN"; }
        if (std::isinf(value)) { return value > 0 ? "Infinity" : "-Infinity"; }
        if (value == 0.0) { return "0"; }
        return fmt::format("{}", value);
    }

    std::string Value::to_string() const {
        switch (kind()) {
            case ValueKind::UNDEFINED: return "undefined";
            case ValueKind::NUL: return "null";
            case ValueKind::BOOLEAN: return std::get<bool>(_data) ? "true" : "false";
            case ValueKind::NUMBER: return format_number(std::get<double>(_data));
            case ValueKind::STRING: return std::get<std::string>(_data);
            case ValueKind::OBJECT: return "[object Object]";
            case ValueKind::ARRAY: {
                // Array to string conversion renders undefined and null elements as empty strings
                std::string result;
                bool first{true};
                for (const auto &v : *std::get<array_s_ptr>(_data)) {
                    if (!first) { result += ','; }
                    first = false;
                    if (!is_undef(v)) { result += v.to_string(); }
                }
                return result;
            }
        }
        return {};
    }

    std::string Value::inspect(int depth) const {
        switch (kind()) {
            case ValueKind::STRING: return fmt::format("'{}'", std::get<std::string>(_data));
            case ValueKind::OBJECT: {
                const auto &obj = *std::get<object_s_ptr>(_data);
                if (obj.empty()) { return "{}"; }
                if (depth <= 0) { return "[Object]"; }
                std::vector<std::string> parts;
                parts.reserve(obj.size());
                for (const auto &key : obj.keys()) {
                    parts.push_back(fmt::format("{}: {}", key, obj.peek(key).inspect(depth - 1)));
                }
                return fmt::format("{{ {} }}", fmt::join(parts, ", "));
            }
            case ValueKind::ARRAY: {
                const auto &arr = *std::get<array_s_ptr>(_data);
                if (arr.empty()) { return "[]"; }
                if (depth <= 0) { return "[Array]"; }
                std::vector<std::string> parts;
                parts.reserve(arr.size());
                for (const auto &v : arr) { parts.push_back(v.inspect(depth - 1)); }
                return fmt::format("[ {} ]", fmt::join(parts, ", "));
            }
            default: return to_string();
        }
    }

    bool same_value(const Value &lhs, const Value &rhs) noexcept {
        if (lhs.kind() != rhs.kind()) { return false; }
        switch (lhs.kind()) {
            case ValueKind::UNDEFINED:
            case ValueKind::NUL: return true;
            case ValueKind::BOOLEAN: return std::get<bool>(lhs.data()) == std::get<bool>(rhs.data());
            case ValueKind::NUMBER: {
                auto l = std::get<double>(lhs.data());
                auto r = std::get<double>(rhs.data());
                return l == r || (std::isnan(l) && std::isnan(r));
            }
            case ValueKind::STRING: return std::get<std::string>(lhs.data()) == std::get<std::string>(rhs.data());
            case ValueKind::OBJECT: return std::get<object_s_ptr>(lhs.data()) == std::get<object_s_ptr>(rhs.data());
            case ValueKind::ARRAY: return std::get<array_s_ptr>(lhs.data()) == std::get<array_s_ptr>(rhs.data());
        }
        return false;
    }

    std::optional<std::size_t> parse_array_index(std::string_view key) noexcept {
        if (key.empty() || (key.size() > 1 && key.front() == '0')) { return std::nullopt; }
        std::size_t index{0};
        auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
        if (ec != std::errc{} || ptr != key.data() + key.size()) { return std::nullopt; }
        return index;
    }
} // namespace reactive
