#include <reactive/types/object.h>
#include <reactive/types/observer.h>

namespace reactive {
    Object::s_ptr Object::make() { return std::make_shared<Object>(); }

    Object::s_ptr Object::make(std::initializer_list<std::pair<std::string, Value>> entries) {
        auto obj = std::make_shared<Object>();
        for (const auto &[key, value] : entries) { obj->ensure_slot(key).value = value; }
        return obj;
    }

    Value Object::get(std::string_view key) const {
        auto s = slot(key);
        if (s == nullptr) { return {}; }
        if (s->cell) { return reactive_get(*s); }
        return s->value;
    }

    void Object::set(std::string_view key, Value value) {
        auto s = slot(key);
        if (s == nullptr) {
            if (is_extensible()) { ensure_slot(key).value = std::move(value); }
            return;
        }
        if (s->cell) {
            reactive_set(*this, key, std::move(value));
            return;
        }
        if (s->writable) { s->value = std::move(value); }
    }

    Value Object::peek(std::string_view key) const {
        auto s = slot(key);
        return s == nullptr ? Value{} : s->value;
    }

    bool Object::has_own(std::string_view key) const { return _slots.contains(key); }

    bool Object::is_reactive(std::string_view key) const {
        auto s = slot(key);
        return s != nullptr && s->cell != nullptr;
    }

    bool Object::define_property(std::string_view key, Value value, SlotFlags flags) {
        auto s = slot(key);
        if (s == nullptr) {
            if (!is_extensible()) { return false; }
            s = &ensure_slot(key);
        } else if (!s->configurable) {
            return false;
        }
        s->value = std::move(value);
        s->configurable = flags.configurable;
        s->writable = flags.writable;
        s->cell.reset();
        return true;
    }

    bool Object::erase(std::string_view key) {
        auto it = _slots.find(key);
        if (it == _slots.end() || !it->second.configurable) { return false; }
        _slots.erase(it);
        std::erase(_keys, key);
        return true;
    }

    void Object::freeze() {
        Container::freeze();
        for (auto &[key, s] : _slots) {
            s.configurable = false;
            s.writable = false;
        }
    }

    Slot *Object::slot(std::string_view key) {
        auto it = _slots.find(key);
        return it == _slots.end() ? nullptr : &it->second;
    }

    const Slot *Object::slot(std::string_view key) const {
        auto it = _slots.find(key);
        return it == _slots.end() ? nullptr : &it->second;
    }

    Slot &Object::ensure_slot(std::string_view key) {
        auto it = _slots.find(key);
        if (it != _slots.end()) { return it->second; }
        _keys.emplace_back(key);
        return _slots.try_emplace(std::string{key}).first->second;
    }
} // namespace reactive
