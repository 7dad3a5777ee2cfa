#include <reactive/runtime/reactive_context.h>
#include <reactive/types/observer.h>
#include <reactive/util/debug.h>

#include <algorithm>

namespace reactive {
    Observer::Observer(Container &value) : _value{value}, _dep{Subject::make()} {}

    void Observer::walk(Object &obj) {
        for (const auto &key : obj.keys()) { define_reactive(obj, key); }
    }

    void Observer::observe_array(const std::vector<Value> &items) {
        for (const auto &item : items) { observe(item); }
    }

    observer_ptr attach_observer(Container &container) {
        // The observer is attached before the walk so that cyclic structures find the existing wrapper
        container._observer = std::make_unique<Observer>(container);
        auto ob = container._observer.get();
        if (container.is_array()) {
            Observer::observe_array(static_cast<Array &>(container).values());
        } else {
            ob->walk(static_cast<Object &>(container));
        }
        return ob;
    }

    observer_ptr observe(const Value &value, bool as_root_data) {
        auto container = value.container();
        if (container == nullptr) { return nullptr; }
        observer_ptr ob{container->observer()};
        if (ob == nullptr && should_observe() && container->is_extensible() && !container->is_raw()) {
            ob = attach_observer(*container);
        }
        if (as_root_data && ob != nullptr) { ob->increment_vm_count(); }
        return ob;
    }

    void define_reactive(Object &obj, std::string_view key, std::optional<Value> val,
                         std::function<void()> custom_setter, bool shallow) {
        if (auto existing = obj.slot(key); existing != nullptr) {
            if (!existing->configurable) { return; }
            if (!val) { val = existing->value; }
        } else if (!obj.is_extensible()) {
            return;
        }
        Value value{val ? std::move(*val) : Value{}};

        auto cell = std::make_unique<ReactiveCell>();
        cell->dep = Subject::make();
        cell->shallow = shallow;
        cell->custom_setter = std::move(custom_setter);
        cell->child_ob = shallow ? nullptr : observe(value);

        // Looked up after observing, observing may have added slots to other objects
        auto &s = obj.ensure_slot(key);
        s.value = std::move(value);
        s.cell = std::move(cell);
    }

    Value reactive_get(const Slot &slot) {
        Value value{slot.value};
        auto cell = slot.cell.get();
        if (cell != nullptr && current_target() != nullptr) {
            cell->dep->depend();
            if (cell->child_ob != nullptr) {
                cell->child_ob->dep().depend();
                if (value.is_array()) { depend_array(*value.as_array()); }
            }
        }
        return value;
    }

    void reactive_set(Object &obj, std::string_view key, Value new_val) {
        auto s = obj.slot(key);
        if (s == nullptr || !s->writable) { return; }
        if (s->cell == nullptr) {
            s->value = std::move(new_val);
            return;
        }
        if (same_value(s->value, new_val)) { return; }
        if (s->cell->custom_setter) {
            auto custom_setter = s->cell->custom_setter;
            custom_setter();
            s = obj.slot(key);
            if (s == nullptr || s->cell == nullptr) { return; }
        }
        s->value = new_val;
        // The cell is heap allocated, it stays put while the slots are re-arranged by the observe below
        auto cell = s->cell.get();
        cell->child_ob = cell->shallow ? nullptr : observe(new_val);
        auto dep = cell->dep;
        dep->notify();
    }

    Value set(const Value &target, std::string_view key, Value val) {
        if (is_undef(target) || is_primitive(target)) {
            warn(nullptr, "Cannot set reactive property on undefined, null, or primitive value: {}", target);
            return val;
        }
        if (target.is_array()) {
            if (auto index = parse_array_index(key)) { return set(*target.as_array(), *index, std::move(val)); }
            warn(nullptr, "Cannot set reactive property \"{}\" on an array, only valid indices are supported", key);
            return val;
        }
        return set(*target.as_object(), key, std::move(val));
    }

    Value set(Object &target, std::string_view key, Value val) {
        if (target.has_own(key)) {
            target.set(key, val);
            return val;
        }
        auto ob = target.observer();
        if (ob != nullptr && ob->vm_count() > 0) {
            warn("Avoid adding reactive properties to a component or its root data at runtime - "
                "declare it upfront in the data option.");
            return val;
        }
        if (ob == nullptr) {
            target.set(key, val);
            return val;
        }
        if (!target.is_extensible()) { return val; }
        define_reactive(target, key, val);
        auto dep = ob->dep_ptr();
        dep->notify();
        return val;
    }

    Value set(Array &target, std::size_t index, Value val) {
        if (index > target.size()) { target.resize(index); }
        target.splice(static_cast<std::ptrdiff_t>(index), 1, {val});
        return val;
    }

    void del(const Value &target, std::string_view key) {
        if (is_undef(target) || is_primitive(target)) {
            warn(nullptr, "Cannot delete reactive property on undefined, null, or primitive value: {}", target);
            return;
        }
        if (target.is_array()) {
            if (auto index = parse_array_index(key)) { del(*target.as_array(), *index); }
            return;
        }
        del(*target.as_object(), key);
    }

    void del(Object &target, std::string_view key) {
        auto ob = target.observer();
        if (ob != nullptr && ob->vm_count() > 0) {
            warn("Avoid deleting properties on a component or its root data - just set it to null.");
            return;
        }
        if (!target.has_own(key)) { return; }
        if (!target.erase(key)) { return; }
        if (ob == nullptr) { return; }
        auto dep = ob->dep_ptr();
        dep->notify();
    }

    void del(Array &target, std::size_t index) { target.splice(static_cast<std::ptrdiff_t>(index), 1); }

    void depend_array(const Array &value) {
        for (const auto &e : value) {
            if (auto c = e.container(); c != nullptr && c->observer() != nullptr) { c->observer()->dep().depend(); }
            if (e.is_array()) { depend_array(*e.as_array()); }
        }
    }

    void toggle_observing(bool value) { ReactiveContext::instance().set_should_observe(value); }

    bool should_observe() { return ReactiveContext::instance().should_observe(); }

    ObservingScope::ObservingScope(bool value) : _previous{should_observe()} { toggle_observing(value); }

    ObservingScope::~ObservingScope() { toggle_observing(_previous); }
} // namespace reactive
