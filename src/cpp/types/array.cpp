#include <reactive/types/array.h>
#include <reactive/types/observer.h>
#include <reactive/util/errors.h>

#include <algorithm>

namespace reactive {
    Array::s_ptr Array::make(std::initializer_list<Value> values) {
        return std::make_shared<Array>(std::vector<Value>(values));
    }

    Array::s_ptr Array::make(std::vector<Value> values) { return std::make_shared<Array>(std::move(values)); }

    Value Array::at(std::size_t index) const { return index < _values.size() ? _values[index] : Value{}; }

    void Array::set_raw(std::size_t index, Value value) {
        check_mutable();
        if (index >= _values.size()) { _values.resize(index + 1); }
        _values[index] = std::move(value);
    }

    void Array::resize(std::size_t length) {
        check_mutable();
        _values.resize(length);
    }

    std::size_t Array::push(Value value) {
        check_mutable();
        _values.push_back(value);
        notify_structural({std::move(value)});
        return _values.size();
    }

    std::size_t Array::push(std::vector<Value> values) {
        check_mutable();
        _values.insert(_values.end(), values.begin(), values.end());
        notify_structural(values);
        return _values.size();
    }

    Value Array::pop() {
        check_mutable();
        if (_values.empty()) {
            notify_structural({});
            return {};
        }
        auto result = std::move(_values.back());
        _values.pop_back();
        notify_structural({});
        return result;
    }

    Value Array::shift() {
        check_mutable();
        if (_values.empty()) {
            notify_structural({});
            return {};
        }
        auto result = std::move(_values.front());
        _values.erase(_values.begin());
        notify_structural({});
        return result;
    }

    std::size_t Array::unshift(std::vector<Value> values) {
        check_mutable();
        _values.insert(_values.begin(), values.begin(), values.end());
        notify_structural(values);
        return _values.size();
    }

    Array::s_ptr Array::splice(std::ptrdiff_t start, std::optional<std::size_t> delete_count,
                               std::vector<Value> items) {
        check_mutable();
        auto len = static_cast<std::ptrdiff_t>(_values.size());
        auto begin = start < 0 ? std::max<std::ptrdiff_t>(len + start, 0) : std::min(start, len);
        auto available = static_cast<std::size_t>(len - begin);
        auto count = delete_count ? std::min(*delete_count, available) : available;

        auto first = _values.begin() + begin;
        auto last = first + static_cast<std::ptrdiff_t>(count);
        auto removed = make(std::vector<Value>(first, last));
        first = _values.erase(first, last);
        _values.insert(first, items.begin(), items.end());
        notify_structural(items);
        return removed;
    }

    void Array::sort(const comparator_type &less) {
        check_mutable();
        if (less) {
            std::stable_sort(_values.begin(), _values.end(), less);
        } else {
            std::stable_sort(_values.begin(), _values.end(), [](const Value &lhs, const Value &rhs) {
                if (lhs.is_undefined()) { return false; }
                if (rhs.is_undefined()) { return true; }
                return lhs.to_string() < rhs.to_string();
            });
        }
        notify_structural({});
    }

    void Array::reverse() {
        check_mutable();
        std::reverse(_values.begin(), _values.end());
        notify_structural({});
    }

    void Array::freeze() { Container::freeze(); }

    void Array::notify_structural(const std::vector<Value> &inserted) {
        auto ob = observer();
        if (ob == nullptr) { return; }
        if (!inserted.empty()) { Observer::observe_array(inserted); }
        // notify change
        ob->dep().notify();
    }

    void Array::check_mutable() const {
        if (is_frozen()) { throw_error<ReactiveError>("Cannot modify a frozen array"); }
    }
} // namespace reactive
