#include <reactive/types/array.h>
#include <reactive/types/object.h>
#include <reactive/types/traverse.h>

#include <cstdint>

namespace reactive {
    namespace {
        void traverse_value(const Value &value, IdSet &seen) {
            auto container = value.container();
            if (container == nullptr || container->is_frozen()) { return; }
            if (!seen.insert(reinterpret_cast<std::uintptr_t>(container)).second) { return; }
            if (value.is_array()) {
                for (const auto &item : value.as_array()->values()) { traverse_value(item, seen); }
            } else {
                const auto &obj = *value.as_object();
                for (const auto &key : obj.keys()) { traverse_value(obj.get(key), seen); }
            }
        }
    } // namespace

    void traverse(const Value &value) {
        IdSet seen;
        traverse_value(value, seen);
    }
} // namespace reactive
