#ifndef REACTIVE_FORWARD_DECLARATIONS_H
#define REACTIVE_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace reactive {
    // Value model - containers are shared, values are copied by reference
    struct Value;

    struct Container;
    using container_ptr = Container *;

    struct Object;
    using object_ptr = Object *;
    using object_s_ptr = std::shared_ptr<Object>;

    struct Array;
    using array_ptr = Array *;
    using array_s_ptr = std::shared_ptr<Array>;

    // Dependency graph - raw pointers are non-owning edges
    struct Subject;
    using subject_ptr = Subject *;
    using subject_s_ptr = std::shared_ptr<Subject>;
    using subject_w_ptr = std::weak_ptr<Subject>;

    struct Observer;
    using observer_ptr = Observer *;

    struct Watcher;
    using watcher_ptr = Watcher *;
    using watcher_s_ptr = std::shared_ptr<Watcher>;

    struct Component;
    using component_ptr = Component *;
    using component_s_ptr = std::shared_ptr<Component>;

    // Runtime
    struct Scheduler;
    struct TickQueue;
    struct TargetStack;
    struct Config;
    struct ReactiveContext;
    struct FlushObserver;
    using flush_observer_ptr = FlushObserver *;

    using subject_id_t = std::uint64_t;
    using watcher_id_t = std::uint64_t;
} // namespace reactive

#endif // REACTIVE_FORWARD_DECLARATIONS_H
