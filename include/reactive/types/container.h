#ifndef REACTIVE_CONTAINER_H
#define REACTIVE_CONTAINER_H

#include <reactive/reactive_base.h>

#include <memory>

namespace reactive {

    /**
     * Shared base of Object and Array. Carries the extensibility flags the store consults before wrapping a
     * container, and owns the Observer (wrapper) once one has been attached. A container has at most one Observer,
     * its life-time is bound to the container.
     */
    struct REACTIVE_EXPORT Container {
        Container();

        Container(const Container &) = delete;

        Container &operator=(const Container &) = delete;

        virtual ~Container();

        [[nodiscard]] virtual bool is_array() const noexcept = 0;

        /**
         * The wrapper attached to this container, nullptr until the store observes it.
         */
        [[nodiscard]] observer_ptr observer() const noexcept { return _observer.get(); }

        [[nodiscard]] bool is_extensible() const noexcept { return _extensible; }

        [[nodiscard]] bool is_frozen() const noexcept { return _frozen; }

        /**
         * Containers tagged with mark_raw are never wrapped, this is used for framework owned structures that must not
         * become reactive state.
         */
        [[nodiscard]] bool is_raw() const noexcept { return _raw; }

        void prevent_extensions() noexcept { _extensible = false; }

        /**
         * Freeze prevents extension and locks every existing slot (non-configurable, non-writable).
         */
        virtual void freeze();

        void mark_raw() noexcept { _raw = true; }

    private:
        friend observer_ptr attach_observer(Container &container);

        std::unique_ptr<Observer> _observer;
        bool _extensible{true};
        bool _frozen{false};
        bool _raw{false};
    };

} // namespace reactive

#endif // REACTIVE_CONTAINER_H
