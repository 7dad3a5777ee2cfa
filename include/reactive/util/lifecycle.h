#ifndef REACTIVE_LIFECYCLE_H
#define REACTIVE_LIFECYCLE_H

#include <reactive/reactive_base.h>

namespace reactive {
    struct ComponentLifeCycle;

    void REACTIVE_EXPORT initialise_component(ComponentLifeCycle &component);

    void REACTIVE_EXPORT start_component(ComponentLifeCycle &component);

    void REACTIVE_EXPORT stop_component(ComponentLifeCycle &component);

    void REACTIVE_EXPORT dispose_component(ComponentLifeCycle &component);

    struct InitialiseTransitionGuard;
    struct StartTransitionGuard;

    /**
     * This will initialise the component in the constructor and dispose in the destructor.
     */
    struct InitialiseDisposeContext {
        explicit InitialiseDisposeContext(ComponentLifeCycle &component);

        ~InitialiseDisposeContext() noexcept;

    private:
        ComponentLifeCycle &_component;
    };

    /**
     * The Life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, options that describe its state are supplied at this point.
     *
     * * initialise is called once, this is where the reactive state (props, data, computed, watch) is installed.
     *
     * * start is called to bring the component into operation (mount the primary render computation). Once a
     *   component has been stopped, start re-activates it.
     *
     * * stop takes the component out of operation without releasing its state (deactivation).
     *
     * * dispose is called once the component is no longer required; every computation it owns is torn down.
     *
     * NOTE: start and stop can be called numerous times during the life-time of the component. Stop is not dispose,
     *       full clean-up is called only on dispose.
     */
    struct REACTIVE_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        [[nodiscard]] bool is_initialised() const;

        [[nodiscard]] bool is_initialising() const;

        [[nodiscard]] bool is_disposing() const;

        /**
         * The component is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        [[nodiscard]] bool is_starting() const;

        [[nodiscard]] bool is_stopping() const;

    protected:
        virtual void initialise() = 0;

        virtual void start() = 0;

        virtual void stop() = 0;

        virtual void dispose() = 0;

    private:
        bool _initialised{false};
        bool _initialised_transitioning{false};
        bool _started{false};
        bool _started_transitioning{false};

        friend InitialiseTransitionGuard;
        friend StartTransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace reactive

#endif // REACTIVE_LIFECYCLE_H
