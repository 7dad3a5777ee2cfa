// Scope guards used to pair push/pop style state changes, a stand-in for std::scope_exit.
#ifndef REACTIVE_UTIL_SCOPE_H
#define REACTIVE_UTIL_SCOPE_H

#include <utility>

namespace reactive {
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)), active_(true) {
        }

        scope_exit(scope_exit &&other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) { other.release(); }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (active_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        bool active_;
    };

    template<class F>
    scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }

    /**
     * Sets a flag for the life of the guard and restores the previous value on exit, including exit by exception.
     */
    class flag_guard {
    public:
        flag_guard(bool &flag, bool value) noexcept : flag_(flag), previous_(flag) { flag_ = value; }

        flag_guard(const flag_guard &) = delete;

        flag_guard &operator=(const flag_guard &) = delete;

        ~flag_guard() { flag_ = previous_; }

    private:
        bool &flag_;
        bool previous_;
    };
} // namespace reactive
#endif // REACTIVE_UTIL_SCOPE_H
