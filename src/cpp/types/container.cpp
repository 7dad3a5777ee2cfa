#include <reactive/types/container.h>
#include <reactive/types/observer.h>

namespace reactive {
    Container::Container() = default;

    // Defined here so that the Observer is a complete type when the unique_ptr is destroyed
    Container::~Container() = default;

    void Container::freeze() {
        _extensible = false;
        _frozen = true;
    }
} // namespace reactive
