#ifndef REACTIVE_TRAVERSE_H
#define REACTIVE_TRAVERSE_H

#include <reactive/types/value.h>

namespace reactive {
    /**
     * Recursively traverse a value to invoke every converted getter, so that every nested property inside the value
     * is collected as a "deep" dependency. Frozen containers are not entered and each wrapped container is visited
     * once, which also guards against cyclic structures.
     */
    REACTIVE_EXPORT void traverse(const Value &value);
} // namespace reactive

#endif // REACTIVE_TRAVERSE_H
