#pragma once

#include <cstddef>
#include <string>

#include "object.h"

namespace DeepBatch {

/**
 * Structural equality of two object graphs. Terminates on cyclic graphs: a
 * pair of nodes already under comparison is assumed equal. Null references
 * are equal only to each other.
 */
bool DeepEquals(const Object* a, const Object* b);

// Printable representation, e.g. [1, 'a', {'k': None}]. Containers that are
// re-entered while printing are shown as [...], (...), {...} or Type(...).
std::string Repr(const Object* object);

// Approximate number of bytes retained by the graph reachable from root.
// Each object is counted once.
size_t EstimateBytes(const Object* root);

} // namespace DeepBatch
