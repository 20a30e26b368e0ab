#pragma once

#include <cstddef>
#include <vector>

#include "object/object.h"

namespace DeepBatch {

/**
 * Interface for the deep-copy primitive supplied by the host environment.
 *
 * CopyMany returns one output per root, in order. Identical roots produce
 * identical outputs, shared or cyclic structure among the roots is mirrored
 * in the outputs, and an uncopyable object fails the whole call with
 * CopyError (no partial results).
 */
class IDeepCopier {
public:
    virtual ~IDeepCopier() = default;

    virtual std::vector<ObjectRef> CopyMany(const std::vector<ObjectRef>& roots) = 0;

    // Equivalent to CopyMany({root})[0].
    virtual ObjectRef CopyOne(ObjectRef root) {
        return CopyMany({root}).front();
    }

    // Approximate bytes reachable from root, for the Batcher's soft byte cap.
    // 0 means the copier does not account bytes.
    virtual size_t EstimateBytes(ObjectRef root) const {
        (void)root;
        return 0;
    }
};

} // namespace DeepBatch
