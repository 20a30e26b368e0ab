#pragma once

#include <vector>

#include "absl/container/flat_hash_map.h"
#include "batcher/interfaces.h"
#include "object.h"

namespace DeepBatch {

/**
 * Reference deep-copy primitive over the Heap object model.
 *
 * Traversal is depth-first with a memo table keyed by source identity. List,
 * dict and record copies are allocated and memoized before their children
 * are visited, so back-edges land on the in-progress copy. Atomic objects are
 * immutable and returned as-is. A tuple is rebuilt only when one of its
 * children copied to a different object.
 *
 * Copies are allocated in the heap given at construction.
 */
class GraphCopier : public IDeepCopier {
public:
    // Traversals deeper than this fail with CopyError.
    static constexpr size_t kMaxDepth = 2000;

    explicit GraphCopier(Heap& heap) : heap_(heap) {}

    std::vector<ObjectRef> CopyMany(const std::vector<ObjectRef>& roots) override;
    size_t EstimateBytes(ObjectRef root) const override;

private:
    using Memo = absl::flat_hash_map<const Object*, ObjectRef>;

    ObjectRef CopyNode(ObjectRef source, Memo& memo, size_t depth);

    Heap& heap_;
};

} // namespace DeepBatch
