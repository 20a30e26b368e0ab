#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "batcher_options.h"
#include "handle.h"
#include "interfaces.h"
#include "proxy.h"

namespace DeepBatch {

/// Monotonic counters describing what a Batcher has done so far.
struct BatcherStats {
    uint64_t defers = 0;          // handles produced; a failed strict copy is not counted
    uint64_t strict_copies = 0;
    uint64_t flushes = 0;         // successful, non-empty flushes
    uint64_t auto_flushes = 0;    // flushes triggered inside Defer()
    uint64_t failed_flushes = 0;
    uint64_t items_resolved = 0;
    uint64_t copy_many_calls = 0;
    uint64_t copy_one_calls = 0;
    uint64_t dedup_hits = 0;      // preserve entries that reused an earlier root
};

/**
 * Batches deferred deep-copy requests and resolves them together.
 *
 * Defer() queues (handle, root, alias policy) without copying. A flush,
 * triggered by Flush(), by Get() on a pending handle, by any Proxy operation,
 * or by the max_items / max_bytes thresholds inside Defer(), resolves the
 * whole queue:
 *   - every duplicate entry is copied on its own with CopyOne(), so it always
 *     gets a distinct output;
 *   - preserve entries are deduplicated by root identity and copied with a
 *     single CopyMany() call; entries naming the same root share one output.
 * A flush resolves every entry or none. On failure the queue is discarded,
 * its handles become Failed, and the error propagates to the caller that
 * triggered the flush.
 *
 * One mutex guards the queue and the whole flush body, including the copier
 * call. Auto-flush runs through FlushLocked() while Defer() already holds the
 * mutex, so no reentrant locking is needed.
 */
class Batcher {
public:
    // Throws ConfigError for invalid options.
    Batcher(std::shared_ptr<IDeepCopier> copier, BatcherOptions options = BatcherOptions());
    ~Batcher();

    Batcher(const Batcher&) = delete;
    Batcher& operator=(const Batcher&) = delete;

    // Queue a deep copy of root. Strict requests are copied immediately and
    // never queued. Unset overrides fall back to the batcher-wide defaults.
    HandlePtr Defer(ObjectRef root,
                    std::optional<Consistency> consistency = std::nullopt,
                    std::optional<AliasPolicy> alias = std::nullopt);

    // Defer() wrapped in a Proxy.
    Proxy DeferProxy(ObjectRef root,
                     std::optional<Consistency> consistency = std::nullopt,
                     std::optional<AliasPolicy> alias = std::nullopt);

    // Return the copy behind handle, flushing the queue first if it is still
    // pending. Rethrows the flush error for a Failed handle. Throws
    // std::logic_error for a handle that was never queued on this Batcher.
    ObjectRef Get(const HandlePtr& handle);

    // Resolve every queued entry. No-op when the queue is empty.
    void Flush();

    size_t PendingCount() const;
    BatcherStats GetStats() const;
    const BatcherOptions& options() const { return options_; }

private:
    struct PendingEntry {
        HandlePtr handle;
        ObjectRef root;
        AliasPolicy alias;
    };

    bool ShouldFlushLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    void FlushLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    void ResolveBatchLocked(const std::vector<PendingEntry>& batch,
                            std::vector<ObjectRef>& resolved) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    void FailBatchLocked(const std::vector<PendingEntry>& batch, std::exception_ptr error,
                         const char* reason) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

    const std::shared_ptr<IDeepCopier> copier_;
    const BatcherOptions options_;

    mutable absl::Mutex mutex_;
    std::vector<PendingEntry> queue_ ABSL_GUARDED_BY(mutex_);
    size_t pending_bytes_ ABSL_GUARDED_BY(mutex_) = 0;
    BatcherStats stats_ ABSL_GUARDED_BY(mutex_);
};

} // namespace DeepBatch
