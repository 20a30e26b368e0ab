#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace DeepBatch {

/// When the snapshot of a deferred root is taken.
enum class Consistency {
    kAtAccess,  // at flush time; the entry joins the batch
    kStrict,    // at Defer() time; copied immediately, never queued
};

/// Whether repeated references to one root in a batch share one output.
enum class AliasPolicy {
    kPreserve,
    kDuplicate,
};

/**
 * Construction-time configuration of a Batcher. Immutable once the Batcher
 * is built.
 */
struct BatcherOptions {
    // Auto-flush when the queue reaches this many entries. Must be > 0.
    int max_items = 64;
    // Soft cap on the estimated bytes reachable from queued roots. Advisory:
    // only enforced when the copier provides estimates.
    std::optional<size_t> max_bytes;
    Consistency consistency = Consistency::kAtAccess;
    AliasPolicy alias = AliasPolicy::kPreserve;
};

// Throws ConfigError when the options cannot be used to build a Batcher.
void ValidateOptions(const BatcherOptions& options);

// Name <-> enum conversions used by configuration and the tool.
// Parse* throw ConfigError on unknown names.
Consistency ParseConsistency(const std::string& value);
AliasPolicy ParseAliasPolicy(const std::string& value);
const char* ToString(Consistency consistency);
const char* ToString(AliasPolicy alias);

} // namespace DeepBatch
