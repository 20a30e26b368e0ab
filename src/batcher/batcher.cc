#include "batcher.h"

#include <stdexcept>

#include <glog/logging.h>

#include "absl/container/flat_hash_map.h"
#include "common/errors.h"

namespace DeepBatch {

namespace {

BatcherOptions Validated(const std::shared_ptr<IDeepCopier>& copier, BatcherOptions options) {
    if (!copier) {
        throw ConfigError("Batcher requires a deep copier");
    }
    ValidateOptions(options);
    return options;
}

} // namespace

Batcher::Batcher(std::shared_ptr<IDeepCopier> copier, BatcherOptions options)
    : copier_(std::move(copier)),
      options_(Validated(copier_, std::move(options))) {
    VLOG(1) << "Batcher created: max_items=" << options_.max_items
            << " max_bytes=" << (options_.max_bytes ? std::to_string(*options_.max_bytes) : "unset")
            << " consistency=" << ToString(options_.consistency)
            << " alias=" << ToString(options_.alias);
}

Batcher::~Batcher() {
    absl::MutexLock lock(&mutex_);
    if (!queue_.empty()) {
        LOG(WARNING) << "Batcher destroyed with " << queue_.size() << " unresolved entries";
        auto error = std::make_exception_ptr(
            std::logic_error("Batcher destroyed before the copy was resolved"));
        for (auto& entry : queue_) {
            entry.handle->Fail(error);
        }
        queue_.clear();
    }
}

HandlePtr Batcher::Defer(ObjectRef root,
                         std::optional<Consistency> consistency,
                         std::optional<AliasPolicy> alias) {
    Consistency mode = consistency.value_or(options_.consistency);
    AliasPolicy policy = alias.value_or(options_.alias);
    auto handle = std::make_shared<Handle>();

    absl::MutexLock lock(&mutex_);

    if (mode == Consistency::kStrict) {
        // Snapshot now; the entry never joins the batch.
        ObjectRef copy = copier_->CopyOne(root);
        ++stats_.copy_one_calls;
        ++stats_.strict_copies;
        ++stats_.defers;
        handle->Resolve(copy);
        return handle;
    }

    queue_.push_back(PendingEntry{handle, root, policy});
    ++stats_.defers;
    if (options_.max_bytes.has_value()) {
        pending_bytes_ += copier_->EstimateBytes(root);
    }

    if (ShouldFlushLocked()) {
        VLOG(2) << "Auto-flush: " << queue_.size() << " entries, ~" << pending_bytes_ << " bytes pending";
        ++stats_.auto_flushes;
        FlushLocked();
    }
    return handle;
}

Proxy Batcher::DeferProxy(ObjectRef root,
                          std::optional<Consistency> consistency,
                          std::optional<AliasPolicy> alias) {
    return Proxy(this, Defer(root, consistency, alias));
}

ObjectRef Batcher::Get(const HandlePtr& handle) {
    if (!handle) {
        throw std::invalid_argument("Get() called with a null handle");
    }

    Handle::State state = handle->state();
    if (state == Handle::State::kReady) {
        return handle->value_;
    }
    if (state == Handle::State::kPending) {
        Flush();
        state = handle->state();
    }
    if (state == Handle::State::kFailed) {
        std::rethrow_exception(handle->error_);
    }
    if (state == Handle::State::kPending) {
        throw std::logic_error("handle is not queued on this Batcher");
    }
    return handle->value_;
}

void Batcher::Flush() {
    absl::MutexLock lock(&mutex_);
    FlushLocked();
}

size_t Batcher::PendingCount() const {
    absl::MutexLock lock(&mutex_);
    return queue_.size();
}

BatcherStats Batcher::GetStats() const {
    absl::MutexLock lock(&mutex_);
    return stats_;
}

bool Batcher::ShouldFlushLocked() const {
    if (queue_.size() >= static_cast<size_t>(options_.max_items)) {
        return true;
    }
    if (options_.max_bytes.has_value() && pending_bytes_ >= *options_.max_bytes) {
        return true;
    }
    return false;
}

void Batcher::FlushLocked() {
    if (queue_.empty()) {
        return;
    }

    // Take the whole queue. It is cleared whether the copy succeeds or not.
    std::vector<PendingEntry> batch;
    batch.swap(queue_);
    pending_bytes_ = 0;

    std::vector<ObjectRef> resolved(batch.size(), nullptr);
    try {
        ResolveBatchLocked(batch, resolved);
    } catch (const std::exception& e) {
        FailBatchLocked(batch, std::current_exception(), e.what());
        throw;
    } catch (...) {
        FailBatchLocked(batch, std::current_exception(), "unknown error");
        throw;
    }

    // Publish only after every copy succeeded.
    for (size_t i = 0; i < batch.size(); ++i) {
        batch[i].handle->Resolve(resolved[i]);
    }
    ++stats_.flushes;
    stats_.items_resolved += batch.size();
}

void Batcher::ResolveBatchLocked(const std::vector<PendingEntry>& batch,
                                 std::vector<ObjectRef>& resolved) {
    std::vector<size_t> duplicate_positions;
    std::vector<size_t> preserve_positions;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (batch[i].alias == AliasPolicy::kDuplicate) {
            duplicate_positions.push_back(i);
        } else {
            preserve_positions.push_back(i);
        }
    }

    for (size_t pos : duplicate_positions) {
        resolved[pos] = copier_->CopyOne(batch[pos].root);
        ++stats_.copy_one_calls;
    }

    if (preserve_positions.empty()) {
        VLOG(2) << "Flushed " << duplicate_positions.size() << " duplicate entries";
        return;
    }

    // Deduplicate preserve roots by identity; repeats reuse the first index.
    std::vector<ObjectRef> inputs;
    std::vector<size_t> input_index;
    input_index.reserve(preserve_positions.size());
    absl::flat_hash_map<const Object*, size_t> seen;
    uint64_t dedup_hits = 0;
    for (size_t pos : preserve_positions) {
        ObjectRef root = batch[pos].root;
        auto [it, inserted] = seen.try_emplace(root, inputs.size());
        if (inserted) {
            inputs.push_back(root);
        } else {
            ++dedup_hits;
        }
        input_index.push_back(it->second);
    }

    std::vector<ObjectRef> outputs = copier_->CopyMany(inputs);
    ++stats_.copy_many_calls;
    if (outputs.size() != inputs.size()) {
        throw CopyError("copier returned " + std::to_string(outputs.size()) +
                        " copies for " + std::to_string(inputs.size()) + " roots");
    }

    for (size_t i = 0; i < preserve_positions.size(); ++i) {
        resolved[preserve_positions[i]] = outputs[input_index[i]];
    }
    stats_.dedup_hits += dedup_hits;

    VLOG(2) << "Flushed " << batch.size() << " entries: " << duplicate_positions.size()
            << " duplicate, " << preserve_positions.size() << " preserve over "
            << inputs.size() << " distinct roots";
}

void Batcher::FailBatchLocked(const std::vector<PendingEntry>& batch, std::exception_ptr error,
                              const char* reason) {
    for (const auto& entry : batch) {
        entry.handle->Fail(error);
    }
    ++stats_.failed_flushes;
    LOG(WARNING) << "Flush of " << batch.size() << " entries failed, queue discarded: " << reason;
}

} // namespace DeepBatch
