#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>

#include "object/object.h"

namespace DeepBatch {

/**
 * One deferred copy result.
 *
 * Pending -> Ready once, when the flush that processes its entry succeeds
 * (or immediately for strict requests). Pending -> Failed when that flush
 * fails; the queue is discarded and the error is kept for later resolution.
 * Both end states are terminal. Only the Batcher mutates a Handle; the state
 * is published with release ordering after the value or error is written.
 */
class Handle {
public:
    enum class State : uint8_t {
        kPending,
        kReady,
        kFailed,
    };

    Handle() = default;
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    State state() const { return state_.load(std::memory_order_acquire); }
    bool IsReady() const { return state() == State::kReady; }
    bool IsFailed() const { return state() == State::kFailed; }

    // Resolved value, or nullptr while not ready. Does not force resolution.
    ObjectRef Peek() const { return IsReady() ? value_ : nullptr; }

private:
    friend class Batcher;

    void Resolve(ObjectRef value) {
        value_ = value;
        state_.store(State::kReady, std::memory_order_release);
    }

    void Fail(std::exception_ptr error) {
        error_ = std::move(error);
        state_.store(State::kFailed, std::memory_order_release);
    }

    ObjectRef value_ = nullptr;
    std::exception_ptr error_;
    std::atomic<State> state_{State::kPending};
};

using HandlePtr = std::shared_ptr<Handle>;

} // namespace DeepBatch
