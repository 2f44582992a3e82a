#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// RetryMiddleware
// ═══════════════════════════════════════════════════════════════════════════
// Re-runs the rest of the chain while the RetryPolicy says so.
//
//   attempt 0     the original request
//   on Retryable  bump RetryAttempt in the bag, sleep the policy's delay,
//                 rebuild the request from the replay buffer, go again
//   otherwise     return the last outcome unchanged
//
// Requests with a Streaming body fail with ReplayUnsupported before any
// attempt is made. ContractViolation, ReplayUnsupported and Cancelled
// from inner stages end the loop immediately.
//
// The backoff sleep is an asio::steady_timer wait, so cancelling the
// surrounding coroutine (e.g. via asio::bind_cancellation_slot on
// co_spawn) aborts the sleep and yields Error{Cancelled}. A cancel that
// arrives while an attempt is in flight also yields Error{Cancelled} once
// that attempt returns; its outcome is discarded.
//
// Nested retry middleware each keep their own RetryAttempt. The inner one
// restores the outer index when it returns.
//
// The middleware knows nothing about HTTP method semantics. Attaching it
// to non-idempotent requests means accepting at-least-once delivery.

#include "relay/middleware/middleware.hpp"
#include "relay/retry/retry_policy.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>

namespace relay {

/// Index of the attempt currently in flight for this logical request
/// (0 = initial attempt). Maintained in the Extension Bag.
struct RetryAttempt {
    std::size_t index{0};
};

class RetryMiddleware final : public IMiddleware {
public:
    RetryMiddleware() = default;

    explicit RetryMiddleware(RetryPolicy policy)
        : policy_(std::move(policy))
    {}

    [[nodiscard]] asio::awaitable<Result<Response>> handle(
        Request request,
        Extensions& extensions,
        Next next
    ) override;

    [[nodiscard]] const RetryPolicy& policy() const noexcept {
        return policy_;
    }

private:
    RetryPolicy policy_;
};

}  // namespace relay
