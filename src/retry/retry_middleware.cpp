#include "relay/retry/retry_middleware.hpp"

#include "relay/http/body.hpp"
#include "relay/log/logger.hpp"

#include <asio/error.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace relay {

namespace {

std::string describe_outcome(const Outcome& outcome) {
    if (outcome.has_value()) {
        return "HTTP " + std::to_string(outcome->status_code);
    }
    return outcome.error().describe();
}

asio::awaitable<bool> cancellation_requested() {
    const auto state = co_await asio::this_coro::cancellation_state;
    co_return state.cancelled() != asio::cancellation_type::none;
}

// Puts an enclosing retry loop's RetryAttempt back into the bag when a
// nested loop finishes.
class OuterAttemptGuard {
public:
    explicit OuterAttemptGuard(Extensions& extensions)
        : extensions_(extensions)
        , saved_(extensions.remove<RetryAttempt>())
    {}

    ~OuterAttemptGuard() {
        if (saved_.has_value()) {
            extensions_.insert(*saved_);
        }
    }

    OuterAttemptGuard(const OuterAttemptGuard&) = delete;
    OuterAttemptGuard& operator=(const OuterAttemptGuard&) = delete;

private:
    Extensions& extensions_;
    std::optional<RetryAttempt> saved_;
};

}  // namespace

asio::awaitable<Result<Response>> RetryMiddleware::handle(
    Request request,
    Extensions& extensions,
    Next next
) {
    // Cancellation surfaces as Error{Cancelled} rather than an exception.
    co_await asio::this_coro::throw_if_cancelled(false);

    const BodyReplayBuffer replay_buffer{request.body};
    if (replay_buffer.can_replay() == false) {
        get_logger().log_fmt(LogLevel::Error, "retry",
            "{} {}: streaming body cannot be replayed, refusing to send",
            to_string(request.method), request.url.href);
        co_return tl::unexpected(Error::replay_unsupported());
    }

    const Request head = request.clone_head();
    const auto jitter = policy_.make_jitter_source();
    const auto started = std::chrono::steady_clock::now();
    asio::steady_timer backoff_timer{co_await asio::this_coro::executor};

    const OuterAttemptGuard outer_attempt{extensions};
    extensions.insert(RetryAttempt{0});
    Request current = std::move(request);

    for (std::size_t attempt = 0;; ++attempt) {
        if (co_await cancellation_requested()) {
            co_return tl::unexpected(Error::cancelled());
        }

        auto outcome = co_await next.clone().run(std::move(current), extensions);

        if (!outcome && outcome.error().is_terminal()) {
            co_return outcome;
        }

        // A cancel that landed while the attempt was in flight has already
        // fired; the backoff wait below would not see it.
        if (co_await cancellation_requested()) {
            get_logger().log_fmt(LogLevel::Debug, "retry",
                "attempt #{} finished after cancellation, discarding {}",
                attempt, describe_outcome(outcome));
            co_return tl::unexpected(Error::cancelled());
        }

        AttemptRecord record;
        record.attempt = attempt;
        record.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        );
        record.outcome = policy_.classify(outcome);
        record.server_hint = retry_after_hint(outcome, policy_.max_delay());

        const auto decision = policy_.decide(record, jitter);
        if (decision.is_stop()) {
            const bool retried = (attempt > 0);
            if (retried) {
                get_logger().log_fmt(LogLevel::Debug, "retry",
                    "giving up after {} retries: {}", attempt, describe_outcome(outcome));
                if (!outcome) {
                    outcome.error().retries = static_cast<std::uint32_t>(attempt);
                }
            }
            co_return outcome;
        }

        get_logger().log_fmt(policy_.retry_log_level(), "retry",
            "Retry attempt #{} after {}. Sleeping {}ms before the next attempt",
            attempt + 1, describe_outcome(outcome), decision.delay().count());

        extensions.get_or_insert_default<RetryAttempt>().index = attempt + 1;

        if (decision.delay().count() > 0) {
            asio::error_code ec;
            backoff_timer.expires_after(decision.delay());
            co_await backoff_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::operation_aborted) {
                get_logger().log_fmt(LogLevel::Debug, "retry",
                    "backoff interrupted by cancellation before attempt #{}", attempt + 1);
                co_return tl::unexpected(Error::cancelled());
            }
            if (ec) {
                co_return tl::unexpected(Error::middleware("backoff timer failed: " + ec.message()));
            }
        }

        auto body = replay_buffer.replay();
        current = head.clone_head();
        current.body = std::move(*body);
    }
}

}  // namespace relay
