#ifndef RELAY_RETRY_RETRY_POLICY_HPP
#define RELAY_RETRY_RETRY_POLICY_HPP

#include "relay/error.hpp"
#include "relay/http/response.hpp"
#include "relay/log/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

enum class Retryability {
    Retryable,
    Permanent
};

/// The outcome of one attempt, as seen by the retry loop.
using Outcome = Result<Response>;

using Classifier = std::function<Retryability(const Outcome&)>;

/// 429 and 5xx are Retryable; every other status is Permanent.
[[nodiscard]] Retryability classify_status(int status_code) noexcept;

/// Default rules:
///   - Transport errors                          Retryable
///   - Middleware errors wrapping a transport
///     condition or a 429/5xx status             Retryable
///   - responses with status 429 or 5xx          Retryable
///   - everything else                           Permanent
[[nodiscard]] Retryability default_classify(const Outcome& outcome);

// ─────────────────────────────────────────────────────────────────────────────
// Jitter
// ─────────────────────────────────────────────────────────────────────────────

enum class Jitter {
    None,   // use the computed delay as-is
    Full    // sample uniformly from [0, computed delay]
};

/// Uniform samples in [0, 1]. Consulted only under Jitter::Full.
using JitterSource = std::function<double()>;

/// Called once per logical request so sources are never shared between
/// concurrent requests.
using JitterSourceFactory = std::function<JitterSource()>;

/// std::mt19937 seeded from std::random_device.
[[nodiscard]] JitterSource make_random_jitter_source();

// ─────────────────────────────────────────────────────────────────────────────
// RetryDecision
// ─────────────────────────────────────────────────────────────────────────────

class RetryDecision {
public:
    [[nodiscard]] static RetryDecision stop() noexcept {
        return RetryDecision{false, std::chrono::milliseconds{0}};
    }

    [[nodiscard]] static RetryDecision retry_after(std::chrono::milliseconds delay) noexcept {
        return RetryDecision{true, delay};
    }

    [[nodiscard]] bool should_retry() const noexcept { return retry_; }
    [[nodiscard]] bool is_stop() const noexcept { return !retry_; }

    /// Zero when stopping.
    [[nodiscard]] std::chrono::milliseconds delay() const noexcept { return delay_; }

    bool operator==(const RetryDecision&) const = default;

private:
    RetryDecision(bool retry, std::chrono::milliseconds delay) noexcept
        : retry_(retry)
        , delay_(delay)
    {}

    bool retry_;
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// AttemptRecord
// ─────────────────────────────────────────────────────────────────────────────
// What the policy needs to know about the attempt that just finished.
// Lives only inside one retry loop.

struct AttemptRecord {
    std::size_t attempt{0};                          // 0 = the initial attempt
    std::chrono::milliseconds elapsed{0};            // since the initial attempt started
    Retryability outcome{Retryability::Permanent};
    std::optional<std::chrono::milliseconds> server_hint;  // from Retry-After
};

/// Delay requested by a 429 or 503 response through a numeric Retry-After
/// header, saturated at `cap`. Any other outcome gives no hint.
[[nodiscard]] std::optional<std::chrono::milliseconds> retry_after_hint(
    const Outcome& outcome,
    std::chrono::milliseconds cap
);

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides whether and when to retry. Pure: no I/O, no shared mutable
// state; randomness only enters through the JitterSource passed in.
//
// Backoff:  delay(n) = min(max_delay, base_delay * 2^n)
// where n is the 0-indexed retry about to be scheduled. With
// max_retries = 3 and base_delay = 10ms the schedule is 10, 20, 40ms and
// a fourth failure stops.
//
// Usage:
//   RetryPolicy policy;
//   policy.with_max_retries(5)
//         .with_base_delay(std::chrono::milliseconds{50})
//         .with_jitter(Jitter::None);

class RetryPolicy {
public:
    RetryPolicy();

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (Builder Pattern)
    // ─────────────────────────────────────────────────────────────────────────

    /// Retries after the initial attempt; 0 disables retrying.
    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    RetryPolicy& with_base_delay(std::chrono::milliseconds delay) {
        base_delay_ = delay;
        return *this;
    }

    RetryPolicy& with_max_delay(std::chrono::milliseconds delay) {
        max_delay_ = delay;
        return *this;
    }

    RetryPolicy& with_jitter(Jitter jitter) {
        jitter_ = jitter;
        return *this;
    }

    /// nullptr restores default_classify.
    RetryPolicy& with_classifier(Classifier classifier);

    /// Do not start a retry whose sleep would end later than `limit` after
    /// the initial attempt began.
    RetryPolicy& with_total_retry_duration(std::chrono::milliseconds limit) {
        total_retry_duration_ = limit;
        return *this;
    }

    /// Honour numeric Retry-After on 429/503 responses (capped at max_delay).
    RetryPolicy& with_respect_retry_after(bool enable) {
        respect_retry_after_ = enable;
        return *this;
    }

    /// nullptr restores make_random_jitter_source.
    RetryPolicy& with_jitter_source_factory(JitterSourceFactory factory);

    /// Level at which the retry middleware reports scheduled retries.
    RetryPolicy& with_retry_log_level(LogLevel level) {
        retry_log_level_ = level;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Query Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t max_retries() const noexcept { return max_retries_; }
    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] std::chrono::milliseconds max_delay() const noexcept { return max_delay_; }
    [[nodiscard]] Jitter jitter() const noexcept { return jitter_; }
    [[nodiscard]] std::optional<std::chrono::milliseconds> total_retry_duration() const noexcept {
        return total_retry_duration_;
    }
    [[nodiscard]] bool respect_retry_after() const noexcept { return respect_retry_after_; }
    [[nodiscard]] LogLevel retry_log_level() const noexcept { return retry_log_level_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Decisions
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Retryability classify(const Outcome& outcome) const;

    /// Uncapped-by-count exponential delay before jitter.
    [[nodiscard]] std::chrono::milliseconds backoff_delay(std::size_t attempt) const noexcept;

    /// Stop when attempt >= max_retries, otherwise the backoff delay with
    /// jitter applied. `jitter` is only called under Jitter::Full.
    [[nodiscard]] RetryDecision next_delay(std::size_t attempt, const JitterSource& jitter) const;

    /// Full decision for a finished attempt: classification, attempt cap,
    /// server hint and total-duration bound.
    [[nodiscard]] RetryDecision decide(const AttemptRecord& record, const JitterSource& jitter) const;

    [[nodiscard]] JitterSource make_jitter_source() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration loading
    // ─────────────────────────────────────────────────────────────────────────
    // Recognized keys (all optional):
    //   max_retries              integer >= 0
    //   base_delay_ms            integer >= 0
    //   max_delay_ms             integer >= 0
    //   jitter                   "none" | "full"
    //   total_retry_duration_ms  integer >= 0
    //   respect_retry_after      bool
    //   log_level                "trace" ... "off"

    [[nodiscard]] static Result<RetryPolicy> from_json(const nlohmann::json& config);

private:
    std::size_t max_retries_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    Jitter jitter_;
    Classifier classifier_;
    std::optional<std::chrono::milliseconds> total_retry_duration_;
    bool respect_retry_after_;
    JitterSourceFactory jitter_source_factory_;
    LogLevel retry_log_level_;
};

}  // namespace relay

#endif  // RELAY_RETRY_RETRY_POLICY_HPP
