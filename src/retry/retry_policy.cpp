#include "relay/retry/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <memory>
#include <random>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

Retryability classify_status(int status_code) noexcept {
    const bool too_many_requests = (status_code == 429);
    const bool server_error = (status_code >= 500) && (status_code <= 599);
    if (too_many_requests || server_error) {
        return Retryability::Retryable;
    }
    return Retryability::Permanent;
}

Retryability default_classify(const Outcome& outcome) {
    if (outcome.has_value()) {
        return classify_status(outcome->status_code);
    }

    const Error& error = outcome.error();
    switch (error.kind) {
        case Error::Kind::Transport:
            return Retryability::Retryable;

        case Error::Kind::Middleware:
            if (error.transport_code.has_value()) {
                return Retryability::Retryable;
            }
            if (error.http_status.has_value()) {
                return classify_status(*error.http_status);
            }
            return Retryability::Permanent;

        case Error::Kind::ContractViolation:
        case Error::Kind::ReplayUnsupported:
        case Error::Kind::Cancelled:
            return Retryability::Permanent;
    }
    return Retryability::Permanent;
}

std::optional<std::chrono::milliseconds> retry_after_hint(
    const Outcome& outcome,
    std::chrono::milliseconds cap
) {
    if (outcome.has_value() == false) {
        return std::nullopt;
    }
    const bool status_allows_hint = (outcome->status_code == 429) || (outcome->status_code == 503);
    if (status_allows_hint == false) {
        return std::nullopt;
    }
    const auto seconds = outcome->retry_after_seconds();
    if (seconds.has_value() == false) {
        return std::nullopt;
    }

    // Header values are arbitrary 64-bit integers; compare in seconds
    // before scaling so nothing above the cap reaches the multiplication.
    const auto ceiling = std::max(cap, std::chrono::milliseconds{0});
    const auto ceiling_seconds = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(ceiling).count()
    );
    if (*seconds > ceiling_seconds) {
        return ceiling;
    }
    return std::min(ceiling, std::chrono::milliseconds{static_cast<std::int64_t>(*seconds) * 1000});
}

JitterSource make_random_jitter_source() {
    auto rng = std::make_shared<std::mt19937_64>(std::random_device{}());
    return [rng]() {
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        return unit(*rng);
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────

RetryPolicy::RetryPolicy()
    : max_retries_(3)
    , base_delay_(100)
    , max_delay_(30'000)
    , jitter_(Jitter::Full)
    , classifier_(default_classify)
    , total_retry_duration_(std::nullopt)
    , respect_retry_after_(true)
    , jitter_source_factory_(make_random_jitter_source)
    , retry_log_level_(LogLevel::Warn)
{}

RetryPolicy& RetryPolicy::with_classifier(Classifier classifier) {
    classifier_ = classifier ? std::move(classifier) : Classifier{default_classify};
    return *this;
}

RetryPolicy& RetryPolicy::with_jitter_source_factory(JitterSourceFactory factory) {
    jitter_source_factory_ = factory ? std::move(factory) : JitterSourceFactory{make_random_jitter_source};
    return *this;
}

Retryability RetryPolicy::classify(const Outcome& outcome) const {
    return classifier_(outcome);
}

JitterSource RetryPolicy::make_jitter_source() const {
    return jitter_source_factory_();
}

std::chrono::milliseconds RetryPolicy::backoff_delay(std::size_t attempt) const noexcept {
    const std::int64_t base = std::max<std::int64_t>(0, base_delay_.count());
    const std::int64_t cap = std::max<std::int64_t>(0, max_delay_.count());

    if (base == 0) {
        return std::chrono::milliseconds{0};
    }

    // base << attempt stays within cap exactly when base <= cap >> attempt.
    const bool saturated = (attempt >= 62) || (base > (cap >> attempt));
    if (saturated) {
        return std::chrono::milliseconds{cap};
    }
    return std::chrono::milliseconds{base << attempt};
}

RetryDecision RetryPolicy::next_delay(std::size_t attempt, const JitterSource& jitter) const {
    if (attempt >= max_retries_) {
        return RetryDecision::stop();
    }

    const auto computed = backoff_delay(attempt);
    const bool use_jitter = (jitter_ == Jitter::Full) && (computed.count() > 0) && jitter;
    if (use_jitter == false) {
        return RetryDecision::retry_after(computed);
    }

    const double unit = std::clamp(jitter(), 0.0, 1.0);
    const auto sampled = static_cast<std::int64_t>(
        std::llround(unit * static_cast<double>(computed.count()))
    );
    return RetryDecision::retry_after(std::chrono::milliseconds{std::clamp<std::int64_t>(sampled, 0, computed.count())});
}

RetryDecision RetryPolicy::decide(const AttemptRecord& record, const JitterSource& jitter) const {
    if (record.outcome == Retryability::Permanent) {
        return RetryDecision::stop();
    }

    auto decision = next_delay(record.attempt, jitter);
    if (decision.is_stop()) {
        return decision;
    }

    if (respect_retry_after_ && record.server_hint.has_value()) {
        const auto hinted = std::clamp(*record.server_hint, std::chrono::milliseconds{0}, max_delay_);
        decision = RetryDecision::retry_after(hinted);
    }

    if (total_retry_duration_.has_value()) {
        const auto resume_at = record.elapsed + decision.delay();
        if (resume_at > *total_retry_duration_) {
            return RetryDecision::stop();
        }
    }

    return decision;
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration loading
// ─────────────────────────────────────────────────────────────────────────────

namespace {

Result<std::int64_t> read_non_negative(const nlohmann::json& config, const char* key) {
    const auto& value = config.at(key);
    if (value.is_number_integer() == false) {
        return tl::unexpected(Error::middleware(std::format("retry config: '{}' must be an integer", key)));
    }
    const auto number = value.get<std::int64_t>();
    if (number < 0) {
        return tl::unexpected(Error::middleware(std::format("retry config: '{}' must be >= 0", key)));
    }
    return number;
}

}  // namespace

Result<RetryPolicy> RetryPolicy::from_json(const nlohmann::json& config) {
    if (config.is_object() == false) {
        return tl::unexpected(Error::middleware("retry config: expected a JSON object"));
    }

    RetryPolicy policy;

    if (config.contains("max_retries")) {
        auto value = read_non_negative(config, "max_retries");
        if (!value) return tl::unexpected(value.error());
        policy.with_max_retries(static_cast<std::size_t>(*value));
    }

    if (config.contains("base_delay_ms")) {
        auto value = read_non_negative(config, "base_delay_ms");
        if (!value) return tl::unexpected(value.error());
        policy.with_base_delay(std::chrono::milliseconds{*value});
    }

    if (config.contains("max_delay_ms")) {
        auto value = read_non_negative(config, "max_delay_ms");
        if (!value) return tl::unexpected(value.error());
        policy.with_max_delay(std::chrono::milliseconds{*value});
    }

    if (config.contains("total_retry_duration_ms")) {
        auto value = read_non_negative(config, "total_retry_duration_ms");
        if (!value) return tl::unexpected(value.error());
        policy.with_total_retry_duration(std::chrono::milliseconds{*value});
    }

    if (config.contains("jitter")) {
        const auto& value = config.at("jitter");
        if (value.is_string() == false) {
            return tl::unexpected(Error::middleware("retry config: 'jitter' must be a string"));
        }
        const auto name = value.get<std::string>();
        if (name == "none") {
            policy.with_jitter(Jitter::None);
        } else if (name == "full") {
            policy.with_jitter(Jitter::Full);
        } else {
            return tl::unexpected(Error::middleware(
                std::format("retry config: unknown jitter '{}' (expected \"none\" or \"full\")", name)
            ));
        }
    }

    if (config.contains("respect_retry_after")) {
        const auto& value = config.at("respect_retry_after");
        if (value.is_boolean() == false) {
            return tl::unexpected(Error::middleware("retry config: 'respect_retry_after' must be a boolean"));
        }
        policy.with_respect_retry_after(value.get<bool>());
    }

    if (config.contains("log_level")) {
        const auto& value = config.at("log_level");
        if (value.is_string() == false) {
            return tl::unexpected(Error::middleware("retry config: 'log_level' must be a string"));
        }
        policy.with_retry_log_level(log_level_from_string(value.get<std::string>()));
    }

    return policy;
}

}  // namespace relay
