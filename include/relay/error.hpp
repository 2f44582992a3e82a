#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Pipeline Error
// ═══════════════════════════════════════════════════════════════════════════
// The one error type that flows through a chain. Kinds are closed; the
// retry classifier switches on them rather than on a type hierarchy.
//
//   Transport          the terminal transport failed to exchange
//   Middleware         a middleware decided the request failed
//   ContractViolation  a middleware misused `next` or threw; programmer error
//   ReplayUnsupported  a retry was requested for a Streaming body
//   Cancelled          the caller cancelled the logical request

#include "relay/transport/transport_error.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace relay {

struct Error {
    enum class Kind {
        Transport,
        Middleware,
        ContractViolation,
        ReplayUnsupported,
        Cancelled
    };

    Kind kind{Kind::Middleware};
    std::string message;

    /// HTTP status a middleware error is about, if any.
    std::optional<int> http_status;

    /// Set for Transport errors, and for Middleware errors that wrap a
    /// transport condition.
    std::optional<TransportError::Code> transport_code;

    /// Retries performed before the error became final. Set by the retry
    /// middleware only when it retried at least once.
    std::optional<std::uint32_t> retries;

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error from_transport_error(const TransportError& err) {
        return {Kind::Transport, err.message, std::nullopt, err.code, std::nullopt};
    }

    [[nodiscard]] static Error middleware(std::string msg) {
        return {Kind::Middleware, std::move(msg), std::nullopt, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error middleware_with_status(int status, std::string msg) {
        return {Kind::Middleware, std::move(msg), status, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error middleware_wrapping(const TransportError& cause, std::string context) {
        return {
            Kind::Middleware,
            std::move(context) + ": " + cause.message,
            std::nullopt,
            cause.code,
            std::nullopt
        };
    }

    [[nodiscard]] static Error contract_violation(std::string msg) {
        return {Kind::ContractViolation, std::move(msg), std::nullopt, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static Error replay_unsupported() {
        return {
            Kind::ReplayUnsupported,
            "Request body is a stream and cannot be replayed for retries",
            std::nullopt,
            std::nullopt,
            std::nullopt
        };
    }

    [[nodiscard]] static Error cancelled() {
        return {Kind::Cancelled, "Request was cancelled", std::nullopt, std::nullopt, std::nullopt};
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_transport() const noexcept { return kind == Kind::Transport; }
    [[nodiscard]] bool is_middleware() const noexcept { return kind == Kind::Middleware; }
    [[nodiscard]] bool is_contract_violation() const noexcept { return kind == Kind::ContractViolation; }
    [[nodiscard]] bool is_replay_unsupported() const noexcept { return kind == Kind::ReplayUnsupported; }
    [[nodiscard]] bool is_cancelled() const noexcept { return kind == Kind::Cancelled; }

    /// Errors that end a logical request immediately; never retried.
    [[nodiscard]] bool is_terminal() const noexcept {
        return kind == Kind::ContractViolation ||
               kind == Kind::ReplayUnsupported ||
               kind == Kind::Cancelled;
    }

    /// Human-readable one-liner, including the retry count when present.
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] constexpr std::string_view to_string(Error::Kind kind) noexcept {
    switch (kind) {
        case Error::Kind::Transport:         return "Transport";
        case Error::Kind::Middleware:        return "Middleware";
        case Error::Kind::ContractViolation: return "ContractViolation";
        case Error::Kind::ReplayUnsupported: return "ReplayUnsupported";
        case Error::Kind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace relay
