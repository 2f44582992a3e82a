#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// TracingMiddleware
// ═══════════════════════════════════════════════════════════════════════════
// Logs each logical request on the way in and its outcome on the way out,
// with the elapsed wall time. Register it outermost to time the whole
// exchange including retries, or inside RetryMiddleware to log every
// attempt separately.
//
// The span name is taken from an OperationName in the Extension Bag when
// one is present, otherwise "<METHOD> <path>".

#include "relay/log/logger.hpp"
#include "relay/middleware/middleware.hpp"

#include <asio/awaitable.hpp>

#include <string>

namespace relay {

/// Logical name for the request, e.g. "orders.list".
struct OperationName {
    std::string value;
};

class TracingMiddleware final : public IMiddleware {
public:
    explicit TracingMiddleware(LogLevel level = LogLevel::Info)
        : level_(level)
    {}

    [[nodiscard]] asio::awaitable<Result<Response>> handle(
        Request request,
        Extensions& extensions,
        Next next
    ) override;

    [[nodiscard]] LogLevel level() const noexcept { return level_; }

private:
    LogLevel level_;
};

}  // namespace relay
