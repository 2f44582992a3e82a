#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Middleware Contract
// ═══════════════════════════════════════════════════════════════════════════
// A middleware wraps everything registered after it, onion-style:
//
//   class Timing final : public relay::IMiddleware {
//   public:
//       asio::awaitable<relay::Result<relay::Response>> handle(
//           relay::Request request, relay::Extensions& extensions, relay::Next next) override
//       {
//           const auto start = std::chrono::steady_clock::now();
//           auto result = co_await std::move(next).run(std::move(request), extensions);
//           record(std::chrono::steady_clock::now() - start);
//           co_return result;
//       }
//   };
//
// handle() either awaits `std::move(next).run(...)` exactly once and
// returns what it produced (possibly altered), or short-circuits by
// returning a Response or Error without touching `next`.

#include "relay/error.hpp"
#include "relay/http/extensions.hpp"
#include "relay/http/request.hpp"
#include "relay/http/response.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace relay {

class ITransport;
class IMiddleware;

using MiddlewareList = std::vector<std::shared_ptr<IMiddleware>>;

// ─────────────────────────────────────────────────────────────────────────────
// Next - single-use continuation into the rest of the chain
// ─────────────────────────────────────────────────────────────────────────────
// Move-only. run() is rvalue-qualified, so proceeding reads as
// `std::move(next).run(...)` and a second call on the same object is a
// use-after-move; at runtime it yields Error{ContractViolation} instead
// of re-entering the chain.
//
// Middleware that legitimately needs several passes through the rest of
// the chain (retry) takes an explicit clone() per pass.

class Next {
public:
    Next(std::shared_ptr<const MiddlewareList> middlewares,
         std::size_t position,
         std::shared_ptr<ITransport> transport);

    Next(const Next&) = delete;
    Next& operator=(const Next&) = delete;

    /// The moved-from continuation counts as consumed.
    Next(Next&& other) noexcept;
    Next& operator=(Next&& other) noexcept;

    ~Next() = default;

    /// Drive `request` through the remaining middleware and the transport.
    [[nodiscard]] asio::awaitable<Result<Response>> run(Request request, Extensions& extensions) &&;

    /// A fresh, unconsumed continuation over the same remainder. Cloning a
    /// consumed continuation yields a consumed one.
    [[nodiscard]] Next clone() const;

    [[nodiscard]] bool consumed() const noexcept { return consumed_; }

    /// Number of middleware still ahead of the transport.
    [[nodiscard]] std::size_t remaining() const noexcept;

private:
    std::shared_ptr<const MiddlewareList> middlewares_;
    std::size_t position_{0};
    std::shared_ptr<ITransport> transport_;
    bool consumed_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// IMiddleware
// ─────────────────────────────────────────────────────────────────────────────
// Implementations must be safe to call from concurrent logical requests:
// per-request state belongs in `extensions`, not in members.

class IMiddleware {
public:
    virtual ~IMiddleware() = default;

    [[nodiscard]] virtual asio::awaitable<Result<Response>> handle(
        Request request,
        Extensions& extensions,
        Next next
    ) = 0;
};

}  // namespace relay
