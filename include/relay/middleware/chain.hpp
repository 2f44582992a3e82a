#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Chain & ChainBuilder
// ═══════════════════════════════════════════════════════════════════════════
// Composes middleware around one transport:
//
//   auto chain = relay::ChainBuilder(transport)
//       .with_extension(OperationName{"orders.list"})
//       .with(std::make_shared<relay::TracingMiddleware>())
//       .with(std::make_shared<relay::RetryMiddleware>(policy))
//       .build();
//
//   auto result = co_await chain.execute(std::move(request));
//
// The first middleware registered is the outermost: it sees the request
// before all others and the response after all others.
//
// A built Chain is immutable and holds no per-request state, so one
// instance may serve any number of concurrent logical requests. It must
// outlive the coroutines returned by execute().

#include "relay/middleware/middleware.hpp"
#include "relay/transport/transport.hpp"

#include <asio/awaitable.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Request initialisers
// ─────────────────────────────────────────────────────────────────────────────
// Run once per logical request, in registration order, after the bag is
// created and before the first middleware.

class IRequestInitialiser {
public:
    virtual ~IRequestInitialiser() = default;
    virtual void init(Request& request, Extensions& extensions) const = 0;
};

/// Seeds every logical request's bag with a copy of `value`, unless the
/// caller already supplied a value of that type.
template <typename T>
class Extension final : public IRequestInitialiser {
public:
    explicit Extension(T value)
        : value_(std::move(value))
    {}

    void init(Request& /*request*/, Extensions& extensions) const override {
        if (extensions.contains<T>() == false) {
            extensions.insert(value_);
        }
    }

private:
    T value_;
};

using InitialiserList = std::vector<std::shared_ptr<IRequestInitialiser>>;

// ─────────────────────────────────────────────────────────────────────────────
// Chain
// ─────────────────────────────────────────────────────────────────────────────

class Chain {
public:
    /// One logical request with a fresh Extension Bag.
    [[nodiscard]] asio::awaitable<Result<Response>> execute(Request request) const;

    /// One logical request whose bag starts from `extensions`.
    [[nodiscard]] asio::awaitable<Result<Response>> execute(Request request, Extensions extensions) const;

    /// One logical request using a caller-owned bag, which stays readable
    /// after completion. `extensions` must outlive the returned coroutine.
    [[nodiscard]] asio::awaitable<Result<Response>> execute_with(Request request, Extensions& extensions) const;

    [[nodiscard]] std::size_t middleware_count() const noexcept {
        return middlewares_->size();
    }

private:
    friend class ChainBuilder;

    Chain(
        std::shared_ptr<const MiddlewareList> middlewares,
        std::shared_ptr<const InitialiserList> initialisers,
        std::shared_ptr<ITransport> transport
    );

    std::shared_ptr<const MiddlewareList> middlewares_;
    std::shared_ptr<const InitialiserList> initialisers_;
    std::shared_ptr<ITransport> transport_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ChainBuilder
// ─────────────────────────────────────────────────────────────────────────────

class ChainBuilder {
public:
    /// Throws std::invalid_argument if `transport` is null.
    explicit ChainBuilder(std::shared_ptr<ITransport> transport);

    /// Append a middleware; registration order is invocation order.
    ChainBuilder& with(std::shared_ptr<IMiddleware> middleware);

    /// Construct and append a middleware of type M.
    template <typename M, typename... Args>
    ChainBuilder& emplace(Args&&... args) {
        return with(std::make_shared<M>(std::forward<Args>(args)...));
    }

    ChainBuilder& with_init(std::shared_ptr<IRequestInitialiser> initialiser);

    /// Shorthand for with_init(Extension<T>{value}).
    template <typename T>
    ChainBuilder& with_extension(T value) {
        return with_init(std::make_shared<Extension<T>>(std::move(value)));
    }

    /// Snapshot the current registrations. The builder stays usable.
    [[nodiscard]] Chain build() const;

private:
    std::shared_ptr<ITransport> transport_;
    MiddlewareList middlewares_;
    InitialiserList initialisers_;
};

}  // namespace relay
