#include "relay/middleware/chain.hpp"

#include "relay/log/logger.hpp"

#include <stdexcept>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Chain
// ─────────────────────────────────────────────────────────────────────────────

Chain::Chain(
    std::shared_ptr<const MiddlewareList> middlewares,
    std::shared_ptr<const InitialiserList> initialisers,
    std::shared_ptr<ITransport> transport
)
    : middlewares_(std::move(middlewares))
    , initialisers_(std::move(initialisers))
    , transport_(std::move(transport))
{}

asio::awaitable<Result<Response>> Chain::execute(Request request) const {
    Extensions extensions;
    co_return co_await execute_with(std::move(request), extensions);
}

asio::awaitable<Result<Response>> Chain::execute(Request request, Extensions extensions) const {
    co_return co_await execute_with(std::move(request), extensions);
}

asio::awaitable<Result<Response>> Chain::execute_with(Request request, Extensions& extensions) const {
    for (const auto& initialiser : *initialisers_) {
        initialiser->init(request, extensions);
    }

    get_logger().log_fmt(LogLevel::Trace, "chain", "{} {} entering {} middleware",
        to_string(request.method), request.url.href, middlewares_->size());

    Next entry{middlewares_, 0, transport_};
    co_return co_await std::move(entry).run(std::move(request), extensions);
}

// ─────────────────────────────────────────────────────────────────────────────
// ChainBuilder
// ─────────────────────────────────────────────────────────────────────────────

ChainBuilder::ChainBuilder(std::shared_ptr<ITransport> transport)
    : transport_(std::move(transport))
{
    if (!transport_) {
        throw std::invalid_argument("ChainBuilder: transport cannot be null");
    }
}

ChainBuilder& ChainBuilder::with(std::shared_ptr<IMiddleware> middleware) {
    if (!middleware) {
        throw std::invalid_argument("ChainBuilder: middleware cannot be null");
    }
    middlewares_.push_back(std::move(middleware));
    return *this;
}

ChainBuilder& ChainBuilder::with_init(std::shared_ptr<IRequestInitialiser> initialiser) {
    if (!initialiser) {
        throw std::invalid_argument("ChainBuilder: initialiser cannot be null");
    }
    initialisers_.push_back(std::move(initialiser));
    return *this;
}

Chain ChainBuilder::build() const {
    return Chain{
        std::make_shared<const MiddlewareList>(middlewares_),
        std::make_shared<const InitialiserList>(initialisers_),
        transport_
    };
}

}  // namespace relay
