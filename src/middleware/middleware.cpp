#include "relay/middleware/middleware.hpp"

#include "relay/log/logger.hpp"
#include "relay/transport/transport.hpp"

#include <asio/error.hpp>

#include <exception>
#include <system_error>
#include <utility>

namespace relay {

Next::Next(
    std::shared_ptr<const MiddlewareList> middlewares,
    std::size_t position,
    std::shared_ptr<ITransport> transport
)
    : middlewares_(std::move(middlewares))
    , position_(position)
    , transport_(std::move(transport))
{}

Next::Next(Next&& other) noexcept
    : middlewares_(other.middlewares_)
    , position_(other.position_)
    , transport_(other.transport_)
    , consumed_(std::exchange(other.consumed_, true))
{}

Next& Next::operator=(Next&& other) noexcept {
    if (this != &other) {
        middlewares_ = other.middlewares_;
        position_ = other.position_;
        transport_ = other.transport_;
        consumed_ = std::exchange(other.consumed_, true);
    }
    return *this;
}

Next Next::clone() const {
    Next copy{middlewares_, position_, transport_};
    copy.consumed_ = consumed_;
    return copy;
}

std::size_t Next::remaining() const noexcept {
    const std::size_t total = middlewares_ ? middlewares_->size() : 0;
    return (position_ < total) ? (total - position_) : 0;
}

asio::awaitable<Result<Response>> Next::run(Request request, Extensions& extensions) && {
    if (consumed_) {
        RELAY_LOG_ERROR("chain", "next() invoked more than once by the same middleware");
        co_return tl::unexpected(Error::contract_violation(
            "next() invoked more than once for a single middleware invocation"
        ));
    }
    consumed_ = true;

    // End of the middleware list: hand the request to the transport.
    if (remaining() == 0) {
        if (!transport_) {
            co_return tl::unexpected(Error::contract_violation("chain has no transport"));
        }
        TransportResult<Response> sent = tl::unexpected(TransportError::io("transport did not respond"));
        try {
            sent = co_await transport_->send(std::move(request));
        } catch (const std::system_error& e) {
            if (e.code() == asio::error::operation_aborted) {
                co_return tl::unexpected(Error::cancelled());
            }
            sent = tl::unexpected(TransportError::io(std::string("transport threw: ") + e.what()));
        } catch (const std::exception& e) {
            sent = tl::unexpected(TransportError::io(std::string("transport threw: ") + e.what()));
        }
        if (!sent) {
            get_logger().log_fmt(LogLevel::Debug, "chain", "transport failed: {} ({})",
                sent.error().message, to_string(sent.error().code));
            co_return tl::unexpected(Error::from_transport_error(sent.error()));
        }
        co_return std::move(*sent);
    }

    const auto& current = (*middlewares_)[position_];
    Next rest{middlewares_, position_ + 1, transport_};

    try {
        co_return co_await current->handle(std::move(request), extensions, std::move(rest));
    } catch (const std::system_error& e) {
        if (e.code() == asio::error::operation_aborted) {
            co_return tl::unexpected(Error::cancelled());
        }
        get_logger().log_fmt(LogLevel::Error, "chain",
            "middleware #{} threw: {}", position_, e.what());
        co_return tl::unexpected(Error::contract_violation(
            std::string("middleware threw an exception: ") + e.what()
        ));
    } catch (const std::exception& e) {
        get_logger().log_fmt(LogLevel::Error, "chain",
            "middleware #{} threw: {}", position_, e.what());
        co_return tl::unexpected(Error::contract_violation(
            std::string("middleware threw an exception: ") + e.what()
        ));
    }
}

}  // namespace relay
