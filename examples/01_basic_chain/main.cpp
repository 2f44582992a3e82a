// Example 01: Basic Chain
//
// Wrap an in-process transport with two middleware and watch the
// onion order in the log.

#include <relay/log/logger.hpp>
#include <relay/middleware/chain.hpp>
#include <relay/middleware/tracing_middleware.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <iostream>

using namespace relay;

namespace {

// Answers every request locally so the example needs no network.
class EchoTransport final : public ITransport {
public:
    asio::awaitable<TransportResult<Response>> send(Request request) override {
        Response response;
        response.status_code = 200;
        response.reason = "OK";
        response.url = request.url.href;
        response.body = std::string(to_string(request.method)) + " " + request.url.path_with_query();
        if (get_header(request.headers, "Authorization").has_value()) {
            response.body += " (authorized)";
        }
        co_return response;
    }
};

// Adds a bearer token to every request.
class AuthMiddleware final : public IMiddleware {
public:
    explicit AuthMiddleware(std::string token)
        : token_(std::move(token))
    {}

    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        request.with_header("Authorization", "Bearer " + token_);
        co_return co_await std::move(next).run(std::move(request), extensions);
    }

private:
    std::string token_;
};

}  // namespace

int main() {
    std::cout << "=== Basic Chain Example ===\n\n";

    set_logger(std::make_unique<ConsoleLogger>(LogLevel::Debug));

    auto chain = ChainBuilder(std::make_shared<EchoTransport>())
        .with_extension(OperationName{"echo.orders"})
        .emplace<TracingMiddleware>()
        .emplace<AuthMiddleware>("demo-token")
        .build();

    auto request = make_request(HttpMethod::Get, "https://api.example.com/orders?limit=5");
    if (!request) {
        std::cerr << "Invalid URL\n";
        return 1;
    }

    asio::io_context io;
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        auto result = co_await chain.execute(std::move(*request));
        if (!result) {
            std::cerr << "Request failed: " << result.error().describe() << "\n";
            co_return;
        }
        std::cout << "Status: " << result->status_code << " " << result->reason << "\n";
        std::cout << "Body:   " << result->body << "\n";
    }, asio::detached);
    io.run();

    set_logger(nullptr);
    return 0;
}
