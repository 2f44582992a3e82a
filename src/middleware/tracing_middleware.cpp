#include "relay/middleware/tracing_middleware.hpp"

#include "relay/retry/retry_middleware.hpp"

#include <chrono>

namespace relay {

namespace {

std::string span_name(const Request& request, const Extensions& extensions) {
    if (const auto* name = extensions.get<OperationName>()) {
        return name->value;
    }
    return std::string(to_string(request.method)) + " " + request.url.path;
}

}  // namespace

asio::awaitable<Result<Response>> TracingMiddleware::handle(
    Request request,
    Extensions& extensions,
    Next next
) {
    const std::string name = span_name(request, extensions);
    const std::string method{to_string(request.method)};
    const std::string url = request.url.href;

    get_logger().log_fmt(level_, "tracing", "{} started: {} {}", name, method, url);

    const auto started = std::chrono::steady_clock::now();
    auto result = co_await std::move(next).run(std::move(request), extensions);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    // RetryAttempt is only present when a RetryMiddleware sits outside us
    // (per-attempt spans) or already finished inside us.
    const auto* attempt = extensions.get<RetryAttempt>();
    const std::size_t attempt_index = (attempt != nullptr) ? attempt->index : 0;

    if (result) {
        get_logger().log_fmt(level_, "tracing", "{} finished: HTTP {} in {}ms (attempt {})",
            name, result->status_code, elapsed.count(), attempt_index);
    } else {
        get_logger().log_fmt(level_, "tracing", "{} failed: {} in {}ms (attempt {})",
            name, result.error().describe(), elapsed.count(), attempt_index);
    }

    co_return result;
}

}  // namespace relay
