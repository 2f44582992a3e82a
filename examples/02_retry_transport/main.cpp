// Example 02: Retry over HTTP
//
// Send a real request through CprTransport with retries configured from
// JSON. Point RELAY_URL at a flaky endpoint (e.g. https://httpbin.org/status/503)
// to watch the backoff schedule.

#include <relay/log/spdlog_logger.hpp>
#include <relay/middleware/chain.hpp>
#include <relay/middleware/tracing_middleware.hpp>
#include <relay/retry/retry_middleware.hpp>
#include <relay/transport/cpr_transport.hpp>

#include <nlohmann/json.hpp>

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <cstdlib>
#include <iostream>

using namespace relay;
using Json = nlohmann::json;

int main() {
    std::cout << "=== Retry Transport Example ===\n\n";

    const char* url_env = std::getenv("RELAY_URL");
    const std::string url = url_env ? url_env : "https://httpbin.org/status/503";

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    // 1. Retry settings, as they might come from a config file
    const Json retry_config = {
        {"max_retries", 4},
        {"base_delay_ms", 200},
        {"max_delay_ms", 5000},
        {"jitter", "full"},
        {"total_retry_duration_ms", 15000},
        {"log_level", "warn"}
    };

    auto policy = RetryPolicy::from_json(retry_config);
    if (!policy) {
        std::cerr << "Bad retry config: " << policy.error().describe() << "\n";
        return 1;
    }

    // 2. Transport
    CprTransportConfig transport_config;
    transport_config.with_user_agent("relay-example/1.0")
                    .with_connect_timeout(std::chrono::seconds(5))
                    .with_read_timeout(std::chrono::seconds(10));
    auto transport = std::make_shared<CprTransport>(transport_config);

    // 3. Chain: one trace span around all attempts
    auto chain = ChainBuilder(transport)
        .with_extension(OperationName{"example.fetch"})
        .emplace<TracingMiddleware>()
        .emplace<RetryMiddleware>(std::move(*policy))
        .build();

    auto request = make_request(HttpMethod::Get, url);
    if (!request) {
        std::cerr << "Invalid URL: " << url << "\n";
        return 1;
    }

    // 4. Run
    asio::io_context io;
    auto future = asio::co_spawn(io, chain.execute(std::move(*request)), asio::use_future);
    io.run();

    auto result = future.get();
    if (!result) {
        std::cerr << "Request failed: " << result.error().describe() << "\n";
        set_logger(nullptr);
        return 1;
    }

    std::cout << "Status: " << result->status_code << "\n";
    std::cout << "Bytes:  " << result->body.size() << "\n";

    set_logger(nullptr);
    return 0;
}
