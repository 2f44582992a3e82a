#include <catch2/catch_test_macros.hpp>

#include "relay/middleware/chain.hpp"
#include "relay/middleware/tracing_middleware.hpp"
#include "relay/retry/retry_middleware.hpp"

#include "mocks/mock_transport.hpp"
#include "test_support.hpp"

#include <asio/io_context.hpp>

using namespace relay;
using namespace relay::testing;
using namespace std::chrono_literals;

namespace {

Request get_orders() {
    auto request = make_request(HttpMethod::Get, "https://api.example.com/v1/orders?page=2");
    REQUIRE(request.has_value());
    return std::move(*request);
}

std::vector<CapturingLogger::Entry> tracing_entries(const CapturingLogger& logger) {
    std::vector<CapturingLogger::Entry> out;
    for (const auto& entry : logger.entries()) {
        if (entry.component == "tracing") {
            out.push_back(entry);
        }
    }
    return out;
}

}  // namespace

TEST_CASE("Tracing logs start and finish of a request", "[tracing]") {
    asio::io_context io;
    ScopedCapturingLogger logger;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_status(200);

    auto chain = ChainBuilder(transport)
        .emplace<TracingMiddleware>()
        .build();

    auto result = run_sync(io, chain.execute(get_orders()));
    REQUIRE(result.has_value());

    const auto entries = tracing_entries(*logger);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].level == LogLevel::Info);
    REQUIRE(entries[0].message.find("GET /v1/orders started") != std::string::npos);
    REQUIRE(entries[0].message.find("https://api.example.com/v1/orders?page=2") != std::string::npos);
    REQUIRE(entries[1].message.find("finished: HTTP 200") != std::string::npos);
}

TEST_CASE("Tracing uses the OperationName extension when present", "[tracing]") {
    asio::io_context io;
    ScopedCapturingLogger logger;
    auto transport = std::make_shared<MockTransport>();

    auto chain = ChainBuilder(transport)
        .with_extension(OperationName{"orders.list"})
        .emplace<TracingMiddleware>(LogLevel::Debug)
        .build();

    auto result = run_sync(io, chain.execute(get_orders()));
    REQUIRE(result.has_value());

    const auto entries = tracing_entries(*logger);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].level == LogLevel::Debug);
    REQUIRE(entries[0].message.rfind("orders.list started", 0) == 0);
    REQUIRE(entries[1].message.rfind("orders.list finished", 0) == 0);
}

TEST_CASE("Tracing reports failures with the error description", "[tracing]") {
    asio::io_context io;
    ScopedCapturingLogger logger;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_error(TransportError::timeout("read timed out"));

    auto chain = ChainBuilder(transport)
        .emplace<TracingMiddleware>()
        .build();

    auto result = run_sync(io, chain.execute(get_orders()));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().is_transport());

    const auto entries = tracing_entries(*logger);
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[1].message.find("failed") != std::string::npos);
    REQUIRE(entries[1].message.find("read timed out") != std::string::npos);
}

TEST_CASE("Tracing inside a retry logs every attempt", "[tracing][retry]") {
    asio::io_context io;
    ScopedCapturingLogger logger;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_status(503);
    transport->queue_status(200);

    RetryPolicy policy;
    policy.with_base_delay(1ms).with_jitter(Jitter::None);

    auto chain = ChainBuilder(transport)
        .emplace<RetryMiddleware>(policy)
        .emplace<TracingMiddleware>()
        .build();

    auto result = run_sync(io, chain.execute(get_orders()));
    REQUIRE(result.has_value());

    const auto entries = tracing_entries(*logger);
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[1].message.find("HTTP 503") != std::string::npos);
    REQUIRE(entries[1].message.find("(attempt 0)") != std::string::npos);
    REQUIRE(entries[3].message.find("HTTP 200") != std::string::npos);
    REQUIRE(entries[3].message.find("(attempt 1)") != std::string::npos);
}
