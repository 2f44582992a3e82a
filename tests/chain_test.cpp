// ─────────────────────────────────────────────────────────────────────────────
// Chain Tests
// ─────────────────────────────────────────────────────────────────────────────
// Onion ordering, short-circuiting, the single-use `next` contract,
// initialisers and independence of concurrent logical requests.

#include <catch2/catch_test_macros.hpp>

#include "relay/middleware/chain.hpp"

#include "mocks/mock_transport.hpp"
#include "mocks/test_middleware.hpp"
#include "test_support.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <future>
#include <stdexcept>
#include <vector>

using namespace relay;
using namespace relay::testing;
using namespace std::chrono_literals;

namespace {

Request get_request(std::string_view url = "http://example.com/resource") {
    auto request = make_request(HttpMethod::Get, url);
    REQUIRE(request.has_value());
    return std::move(*request);
}

struct Tenant {
    std::string id;
};

/// Records the bag contents it sees on entry.
class TenantProbe final : public IMiddleware {
public:
    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        if (const auto* tenant = extensions.get<Tenant>()) {
            seen = tenant->id;
        }
        co_return co_await std::move(next).run(std::move(request), extensions);
    }

    std::string seen;
};

class OrderedInitialiser final : public IRequestInitialiser {
public:
    OrderedInitialiser(std::string name, std::shared_ptr<EventLog> log)
        : name_(std::move(name))
        , log_(std::move(log))
    {}

    void init(Request& request, Extensions& /*extensions*/) const override {
        log_->record("init:" + name_);
        append_header(request.headers, "X-Init", name_);
    }

private:
    std::string name_;
    std::shared_ptr<EventLog> log_;
};

/// A transport whose send() throws instead of returning an error.
class ThrowingTransport final : public ITransport {
public:
    asio::awaitable<TransportResult<Response>> send(Request /*request*/) override {
        throw std::runtime_error("socket exploded");
        co_return MockTransport::make_response(200);
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Ordering
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Middleware run onion-style in registration order", "[chain]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    auto log = std::make_shared<EventLog>();

    auto chain = ChainBuilder(transport)
        .emplace<RecordingMiddleware>("m1", log)
        .emplace<RecordingMiddleware>("m2", log)
        .emplace<RecordingMiddleware>("m3", log)
        .build();

    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE(result.has_value());
    REQUIRE(result->status_code == 200);
    REQUIRE(transport->call_count() == 1);
    REQUIRE(log->events() == std::vector<std::string>{
        "m1:in", "m2:in", "m3:in", "m3:out", "m2:out", "m1:out"
    });
}

TEST_CASE("Empty chain goes straight to the transport", "[chain]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_status(201, "created");

    auto chain = ChainBuilder(transport).build();
    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE(chain.middleware_count() == 0);
    REQUIRE(result.has_value());
    REQUIRE(result->status_code == 201);
    REQUIRE(result->body == "created");
}

TEST_CASE("Middleware changes to the request reach the transport", "[chain]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();

    auto chain = ChainBuilder(transport)
        .emplace<HeaderMiddleware>("Authorization", "Bearer token")
        .emplace<BodyRewritingMiddleware>("{\"a\":1}")
        .build();

    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE(result.has_value());
    const auto sent = transport->requests();
    REQUIRE(sent.size() == 1);
    REQUIRE(get_header(sent[0].headers, "authorization") == "Bearer token");
    REQUIRE(sent[0].body == "{\"a\":1}");
    REQUIRE(sent[0].body_kind == Body::Kind::Buffered);
}

// ═══════════════════════════════════════════════════════════════════════════
// Short-circuit and errors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Short-circuiting middleware skips the rest of the chain", "[chain]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    auto log = std::make_shared<EventLog>();

    auto chain = ChainBuilder(transport)
        .emplace<RecordingMiddleware>("outer", log)
        .emplace<ShortCircuitMiddleware>(304)
        .emplace<RecordingMiddleware>("inner", log)
        .build();

    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE(result.has_value());
    REQUIRE(result->status_code == 304);
    REQUIRE(transport->call_count() == 0);
    REQUIRE(log->events() == std::vector<std::string>{"outer:in", "outer:out"});
}

TEST_CASE("Transport failures surface as Transport errors", "[chain]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_error(TransportError::connection_failed("connection refused"));

    auto chain = ChainBuilder(transport).build();
    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().is_transport());
    REQUIRE(result.error().transport_code == TransportError::Code::ConnectionFailed);
    REQUIRE(result.error().message == "connection refused");
}

TEST_CASE("Exceptions thrown by the transport become Transport errors", "[chain]") {
    asio::io_context io;
    auto transport = std::make_shared<ThrowingTransport>();

    SECTION("empty chain") {
        auto chain = ChainBuilder(transport).build();
        auto result = run_sync(io, chain.execute(get_request()));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_transport());
        REQUIRE(result.error().transport_code == TransportError::Code::Io);
        REQUIRE(result.error().message.find("socket exploded") != std::string::npos);
    }

    SECTION("behind a middleware") {
        auto log = std::make_shared<EventLog>();
        auto chain = ChainBuilder(transport)
            .emplace<RecordingMiddleware>("outer", log)
            .build();
        auto result = run_sync(io, chain.execute(get_request()));

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_transport());
        REQUIRE_FALSE(result.error().is_contract_violation());
    }
}

TEST_CASE("Invoking next twice is a contract violation", "[chain][contract]") {
    asio::io_context io;
    ScopedCapturingLogger logger;
    auto transport = std::make_shared<MockTransport>();
    auto doubler = std::make_shared<DoubleNextMiddleware>();

    auto chain = ChainBuilder(transport).with(doubler).build();
    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().is_contract_violation());
    REQUIRE(doubler->first_succeeded);
    REQUIRE(transport->call_count() == 1);
    REQUIRE(logger->count("chain", LogLevel::Error) == 1);
}

TEST_CASE("A throwing middleware becomes a contract violation", "[chain][contract]") {
    asio::io_context io;
    ScopedCapturingLogger logger;
    auto transport = std::make_shared<MockTransport>();
    auto log = std::make_shared<EventLog>();

    auto chain = ChainBuilder(transport)
        .emplace<RecordingMiddleware>("outer", log)
        .emplace<ThrowingMiddleware>()
        .build();

    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().is_contract_violation());
    REQUIRE(result.error().message.find("boom") != std::string::npos);
    REQUIRE(transport->call_count() == 0);
    REQUIRE(log->events() == std::vector<std::string>{"outer:in", "outer:out"});
    REQUIRE(logger->count("chain", LogLevel::Error) == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Initialisers and extensions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Initialisers run in order before the first middleware", "[chain][init]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    auto log = std::make_shared<EventLog>();

    auto chain = ChainBuilder(transport)
        .with_init(std::make_shared<OrderedInitialiser>("a", log))
        .emplace<RecordingMiddleware>("m1", log)
        .with_init(std::make_shared<OrderedInitialiser>("b", log))
        .build();

    auto result = run_sync(io, chain.execute(get_request()));

    REQUIRE(result.has_value());
    REQUIRE(log->events() == std::vector<std::string>{"init:a", "init:b", "m1:in", "m1:out"});
    REQUIRE(get_all_headers(transport->requests()[0].headers, "x-init").size() == 2);
}

TEST_CASE("Extension initialiser seeds the bag", "[chain][init]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    auto probe = std::make_shared<TenantProbe>();

    auto chain = ChainBuilder(transport)
        .with_extension(Tenant{"default"})
        .with(probe)
        .build();

    SECTION("fresh bag receives the configured value") {
        auto result = run_sync(io, chain.execute(get_request()));
        REQUIRE(result.has_value());
        REQUIRE(probe->seen == "default");
    }

    SECTION("a caller-supplied value is not overwritten") {
        Extensions seeded;
        seeded.insert(Tenant{"acme"});
        auto result = run_sync(io, chain.execute(get_request(), std::move(seeded)));
        REQUIRE(result.has_value());
        REQUIRE(probe->seen == "acme");
    }
}

TEST_CASE("execute_with leaves the bag readable afterwards", "[chain][extensions]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();

    auto chain = ChainBuilder(transport)
        .emplace<CountingMiddleware>()
        .emplace<CountingMiddleware>()
        .build();

    Extensions bag;
    auto result = run_sync(io, chain.execute_with(get_request(), bag));

    REQUIRE(result.has_value());
    REQUIRE(bag.get<CallCount>() != nullptr);
    REQUIRE(bag.get<CallCount>()->value == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Builder
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ChainBuilder rejects null components", "[chain][builder]") {
    REQUIRE_THROWS_AS(ChainBuilder(nullptr), std::invalid_argument);

    ChainBuilder builder(std::make_shared<MockTransport>());
    REQUIRE_THROWS_AS(builder.with(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(builder.with_init(nullptr), std::invalid_argument);
}

TEST_CASE("Built chains are snapshots of the builder", "[chain][builder]") {
    ChainBuilder builder(std::make_shared<MockTransport>());
    builder.emplace<CountingMiddleware>();

    const auto first = builder.build();
    builder.emplace<CountingMiddleware>();
    const auto second = builder.build();

    REQUIRE(first.middleware_count() == 1);
    REQUIRE(second.middleware_count() == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Concurrent logical requests keep separate bags", "[chain][concurrency]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->set_delay(5ms);
    auto counter = std::make_shared<CountingMiddleware>();

    const auto chain = ChainBuilder(transport).with(counter).build();

    constexpr std::size_t kRequests = 20;
    std::vector<Extensions> bags(kRequests);
    std::vector<std::future<Result<Response>>> futures;
    futures.reserve(kRequests);

    for (std::size_t i = 0; i < kRequests; ++i) {
        futures.push_back(asio::co_spawn(io, chain.execute_with(get_request(), bags[i]), asio::use_future));
    }
    io.run();

    for (auto& future : futures) {
        auto result = future.get();
        REQUIRE(result.has_value());
        REQUIRE(result->status_code == 200);
    }
    for (const auto& bag : bags) {
        REQUIRE(bag.get<CallCount>()->value == 1);
    }
    REQUIRE(counter->invocations.load() == kRequests);
    REQUIRE(transport->call_count() == kRequests);
}
