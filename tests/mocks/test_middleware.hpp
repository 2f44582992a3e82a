#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Test Middleware
// ═══════════════════════════════════════════════════════════════════════════
// Small IMiddleware implementations used to probe chain behaviour.

#include "relay/middleware/middleware.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace relay::testing {

/// Shared, thread-safe list of events in the order they happened.
class EventLog {
public:
    void record(std::string event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    [[nodiscard]] std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

/// Records "<name>:in" before delegating and "<name>:out" after.
class RecordingMiddleware final : public IMiddleware {
public:
    RecordingMiddleware(std::string name, std::shared_ptr<EventLog> log)
        : name_(std::move(name))
        , log_(std::move(log))
    {}

    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        log_->record(name_ + ":in");
        auto result = co_await std::move(next).run(std::move(request), extensions);
        log_->record(name_ + ":out");
        co_return result;
    }

private:
    std::string name_;
    std::shared_ptr<EventLog> log_;
};

/// Answers with a fixed status without calling next.
class ShortCircuitMiddleware final : public IMiddleware {
public:
    explicit ShortCircuitMiddleware(std::uint16_t status)
        : status_(status)
    {}

    asio::awaitable<Result<Response>> handle(Request /*request*/, Extensions& /*extensions*/, Next /*next*/) override {
        Response response;
        response.status_code = status_;
        co_return response;
    }

private:
    std::uint16_t status_;
};

/// Calls next twice on the same continuation and returns the second result.
class DoubleNextMiddleware final : public IMiddleware {
public:
    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        auto copy = request.try_clone();
        auto first = co_await std::move(next).run(std::move(request), extensions);
        first_succeeded = first.has_value();
        co_return co_await std::move(next).run(std::move(*copy), extensions);
    }

    bool first_succeeded{false};
};

class ThrowingMiddleware final : public IMiddleware {
public:
    asio::awaitable<Result<Response>> handle(Request /*request*/, Extensions& /*extensions*/, Next /*next*/) override {
        throw std::runtime_error("boom");
        co_return Response{};
    }
};

/// Counts invocations in the bag under CallCount.
struct CallCount {
    std::size_t value{0};
};

class CountingMiddleware final : public IMiddleware {
public:
    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        extensions.get_or_insert_default<CallCount>().value += 1;
        invocations.fetch_add(1);
        co_return co_await std::move(next).run(std::move(request), extensions);
    }

    std::atomic<std::size_t> invocations{0};
};

/// Adds a header before delegating.
class HeaderMiddleware final : public IMiddleware {
public:
    HeaderMiddleware(std::string name, std::string value)
        : name_(std::move(name))
        , value_(std::move(value))
    {}

    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        request.with_header(name_, value_);
        co_return co_await std::move(next).run(std::move(request), extensions);
    }

private:
    std::string name_;
    std::string value_;
};

/// Replaces the body with something else before delegating.
class BodyRewritingMiddleware final : public IMiddleware {
public:
    explicit BodyRewritingMiddleware(std::string replacement)
        : replacement_(std::move(replacement))
    {}

    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        request.with_body(replacement_);
        co_return co_await std::move(next).run(std::move(request), extensions);
    }

private:
    std::string replacement_;
};

/// Turns any non-success response into a Middleware error carrying its status.
class StatusToErrorMiddleware final : public IMiddleware {
public:
    asio::awaitable<Result<Response>> handle(Request request, Extensions& extensions, Next next) override {
        auto result = co_await std::move(next).run(std::move(request), extensions);
        if (result && result->is_success() == false) {
            co_return tl::unexpected(Error::middleware_with_status(
                result->status_code, "unexpected status"));
        }
        co_return result;
    }
};

}  // namespace relay::testing
