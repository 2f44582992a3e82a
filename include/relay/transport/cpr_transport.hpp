#ifndef RELAY_TRANSPORT_CPR_TRANSPORT_HPP
#define RELAY_TRANSPORT_CPR_TRANSPORT_HPP

#include "relay/transport/cpr_transport_config.hpp"
#include "relay/transport/transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/thread_pool.hpp>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// CprTransport
// ─────────────────────────────────────────────────────────────────────────────
// Production transport on top of cpr (libcurl). Each send() runs one
// blocking cpr::Session exchange on an internal asio::thread_pool and
// resumes the awaiting coroutine on its own executor.
//
// A Streaming body is drained into memory before the exchange starts.
//
// Cancelling the awaiting coroutine does not interrupt an exchange that
// is already running on the pool; the result is discarded when it lands.

class CprTransport final : public ITransport {
public:
    explicit CprTransport(CprTransportConfig config = {});

    /// Joins the worker pool; in-flight exchanges run to completion.
    ~CprTransport() override;

    CprTransport(const CprTransport&) = delete;
    CprTransport& operator=(const CprTransport&) = delete;

    [[nodiscard]] asio::awaitable<TransportResult<Response>> send(Request request) override;

    [[nodiscard]] const CprTransportConfig& config() const noexcept {
        return config_;
    }

private:
    asio::awaitable<TransportResult<Response>> send_on_pool(Request request);

    [[nodiscard]] TransportResult<Response> perform(Request request) const;

    CprTransportConfig config_;
    asio::thread_pool pool_;
};

}  // namespace relay

#endif  // RELAY_TRANSPORT_CPR_TRANSPORT_HPP
