#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// The terminal stage of every chain: performs the actual exchange.
// Implementations own their concurrency (connection pools, worker
// threads); the chain only ever awaits send().

#include "relay/http/request.hpp"
#include "relay/http/response.hpp"
#include "relay/transport/transport_error.hpp"

#include <asio/awaitable.hpp>

namespace relay {

class ITransport {
public:
    virtual ~ITransport() = default;

    /// Send one request and read the full response. Consumes the request.
    [[nodiscard]] virtual asio::awaitable<TransportResult<Response>> send(Request request) = 0;
};

}  // namespace relay
