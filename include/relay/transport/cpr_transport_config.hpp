#ifndef RELAY_TRANSPORT_CPR_TRANSPORT_CONFIG_HPP
#define RELAY_TRANSPORT_CPR_TRANSPORT_CONFIG_HPP

#include "relay/error.hpp"
#include "relay/http/http_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// CprTransport Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Settings applied to every exchange performed by a CprTransport.

struct CprTransportConfig {
    // Sent with every request. A header set on the Request itself wins.
    HeaderMap default_headers;

    // Empty = let libcurl pick its own User-Agent.
    std::string user_agent{"relay/1.0"};

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    // Maximum time to establish the TCP (and TLS) connection.
    std::chrono::milliseconds connect_timeout{10'000};

    // Maximum time for the whole exchange once started. 0 = no limit.
    std::chrono::milliseconds read_timeout{30'000};

    // ─────────────────────────────────────────────────────────────────────────
    // TLS
    // ─────────────────────────────────────────────────────────────────────────

    // Verify the server certificate chain and hostname.
    // WARNING: disabling this is only acceptable against local test servers.
    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────────────

    // Threads used to run blocking libcurl calls off the caller's executor.
    std::size_t worker_threads{4};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   config.with_bearer_token("xxx").with_connect_timeout(2s)

    CprTransportConfig& with_bearer_token(const std::string& token);
    CprTransportConfig& with_header(const std::string& name, const std::string& value);
    CprTransportConfig& with_user_agent(std::string agent);
    CprTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    CprTransportConfig& with_read_timeout(std::chrono::milliseconds timeout);
    CprTransportConfig& with_verify_ssl(bool verify);
    CprTransportConfig& with_worker_threads(std::size_t threads);

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration loading
    // ─────────────────────────────────────────────────────────────────────────
    // Recognized keys (all optional):
    //   headers             object of string -> string
    //   user_agent          string
    //   connect_timeout_ms  integer >= 0
    //   read_timeout_ms     integer >= 0
    //   verify_ssl          bool
    //   worker_threads      integer >= 1

    [[nodiscard]] static Result<CprTransportConfig> from_json(const nlohmann::json& config);
};

}  // namespace relay

#endif  // RELAY_TRANSPORT_CPR_TRANSPORT_CONFIG_HPP
