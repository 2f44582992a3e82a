#pragma once

#include "relay/http/http_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────────────────────────────────────
// A fully received HTTP response. The body is read to completion by the
// transport, so a Response is a plain copyable value that middleware may
// inspect or replace freely.

struct Response {
    std::uint16_t status_code{0};
    std::string reason;     // e.g. "Not Found"; may be empty
    HeaderMap headers;
    std::string body;
    std::string url;        // final URL after redirects

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_client_error() const {
        return (status_code >= 400) && (status_code < 500);
    }

    [[nodiscard]] bool is_server_error() const {
        return (status_code >= 500) && (status_code < 600);
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }

    /// Value of Content-Length, when present and numeric.
    [[nodiscard]] std::optional<std::uint64_t> content_length() const;

    /// Delay requested by a numeric Retry-After header (delta-seconds form).
    [[nodiscard]] std::optional<std::uint64_t> retry_after_seconds() const;
};

}  // namespace relay
