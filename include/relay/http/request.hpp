#pragma once

#include "relay/http/body.hpp"
#include "relay/http/http_types.hpp"

#include <optional>
#include <string>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────────────────────────────────────
// An outbound HTTP request. Move-only because its Body may be a
// single-consumption stream; each middleware receives it by value and
// hands it on with std::move.
//
// The Extension Bag of the logical request travels beside the Request
// (see Chain::execute and IMiddleware::handle), not inside it, so that it
// survives while individual attempts are rebuilt.

struct Request {
    HttpMethod method{HttpMethod::Get};
    Url url;
    HeaderMap headers;
    Body body;

    Request() = default;

    Request(HttpMethod m, Url target)
        : method(m)
        , url(std::move(target))
    {}

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;
    Request(Request&&) noexcept = default;
    Request& operator=(Request&&) noexcept = default;

    /// Replaces any existing values of `name`.
    Request& with_header(std::string_view name, std::string value) {
        set_header(headers, name, std::move(value));
        return *this;
    }

    Request& with_body(Body payload) {
        body = std::move(payload);
        return *this;
    }

    Request& with_body(std::string bytes) {
        body = Body::buffered(std::move(bytes));
        return *this;
    }

    /// Method, URL and headers with an Absent body.
    [[nodiscard]] Request clone_head() const {
        Request copy{method, url};
        copy.headers = headers;
        return copy;
    }

    /// Full duplicate; nullopt when the body is Streaming.
    [[nodiscard]] std::optional<Request> try_clone() const {
        auto body_copy = body.try_clone();
        if (body_copy.has_value() == false) {
            return std::nullopt;
        }
        Request copy = clone_head();
        copy.body = std::move(*body_copy);
        return std::optional<Request>{std::move(copy)};
    }
};

/// Parse `url` and build a request for it; nullopt if the URL is not a valid http(s) URL.
[[nodiscard]] inline std::optional<Request> make_request(HttpMethod method, std::string_view url) {
    auto parsed = parse_url(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }
    return std::optional<Request>{Request{method, std::move(*parsed)}};
}

}  // namespace relay
