#ifndef RELAY_TRANSPORT_TRANSPORT_ERROR_HPP
#define RELAY_TRANSPORT_TRANSPORT_ERROR_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// TransportError
// ─────────────────────────────────────────────────────────────────────────────
// Low-level exchange failures reported by an ITransport. The chain turns
// these into Error{Kind::Transport} before any middleware sees them.

struct TransportError {
    enum class Code {
        ConnectionFailed,    // DNS, refused, reset
        Timeout,             // connect or read deadline hit
        SslError,            // handshake or certificate verification
        Io                   // anything else on the wire
    };

    Code code{Code::Io};
    std::string message;

    static TransportError connection_failed(std::string msg) {
        return {Code::ConnectionFailed, std::move(msg)};
    }

    static TransportError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }

    static TransportError ssl_error(std::string msg) {
        return {Code::SslError, std::move(msg)};
    }

    static TransportError io(std::string msg) {
        return {Code::Io, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Code code) noexcept {
    switch (code) {
        case TransportError::Code::ConnectionFailed: return "ConnectionFailed";
        case TransportError::Code::Timeout:          return "Timeout";
        case TransportError::Code::SslError:         return "SslError";
        case TransportError::Code::Io:               return "Io";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace relay

#endif  // RELAY_TRANSPORT_TRANSPORT_ERROR_HPP
