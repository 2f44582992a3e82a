#include "relay/transport/cpr_transport.hpp"

#include "relay/log/logger.hpp"

#include <cpr/cpr.h>

#include <asio/co_spawn.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace relay {

namespace {

// cpr::Header is a case-insensitive map, so repeated request headers are
// folded into one comma-separated value (RFC 9110 §5.3).
cpr::Header build_headers(const HeaderMap& defaults, const HeaderMap& request_headers) {
    cpr::Header merged;
    for (const auto& [name, value] : request_headers) {
        auto it = merged.find(name);
        if (it == merged.end()) {
            merged.emplace(name, value);
        } else {
            it->second += ", " + value;
        }
    }
    for (const auto& [name, value] : defaults) {
        if (merged.find(name) == merged.end()) {
            merged.emplace(name, value);
        }
    }
    return merged;
}

cpr::Response dispatch(cpr::Session& session, HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:     return session.Get();
        case HttpMethod::Head:    return session.Head();
        case HttpMethod::Post:    return session.Post();
        case HttpMethod::Put:     return session.Put();
        case HttpMethod::Patch:   return session.Patch();
        case HttpMethod::Delete:  return session.Delete();
        case HttpMethod::Options: return session.Options();
    }
    return session.Get();
}

TransportError map_error(const cpr::Error& error) {
    const std::string& msg = error.message;
    const bool is_ssl_error =
        (msg.find("SSL") != std::string::npos) ||
        (msg.find("ssl") != std::string::npos) ||
        (msg.find("certificate") != std::string::npos) ||
        (msg.find("TLS") != std::string::npos);

    if (is_ssl_error) {
        return TransportError::ssl_error(msg);
    }

    switch (error.code) {
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return TransportError::timeout(msg);

        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return TransportError::ssl_error(msg);

        default:
            // DNS, refused, reset and most other libcurl failures.
            return TransportError::connection_failed(msg);
    }
}

Response convert_response(const cpr::Response& raw) {
    Response response;
    response.status_code = static_cast<std::uint16_t>(std::clamp<long>(raw.status_code, 0, 999));
    response.reason = raw.reason;
    response.body = raw.text;
    response.url = raw.url.str();
    for (const auto& [name, value] : raw.header) {
        append_header(response.headers, name, value);
    }
    return response;
}

}  // namespace

CprTransport::CprTransport(CprTransportConfig config)
    : config_(std::move(config))
    , pool_(std::max<std::size_t>(1, config_.worker_threads))
{}

CprTransport::~CprTransport() {
    pool_.join();
}

asio::awaitable<TransportResult<Response>> CprTransport::send(Request request) {
    co_return co_await asio::co_spawn(pool_, send_on_pool(std::move(request)), asio::use_awaitable);
}

asio::awaitable<TransportResult<Response>> CprTransport::send_on_pool(Request request) {
    co_return perform(std::move(request));
}

TransportResult<Response> CprTransport::perform(Request request) const {
    const std::string method{to_string(request.method)};
    const std::string url = request.url.href;

    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetHeader(build_headers(config_.default_headers, request.headers));
    session.SetConnectTimeout(cpr::ConnectTimeout{config_.connect_timeout});
    session.SetTimeout(cpr::Timeout{config_.read_timeout});
    session.SetVerifySsl(cpr::VerifySsl{config_.verify_ssl});
    if (config_.user_agent.empty() == false) {
        session.SetUserAgent(cpr::UserAgent{config_.user_agent});
    }

    const bool has_body = (request.body.is_absent() == false);
    if (has_body) {
        session.SetBody(cpr::Body{request.body.take_all()});
    }

    get_logger().log_fmt(LogLevel::Trace, "transport", "{} {} sending", method, url);

    const cpr::Response raw = dispatch(session, request.method);

    const bool has_error = (raw.error.code != cpr::ErrorCode::OK);
    if (has_error) {
        auto error = map_error(raw.error);
        get_logger().log_fmt(LogLevel::Debug, "transport", "{} {} failed: {} ({})",
            method, url, error.message, to_string(error.code));
        return tl::unexpected(std::move(error));
    }

    get_logger().log_fmt(LogLevel::Debug, "transport", "{} {} -> {} ({} bytes, {:.3f}s)",
        method, url, raw.status_code, raw.text.size(), raw.elapsed);

    return convert_response(raw);
}

}  // namespace relay
