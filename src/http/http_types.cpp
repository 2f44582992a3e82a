#include "relay/http/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace relay {

std::vector<std::string> get_all_headers(const HeaderMap& headers, std::string_view name) {
    std::vector<std::string> values;
    for (const auto& [key, value] : headers) {
        if (header_name_equals(key, name)) {
            values.push_back(value);
        }
    }
    return values;
}

void set_header(HeaderMap& headers, std::string_view name, std::string value) {
    remove_header(headers, name);
    headers.emplace(std::string(name), std::move(value));
}

std::size_t remove_header(HeaderMap& headers, std::string_view name) {
    return std::erase_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Patch:   return "PATCH";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Options: return "OPTIONS";
    }
    return "UNKNOWN";
}

std::optional<HttpMethod> parse_http_method(std::string_view name) {
    constexpr HttpMethod all[] = {
        HttpMethod::Get, HttpMethod::Head, HttpMethod::Post, HttpMethod::Put,
        HttpMethod::Patch, HttpMethod::Delete, HttpMethod::Options
    };
    for (const auto method : all) {
        if (header_name_equals(to_string(method), name)) {
            return method;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL parsing (ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// ada normalizes the host (IDN, IPv6 brackets), percent-encodes the path
// and strips default ports; we only narrow the result to http/https.

std::optional<Url> parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }

    std::string scheme(parsed->get_protocol());
    if (scheme.empty() == false && scheme.back() == ':') {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if (is_http == false && is_https == false) {
        return std::nullopt;
    }

    std::string host(parsed->get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_text = parsed->get_port();
    if (port_text.empty() == false) {
        const auto* first = port_text.data();
        const auto* last = port_text.data() + port_text.size();
        const auto [ptr, ec] = std::from_chars(first, last, port);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
    }

    std::string path(parsed->get_pathname());
    if (path.empty()) {
        path = "/";
    }

    Url result;
    result.href = std::string(parsed->get_href());
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(parsed->get_search());
    return result;
}

}  // namespace relay
