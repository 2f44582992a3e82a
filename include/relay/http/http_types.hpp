#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Header Multimap
// ─────────────────────────────────────────────────────────────────────────────
// A header name may repeat (Set-Cookie, Via, ...). Names compare
// case-insensitively (RFC 9110 §5.1); use the helpers below instead of
// the container's own find().

using HeaderMap = std::unordered_multimap<std::string, std::string>;

[[nodiscard]] inline bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

/// First value stored under `name`, if any.
[[nodiscard]] inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

/// Every value stored under `name`, in unspecified order.
[[nodiscard]] std::vector<std::string> get_all_headers(const HeaderMap& headers, std::string_view name);

/// Replace all values of `name` with a single value.
void set_header(HeaderMap& headers, std::string_view name, std::string value);

/// Add a value without touching existing ones.
inline void append_header(HeaderMap& headers, std::string name, std::string value) {
    headers.emplace(std::move(name), std::move(value));
}

/// Remove every value of `name`. Returns how many were removed.
std::size_t remove_header(HeaderMap& headers, std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Head,
    Post,
    Put,
    Patch,
    Delete,
    Options
};

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

[[nodiscard]] std::optional<HttpMethod> parse_http_method(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Url
// ─────────────────────────────────────────────────────────────────────────────
// A validated http(s) request target. Produced only by parse_url(), which
// delegates to ada-url (WHATWG URL Standard).

struct Url {
    std::string href;     // normalized full URL
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // always starts with '/'
    std::string query;    // includes the leading '?', or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string path_with_query() const {
        return path + query;
    }

    bool operator==(const Url&) const = default;
};

/// Returns nullopt for malformed URLs and for schemes other than http/https.
[[nodiscard]] std::optional<Url> parse_url(std::string_view url);

}  // namespace relay
