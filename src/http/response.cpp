#include "relay/http/response.hpp"

#include <charconv>

namespace relay {

namespace {

std::optional<std::uint64_t> parse_unsigned(const std::optional<std::string>& text) {
    if (text.has_value() == false) {
        return std::nullopt;
    }
    std::string_view value(*text);
    while (value.empty() == false && value.front() == ' ') value.remove_prefix(1);
    while (value.empty() == false && value.back() == ' ') value.remove_suffix(1);
    if (value.empty()) {
        return std::nullopt;
    }

    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    const bool fully_parsed = (ec == std::errc{}) && (ptr == value.data() + value.size());
    if (fully_parsed == false) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

std::optional<std::uint64_t> Response::content_length() const {
    return parse_unsigned(header("Content-Length"));
}

// The HTTP-date form of Retry-After is not interpreted.
std::optional<std::uint64_t> Response::retry_after_seconds() const {
    return parse_unsigned(header("Retry-After"));
}

}  // namespace relay
