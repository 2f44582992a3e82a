#include "relay/error.hpp"

#include <format>

namespace relay {

std::string Error::describe() const {
    std::string text = std::format("{} error: {}", to_string(kind), message);
    if (http_status.has_value()) {
        text += std::format(" (HTTP {})", *http_status);
    }
    if (transport_code.has_value()) {
        text += std::format(" [{}]", to_string(*transport_code));
    }
    if (retries.has_value()) {
        text += std::format("; request failed after {} retries", *retries);
    }
    return text;
}

}  // namespace relay
