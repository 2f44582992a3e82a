#include "relay/transport/cpr_transport_config.hpp"

#include <cstdint>
#include <format>

namespace relay {

CprTransportConfig& CprTransportConfig::with_bearer_token(const std::string& token) {
    // Format: "Bearer <token>"
    const std::string header_value = "Bearer " + token;
    set_header(default_headers, "Authorization", header_value);
    return *this;
}

CprTransportConfig& CprTransportConfig::with_header(
    const std::string& name,
    const std::string& value
) {
    set_header(default_headers, name, value);
    return *this;
}

CprTransportConfig& CprTransportConfig::with_user_agent(std::string agent) {
    user_agent = std::move(agent);
    return *this;
}

CprTransportConfig& CprTransportConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

CprTransportConfig& CprTransportConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

CprTransportConfig& CprTransportConfig::with_verify_ssl(bool verify) {
    verify_ssl = verify;
    return *this;
}

CprTransportConfig& CprTransportConfig::with_worker_threads(std::size_t threads) {
    worker_threads = threads;
    return *this;
}

namespace {

Result<std::int64_t> read_integer(const nlohmann::json& config, const char* key, std::int64_t minimum) {
    const auto& value = config.at(key);
    if (value.is_number_integer() == false) {
        return tl::unexpected(Error::middleware(std::format("transport config: '{}' must be an integer", key)));
    }
    const auto number = value.get<std::int64_t>();
    if (number < minimum) {
        return tl::unexpected(Error::middleware(
            std::format("transport config: '{}' must be >= {}", key, minimum)
        ));
    }
    return number;
}

}  // namespace

Result<CprTransportConfig> CprTransportConfig::from_json(const nlohmann::json& config) {
    if (config.is_object() == false) {
        return tl::unexpected(Error::middleware("transport config: expected a JSON object"));
    }

    CprTransportConfig result;

    if (config.contains("headers")) {
        const auto& headers = config.at("headers");
        if (headers.is_object() == false) {
            return tl::unexpected(Error::middleware("transport config: 'headers' must be an object"));
        }
        for (const auto& [name, value] : headers.items()) {
            if (value.is_string() == false) {
                return tl::unexpected(Error::middleware(
                    std::format("transport config: header '{}' must be a string", name)
                ));
            }
            result.with_header(name, value.get<std::string>());
        }
    }

    if (config.contains("user_agent")) {
        const auto& value = config.at("user_agent");
        if (value.is_string() == false) {
            return tl::unexpected(Error::middleware("transport config: 'user_agent' must be a string"));
        }
        result.with_user_agent(value.get<std::string>());
    }

    if (config.contains("connect_timeout_ms")) {
        auto value = read_integer(config, "connect_timeout_ms", 0);
        if (!value) return tl::unexpected(value.error());
        result.with_connect_timeout(std::chrono::milliseconds{*value});
    }

    if (config.contains("read_timeout_ms")) {
        auto value = read_integer(config, "read_timeout_ms", 0);
        if (!value) return tl::unexpected(value.error());
        result.with_read_timeout(std::chrono::milliseconds{*value});
    }

    if (config.contains("verify_ssl")) {
        const auto& value = config.at("verify_ssl");
        if (value.is_boolean() == false) {
            return tl::unexpected(Error::middleware("transport config: 'verify_ssl' must be a boolean"));
        }
        result.with_verify_ssl(value.get<bool>());
    }

    if (config.contains("worker_threads")) {
        auto value = read_integer(config, "worker_threads", 1);
        if (!value) return tl::unexpected(value.error());
        result.with_worker_threads(static_cast<std::size_t>(*value));
    }

    return result;
}

}  // namespace relay
