#include <catch2/catch_test_macros.hpp>

#include "relay/error.hpp"

using namespace relay;

TEST_CASE("Transport errors keep their code", "[error]") {
    const auto error = Error::from_transport_error(TransportError::timeout("read timed out"));

    REQUIRE(error.is_transport());
    REQUIRE(error.transport_code == TransportError::Code::Timeout);
    REQUIRE(error.message == "read timed out");
    REQUIRE(error.is_terminal() == false);
}

TEST_CASE("Middleware errors may wrap a transport condition", "[error]") {
    const auto wrapped = Error::middleware_wrapping(
        TransportError::connection_failed("refused"), "auth refresh");

    REQUIRE(wrapped.is_middleware());
    REQUIRE(wrapped.transport_code == TransportError::Code::ConnectionFailed);
    REQUIRE(wrapped.message == "auth refresh: refused");

    const auto with_status = Error::middleware_with_status(503, "upstream unavailable");
    REQUIRE(with_status.http_status == 503);
    REQUIRE(with_status.transport_code.has_value() == false);
}

TEST_CASE("Terminal kinds", "[error]") {
    REQUIRE(Error::contract_violation("twice").is_terminal());
    REQUIRE(Error::replay_unsupported().is_terminal());
    REQUIRE(Error::cancelled().is_terminal());
    REQUIRE(Error::middleware("nope").is_terminal() == false);
}

TEST_CASE("describe mentions kind, status and transport code", "[error]") {
    const auto error = Error::from_transport_error(TransportError::ssl_error("bad certificate"));

    const auto text = error.describe();
    REQUIRE(text.find("Transport") != std::string::npos);
    REQUIRE(text.find("bad certificate") != std::string::npos);
    REQUIRE(text.find("SslError") != std::string::npos);
    REQUIRE(text.find("retries") == std::string::npos);

    const auto status_text = Error::middleware_with_status(429, "slow down").describe();
    REQUIRE(status_text.find("HTTP 429") != std::string::npos);
}

TEST_CASE("describe reports the retry count when annotated", "[error]") {
    auto error = Error::middleware("still failing");
    error.retries = 3;

    REQUIRE(error.describe().find("request failed after 3 retries") != std::string::npos);
    REQUIRE(error.kind == Error::Kind::Middleware);
    REQUIRE(error.message == "still failing");
}

TEST_CASE("Error kinds have stable names", "[error]") {
    REQUIRE(to_string(Error::Kind::ContractViolation) == "ContractViolation");
    REQUIRE(to_string(Error::Kind::ReplayUnsupported) == "ReplayUnsupported");
    REQUIRE(to_string(TransportError::Code::Io) == "Io");
}
