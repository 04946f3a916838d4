#include <catch2/catch_test_macros.hpp>

#include "agentpp/resilience/backoff_policy.hpp"
#include "agentpp/resilience/breaker_json.hpp"
#include "agentpp/resilience/circuit_breaker_config.hpp"

#include <chrono>
#include <memory>

using namespace agentpp;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// CircuitBreakerConfig
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreakerConfig defaults", "[config]") {
    CircuitBreakerConfig config;

    REQUIRE(config.failure_threshold == 5);
    REQUIRE(config.success_threshold == 2);
    REQUIRE(config.timeout == 30s);
    REQUIRE(config.max_concurrent_requests == 1);
    REQUIRE_FALSE(config.on_state_change);
    REQUIRE(config.validate().has_value());
}

TEST_CASE("CircuitBreakerConfig builder chains", "[config]") {
    bool called = false;
    auto config = CircuitBreakerConfig{}
        .with_failure_threshold(3)
        .with_success_threshold(4)
        .with_timeout(250ms)
        .with_max_concurrent_requests(8)
        .with_state_change_callback([&called](const std::string&, CircuitState, CircuitState) {
            called = true;
        });

    REQUIRE(config.failure_threshold == 3);
    REQUIRE(config.success_threshold == 4);
    REQUIRE(config.timeout == 250ms);
    REQUIRE(config.max_concurrent_requests == 8);

    config.on_state_change("db", CircuitState::Closed, CircuitState::Open);
    REQUIRE(called);
}

TEST_CASE("CircuitBreakerConfig validation", "[config]") {
    SECTION("zero failure threshold") {
        auto result = CircuitBreakerConfig{}.with_failure_threshold(0).validate();
        REQUIRE(result.error().code == BreakerErrorCode::InvalidConfig);
        REQUIRE(result.error().message == "invalid config: failure threshold must be greater than 0");
    }

    SECTION("zero success threshold") {
        auto result = CircuitBreakerConfig{}.with_success_threshold(0).validate();
        REQUIRE(result.error().message == "invalid config: success threshold must be greater than 0");
    }

    SECTION("non-positive timeout") {
        REQUIRE_FALSE(CircuitBreakerConfig{}.with_timeout(0ms).validate().has_value());
        REQUIRE_FALSE(CircuitBreakerConfig{}.with_timeout(-5ms).validate().has_value());
    }

    SECTION("zero max concurrent requests becomes one") {
        auto config = CircuitBreakerConfig{}.with_max_concurrent_requests(0);
        REQUIRE(config.validate().has_value());
        REQUIRE(config.max_concurrent_requests == 1);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RetryConfig
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryConfig defaults and builders", "[config][retry]") {
    RetryConfig defaults;
    REQUIRE(defaults.max_attempts == 3);
    REQUIRE(defaults.initial_delay == 100ms);
    REQUIRE(defaults.max_delay == 5s);
    REQUIRE(defaults.backoff_factor == 2.0);
    REQUIRE(defaults.retryable_errors.empty());
    REQUIRE(defaults.backoff_policy == nullptr);
    REQUIRE(defaults.validate().has_value());

    auto policy = std::make_shared<ConstantBackoff>(10ms);
    auto config = RetryConfig{}
        .with_max_attempts(7)
        .with_initial_delay(50ms)
        .with_max_delay(2s)
        .with_backoff_factor(1.5)
        .with_retryable_error(BreakerError::timeout(""))
        .with_backoff_policy(policy);

    REQUIRE(config.max_attempts == 7);
    REQUIRE(config.initial_delay == 50ms);
    REQUIRE(config.max_delay == 2s);
    REQUIRE(config.backoff_factor == 1.5);
    REQUIRE(config.retryable_errors.size() == 1);
    REQUIRE(config.backoff_policy == policy);
}

TEST_CASE("RetryConfig validation", "[config][retry]") {
    REQUIRE_FALSE(RetryConfig{}.with_max_attempts(0).validate().has_value());
    REQUIRE_FALSE(RetryConfig{}.with_initial_delay(-1ms).validate().has_value());
    REQUIRE_FALSE(RetryConfig{}.with_max_delay(-1ms).validate().has_value());
    REQUIRE_FALSE(RetryConfig{}.with_backoff_factor(0.0).validate().has_value());
    REQUIRE(RetryConfig{}.with_initial_delay(0ms).validate().has_value());
}

TEST_CASE("BreakerError pattern matching", "[config][retry]") {
    const auto server_error = BreakerError::failure("upstream", 503);

    REQUIRE(server_error.matches(BreakerError::failure("")));
    REQUIRE(server_error.matches(BreakerError::failure("", 503)));
    REQUIRE_FALSE(server_error.matches(BreakerError::failure("", 400)));
    REQUIRE_FALSE(server_error.matches(BreakerError::timeout("")));
    REQUIRE(server_error.is(BreakerErrorCode::OperationFailed));
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON Configuration
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Circuit breaker config from JSON", "[config][json]") {
    SECTION("all keys") {
        auto j = Json::parse(R"({
            "failure_threshold": 3,
            "success_threshold": 1,
            "timeout_ms": 1500,
            "max_concurrent_requests": 4
        })");

        auto config = circuit_breaker_config_from_json(j);
        REQUIRE(config.has_value());
        REQUIRE(config->failure_threshold == 3);
        REQUIRE(config->success_threshold == 1);
        REQUIRE(config->timeout == 1500ms);
        REQUIRE(config->max_concurrent_requests == 4);
    }

    SECTION("missing keys keep defaults, unknown keys are ignored") {
        auto config = circuit_breaker_config_from_json(Json::parse(R"({"timeout_ms": 200, "name": "db"})"));
        REQUIRE(config.has_value());
        REQUIRE(config->failure_threshold == 5);
        REQUIRE(config->timeout == 200ms);
    }

    SECTION("zero max_concurrent_requests is normalised") {
        auto config = circuit_breaker_config_from_json(Json::parse(R"({"max_concurrent_requests": 0})"));
        REQUIRE(config->max_concurrent_requests == 1);
    }

    SECTION("wrong type") {
        auto config = circuit_breaker_config_from_json(Json::parse(R"({"failure_threshold": "five"})"));
        REQUIRE(config.error().code == BreakerErrorCode::InvalidConfig);
        REQUIRE(config.error().message == "invalid config: failure_threshold must be an integer");
    }

    SECTION("negative threshold") {
        auto config = circuit_breaker_config_from_json(Json::parse(R"({"success_threshold": -1})"));
        REQUIRE(config.error().message == "invalid config: success_threshold must not be negative");
    }

    SECTION("out of range threshold") {
        auto config = circuit_breaker_config_from_json(Json::parse(R"({"failure_threshold": 10000000000})"));
        REQUIRE(config.error().message == "invalid config: failure_threshold is out of range");
    }

    SECTION("values that fail validation") {
        REQUIRE_FALSE(circuit_breaker_config_from_json(Json::parse(R"({"timeout_ms": 0})")).has_value());
        REQUIRE_FALSE(circuit_breaker_config_from_json(Json::parse(R"({"failure_threshold": 0})")).has_value());
    }

    SECTION("not an object") {
        auto config = circuit_breaker_config_from_json(Json::parse("[1, 2, 3]"));
        REQUIRE(config.error().code == BreakerErrorCode::InvalidConfig);
    }
}

TEST_CASE("Retry config from JSON", "[config][json][retry]") {
    SECTION("all keys") {
        auto config = retry_config_from_json(Json::parse(R"({
            "max_attempts": 6,
            "initial_delay_ms": 20,
            "max_delay_ms": 800,
            "backoff_factor": 1.5
        })"));
        REQUIRE(config.has_value());
        REQUIRE(config->max_attempts == 6);
        REQUIRE(config->initial_delay == 20ms);
        REQUIRE(config->max_delay == 800ms);
        REQUIRE(config->backoff_factor == 1.5);
    }

    SECTION("integer backoff factor") {
        auto config = retry_config_from_json(Json::parse(R"({"backoff_factor": 3})"));
        REQUIRE(config->backoff_factor == 3.0);
    }

    SECTION("empty object keeps defaults") {
        auto config = retry_config_from_json(Json::object());
        REQUIRE(config->max_attempts == 3);
        REQUIRE(config->initial_delay == 100ms);
    }

    SECTION("invalid values") {
        REQUIRE_FALSE(retry_config_from_json(Json::parse(R"({"max_attempts": 0})")).has_value());
        REQUIRE_FALSE(retry_config_from_json(Json::parse(R"({"initial_delay_ms": -10})")).has_value());
        REQUIRE_FALSE(retry_config_from_json(Json::parse(R"({"backoff_factor": "fast"})")).has_value());
        REQUIRE_FALSE(retry_config_from_json(Json::parse(R"({"max_delay_ms": 1.5})")).has_value());
        REQUIRE_FALSE(retry_config_from_json(Json::parse("null")).has_value());
    }
}
