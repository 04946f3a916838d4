#include <catch2/catch_test_macros.hpp>

#include "agentpp/resilience/breaker_json.hpp"
#include "mocks/recording_observer.hpp"

#include <chrono>
#include <string>

using namespace agentpp;
using namespace agentpp::testing;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitState serializes to its name", "[json]") {
    REQUIRE(to_json(CircuitState::Closed) == "closed");
    REQUIRE(to_json(CircuitState::Open) == "open");
    REQUIRE(to_json(CircuitState::HalfOpen) == "half-open");
}

TEST_CASE("BreakerError serializes optional fields only when set", "[json]") {
    auto open = to_json(BreakerError::circuit_open());
    REQUIRE(open["code"] == "CircuitOpen");
    REQUIRE(open["message"] == "circuit breaker is open");
    REQUIRE_FALSE(open.contains("app_code"));
    REQUIRE_FALSE(open.contains("cause"));

    auto failed = to_json(BreakerError::failure("tool crashed", 502));
    REQUIRE(failed["code"] == "OperationFailed");
    REQUIRE(failed["app_code"] == 502);

    auto timed_out = to_json(BreakerError::timeout("context deadline exceeded"));
    REQUIRE(timed_out["cause"] == "context deadline exceeded");
}

TEST_CASE("Breaker stats serialize with timestamps", "[json]") {
    CircuitBreaker breaker("mcp_call_tool", CircuitBreakerConfig{}.with_failure_threshold(1).with_timeout(1h));

    SECTION("before any failure") {
        auto j = to_json(breaker.stats());
        REQUIRE(j["state"] == "closed");
        REQUIRE(j["total_requests"] == 0);
        REQUIRE(j["last_error"].is_null());
        REQUIRE(j["last_error_time"].is_null());

        const auto stamp = j["state_changed_at"].get<std::string>();
        REQUIRE(stamp.size() == 24);  // 2026-01-01T00:00:00.000Z
        REQUIRE(stamp.back() == 'Z');
    }

    SECTION("after a failure") {
        (void)breaker.execute(Context::background(), [] { return fail(503); });

        auto j = to_json(breaker.stats());
        REQUIRE(j["state"] == "open");
        REQUIRE(j["total_requests"] == 1);
        REQUIRE(j["total_failures"] == 1);
        REQUIRE(j["consecutive_failures"] == 1);
        REQUIRE(j["last_error"]["app_code"] == 503);
        REQUIRE(j["last_error_time"].is_string());
    }
}

TEST_CASE("Metrics snapshot serializes latencies in microseconds", "[json][metrics]") {
    MetricsCollector collector("db");
    collector.record_request(true, 2ms);
    collector.record_request(false, 4ms);
    collector.record_rejection();
    collector.record_state_change(CircuitState::Open);

    auto j = to_json(collector.snapshot());

    REQUIRE(j["name"] == "db");
    REQUIRE(j["requests_total"] == 2);
    REQUIRE(j["requests_successful"] == 1);
    REQUIRE(j["requests_failed"] == 1);
    REQUIRE(j["requests_rejected"] == 1);
    REQUIRE(j["state_transitions"]["open"] == 1);
    REQUIRE(j["latency_samples"] == 2);
    REQUIRE(j["latency_us"]["min"].get<double>() == 2000.0);
    REQUIRE(j["latency_us"]["max"].get<double>() == 4000.0);
    REQUIRE(j["latency_us"]["avg"].get<double>() == 3000.0);
}

TEST_CASE("HealthStatus serializes its buckets", "[json][health]") {
    HealthStatus status{{"a"}, {}, {"b", "c"}};

    auto j = to_json(status);

    REQUIRE(j["healthy"] == Json::array({"a"}));
    REQUIRE(j["degraded"].empty());
    REQUIRE(j["unhealthy"] == Json::array({"b", "c"}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Health Report
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Health report", "[json][health]") {
    MultiCircuitBreaker breakers(CircuitBreakerConfig{}.with_failure_threshold(1).with_timeout(1h));
    const auto ctx = Context::background();

    SECTION("empty registry is healthy") {
        auto report = health_report(breakers);
        REQUIRE(report["status"] == "healthy");
        REQUIRE(report["circuit_breakers"]["states"].empty());
        REQUIRE(report["circuit_breakers"]["stats"].empty());
    }

    SECTION("all closed is healthy") {
        (void)breakers.execute(ctx, "mcp_connect", [] { return succeed(); });

        auto report = health_report(breakers);
        REQUIRE(report["status"] == "healthy");
        REQUIRE(report["circuit_breakers"]["states"]["mcp_connect"] == "closed");
        REQUIRE(report["circuit_breakers"]["stats"]["mcp_connect"]["total_successes"] == 1);
    }

    SECTION("one open breaker degrades the report") {
        (void)breakers.execute(ctx, "mcp_connect", [] { return succeed(); });
        (void)breakers.execute(ctx, "mcp_call_tool", [] { return fail(); });

        auto report = health_report(breakers);
        REQUIRE(report["status"] == "degraded");
        REQUIRE(report["circuit_breakers"]["states"]["mcp_call_tool"] == "open");
        REQUIRE(report["circuit_breakers"]["states"]["mcp_connect"] == "closed");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Error Responses
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Open circuit maps to 503 with Retry-After", "[json][response]") {
    auto response = breaker_error_response(BreakerError::circuit_open(), "call_tool", 30s);

    REQUIRE(response.has_value());
    REQUIRE(response->http_status == 503);
    REQUIRE(response->retry_after_seconds == 30);
    REQUIRE(response->body["error"] == "Service temporarily unavailable");
    REQUIRE(response->body["code"] == "circuit_breaker_open");
    REQUIRE(response->body["message"] ==
            "The call_tool operation is currently unavailable due to repeated failures. "
            "Please try again in 30 seconds.");
    REQUIRE(response->body["details"]["operation"] == "call_tool");
    REQUIRE(response->body["details"]["circuit_state"] == "open");
    REQUIRE(response->body["details"]["retry_after_seconds"] == 30);
}

TEST_CASE("Retry-After is at least one second", "[json][response]") {
    auto response = breaker_error_response(BreakerError::circuit_open(), "connect", 200ms);

    REQUIRE(response->retry_after_seconds == 1);
}

TEST_CASE("Half-open rejection maps to 429", "[json][response]") {
    auto response = breaker_error_response(BreakerError::too_many_requests(), "list_tools");

    REQUIRE(response.has_value());
    REQUIRE(response->http_status == 429);
    REQUIRE(response->retry_after_seconds == 5);
    REQUIRE(response->body["code"] == "circuit_breaker_half_open");
    REQUIRE(response->body["details"]["circuit_state"] == "half-open");
}

TEST_CASE("Other errors have no breaker response", "[json][response]") {
    REQUIRE_FALSE(breaker_error_response(BreakerError::failure("boom"), "call_tool").has_value());
    REQUIRE_FALSE(breaker_error_response(BreakerError::timeout("context canceled"), "call_tool").has_value());
    REQUIRE_FALSE(breaker_error_response(BreakerError::panic("oops"), "call_tool").has_value());
}

TEST_CASE("Degraded service response", "[json][response]") {
    auto body = degraded_service_response("list_tools");

    REQUIRE(body["status"] == "degraded");
    REQUIRE(body["operation"] == "list_tools");
    REQUIRE(body["message"] ==
            "The list_tools operation is currently degraded. Using cached or fallback data.");
    REQUIRE(body["timestamp"].is_string());
}
