#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// JSON mapping for breaker state, configuration and health reporting
// ─────────────────────────────────────────────────────────────────────────────
// Serialization is for observability endpoints and the operator CLI; config
// parsing accepts the keys below and ignores anything else.
//
//   circuit breaker: failure_threshold, success_threshold, timeout_ms,
//                    max_concurrent_requests
//   retry:           max_attempts, initial_delay_ms, max_delay_ms,
//                    backoff_factor
//
// Durations in config are milliseconds; latencies in metrics output are
// microseconds.

#include "agentpp/resilience/breaker_error.hpp"
#include "agentpp/resilience/circuit_breaker.hpp"
#include "agentpp/resilience/circuit_breaker_config.hpp"
#include "agentpp/resilience/circuit_state.hpp"
#include "agentpp/resilience/metrics.hpp"
#include "agentpp/resilience/multi_circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace agentpp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Json to_json(CircuitState state);
[[nodiscard]] Json to_json(const BreakerError& error);
[[nodiscard]] Json to_json(const CircuitBreakerStats& stats);
[[nodiscard]] Json to_json(const MetricsSnapshot& snapshot);
[[nodiscard]] Json to_json(const HealthStatus& status);

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Missing keys keep the CircuitBreakerConfig defaults. The result has
/// already been validated.
[[nodiscard]] BreakerResult<CircuitBreakerConfig> circuit_breaker_config_from_json(const Json& j);

[[nodiscard]] BreakerResult<RetryConfig> retry_config_from_json(const Json& j);

// ─────────────────────────────────────────────────────────────────────────────
// Health & Error Responses
// ─────────────────────────────────────────────────────────────────────────────

/// {"status": "healthy"|"degraded",
///  "circuit_breakers": {"states": {name: state}, "stats": {name: stats}}}
/// "degraded" as soon as one breaker is open.
[[nodiscard]] Json health_report(const MultiCircuitBreaker& breakers);

struct BreakerErrorResponse {
    int http_status;
    int retry_after_seconds;
    Json body;
};

/// HTTP mapping for breaker rejections:
///   CircuitOpen     -> 503, Retry-After = open_timeout in seconds (at least 1)
///   TooManyRequests -> 429, Retry-After = 5
/// Any other error returns nullopt; the caller reports it its own way.
[[nodiscard]] std::optional<BreakerErrorResponse> breaker_error_response(
    const BreakerError& error,
    const std::string& operation,
    std::chrono::milliseconds open_timeout = std::chrono::milliseconds{30'000}
);

/// Body served by a fallback path while `operation` is degraded.
[[nodiscard]] Json degraded_service_response(const std::string& operation);

}  // namespace agentpp
