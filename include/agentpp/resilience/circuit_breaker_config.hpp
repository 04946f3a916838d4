#ifndef AGENTPP_RESILIENCE_CIRCUIT_BREAKER_CONFIG_HPP
#define AGENTPP_RESILIENCE_CIRCUIT_BREAKER_CONFIG_HPP

#include "agentpp/resilience/breaker_error.hpp"
#include "agentpp/resilience/circuit_state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace agentpp {

struct IBackoffPolicy;

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Copied into the breaker at construction and never changed afterwards.

struct CircuitBreakerConfig {
    /// Invoked off-lock on a detached thread for every transition.
    using StateChangeCallback =
        std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

    /// Consecutive failures in Closed before the circuit opens. Must be > 0.
    std::uint32_t failure_threshold{5};

    /// Consecutive successes in HalfOpen before the circuit closes. Must be > 0.
    std::uint32_t success_threshold{2};

    /// How long the circuit stays Open before admitting a trial. Must be > 0.
    std::chrono::milliseconds timeout{30'000};

    /// Trial requests allowed in flight while HalfOpen. 0 is treated as 1.
    std::uint32_t max_concurrent_requests{1};

    /// Optional single subscriber; CircuitBreaker::add_observer() adds more.
    StateChangeCallback on_state_change;

    /// Rejects non-positive thresholds/timeout and normalises
    /// max_concurrent_requests.
    [[nodiscard]] BreakerResult<void> validate();

    CircuitBreakerConfig& with_failure_threshold(std::uint32_t threshold);
    CircuitBreakerConfig& with_success_threshold(std::uint32_t threshold);
    CircuitBreakerConfig& with_timeout(std::chrono::milliseconds open_timeout);
    CircuitBreakerConfig& with_max_concurrent_requests(std::uint32_t max_requests);
    CircuitBreakerConfig& with_state_change_callback(StateChangeCallback callback);
};

// ─────────────────────────────────────────────────────────────────────────────
// Retry Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Used by CircuitBreakerWithRetry. The delay starts at initial_delay and is
// multiplied by backoff_factor after every retry, capped at max_delay.

struct RetryConfig {
    /// Total attempts including the first one. Must be > 0.
    std::size_t max_attempts{3};

    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{5'000};
    double backoff_factor{2.0};

    /// Errors worth retrying, matched with BreakerError::matches().
    /// Empty = retry every error except CircuitOpen.
    std::vector<BreakerError> retryable_errors;

    /// Overrides the delay schedule. If null, an ExponentialBackoff built
    /// from the fields above is used.
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    [[nodiscard]] BreakerResult<void> validate() const;

    RetryConfig& with_max_attempts(std::size_t attempts);
    RetryConfig& with_initial_delay(std::chrono::milliseconds delay);
    RetryConfig& with_max_delay(std::chrono::milliseconds delay);
    RetryConfig& with_backoff_factor(double factor);
    RetryConfig& with_retryable_error(BreakerError error);
    RetryConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_CIRCUIT_BREAKER_CONFIG_HPP
