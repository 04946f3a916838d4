#ifndef AGENTPP_RESILIENCE_RETRY_HPP
#define AGENTPP_RESILIENCE_RETRY_HPP

#include "agentpp/resilience/backoff_policy.hpp"
#include "agentpp/resilience/circuit_breaker.hpp"
#include "agentpp/resilience/circuit_breaker_config.hpp"

#include <memory>
#include <string>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// CircuitBreakerWithRetry
// ─────────────────────────────────────────────────────────────────────────────
// Retries failed executions with a growing delay. Every attempt goes through
// the breaker, so the breaker still counts each failure.
//
// Not retried:
// - CircuitOpen: fast-fail wins over the retry policy
// - errors outside RetryConfig::retryable_errors (when that list is set)
// If the context ends while waiting between attempts, Cancelled is returned
// immediately.
//
// Usage:
//   CircuitBreakerWithRetry connect("mcp_connect", CircuitBreakerConfig{},
//                                   RetryConfig{}.with_max_attempts(5));
//   auto result = connect.execute(ctx, [session] { return session->connect(); });

class CircuitBreakerWithRetry {
public:
    /// Creates and owns a breaker. Throws std::invalid_argument on a bad config.
    CircuitBreakerWithRetry(std::string name, CircuitBreakerConfig breaker_config, RetryConfig retry_config);

    /// Wraps an existing breaker. Throws std::invalid_argument on a bad
    /// retry config or a null breaker.
    CircuitBreakerWithRetry(std::shared_ptr<CircuitBreaker> breaker, RetryConfig retry_config);

    template <typename Fn>
    BreakerResult<void> execute(const Context& ctx, Fn&& fn) {
        if constexpr (std::is_invocable_v<Fn&, const Context&>) {
            return execute_operation(ctx, CircuitBreaker::Operation(std::forward<Fn>(fn)));
        } else {
            return execute_operation(ctx, CircuitBreaker::Operation(
                [f = std::forward<Fn>(fn)](const Context&) mutable { return f(); }
            ));
        }
    }

    BreakerResult<void> execute_operation(const Context& ctx, const CircuitBreaker::Operation& operation);

    [[nodiscard]] const std::shared_ptr<CircuitBreaker>& circuit_breaker() const noexcept { return breaker_; }
    [[nodiscard]] const RetryConfig& retry_config() const noexcept { return retry_config_; }

private:
    [[nodiscard]] bool should_retry(const BreakerError& error) const;

    std::shared_ptr<CircuitBreaker> breaker_;
    RetryConfig retry_config_;
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_RETRY_HPP
