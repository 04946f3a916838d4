#include "agentpp/resilience/circuit_breaker_config.hpp"

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// CircuitBreakerConfig
// ─────────────────────────────────────────────────────────────────────────────

BreakerResult<void> CircuitBreakerConfig::validate() {
    if (failure_threshold == 0) {
        return tl::unexpected(BreakerError::invalid_config("failure threshold must be greater than 0"));
    }
    if (success_threshold == 0) {
        return tl::unexpected(BreakerError::invalid_config("success threshold must be greater than 0"));
    }
    if (timeout.count() <= 0) {
        return tl::unexpected(BreakerError::invalid_config("timeout must be greater than 0"));
    }
    if (max_concurrent_requests == 0) {
        max_concurrent_requests = 1;
    }
    return {};
}

CircuitBreakerConfig& CircuitBreakerConfig::with_failure_threshold(std::uint32_t threshold) {
    failure_threshold = threshold;
    return *this;
}

CircuitBreakerConfig& CircuitBreakerConfig::with_success_threshold(std::uint32_t threshold) {
    success_threshold = threshold;
    return *this;
}

CircuitBreakerConfig& CircuitBreakerConfig::with_timeout(std::chrono::milliseconds open_timeout) {
    timeout = open_timeout;
    return *this;
}

CircuitBreakerConfig& CircuitBreakerConfig::with_max_concurrent_requests(std::uint32_t max_requests) {
    max_concurrent_requests = max_requests;
    return *this;
}

CircuitBreakerConfig& CircuitBreakerConfig::with_state_change_callback(StateChangeCallback callback) {
    on_state_change = std::move(callback);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryConfig
// ─────────────────────────────────────────────────────────────────────────────

BreakerResult<void> RetryConfig::validate() const {
    if (max_attempts == 0) {
        return tl::unexpected(BreakerError::invalid_config("max attempts must be greater than 0"));
    }
    if (initial_delay.count() < 0 || max_delay.count() < 0) {
        return tl::unexpected(BreakerError::invalid_config("retry delays must not be negative"));
    }
    if (backoff_factor <= 0.0) {
        return tl::unexpected(BreakerError::invalid_config("backoff factor must be greater than 0"));
    }
    return {};
}

RetryConfig& RetryConfig::with_max_attempts(std::size_t attempts) {
    max_attempts = attempts;
    return *this;
}

RetryConfig& RetryConfig::with_initial_delay(std::chrono::milliseconds delay) {
    initial_delay = delay;
    return *this;
}

RetryConfig& RetryConfig::with_max_delay(std::chrono::milliseconds delay) {
    max_delay = delay;
    return *this;
}

RetryConfig& RetryConfig::with_backoff_factor(double factor) {
    backoff_factor = factor;
    return *this;
}

RetryConfig& RetryConfig::with_retryable_error(BreakerError error) {
    retryable_errors.push_back(std::move(error));
    return *this;
}

RetryConfig& RetryConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

}  // namespace agentpp
