#include "agentpp/resilience/retry.hpp"

#include "agentpp/log/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace agentpp {

namespace {

RetryConfig checked(RetryConfig config) {
    auto valid = config.validate();
    if (!valid) {
        throw std::invalid_argument(valid.error().message);
    }
    if (!config.backoff_policy) {
        config.backoff_policy = std::make_shared<ExponentialBackoff>(
            config.initial_delay,
            config.backoff_factor,
            config.max_delay,
            0.0
        );
    }
    return config;
}

}  // namespace

CircuitBreakerWithRetry::CircuitBreakerWithRetry(
    std::string name,
    CircuitBreakerConfig breaker_config,
    RetryConfig retry_config
)
    : breaker_(std::make_shared<CircuitBreaker>(std::move(name), std::move(breaker_config)))
    , retry_config_(checked(std::move(retry_config)))
{}

CircuitBreakerWithRetry::CircuitBreakerWithRetry(
    std::shared_ptr<CircuitBreaker> breaker,
    RetryConfig retry_config
)
    : breaker_(std::move(breaker))
    , retry_config_(checked(std::move(retry_config)))
{
    if (!breaker_) {
        throw std::invalid_argument("CircuitBreakerWithRetry: breaker cannot be null");
    }
}

BreakerResult<void> CircuitBreakerWithRetry::execute_operation(
    const Context& ctx,
    const CircuitBreaker::Operation& operation
) {
    const std::size_t max_attempts = retry_config_.max_attempts;
    BreakerResult<void> result;

    for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
        result = breaker_->execute_operation(ctx, operation);
        if (result.has_value()) {
            return result;
        }

        const BreakerError& error = result.error();
        if (error.is(BreakerErrorCode::CircuitOpen)) {
            return result;
        }
        if (should_retry(error) == false) {
            return result;
        }

        const bool last_attempt = (attempt + 1 == max_attempts);
        if (last_attempt) {
            return result;
        }

        const auto delay = retry_config_.backoff_policy->next_delay(attempt);
        AGENTPP_LOG_DEBUG("[retry] {}: attempt {}/{} failed ({}), retrying in {}ms",
                          breaker_->name(), attempt + 1, max_attempts, error.message, delay.count());

        if (ctx.sleep_for(delay) == false) {
            const auto reason = ctx.error().value_or(ContextError::Cancelled);
            return tl::unexpected(BreakerError::cancelled(std::string(to_string(reason))));
        }
    }

    return result;
}

bool CircuitBreakerWithRetry::should_retry(const BreakerError& error) const {
    const auto& allowed = retry_config_.retryable_errors;
    if (allowed.empty()) {
        return true;
    }
    return std::any_of(allowed.begin(), allowed.end(), [&error](const BreakerError& pattern) {
        return error.matches(pattern);
    });
}

}  // namespace agentpp
