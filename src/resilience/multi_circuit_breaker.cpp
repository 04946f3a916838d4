#include "agentpp/resilience/multi_circuit_breaker.hpp"

#include "agentpp/log/logger.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace agentpp {

MultiCircuitBreaker::MultiCircuitBreaker(CircuitBreakerConfig default_config)
    : default_config_(std::move(default_config))
{
    auto valid = default_config_.validate();
    if (!valid) {
        throw std::invalid_argument("MultiCircuitBreaker: " + valid.error().message);
    }
}

std::shared_ptr<CircuitBreaker> MultiCircuitBreaker::get_or_create(const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Another thread may have created it between the two locks
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(name, default_config_);
    breakers_.emplace(name, breaker);
    AGENTPP_LOG_DEBUG("[registry] created circuit breaker '{}'", name);
    return breaker;
}

std::shared_ptr<CircuitBreaker> MultiCircuitBreaker::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it == breakers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::map<std::string, std::shared_ptr<CircuitBreaker>> MultiCircuitBreaker::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {breakers_.begin(), breakers_.end()};
}

void MultiCircuitBreaker::reset_all() {
    // Reset outside the registry lock; reset() takes each breaker's own lock
    for (const auto& [name, breaker] : get_all()) {
        breaker->reset();
    }
}

HealthStatus MultiCircuitBreaker::health_status() const {
    HealthStatus status;

    for (const auto& [name, breaker] : get_all()) {
        switch (breaker->state()) {
            case CircuitState::Closed:
                status.healthy.push_back(name);
                break;
            case CircuitState::HalfOpen:
                status.degraded.push_back(name);
                break;
            case CircuitState::Open:
                status.unhealthy.push_back(name);
                break;
        }
    }

    return status;
}

std::size_t MultiCircuitBreaker::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return breakers_.size();
}

}  // namespace agentpp
