#include "agentpp/resilience/circuit_breaker_group.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace agentpp {

CircuitBreakerGroup::CircuitBreakerGroup(std::vector<std::shared_ptr<CircuitBreaker>> breakers)
    : breakers_(std::move(breakers))
{
    const bool has_null = std::any_of(breakers_.begin(), breakers_.end(),
                                      [](const auto& breaker) { return breaker == nullptr; });
    if (has_null) {
        throw std::invalid_argument("CircuitBreakerGroup: breakers cannot be null");
    }
}

std::vector<BreakerResult<void>> CircuitBreakerGroup::execute_all(
    const Context& ctx,
    const std::vector<CircuitBreaker::Operation>& operations
) {
    if (operations.size() != breakers_.size()) {
        throw std::invalid_argument(
            "CircuitBreakerGroup: got " + std::to_string(operations.size()) +
            " operations for " + std::to_string(breakers_.size()) + " circuit breakers"
        );
    }

    std::vector<BreakerResult<void>> results(operations.size());
    std::vector<std::jthread> workers;
    workers.reserve(operations.size());

    for (std::size_t i = 0; i < operations.size(); ++i) {
        workers.emplace_back([this, &ctx, &operations, &results, i]() {
            results[i] = breakers_[i]->execute_operation(ctx, operations[i]);
        });
    }

    // jthread joins on destruction
    workers.clear();
    return results;
}

}  // namespace agentpp
