#ifndef AGENTPP_RESILIENCE_CIRCUIT_BREAKER_GROUP_HPP
#define AGENTPP_RESILIENCE_CIRCUIT_BREAKER_GROUP_HPP

#include "agentpp/resilience/circuit_breaker.hpp"

#include <memory>
#include <vector>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// CircuitBreakerGroup
// ─────────────────────────────────────────────────────────────────────────────
// Fans one call per slot out to a fixed list of breakers in parallel and
// waits for all of them. results[i] belongs to breakers[i].

class CircuitBreakerGroup {
public:
    /// Throws std::invalid_argument if any breaker is null.
    explicit CircuitBreakerGroup(std::vector<std::shared_ptr<CircuitBreaker>> breakers);

    /// Throws std::invalid_argument if operations.size() != size().
    [[nodiscard]] std::vector<BreakerResult<void>> execute_all(
        const Context& ctx,
        const std::vector<CircuitBreaker::Operation>& operations
    );

    [[nodiscard]] std::size_t size() const noexcept { return breakers_.size(); }

    [[nodiscard]] const std::vector<std::shared_ptr<CircuitBreaker>>& breakers() const noexcept {
        return breakers_;
    }

private:
    std::vector<std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_CIRCUIT_BREAKER_GROUP_HPP
