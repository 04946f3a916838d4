#ifndef AGENTPP_RESILIENCE_MULTI_CIRCUIT_BREAKER_HPP
#define AGENTPP_RESILIENCE_MULTI_CIRCUIT_BREAKER_HPP

#include "agentpp/resilience/circuit_breaker.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// Health Status
// ─────────────────────────────────────────────────────────────────────────────

struct HealthStatus {
    std::vector<std::string> healthy;    ///< Closed
    std::vector<std::string> degraded;   ///< HalfOpen
    std::vector<std::string> unhealthy;  ///< Open
};

// ─────────────────────────────────────────────────────────────────────────────
// MultiCircuitBreaker
// ─────────────────────────────────────────────────────────────────────────────
// Caller-owned registry of named breakers sharing one default config. A
// breaker is created on first use; concurrent first calls for the same name
// get the same instance (shared lock on the lookup path, exclusive lock plus
// re-check on creation).
//
// Usage:
//   MultiCircuitBreaker breakers(CircuitBreakerConfig{}.with_timeout(30s));
//   breakers.execute(ctx, "mcp_call_tool", [client, req] { return client->call_tool(req); });
//   auto health = breakers.health_status();

class MultiCircuitBreaker {
public:
    /// Throws std::invalid_argument if `default_config` fails validation.
    explicit MultiCircuitBreaker(CircuitBreakerConfig default_config);

    MultiCircuitBreaker(const MultiCircuitBreaker&) = delete;
    MultiCircuitBreaker& operator=(const MultiCircuitBreaker&) = delete;

    /// Never returns null.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_or_create(const std::string& name);

    /// Lookup without creation.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(const std::string& name) const;

    template <typename Fn>
    BreakerResult<void> execute(const Context& ctx, const std::string& name, Fn&& fn) {
        return get_or_create(name)->execute(ctx, std::forward<Fn>(fn));
    }

    /// Copy of the registry, ordered by name.
    [[nodiscard]] std::map<std::string, std::shared_ptr<CircuitBreaker>> get_all() const;

    void reset_all();

    /// Breaker names bucketed by current state, each bucket sorted.
    [[nodiscard]] HealthStatus health_status() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const CircuitBreakerConfig& default_config() const noexcept { return default_config_; }

private:
    CircuitBreakerConfig default_config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_MULTI_CIRCUIT_BREAKER_HPP
