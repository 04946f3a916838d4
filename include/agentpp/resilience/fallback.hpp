#ifndef AGENTPP_RESILIENCE_FALLBACK_HPP
#define AGENTPP_RESILIENCE_FALLBACK_HPP

#include "agentpp/resilience/circuit_breaker.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// CircuitBreakerWithFallback<T>
// ─────────────────────────────────────────────────────────────────────────────
// Runs a value-producing operation under a breaker and substitutes the
// fallback's result on any failure, CircuitOpen included. The breaker's own
// error never reaches the caller while a fallback is installed; without one
// the error is returned as is.
//
// Usage:
//   CircuitBreakerWithFallback<std::vector<Tool>> list_tools(
//       "mcp_list_tools", CircuitBreakerConfig{},
//       [tool_cache, id]() -> BreakerResult<std::vector<Tool>> { return tool_cache->get(id); });
//
//   auto tools = list_tools.execute(ctx, [client] { return client->list_tools(); });
//
// The operation may outlive execute() on a timeout; capture what it uses by
// value or through a shared_ptr.

template <typename T>
class CircuitBreakerWithFallback {
public:
    using FallbackFn = std::function<BreakerResult<T>()>;
    using ValueOperation = std::function<BreakerResult<T>(const Context&)>;

    /// Creates and owns a breaker. Throws std::invalid_argument on a bad config.
    CircuitBreakerWithFallback(std::string name, CircuitBreakerConfig config, FallbackFn fallback)
        : breaker_(std::make_shared<CircuitBreaker>(std::move(name), std::move(config)))
        , fallback_(std::move(fallback))
    {}

    CircuitBreakerWithFallback(std::shared_ptr<CircuitBreaker> breaker, FallbackFn fallback)
        : breaker_(std::move(breaker))
        , fallback_(std::move(fallback))
    {
        if (!breaker_) {
            throw std::invalid_argument("CircuitBreakerWithFallback: breaker cannot be null");
        }
    }

    /// `fn` returns BreakerResult<T> and takes no arguments or `const Context&`.
    template <typename Fn>
    BreakerResult<T> execute(const Context& ctx, Fn&& fn) {
        if constexpr (std::is_invocable_v<Fn&, const Context&>) {
            return execute_operation(ctx, ValueOperation(std::forward<Fn>(fn)));
        } else {
            return execute_operation(ctx, ValueOperation(
                [f = std::forward<Fn>(fn)](const Context&) mutable { return f(); }
            ));
        }
    }

    BreakerResult<T> execute_operation(const Context& ctx, ValueOperation operation) {
        // The worker may outlive this call (timeout), so the slot it writes
        // into is shared rather than a local.
        auto slot = std::make_shared<Slot>();

        auto outcome = breaker_->execute_operation(ctx,
            [slot, operation = std::move(operation)](const Context& inner) -> BreakerResult<void> {
                auto produced = operation(inner);
                if (!produced) {
                    return tl::unexpected(std::move(produced.error()));
                }
                std::lock_guard<std::mutex> lock(slot->mutex);
                slot->value.emplace(std::move(*produced));
                return {};
            });

        if (!outcome) {
            if (fallback_) {
                return fallback_();
            }
            return tl::unexpected(std::move(outcome.error()));
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        return std::move(*slot->value);
    }

    [[nodiscard]] const std::shared_ptr<CircuitBreaker>& circuit_breaker() const noexcept { return breaker_; }

private:
    struct Slot {
        std::mutex mutex;
        std::optional<T> value;
    };

    std::shared_ptr<CircuitBreaker> breaker_;
    FallbackFn fallback_;
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_FALLBACK_HPP
