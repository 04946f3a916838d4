#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Gates calls into a failure-prone dependency (database, MCP server, agent
// subprocess, external API).
//
// State Machine:
//
//   ┌─────────┐  failure_threshold   ┌────────┐
//   │ CLOSED  │ ─────────────────────▶│  OPEN  │◀──────────────┐
//   └────▲────┘   consecutive         └────┬───┘               │
//        │        failures                 │ timeout elapsed,  │ any
//        │                                 │ next admission    │ failure
//        │                                 ▼                   │
//        │  success_threshold        ┌──────────┐              │
//        └───────────────────────────│HALF_OPEN │──────────────┘
//           consecutive successes    └──────────┘
//                                     at most max_concurrent_requests
//                                     trials in flight
//
// Usage:
//   auto breaker = CircuitBreaker::create("mcp_call_tool", CircuitBreakerConfig{});
//   if (!breaker) { return tl::unexpected(breaker.error()); }
//
//   auto result = (*breaker)->execute(ctx, [client, request]() -> BreakerResult<void> {
//       return client->call_tool(request);
//   });
//
// execute() runs the operation on a worker thread and waits for it or for
// the context to end, whichever comes first. When the context wins, the
// caller gets Timeout and the worker is left to finish on its own; its
// result is discarded. Anything the operation captures must outlive that
// worker, so capture by value or through a shared_ptr; a `[&]` capture of
// the caller's locals dangles once Timeout is returned. Operations that can
// stop early should take the Context as their parameter and check it.

#include "agentpp/resilience/breaker_error.hpp"
#include "agentpp/resilience/circuit_breaker_config.hpp"
#include "agentpp/resilience/circuit_state.hpp"
#include "agentpp/resilience/context.hpp"
#include "agentpp/resilience/metrics.hpp"
#include "agentpp/resilience/state_observer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Statistics
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerStats {
    std::uint64_t total_requests{0};   ///< Every admission attempt, rejected or not
    std::uint64_t total_successes{0};
    std::uint64_t total_failures{0};
    std::uint32_t consecutive_successes{0};
    std::uint32_t consecutive_failures{0};
    std::uint32_t half_open_in_flight{0};
    std::optional<BreakerError> last_error;
    std::optional<std::chrono::system_clock::time_point> last_error_time;
    CircuitState state{CircuitState::Closed};
    std::chrono::system_clock::time_point state_changed_at;
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using Operation = std::function<BreakerResult<void>(const Context&)>;

    /// Validates `config`; returns InvalidConfig instead of a breaker on failure.
    [[nodiscard]] static BreakerResult<std::shared_ptr<CircuitBreaker>> create(
        std::string name,
        CircuitBreakerConfig config
    );

    /// Throws std::invalid_argument if `config` fails validation.
    /// Meant for startup wiring where a bad config is a programming error.
    CircuitBreaker(std::string name, CircuitBreakerConfig config);

    // Non-copyable, non-movable (owns a mutex, observers hold its name)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────────────

    /// Run `fn` under the breaker. `fn` returns BreakerResult<void> and takes
    /// either no arguments or `const Context&`.
    ///
    /// Errors: CircuitOpen / TooManyRequests (fn never ran), Timeout (ctx
    /// ended first), Panic (fn threw), or fn's own error unchanged.
    ///
    /// After a Timeout `fn` keeps running on its worker, so whatever it
    /// captures must stay valid until it returns.
    template <typename Fn>
    BreakerResult<void> execute(const Context& ctx, Fn&& fn) {
        if constexpr (std::is_invocable_v<Fn&, const Context&>) {
            return execute_operation(ctx, Operation(std::forward<Fn>(fn)));
        } else {
            static_assert(std::is_invocable_r_v<BreakerResult<void>, Fn&>,
                          "execute() needs a callable returning BreakerResult<void>");
            return execute_operation(ctx, Operation(
                [f = std::forward<Fn>(fn)](const Context&) mutable { return f(); }
            ));
        }
    }

    BreakerResult<void> execute_operation(const Context& ctx, Operation operation);

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;

    /// "closed", "open" or "half-open"
    [[nodiscard]] std::string_view state_name() const;

    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] MetricsSnapshot metrics() const { return metrics_.snapshot(); }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Manual Control
    // ─────────────────────────────────────────────────────────────────────────

    /// Back to Closed with zeroed consecutive counters. Cumulative totals and
    /// metrics are kept.
    void reset();

    /// Trip the circuit now (operator override). The Open timer starts now.
    void force_open();

    /// Close the circuit now (operator override). Same effect as reset().
    void force_close();

    /// Clear the metrics collector without touching breaker state.
    void reset_metrics() { metrics_.reset(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Observers
    // ─────────────────────────────────────────────────────────────────────────

    void add_observer(std::shared_ptr<IStateObserver> observer);

    /// Convenience for add_observer(CallbackStateObserver)
    void on_state_change(CallbackStateObserver::Callback callback);

private:
    using Clock = std::chrono::steady_clock;

    struct Transition {
        std::vector<StateChangeEvent> events;
        std::vector<std::shared_ptr<IStateObserver>> observers;
    };

    // Set when the request took a half-open trial slot; names the half-open
    // period the slot belongs to.
    using TrialSlot = std::optional<std::uint64_t>;

    BreakerResult<void> before_request(TrialSlot& slot, Transition& transition);
    void after_request(const BreakerResult<void>& outcome, std::chrono::nanoseconds latency,
                       const TrialSlot& slot, Transition& transition);

    // Caller must hold mutex_
    void on_success_locked(Transition& transition);
    void on_failure_locked(const BreakerError& error, Transition& transition);
    void set_state_locked(CircuitState new_state, Transition& transition);

    // Caller must NOT hold mutex_
    static void dispatch(Transition transition);

    const std::string name_;
    CircuitBreakerConfig config_;
    MetricsCollector metrics_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    Clock::time_point state_changed_at_{Clock::now()};
    std::chrono::system_clock::time_point state_changed_wall_{std::chrono::system_clock::now()};
    std::uint64_t total_requests_{0};
    std::uint64_t total_successes_{0};
    std::uint64_t total_failures_{0};
    std::uint32_t consecutive_successes_{0};
    std::uint32_t consecutive_failures_{0};
    std::uint32_t half_open_in_flight_{0};
    std::uint64_t half_open_period_{0};
    std::optional<BreakerError> last_error_;
    std::optional<std::chrono::system_clock::time_point> last_error_time_;
    std::vector<std::shared_ptr<IStateObserver>> observers_;
};

}  // namespace agentpp
