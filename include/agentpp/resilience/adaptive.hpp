#ifndef AGENTPP_RESILIENCE_ADAPTIVE_HPP
#define AGENTPP_RESILIENCE_ADAPTIVE_HPP

#include "agentpp/resilience/circuit_breaker.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// AdaptiveCircuitBreaker
// ─────────────────────────────────────────────────────────────────────────────
// Wraps a breaker with a background ticker that recomputes the cumulative
// error rate (total_failures / total_requests) every `interval`.
//
// The rate is only observed: thresholds are NOT adjusted. Feeding it back into
// failure_threshold/success_threshold needs explicit tuning rules first.

class AdaptiveCircuitBreaker {
public:
    /// Creates and owns a breaker and starts the ticker.
    /// Throws std::invalid_argument on a bad config or a non-positive interval.
    AdaptiveCircuitBreaker(std::string name, CircuitBreakerConfig config, std::chrono::milliseconds interval);

    /// Stops and joins the ticker.
    ~AdaptiveCircuitBreaker();

    AdaptiveCircuitBreaker(const AdaptiveCircuitBreaker&) = delete;
    AdaptiveCircuitBreaker& operator=(const AdaptiveCircuitBreaker&) = delete;
    AdaptiveCircuitBreaker(AdaptiveCircuitBreaker&&) = delete;
    AdaptiveCircuitBreaker& operator=(AdaptiveCircuitBreaker&&) = delete;

    template <typename Fn>
    BreakerResult<void> execute(const Context& ctx, Fn&& fn) {
        return breaker_->execute(ctx, std::forward<Fn>(fn));
    }

    /// Error rate as of the last tick; 0.0 until a tick has seen a request.
    [[nodiscard]] double error_rate() const;

    /// Stop the ticker. Idempotent; execute() keeps working afterwards.
    void stop();

    [[nodiscard]] const std::shared_ptr<CircuitBreaker>& circuit_breaker() const noexcept { return breaker_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    void run_ticker();

    std::shared_ptr<CircuitBreaker> breaker_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stopping_{false};
    double error_rate_{0.0};

    std::thread ticker_;  // last member: starts after everything above exists
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_ADAPTIVE_HPP
