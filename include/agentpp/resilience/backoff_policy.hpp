#ifndef AGENTPP_RESILIENCE_BACKOFF_POLICY_HPP
#define AGENTPP_RESILIENCE_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy - Strategy Pattern Interface
// ─────────────────────────────────────────────────────────────────────────────
// Decides how long CircuitBreakerWithRetry waits between attempts. One policy
// instance may serve concurrent execute() calls, so implementations must be
// thread-safe.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: 0-indexed retry number (0 = first retry after initial failure)
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^attempt, max), then optional ±jitter.
//
// With base=100ms, multiplier=2.0, max=5s, no jitter:
//   attempt 0: 100ms, 1: 200ms, 2: 400ms, ... 6+: 5000ms

class ExponentialBackoff final : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{100},
              2.0,
              std::chrono::milliseconds{5'000},
              0.0
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 = deterministic, 0.25 = ±25%
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double exponent = static_cast<double>(attempt);
        const double base_ms = static_cast<double>(base_.count());
        const double delay_ms = base_ms * std::pow(multiplier_, exponent);

        const double max_ms = static_cast<double>(max_.count());
        const double capped_ms = std::min(delay_ms, max_ms);

        const double jittered_ms = add_jitter(capped_ms);

        const auto result_ms = static_cast<std::int64_t>(std::max(0.0, jittered_ms));
        return std::chrono::milliseconds{result_ms};
    }

private:
    double add_jitter(double base_value) {
        const bool has_jitter = (jitter_factor_ > 0.0);
        if (has_jitter == false) {
            return base_value;
        }

        std::uniform_real_distribution<double> dist(
            1.0 - jitter_factor_,
            1.0 + jitter_factor_
        );
        std::lock_guard<std::mutex> lock(rng_mutex_);
        return base_value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - Testing Helper
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff final : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff final : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_BACKOFF_POLICY_HPP
