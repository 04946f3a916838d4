#ifndef AGENTPP_RESILIENCE_METRICS_HPP
#define AGENTPP_RESILIENCE_METRICS_HPP

#include "agentpp/resilience/circuit_state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// Metrics Snapshot
// ─────────────────────────────────────────────────────────────────────────────
// Point-in-time copy handed to callers; holds no reference to the collector.

struct MetricsSnapshot {
    std::string name;
    std::uint64_t requests_total{0};       ///< Executions that ran (not rejections)
    std::uint64_t requests_successful{0};
    std::uint64_t requests_failed{0};
    std::uint64_t requests_rejected{0};
    std::map<std::string, std::uint64_t> state_transitions;  ///< Target state name -> count

    // Computed from the latency window at snapshot time; zero when empty.
    std::size_t latency_samples{0};
    std::chrono::nanoseconds avg_latency{0};
    std::chrono::nanoseconds min_latency{0};
    std::chrono::nanoseconds max_latency{0};
    std::chrono::nanoseconds p50_latency{0};
    std::chrono::nanoseconds p95_latency{0};
    std::chrono::nanoseconds p99_latency{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Metrics Collector
// ─────────────────────────────────────────────────────────────────────────────
// Counters plus a ring buffer of the most recent execution latencies.
// Percentiles sort a copy of the window on every snapshot(), so the window
// must stay small; 100 samples is the default.

class MetricsCollector {
public:
    static constexpr std::size_t DEFAULT_LATENCY_WINDOW = 100;

    /// Throws std::invalid_argument if latency_window is 0.
    explicit MetricsCollector(std::string name, std::size_t latency_window = DEFAULT_LATENCY_WINDOW);

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void record_request(bool success, std::chrono::nanoseconds latency);
    void record_rejection();
    void record_state_change(CircuitState new_state);

    [[nodiscard]] MetricsSnapshot snapshot() const;

    /// Zero every counter and empty the latency window.
    void reset();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t latency_window() const noexcept { return window_; }

private:
    const std::string name_;
    const std::size_t window_;

    mutable std::mutex mutex_;
    std::uint64_t requests_total_{0};
    std::uint64_t requests_successful_{0};
    std::uint64_t requests_failed_{0};
    std::uint64_t requests_rejected_{0};
    std::map<std::string, std::uint64_t> state_transitions_;

    std::vector<std::chrono::nanoseconds> latencies_;
    std::size_t next_slot_{0};  // overwritten next once the window is full
};

}  // namespace agentpp

#endif  // AGENTPP_RESILIENCE_METRICS_HPP
