#include "agentpp/resilience/metrics.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace agentpp {

namespace {

// `sorted` must be non-empty and ascending.
std::chrono::nanoseconds percentile(
    const std::vector<std::chrono::nanoseconds>& sorted,
    double fraction
) {
    const auto last = sorted.size() - 1;
    auto index = static_cast<std::size_t>(static_cast<double>(last) * fraction);
    index = std::min(index, last);
    return sorted[index];
}

}  // namespace

MetricsCollector::MetricsCollector(std::string name, std::size_t latency_window)
    : name_(std::move(name))
    , window_(latency_window)
{
    if (window_ == 0) {
        throw std::invalid_argument("MetricsCollector: latency window must be greater than 0");
    }
    latencies_.reserve(window_);
}

void MetricsCollector::record_request(bool success, std::chrono::nanoseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);

    ++requests_total_;
    if (success) {
        ++requests_successful_;
    } else {
        ++requests_failed_;
    }

    const bool window_full = (latencies_.size() >= window_);
    if (window_full) {
        latencies_[next_slot_] = latency;
    } else {
        latencies_.push_back(latency);
    }
    next_slot_ = (next_slot_ + 1) % window_;
}

void MetricsCollector::record_rejection() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++requests_rejected_;
}

void MetricsCollector::record_state_change(CircuitState new_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_transitions_[std::string(to_string(new_state))];
}

MetricsSnapshot MetricsCollector::snapshot() const {
    std::vector<std::chrono::nanoseconds> sorted;
    MetricsSnapshot snap;
    snap.name = name_;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap.requests_total = requests_total_;
        snap.requests_successful = requests_successful_;
        snap.requests_failed = requests_failed_;
        snap.requests_rejected = requests_rejected_;
        snap.state_transitions = state_transitions_;
        sorted = latencies_;
    }

    if (sorted.empty()) {
        return snap;
    }

    std::sort(sorted.begin(), sorted.end());

    const auto total = std::accumulate(sorted.begin(), sorted.end(), std::chrono::nanoseconds{0});
    const auto count = static_cast<std::int64_t>(sorted.size());

    snap.latency_samples = sorted.size();
    snap.avg_latency = total / count;
    snap.min_latency = sorted.front();
    snap.max_latency = sorted.back();
    snap.p50_latency = percentile(sorted, 0.50);
    snap.p95_latency = percentile(sorted, 0.95);
    snap.p99_latency = percentile(sorted, 0.99);
    return snap;
}

void MetricsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_total_ = 0;
    requests_successful_ = 0;
    requests_failed_ = 0;
    requests_rejected_ = 0;
    state_transitions_.clear();
    latencies_.clear();
    next_slot_ = 0;
}

}  // namespace agentpp
