#include "agentpp/resilience/adaptive.hpp"

#include "agentpp/log/logger.hpp"

#include <stdexcept>

namespace agentpp {

AdaptiveCircuitBreaker::AdaptiveCircuitBreaker(
    std::string name,
    CircuitBreakerConfig config,
    std::chrono::milliseconds interval
)
    : breaker_(std::make_shared<CircuitBreaker>(std::move(name), std::move(config)))
    , interval_(interval)
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("AdaptiveCircuitBreaker: interval must be greater than 0");
    }
    ticker_ = std::thread([this]() { run_ticker(); });
}

AdaptiveCircuitBreaker::~AdaptiveCircuitBreaker() {
    stop();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

double AdaptiveCircuitBreaker::error_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_rate_;
}

void AdaptiveCircuitBreaker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
}

void AdaptiveCircuitBreaker::run_ticker() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const bool stopped = stop_cv_.wait_for(lock, interval_, [this] { return stopping_; });
        if (stopped) {
            return;
        }

        lock.unlock();
        const auto stats = breaker_->stats();
        lock.lock();

        if (stopping_) {
            return;
        }
        if (stats.total_requests == 0) {
            continue;
        }

        error_rate_ = static_cast<double>(stats.total_failures) / static_cast<double>(stats.total_requests);
        AGENTPP_LOG_TRACE("[adaptive] {}: error rate {:.3f} over {} requests",
                          breaker_->name(), error_rate_, stats.total_requests);
    }
}

}  // namespace agentpp
