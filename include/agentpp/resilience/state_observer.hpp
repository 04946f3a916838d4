#pragma once

#include "agentpp/log/logger.hpp"
#include "agentpp/resilience/circuit_state.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// State Change Event
// ─────────────────────────────────────────────────────────────────────────────

struct StateChangeEvent {
    std::string name;  ///< Breaker name
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
};

// ─────────────────────────────────────────────────────────────────────────────
// IStateObserver
// ─────────────────────────────────────────────────────────────────────────────
// Subscribers (audit log, metrics exporter, ...) implement this and register
// with CircuitBreaker::add_observer(). Each notification runs on its own
// detached thread after the breaker has released its lock; an exception
// thrown here is logged and dropped.

class IStateObserver {
public:
    virtual ~IStateObserver() = default;

    virtual void on_state_change(const StateChangeEvent& event) = 0;
};

/// Adapts a plain callable to IStateObserver.
class CallbackStateObserver final : public IStateObserver {
public:
    using Callback = std::function<void(const StateChangeEvent&)>;

    explicit CallbackStateObserver(Callback callback)
        : callback_(std::move(callback))
    {}

    void on_state_change(const StateChangeEvent& event) override {
        if (callback_) {
            callback_(event);
        }
    }

private:
    Callback callback_;
};

/// Logs every transition through the global logger.
/// Transitions into Open log at Warn, the rest at `level`.
class LoggingStateObserver final : public IStateObserver {
public:
    explicit LoggingStateObserver(LogLevel level = LogLevel::Info)
        : level_(level)
    {}

    void on_state_change(const StateChangeEvent& event) override;

private:
    LogLevel level_;
};

}  // namespace agentpp
