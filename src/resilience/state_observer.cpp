#include "agentpp/resilience/state_observer.hpp"

namespace agentpp {

void LoggingStateObserver::on_state_change(const StateChangeEvent& event) {
    const LogLevel level = (event.to == CircuitState::Open) ? LogLevel::Warn : level_;
    AGENTPP_LOG_AT(level, "[circuit breaker] {}: state changed from {} to {}",
                   event.name, to_string(event.from), to_string(event.to));
}

}  // namespace agentpp
