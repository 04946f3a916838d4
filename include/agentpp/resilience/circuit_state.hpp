#pragma once

#include <cstdint>
#include <string_view>

namespace agentpp {

enum class CircuitState : std::uint8_t {
    Closed,    ///< Normal operation, requests pass through
    Open,      ///< Tripped, requests rejected without running
    HalfOpen   ///< Probing whether the dependency recovered
};

/// Lowercase names, as reported by CircuitBreaker::state_name() and in JSON.
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half-open";
    }
    return "unknown";
}

}  // namespace agentpp
