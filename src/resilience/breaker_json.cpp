#include "agentpp/resilience/breaker_json.hpp"

#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace agentpp {

namespace {

[[nodiscard]] std::string format_utc(std::chrono::system_clock::time_point tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

[[nodiscard]] double to_micros(std::chrono::nanoseconds ns) {
    return std::chrono::duration<double, std::micro>(ns).count();
}

// Reads an optional non-negative integer field. Leaves `out` untouched when
// the key is absent.
template <typename T>
[[nodiscard]] BreakerResult<void> read_unsigned(const Json& j, const char* key, T& out) {
    const bool has_key = j.contains(key);
    if (has_key == false) {
        return {};
    }

    const auto& node = j.at(key);
    const bool is_integer = node.is_number_integer();
    if (is_integer == false) {
        return tl::unexpected(BreakerError::invalid_config(std::string(key) + " must be an integer"));
    }
    if (node.is_number_unsigned() == false && node.get<std::int64_t>() < 0) {
        return tl::unexpected(BreakerError::invalid_config(std::string(key) + " must not be negative"));
    }

    const auto value = node.get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return tl::unexpected(BreakerError::invalid_config(std::string(key) + " is out of range"));
    }
    out = static_cast<T>(value);
    return {};
}

[[nodiscard]] BreakerResult<void> read_millis(const Json& j, const char* key, std::chrono::milliseconds& out) {
    const bool has_key = j.contains(key);
    if (has_key == false) {
        return {};
    }

    const auto& node = j.at(key);
    if (node.is_number_integer() == false) {
        return tl::unexpected(BreakerError::invalid_config(std::string(key) + " must be an integer"));
    }
    out = std::chrono::milliseconds{node.get<std::int64_t>()};
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────────────────────────────────────

Json to_json(CircuitState state) {
    return std::string(to_string(state));
}

Json to_json(const BreakerError& error) {
    Json j = {
        {"code", std::string(to_string(error.code))},
        {"message", error.message}
    };
    if (error.app_code) {
        j["app_code"] = *error.app_code;
    }
    if (error.cause) {
        j["cause"] = *error.cause;
    }
    return j;
}

Json to_json(const CircuitBreakerStats& stats) {
    Json j = {
        {"state", to_json(stats.state)},
        {"total_requests", stats.total_requests},
        {"total_successes", stats.total_successes},
        {"total_failures", stats.total_failures},
        {"consecutive_successes", stats.consecutive_successes},
        {"consecutive_failures", stats.consecutive_failures},
        {"half_open_in_flight", stats.half_open_in_flight},
        {"state_changed_at", format_utc(stats.state_changed_at)}
    };

    if (stats.last_error) {
        j["last_error"] = to_json(*stats.last_error);
    } else {
        j["last_error"] = nullptr;
    }

    if (stats.last_error_time) {
        j["last_error_time"] = format_utc(*stats.last_error_time);
    } else {
        j["last_error_time"] = nullptr;
    }

    return j;
}

Json to_json(const MetricsSnapshot& snapshot) {
    return {
        {"name", snapshot.name},
        {"requests_total", snapshot.requests_total},
        {"requests_successful", snapshot.requests_successful},
        {"requests_failed", snapshot.requests_failed},
        {"requests_rejected", snapshot.requests_rejected},
        {"state_transitions", snapshot.state_transitions},
        {"latency_samples", snapshot.latency_samples},
        {"latency_us", {
            {"avg", to_micros(snapshot.avg_latency)},
            {"min", to_micros(snapshot.min_latency)},
            {"max", to_micros(snapshot.max_latency)},
            {"p50", to_micros(snapshot.p50_latency)},
            {"p95", to_micros(snapshot.p95_latency)},
            {"p99", to_micros(snapshot.p99_latency)}
        }}
    };
}

Json to_json(const HealthStatus& status) {
    return {
        {"healthy", status.healthy},
        {"degraded", status.degraded},
        {"unhealthy", status.unhealthy}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

BreakerResult<CircuitBreakerConfig> circuit_breaker_config_from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(BreakerError::invalid_config("circuit breaker config must be a JSON object"));
    }

    CircuitBreakerConfig config;

    auto status = read_unsigned(j, "failure_threshold", config.failure_threshold)
        .and_then([&] { return read_unsigned(j, "success_threshold", config.success_threshold); })
        .and_then([&] { return read_millis(j, "timeout_ms", config.timeout); })
        .and_then([&] { return read_unsigned(j, "max_concurrent_requests", config.max_concurrent_requests); })
        .and_then([&] { return config.validate(); });
    if (!status) {
        return tl::unexpected(status.error());
    }

    return config;
}

BreakerResult<RetryConfig> retry_config_from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(BreakerError::invalid_config("retry config must be a JSON object"));
    }

    RetryConfig config;

    auto status = read_unsigned(j, "max_attempts", config.max_attempts)
        .and_then([&] { return read_millis(j, "initial_delay_ms", config.initial_delay); })
        .and_then([&] { return read_millis(j, "max_delay_ms", config.max_delay); });
    if (!status) {
        return tl::unexpected(status.error());
    }

    if (j.contains("backoff_factor")) {
        const auto& node = j.at("backoff_factor");
        if (node.is_number() == false) {
            return tl::unexpected(BreakerError::invalid_config("backoff_factor must be a number"));
        }
        config.backoff_factor = node.get<double>();
    }

    auto valid = config.validate();
    if (!valid) {
        return tl::unexpected(valid.error());
    }

    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Health & Error Responses
// ─────────────────────────────────────────────────────────────────────────────

Json health_report(const MultiCircuitBreaker& breakers) {
    Json states = Json::object();
    Json stats = Json::object();
    bool any_open = false;

    for (const auto& [name, breaker] : breakers.get_all()) {
        const auto snapshot = breaker->stats();
        states[name] = to_json(snapshot.state);
        stats[name] = to_json(snapshot);
        if (snapshot.state == CircuitState::Open) {
            any_open = true;
        }
    }

    return {
        {"status", any_open ? "degraded" : "healthy"},
        {"circuit_breakers", {
            {"states", states},
            {"stats", stats}
        }}
    };
}

std::optional<BreakerErrorResponse> breaker_error_response(
    const BreakerError& error,
    const std::string& operation,
    std::chrono::milliseconds open_timeout
) {
    switch (error.code) {
        case BreakerErrorCode::CircuitOpen: {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(open_timeout).count();
            const int retry_after = seconds < 1 ? 1 : static_cast<int>(seconds);
            return BreakerErrorResponse{
                503,
                retry_after,
                Json{
                    {"error", "Service temporarily unavailable"},
                    {"code", "circuit_breaker_open"},
                    {"message", "The " + operation + " operation is currently unavailable due to "
                                "repeated failures. Please try again in " +
                                std::to_string(retry_after) + " seconds."},
                    {"details", {
                        {"operation", operation},
                        {"circuit_state", to_json(CircuitState::Open)},
                        {"retry_after_seconds", retry_after}
                    }}
                }
            };
        }

        case BreakerErrorCode::TooManyRequests:
            return BreakerErrorResponse{
                429,
                5,
                Json{
                    {"error", "Too many requests"},
                    {"code", "circuit_breaker_half_open"},
                    {"message", "The " + operation + " operation is recovering and cannot accept "
                                "more requests at this time. Please try again shortly."},
                    {"details", {
                        {"operation", operation},
                        {"circuit_state", to_json(CircuitState::HalfOpen)},
                        {"retry_after_seconds", 5}
                    }}
                }
            };

        default:
            return std::nullopt;
    }
}

Json degraded_service_response(const std::string& operation) {
    return {
        {"status", "degraded"},
        {"message", "The " + operation + " operation is currently degraded. Using cached or fallback data."},
        {"operation", operation},
        {"timestamp", format_utc(std::chrono::system_clock::now())}
    };
}

}  // namespace agentpp
