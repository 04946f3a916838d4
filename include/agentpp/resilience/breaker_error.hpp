#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Breaker Error
// ═══════════════════════════════════════════════════════════════════════════
// Every operation guarded by a breaker reports failure through BreakerError.
// Callers branch on the code:
//
//   auto result = breaker.execute(ctx, call_tool);
//   if (!result) {
//       switch (result.error().code) {
//           case BreakerErrorCode::CircuitOpen:     return cached_tools();
//           case BreakerErrorCode::TooManyRequests: return retry_later();
//           default:                                return surface(result.error());
//       }
//   }

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace agentpp {

enum class BreakerErrorCode {
    CircuitOpen,      ///< Open and the timeout has not elapsed; fn never ran
    TooManyRequests,  ///< HalfOpen trial slots are all in flight
    Timeout,          ///< Context ended before fn reported a result
    Panic,            ///< fn threw; the exception was caught on the worker
    OperationFailed,  ///< fn returned an error of its own
    InvalidConfig,    ///< Configuration rejected by validation
    Cancelled         ///< Context ended while a combinator was waiting
};

[[nodiscard]] constexpr std::string_view to_string(BreakerErrorCode code) noexcept {
    switch (code) {
        case BreakerErrorCode::CircuitOpen:     return "CircuitOpen";
        case BreakerErrorCode::TooManyRequests: return "TooManyRequests";
        case BreakerErrorCode::Timeout:         return "Timeout";
        case BreakerErrorCode::Panic:           return "Panic";
        case BreakerErrorCode::OperationFailed: return "OperationFailed";
        case BreakerErrorCode::InvalidConfig:   return "InvalidConfig";
        case BreakerErrorCode::Cancelled:       return "Cancelled";
    }
    return "Unknown";
}

struct BreakerError {
    BreakerErrorCode code;
    std::string message;
    std::optional<int> app_code;       ///< Caller-defined code for OperationFailed
    std::optional<std::string> cause;  ///< Wrapped context error, if any

    [[nodiscard]] bool is(BreakerErrorCode c) const noexcept {
        return code == c;
    }

    /// Pattern match used by retry allow-lists: same code, and same app_code
    /// when the pattern carries one. Messages are not compared.
    [[nodiscard]] bool matches(const BreakerError& pattern) const noexcept {
        if (code != pattern.code) {
            return false;
        }
        if (pattern.app_code.has_value()) {
            return app_code == pattern.app_code;
        }
        return true;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static BreakerError circuit_open() {
        return {BreakerErrorCode::CircuitOpen, "circuit breaker is open", std::nullopt, std::nullopt};
    }

    [[nodiscard]] static BreakerError too_many_requests() {
        return {BreakerErrorCode::TooManyRequests, "too many requests in half-open state",
                std::nullopt, std::nullopt};
    }

    [[nodiscard]] static BreakerError timeout(std::string cause) {
        std::string msg = "circuit breaker operation timeout: " + cause;
        return {BreakerErrorCode::Timeout, std::move(msg), std::nullopt, std::move(cause)};
    }

    [[nodiscard]] static BreakerError panic(std::string_view what) {
        return {BreakerErrorCode::Panic, "panic recovered: " + std::string(what),
                std::nullopt, std::nullopt};
    }

    [[nodiscard]] static BreakerError failure(std::string msg) {
        return {BreakerErrorCode::OperationFailed, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static BreakerError failure(std::string msg, int app_code) {
        return {BreakerErrorCode::OperationFailed, std::move(msg), app_code, std::nullopt};
    }

    [[nodiscard]] static BreakerError invalid_config(std::string msg) {
        return {BreakerErrorCode::InvalidConfig, "invalid config: " + msg, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static BreakerError cancelled(std::string cause) {
        std::string msg = cause;
        return {BreakerErrorCode::Cancelled, std::move(msg), std::nullopt, std::move(cause)};
    }
};

template <typename T>
using BreakerResult = tl::expected<T, BreakerError>;

}  // namespace agentpp
