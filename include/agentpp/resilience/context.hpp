#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Context
// ═══════════════════════════════════════════════════════════════════════════
// Carries a caller's deadline and cancellation signal into breaker calls.
// A Context is a cheap value: an optional deadline plus a std::stop_token.
//
//   std::stop_source shutdown;
//   auto ctx = Context::background()
//                  .with_timeout(std::chrono::seconds(10))
//                  .with_stop_token(shutdown.get_token());
//
//   breaker.execute(ctx, [](const Context& ctx) { return list_tools(ctx); });
//
// Ending a context stops callers from *waiting*; it never interrupts work
// already running. Work that wants to stop early must check the context it
// is handed.

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>

namespace agentpp {

enum class ContextError {
    Cancelled,         ///< The stop_token was signalled
    DeadlineExceeded   ///< The deadline passed
};

[[nodiscard]] constexpr std::string_view to_string(ContextError err) noexcept {
    switch (err) {
        case ContextError::Cancelled:        return "context canceled";
        case ContextError::DeadlineExceeded: return "context deadline exceeded";
    }
    return "context error";
}

class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// Never ends
    Context() = default;

    [[nodiscard]] static Context background() { return Context{}; }

    /// Copy with a deadline `timeout` from now (keeps an earlier deadline).
    /// A timeout past the clock's range means no effective deadline.
    [[nodiscard]] Context with_timeout(std::chrono::milliseconds timeout) const;

    /// Copy with the given deadline (keeps an earlier deadline)
    [[nodiscard]] Context with_deadline(Clock::time_point deadline) const;

    /// Copy that also ends when `token` is signalled
    [[nodiscard]] Context with_stop_token(std::stop_token token) const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }
    [[nodiscard]] const std::stop_token& stop_token() const noexcept { return token_; }

    [[nodiscard]] bool is_done() const noexcept { return error().has_value(); }

    /// Why the context ended; nullopt while it is still live.
    [[nodiscard]] std::optional<ContextError> error() const noexcept;

    /// Cancellable sleep. Returns true if the full duration elapsed, false if
    /// the context ended first.
    bool sleep_for(std::chrono::milliseconds duration) const;

    /// Block on `cv` until `pred` holds or the context ends. Returns pred().
    template <typename Predicate>
    bool wait(std::unique_lock<std::mutex>& lock, std::condition_variable_any& cv, Predicate pred) const {
        if (deadline_.has_value()) {
            return cv.wait_until(lock, token_, *deadline_, std::move(pred));
        }
        return cv.wait(lock, token_, std::move(pred));
    }

private:
    std::optional<Clock::time_point> deadline_;
    std::stop_token token_;
};

}  // namespace agentpp
