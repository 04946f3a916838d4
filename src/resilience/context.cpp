#include "agentpp/resilience/context.hpp"

namespace agentpp {

namespace {

// from + d, clamped to the clock's range. Non-positive d yields `from`.
Context::Clock::time_point saturating_add(Context::Clock::time_point from, std::chrono::milliseconds d) {
    if (d.count() <= 0) {
        return from;
    }
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Context::Clock::time_point::max() - from
    );
    if (d >= headroom) {
        return Context::Clock::time_point::max();
    }
    return from + d;
}

}  // namespace

Context Context::with_timeout(std::chrono::milliseconds timeout) const {
    return with_deadline(saturating_add(Clock::now(), timeout));
}

Context Context::with_deadline(Clock::time_point deadline) const {
    Context copy = *this;
    const bool tighter = (deadline_.has_value() == false) || (deadline < *deadline_);
    if (tighter) {
        copy.deadline_ = deadline;
    }
    return copy;
}

Context Context::with_stop_token(std::stop_token token) const {
    // A Context follows one token; the newest one wins.
    Context copy = *this;
    copy.token_ = std::move(token);
    return copy;
}

std::optional<ContextError> Context::error() const noexcept {
    if (token_.stop_requested()) {
        return ContextError::Cancelled;
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
        return ContextError::DeadlineExceeded;
    }
    return std::nullopt;
}

bool Context::sleep_for(std::chrono::milliseconds duration) const {
    const auto wake_at = saturating_add(Clock::now(), duration);

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);

    // Nothing notifies cv except the stop_token, so this returns on the
    // earliest of wake_at, the deadline, or a stop request.
    const auto limit = (deadline_.has_value() && *deadline_ < wake_at) ? *deadline_ : wake_at;
    cv.wait_until(lock, token_, limit, [] { return false; });

    if (token_.stop_requested()) {
        return false;
    }
    return Clock::now() >= wake_at;
}

}  // namespace agentpp
