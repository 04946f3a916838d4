#include "agentpp/resilience/circuit_breaker.hpp"

#include "agentpp/log/logger.hpp"

#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace agentpp {

namespace {

// Shared between execute() and its worker. Outlives whichever side gives up
// first, so an abandoned worker can still publish its result safely.
struct Completion {
    std::mutex mutex;
    std::condition_variable_any cv;
    bool done{false};
    BreakerResult<void> result;
};

BreakerResult<void> run_guarded(
    const CircuitBreaker::Operation& operation,
    const Context& ctx,
    const std::string& breaker_name
) {
    try {
        return operation(ctx);
    } catch (const std::exception& e) {
        AGENTPP_LOG_WARN("[circuit breaker] {}: operation threw: {}", breaker_name, e.what());
        return tl::unexpected(BreakerError::panic(e.what()));
    } catch (...) {
        AGENTPP_LOG_WARN("[circuit breaker] {}: operation threw a non-standard exception", breaker_name);
        return tl::unexpected(BreakerError::panic("unknown exception"));
    }
}

void notify_observer(const std::shared_ptr<IStateObserver>& observer, const StateChangeEvent& event) {
    try {
        observer->on_state_change(event);
    } catch (const std::exception& e) {
        AGENTPP_LOG_WARN("[circuit breaker] {}: state observer threw: {}", event.name, e.what());
    } catch (...) {
        AGENTPP_LOG_WARN("[circuit breaker] {}: state observer threw a non-standard exception", event.name);
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

BreakerResult<std::shared_ptr<CircuitBreaker>> CircuitBreaker::create(
    std::string name,
    CircuitBreakerConfig config
) {
    auto valid = config.validate();
    if (!valid) {
        return tl::unexpected(valid.error());
    }
    return std::make_shared<CircuitBreaker>(std::move(name), std::move(config));
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config)
    : name_(std::move(name))
    , config_(std::move(config))
    , metrics_(name_)
{
    auto valid = config_.validate();
    if (!valid) {
        throw std::invalid_argument(name_ + ": " + valid.error().message);
    }

    if (config_.on_state_change) {
        auto callback = config_.on_state_change;
        observers_.push_back(std::make_shared<CallbackStateObserver>(
            [callback](const StateChangeEvent& event) {
                callback(event.name, event.from, event.to);
            }
        ));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

BreakerResult<void> CircuitBreaker::execute_operation(const Context& ctx, Operation operation) {
    TrialSlot slot;
    Transition admission;
    auto admitted = before_request(slot, admission);
    dispatch(std::move(admission));
    if (!admitted) {
        return admitted;
    }

    auto completion = std::make_shared<Completion>();
    const auto start = Clock::now();

    try {
        std::thread worker([completion, operation = std::move(operation), ctx, name = name_]() {
            auto result = run_guarded(operation, ctx, name);
            {
                std::lock_guard<std::mutex> lock(completion->mutex);
                completion->result = std::move(result);
                completion->done = true;
            }
            completion->cv.notify_all();
        });
        worker.detach();
    } catch (const std::system_error& e) {
        // Admission was granted, so the attempt still has to be accounted for.
        auto failed = BreakerResult<void>(tl::unexpected(
            BreakerError::failure(std::string("could not start worker thread: ") + e.what())
        ));
        Transition outcome;
        after_request(failed, Clock::now() - start, slot, outcome);
        dispatch(std::move(outcome));
        return failed;
    }

    BreakerResult<void> result;
    {
        std::unique_lock<std::mutex> lock(completion->mutex);
        const bool completed = ctx.wait(lock, completion->cv, [&completion] { return completion->done; });
        if (completed) {
            result = std::move(completion->result);
        } else {
            const auto reason = ctx.error().value_or(ContextError::Cancelled);
            result = tl::unexpected(BreakerError::timeout(std::string(to_string(reason))));
            AGENTPP_LOG_DEBUG("[circuit breaker] {}: {} before the operation finished; "
                              "worker left running", name_, to_string(reason));
        }
    }

    Transition outcome;
    after_request(result, Clock::now() - start, slot, outcome);
    dispatch(std::move(outcome));
    return result;
}

BreakerResult<void> CircuitBreaker::before_request(TrialSlot& slot, Transition& transition) {
    std::lock_guard<std::mutex> lock(mutex_);

    ++total_requests_;

    switch (state_) {
        case CircuitState::Closed:
            return {};

        case CircuitState::Open: {
            // Compared in milliseconds; converting the timeout to the clock's
            // nanoseconds overflows for very long timeouts.
            const auto open_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - state_changed_at_
            );
            const bool timeout_elapsed = open_for >= config_.timeout;
            if (timeout_elapsed) {
                set_state_locked(CircuitState::HalfOpen, transition);
                ++half_open_period_;
                consecutive_successes_ = 0;
                half_open_in_flight_ = 1;
                slot = half_open_period_;
                return {};
            }
            metrics_.record_rejection();
            AGENTPP_LOG_TRACE("[circuit breaker] {}: rejected, circuit open", name_);
            return tl::unexpected(BreakerError::circuit_open());
        }

        case CircuitState::HalfOpen:
            if (half_open_in_flight_ >= config_.max_concurrent_requests) {
                metrics_.record_rejection();
                AGENTPP_LOG_TRACE("[circuit breaker] {}: rejected, {} half-open trials in flight",
                                  name_, half_open_in_flight_);
                return tl::unexpected(BreakerError::too_many_requests());
            }
            ++half_open_in_flight_;
            slot = half_open_period_;
            return {};
    }

    return tl::unexpected(BreakerError::failure("unknown circuit breaker state"));
}

void CircuitBreaker::after_request(
    const BreakerResult<void>& outcome,
    std::chrono::nanoseconds latency,
    const TrialSlot& slot,
    Transition& transition
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Only a trial from the current half-open period gives its slot back
    const bool owns_slot = (state_ == CircuitState::HalfOpen) && (slot == half_open_period_);
    if (owns_slot && half_open_in_flight_ > 0) {
        --half_open_in_flight_;
    }

    metrics_.record_request(outcome.has_value(), latency);

    if (outcome.has_value()) {
        on_success_locked(transition);
    } else {
        on_failure_locked(outcome.error(), transition);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transitions (caller holds mutex_)
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::on_success_locked(Transition& transition) {
    ++total_successes_;
    ++consecutive_successes_;
    consecutive_failures_ = 0;

    switch (state_) {
        case CircuitState::Closed:
            break;

        case CircuitState::HalfOpen:
            if (consecutive_successes_ >= config_.success_threshold) {
                set_state_locked(CircuitState::Closed, transition);
                consecutive_successes_ = 0;
                consecutive_failures_ = 0;
                half_open_in_flight_ = 0;
            }
            break;

        case CircuitState::Open:
            // Admitted before the circuit opened; the Open timer decides
            // when to probe again, not a late straggler.
            break;
    }
}

void CircuitBreaker::on_failure_locked(const BreakerError& error, Transition& transition) {
    ++total_failures_;
    ++consecutive_failures_;
    consecutive_successes_ = 0;
    last_error_ = error;
    last_error_time_ = std::chrono::system_clock::now();

    switch (state_) {
        case CircuitState::Closed:
            if (consecutive_failures_ >= config_.failure_threshold) {
                set_state_locked(CircuitState::Open, transition);
            }
            break;

        case CircuitState::HalfOpen:
            set_state_locked(CircuitState::Open, transition);
            half_open_in_flight_ = 0;
            break;

        case CircuitState::Open:
            // Late failure from a request admitted earlier restarts the timer
            state_changed_at_ = Clock::now();
            state_changed_wall_ = std::chrono::system_clock::now();
            break;
    }
}

void CircuitBreaker::set_state_locked(CircuitState new_state, Transition& transition) {
    if (state_ == new_state) {
        return;
    }

    const CircuitState old_state = state_;
    state_ = new_state;
    state_changed_at_ = Clock::now();
    state_changed_wall_ = std::chrono::system_clock::now();

    metrics_.record_state_change(new_state);
    AGENTPP_LOG_DEBUG("[circuit breaker] {}: {} -> {}", name_, to_string(old_state), to_string(new_state));

    transition.events.push_back(StateChangeEvent{name_, old_state, new_state, state_changed_wall_});
    if (transition.observers.empty()) {
        transition.observers = observers_;
    }
}

void CircuitBreaker::dispatch(Transition transition) {
    for (const auto& event : transition.events) {
        for (const auto& observer : transition.observers) {
            try {
                std::thread([observer, event]() { notify_observer(observer, event); }).detach();
            } catch (const std::system_error& e) {
                AGENTPP_LOG_WARN("[circuit breaker] {}: could not start observer thread: {}",
                                 event.name, e.what());
            }
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string_view CircuitBreaker::state_name() const {
    return to_string(state());
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats snapshot;
    snapshot.total_requests = total_requests_;
    snapshot.total_successes = total_successes_;
    snapshot.total_failures = total_failures_;
    snapshot.consecutive_successes = consecutive_successes_;
    snapshot.consecutive_failures = consecutive_failures_;
    snapshot.half_open_in_flight = half_open_in_flight_;
    snapshot.last_error = last_error_;
    snapshot.last_error_time = last_error_time_;
    snapshot.state = state_;
    snapshot.state_changed_at = state_changed_wall_;
    return snapshot;
}

// ─────────────────────────────────────────────────────────────────────────────
// Manual Control
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::reset() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_state_locked(CircuitState::Closed, transition);
        state_changed_at_ = Clock::now();
        state_changed_wall_ = std::chrono::system_clock::now();
        consecutive_successes_ = 0;
        consecutive_failures_ = 0;
        half_open_in_flight_ = 0;
    }
    dispatch(std::move(transition));
}

void CircuitBreaker::force_open() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_state_locked(CircuitState::Open, transition);
        state_changed_at_ = Clock::now();
        state_changed_wall_ = std::chrono::system_clock::now();
        half_open_in_flight_ = 0;
    }
    dispatch(std::move(transition));
}

void CircuitBreaker::force_close() {
    reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::add_observer(std::shared_ptr<IStateObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void CircuitBreaker::on_state_change(CallbackStateObserver::Callback callback) {
    add_observer(std::make_shared<CallbackStateObserver>(std::move(callback)));
}

}  // namespace agentpp
