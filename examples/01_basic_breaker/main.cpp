// Example 01: Basic Circuit Breaker
//
// Walks one breaker through Closed -> Open -> HalfOpen -> Closed against a
// dependency that fails for a while and then recovers.

#include <agentpp/log/spdlog_logger.hpp>
#include <agentpp/resilience/breaker_json.hpp>
#include <agentpp/resilience/circuit_breaker.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace agentpp;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== Circuit Breaker Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    // 1. Configure: open after 3 failures, probe after 200ms, close after 2 successes
    auto config = CircuitBreakerConfig{}
        .with_failure_threshold(3)
        .with_success_threshold(2)
        .with_timeout(200ms);

    auto created = CircuitBreaker::create("inventory_db", config);
    if (!created) {
        std::cerr << "Failed to create breaker: " << created.error().message << "\n";
        return 1;
    }
    auto breaker = *created;

    // 2. Watch transitions
    breaker->on_state_change([](const StateChangeEvent& event) {
        std::cout << "*** " << event.name << ": "
                  << to_string(event.from) << " -> " << to_string(event.to) << " ***\n";
    });

    // 3. A dependency that is down until `healthy` flips. The query owns
    //    its state so a timed-out worker never touches a dead frame.
    auto healthy = std::make_shared<std::atomic<bool>>(false);
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto query = [healthy, calls]() -> BreakerResult<void> {
        ++*calls;
        if (healthy->load() == false) {
            return tl::unexpected(BreakerError::failure("connection refused", 111));
        }
        return {};
    };

    const auto ctx = Context::background().with_timeout(5s);

    auto run = [&](const char* label) {
        auto result = breaker->execute(ctx, query);
        std::cout << "  " << label << ": "
                  << (result ? "ok" : result.error().message)
                  << "  [state " << breaker->state_name() << "]\n";
    };

    // 4. Trip the circuit
    std::cout << "=== Failing dependency ===\n";
    for (int i = 0; i < 3; ++i) {
        run("call");
    }

    // 5. Fast-fail while open; the dependency is not touched
    std::cout << "\n=== Open circuit ===\n";
    const int before = calls->load();
    run("call");
    run("call");
    std::cout << "  dependency calls while open: " << (calls->load() - before) << "\n";

    // 6. Recover
    std::cout << "\n=== Recovery ===\n";
    *healthy = true;
    std::this_thread::sleep_for(250ms);
    run("probe");
    run("probe");

    // Observers run on their own threads
    std::this_thread::sleep_for(50ms);

    // 7. Inspect
    std::cout << "\n=== Stats ===\n";
    std::cout << to_json(breaker->stats()).dump(2) << "\n";
    std::cout << "\n=== Metrics ===\n";
    std::cout << to_json(breaker->metrics()).dump(2) << "\n";

    return 0;
}
