#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "agentpp/resilience/adaptive.hpp"
#include "mocks/recording_observer.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace agentpp;
using namespace agentpp::testing;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("Adaptive error rate is zero before any traffic", "[resilience][adaptive]") {
    AdaptiveCircuitBreaker adaptive("db", CircuitBreakerConfig{}, 10ms);

    std::this_thread::sleep_for(40ms);

    REQUIRE(adaptive.error_rate() == 0.0);
    REQUIRE(adaptive.interval() == 10ms);
}

TEST_CASE("Adaptive computes failures over total requests", "[resilience][adaptive]") {
    AdaptiveCircuitBreaker adaptive("db", CircuitBreakerConfig{}.with_failure_threshold(100), 10ms);
    const auto ctx = Context::background();

    for (int i = 0; i < 3; ++i) {
        (void)adaptive.execute(ctx, [] { return succeed(); });
    }
    (void)adaptive.execute(ctx, [] { return fail(); });

    REQUIRE(eventually([&] { return adaptive.error_rate() > 0.0; }));
    REQUIRE_THAT(adaptive.error_rate(), WithinAbs(0.25, 1e-9));
}

TEST_CASE("Adaptive counts rejections in the denominator", "[resilience][adaptive]") {
    AdaptiveCircuitBreaker adaptive("db",
                                    CircuitBreakerConfig{}.with_failure_threshold(1).with_timeout(1h),
                                    10ms);
    const auto ctx = Context::background();

    (void)adaptive.execute(ctx, [] { return fail(); });
    (void)adaptive.execute(ctx, [] { return succeed(); });  // rejected, circuit open

    REQUIRE(eventually([&] { return adaptive.error_rate() > 0.0; }));
    REQUIRE_THAT(adaptive.error_rate(), WithinAbs(0.5, 1e-9));
}

TEST_CASE("Adaptive does not change the breaker's thresholds", "[resilience][adaptive]") {
    AdaptiveCircuitBreaker adaptive("db", CircuitBreakerConfig{}.with_failure_threshold(50), 5ms);
    const auto ctx = Context::background();

    for (int i = 0; i < 20; ++i) {
        (void)adaptive.execute(ctx, [] { return fail(); });
    }
    REQUIRE(eventually([&] { return adaptive.error_rate() == 1.0; }));

    REQUIRE(adaptive.circuit_breaker()->config().failure_threshold == 50);
    REQUIRE(adaptive.circuit_breaker()->state() == CircuitState::Closed);
}

TEST_CASE("Adaptive stop freezes the error rate", "[resilience][adaptive]") {
    AdaptiveCircuitBreaker adaptive("db", CircuitBreakerConfig{}.with_failure_threshold(100), 5ms);
    const auto ctx = Context::background();

    (void)adaptive.execute(ctx, [] { return fail(); });
    REQUIRE(eventually([&] { return adaptive.error_rate() == 1.0; }));

    adaptive.stop();
    adaptive.stop();  // idempotent

    (void)adaptive.execute(ctx, [] { return succeed(); });
    std::this_thread::sleep_for(30ms);

    // execute still works, the rate is no longer refreshed
    REQUIRE(adaptive.circuit_breaker()->stats().total_successes == 1);
    REQUIRE(adaptive.error_rate() == 1.0);
}

TEST_CASE("Adaptive destructor stops the ticker promptly", "[resilience][adaptive]") {
    const auto start = std::chrono::steady_clock::now();
    {
        AdaptiveCircuitBreaker adaptive("db", CircuitBreakerConfig{}, 1h);
    }
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);
}

TEST_CASE("Adaptive rejects a non-positive interval", "[resilience][adaptive]") {
    REQUIRE_THROWS_AS(AdaptiveCircuitBreaker("db", CircuitBreakerConfig{}, 0ms), std::invalid_argument);
    REQUIRE_THROWS_AS(AdaptiveCircuitBreaker("db", CircuitBreakerConfig{}.with_timeout(0ms), 10ms),
                      std::invalid_argument);
}
