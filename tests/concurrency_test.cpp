// ═══════════════════════════════════════════════════════════════════════════
// Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════
// Thread safety of the global logger, a single breaker under load, and the
// breaker registry.

#include <catch2/catch_test_macros.hpp>

#include "agentpp/log/logger.hpp"
#include "agentpp/resilience/circuit_breaker.hpp"
#include "agentpp/resilience/multi_circuit_breaker.hpp"
#include "mocks/recording_observer.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace agentpp;
using namespace agentpp::testing;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Logger Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════

// Custom logger that counts log calls for testing
class CountingLogger : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {
        log_count_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return log_count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::size_t> log_count_{0};
};

TEST_CASE("Logger swap is visible to readers", "[concurrency][logger]") {
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Info));

    auto counting = std::make_unique<CountingLogger>();
    auto* ptr = counting.get();
    set_logger(std::move(counting));

    REQUIRE(get_logger().should_log(LogLevel::Info));
    AGENTPP_LOG_INFO("breaker {} ready", "mcp_connect");
    REQUIRE(ptr->count() == 1);

    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Info));
}

TEST_CASE("Logger concurrent writes are all delivered", "[concurrency][logger]") {
    constexpr int num_threads = 4;
    constexpr int writes_per_thread = 1000;

    auto counting = std::make_unique<CountingLogger>();
    auto* ptr = counting.get();
    set_logger(std::move(counting));

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < writes_per_thread; ++j) {
                AGENTPP_LOG_DEBUG("thread {} write {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(ptr->count() == num_threads * writes_per_thread);
    set_logger(nullptr);
}

// Slow logger that notices being written to after destruction
class SlowLogger : public ILogger {
public:
    SlowLogger(std::shared_ptr<std::atomic<int>> delivered, std::shared_ptr<std::atomic<int>> after_free)
        : delivered_(std::move(delivered))
        , after_free_(std::move(after_free))
    {}

    ~SlowLogger() override {
        alive_.store(false);
    }

    void log(const LogRecord& /*record*/) override {
        std::this_thread::sleep_for(20us);
        if (alive_.load() == false) {
            after_free_->fetch_add(1);
        }
        delivered_->fetch_add(1);
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }

private:
    std::atomic<bool> alive_{true};
    std::shared_ptr<std::atomic<int>> delivered_;
    std::shared_ptr<std::atomic<int>> after_free_;
};

TEST_CASE("Logger swapped during writes stays alive until they finish", "[concurrency][logger]") {
    constexpr int num_threads = 4;
    constexpr int writes_per_thread = 500;

    auto delivered = std::make_shared<std::atomic<int>>(0);
    auto after_free = std::make_shared<std::atomic<int>>(0);
    set_logger(std::make_unique<SlowLogger>(delivered, after_free));

    std::atomic<bool> writers_done{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < writes_per_thread; ++j) {
                AGENTPP_LOG_INFO("[circuit breaker] worker {}: write {}", i, j);
            }
        });
    }

    std::thread swapper([&]() {
        while (writers_done.load() == false) {
            set_logger(std::make_unique<SlowLogger>(delivered, after_free));
            std::this_thread::sleep_for(100us);
        }
    });

    for (auto& t : threads) {
        t.join();
    }
    writers_done = true;
    swapper.join();
    set_logger(nullptr);

    REQUIRE(delivered->load() == num_threads * writes_per_thread);
    REQUIRE(after_free->load() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// CircuitBreaker Under Load
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker counters stay consistent under contention", "[concurrency][circuit_breaker]") {
    constexpr int num_threads = 8;
    constexpr int calls_per_thread = 200;

    auto breaker = std::make_shared<CircuitBreaker>(
        "agent_subprocess",
        CircuitBreakerConfig{}
            .with_failure_threshold(3)
            .with_success_threshold(2)
            .with_timeout(2ms)
            .with_max_concurrent_requests(2)
    );
    auto recorder = std::make_shared<RecordingObserver>();
    breaker->add_observer(recorder);

    std::atomic<int> ran{0};
    std::atomic<int> ok{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned>(t));
            std::bernoulli_distribution fails(0.3);
            for (int i = 0; i < calls_per_thread; ++i) {
                const bool should_fail = fails(rng);
                auto result = breaker->execute(Context::background(), [&ran, should_fail] {
                    ++ran;
                    return should_fail ? fail() : succeed();
                });
                if (result) {
                    ++ok;
                } else if (result.error().is(BreakerErrorCode::CircuitOpen) ||
                           result.error().is(BreakerErrorCode::TooManyRequests)) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    const auto stats = breaker->stats();
    const auto metrics = breaker->metrics();

    REQUIRE(stats.total_requests == num_threads * calls_per_thread);
    REQUIRE(stats.total_successes == static_cast<std::uint64_t>(ok.load()));
    REQUIRE(stats.total_successes + stats.total_failures == static_cast<std::uint64_t>(ran.load()));
    REQUIRE(stats.total_successes + stats.total_failures + static_cast<std::uint64_t>(rejected.load()) ==
            stats.total_requests);

    REQUIRE(metrics.requests_total == static_cast<std::uint64_t>(ran.load()));
    REQUIRE(metrics.requests_rejected == static_cast<std::uint64_t>(rejected.load()));
    REQUIRE(stats.half_open_in_flight <= 2);

    // Every transition reached the observer exactly once
    std::uint64_t transitions = 0;
    for (const auto& [state, count] : metrics.state_transitions) {
        transitions += count;
    }
    REQUIRE(eventually([&] { return recorder->count() == transitions; }));
}

TEST_CASE("CircuitBreaker half-open admits no more than the limit", "[concurrency][circuit_breaker]") {
    constexpr std::uint32_t limit = 3;
    auto breaker = std::make_shared<CircuitBreaker>(
        "mcp_call_tool",
        CircuitBreakerConfig{}.with_timeout(20ms).with_success_threshold(100).with_max_concurrent_requests(limit)
    );
    breaker->force_open();
    std::this_thread::sleep_for(30ms);

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    std::atomic<int> admitted{0};

    std::vector<std::future<BreakerResult<void>>> futures;
    for (int i = 0; i < 12; ++i) {
        futures.push_back(std::async(std::launch::async, [&] {
            return breaker->execute(Context::background(), [&] {
                ++admitted;
                const int now = ++in_flight;
                int seen = peak.load();
                while (now > seen && peak.compare_exchange_weak(seen, now) == false) {
                }
                std::this_thread::sleep_for(50ms);
                --in_flight;
                return succeed();
            });
        }));
    }

    int too_many = 0;
    for (auto& future : futures) {
        auto result = future.get();
        if (!result && result.error().is(BreakerErrorCode::TooManyRequests)) {
            ++too_many;
        }
    }

    REQUIRE(peak.load() <= static_cast<int>(limit));
    REQUIRE(admitted.load() + too_many == 12);
    REQUIRE(breaker->state() == CircuitState::HalfOpen);
}

TEST_CASE("CircuitBreaker outlives the caller's reference", "[concurrency][circuit_breaker][memory]") {
    std::weak_ptr<CircuitBreaker> weak;
    std::thread worker;
    {
        auto breaker = std::make_shared<CircuitBreaker>("db", CircuitBreakerConfig{});
        weak = breaker;
        worker = std::thread([breaker]() {
            for (int i = 0; i < 100; ++i) {
                (void)breaker->execute(Context::background(), [] { return succeed(); });
            }
        });
    }
    worker.join();

    REQUIRE(weak.expired());
}

// ═══════════════════════════════════════════════════════════════════════════
// Registry Concurrency
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("MultiCircuitBreaker handles concurrent create and execute", "[concurrency][registry]") {
    constexpr int num_threads = 8;
    constexpr int calls_per_thread = 100;
    const std::vector<std::string> names = {"mcp_connect", "mcp_call_tool", "mcp_list_tools", "mcp_disconnect"};

    MultiCircuitBreaker breakers(CircuitBreakerConfig{}.with_failure_threshold(1000));
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < calls_per_thread; ++i) {
                const auto& name = names[static_cast<std::size_t>(t + i) % names.size()];
                (void)breakers.execute(Context::background(), name, [] { return succeed(); });
                (void)breakers.health_status();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(breakers.size() == names.size());

    std::uint64_t total = 0;
    for (const auto& [name, breaker] : breakers.get_all()) {
        total += breaker->stats().total_successes;
    }
    REQUIRE(total == num_threads * calls_per_thread);
    REQUIRE(breakers.health_status().healthy.size() == names.size());
}
