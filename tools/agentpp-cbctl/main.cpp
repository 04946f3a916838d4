// ─────────────────────────────────────────────────────────────────────────────
// agentpp-cbctl - Circuit Breaker Workload Tool
// ─────────────────────────────────────────────────────────────────────────────
// Drives a simulated workload through named circuit breakers so a breaker
// config can be tried out before it ships.
//
// Usage:
//   agentpp-cbctl --config breakers.json --requests 200 --failure-rate 0.3
//   agentpp-cbctl --breaker mcp_call_tool --failure-rate 1.0 --json
//
// Config file:
//   {
//     "circuit_breaker": {"failure_threshold": 5, "timeout_ms": 30000},
//     "retry": {"max_attempts": 3, "initial_delay_ms": 50},
//     "breakers": ["mcp_connect", "mcp_call_tool"]
//   }
//
// Features:
//   - One shared breaker config for every named breaker
//   - Optional retry wrapper around each breaker
//   - Configurable failure rate, latency, per-call timeout and concurrency
//   - State transitions logged through spdlog
//   - Health report and per-breaker metrics as JSON

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "agentpp/log/spdlog_logger.hpp"
#include "agentpp/resilience/breaker_json.hpp"
#include "agentpp/resilience/multi_circuit_breaker.hpp"
#include "agentpp/resilience/retry.hpp"
#include "agentpp/resilience/state_observer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace agentpp;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset  = "\033[0m";
    const char* bold   = "\033[1m";
    const char* dim    = "\033[2m";
    const char* red    = "\033[31m";
    const char* green  = "\033[32m";
    const char* yellow = "\033[33m";
    const char* cyan   = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

const char* state_color(CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return color::green;
        case CircuitState::HalfOpen: return color::yellow;
        case CircuitState::Open:     return color::red;
    }
    return color::reset;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ToolConfig {
    CircuitBreakerConfig breaker;
    std::optional<RetryConfig> retry;
    std::vector<std::string> names;  // unique, in first-seen order
};

// Names repeated across the config file and --breaker run once.
void add_breaker_name(ToolConfig& config, const std::string& name) {
    if (std::find(config.names.begin(), config.names.end(), name) == config.names.end()) {
        config.names.push_back(name);
    }
}

BreakerResult<ToolConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(BreakerError::invalid_config("cannot open " + path));
    }

    Json doc;
    try {
        doc = Json::parse(in);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(BreakerError::invalid_config(path + ": " + e.what()));
    }

    if (doc.is_object() == false) {
        return tl::unexpected(BreakerError::invalid_config(path + ": top level must be an object"));
    }

    ToolConfig config;

    if (doc.contains("circuit_breaker")) {
        auto breaker = circuit_breaker_config_from_json(doc["circuit_breaker"]);
        if (!breaker) {
            return tl::unexpected(breaker.error());
        }
        config.breaker = std::move(*breaker);
    }

    if (doc.contains("retry")) {
        auto retry = retry_config_from_json(doc["retry"]);
        if (!retry) {
            return tl::unexpected(retry.error());
        }
        config.retry = std::move(*retry);
    }

    if (doc.contains("breakers")) {
        const auto& names = doc["breakers"];
        if (names.is_array() == false) {
            return tl::unexpected(BreakerError::invalid_config("breakers must be an array of names"));
        }
        for (const auto& name : names) {
            if (name.is_string() == false) {
                return tl::unexpected(BreakerError::invalid_config("breakers must be an array of names"));
            }
            add_breaker_name(config, name.get<std::string>());
        }
    }

    return config;
}

// ═══════════════════════════════════════════════════════════════════════════
// Workload
// ═══════════════════════════════════════════════════════════════════════════

struct Workload {
    std::size_t requests{100};
    double failure_rate{0.2};
    std::chrono::milliseconds latency{5};
    std::optional<std::chrono::milliseconds> call_timeout;
    std::size_t concurrency{4};
};

struct Tally {
    std::atomic<std::uint64_t> ok{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<std::uint64_t> timed_out{0};
};

BreakerResult<void> simulated_call(const Context& ctx, std::chrono::milliseconds latency, bool fail) {
    const bool finished = ctx.sleep_for(latency);
    if (finished == false) {
        return tl::unexpected(BreakerError::cancelled("simulated call cancelled"));
    }
    if (fail) {
        return tl::unexpected(BreakerError::failure("simulated dependency failure", 500));
    }
    return {};
}

void tally(Tally& counts, const BreakerResult<void>& result) {
    if (result) {
        ++counts.ok;
        return;
    }
    switch (result.error().code) {
        case BreakerErrorCode::CircuitOpen:
        case BreakerErrorCode::TooManyRequests:
            ++counts.rejected;
            break;
        case BreakerErrorCode::Timeout:
            ++counts.timed_out;
            break;
        default:
            ++counts.failed;
            break;
    }
}

void run_workload(
    MultiCircuitBreaker& breakers,
    const ToolConfig& config,
    const Workload& workload,
    std::map<std::string, Tally>& tallies
) {
    std::vector<std::jthread> workers;

    for (const auto& name : config.names) {
        auto breaker = breakers.get_or_create(name);
        std::shared_ptr<CircuitBreakerWithRetry> retrying;
        if (config.retry) {
            retrying = std::make_shared<CircuitBreakerWithRetry>(breaker, *config.retry);
        }

        Tally& counts = tallies[name];
        const std::size_t per_worker = (workload.requests + workload.concurrency - 1) / workload.concurrency;

        for (std::size_t w = 0; w < workload.concurrency; ++w) {
            const std::size_t first = w * per_worker;
            const std::size_t last = std::min(workload.requests, first + per_worker);
            if (first >= last) {
                break;
            }

            workers.emplace_back([breaker, retrying, &counts, &workload, first, last, seed = w + 1]() {
                std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
                std::bernoulli_distribution fails(workload.failure_rate);

                for (std::size_t i = first; i < last; ++i) {
                    const bool fail = fails(rng);
                    Context ctx = Context::background();
                    if (workload.call_timeout) {
                        ctx = ctx.with_timeout(*workload.call_timeout);
                    }

                    // Copied by value: a timed-out call keeps running after we move on
                    auto call = [latency = workload.latency, fail](const Context& call_ctx) {
                        return simulated_call(call_ctx, latency, fail);
                    };

                    auto result = retrying ? retrying->execute(ctx, call) : breaker->execute(ctx, call);
                    tally(counts, result);
                }
            });
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("agentpp-cbctl", "Circuit Breaker Workload Tool");

    options.add_options()
        ("c,config", "JSON config file (circuit_breaker, retry, breakers)", cxxopts::value<std::string>())
        ("b,breaker", "Breaker name (can be repeated; adds to the config file's list)", cxxopts::value<std::vector<std::string>>())
        ("n,requests", "Requests per breaker", cxxopts::value<std::size_t>()->default_value("100"))
        ("f,failure-rate", "Probability a simulated call fails (0.0 - 1.0)", cxxopts::value<double>()->default_value("0.2"))
        ("latency-ms", "Simulated call latency", cxxopts::value<int>()->default_value("5"))
        ("timeout-ms", "Per-call deadline (0 = none)", cxxopts::value<int>()->default_value("0"))
        ("concurrency", "Worker threads per breaker", cxxopts::value<std::size_t>()->default_value("4"))
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    agentpp-cbctl --breaker mcp_call_tool --failure-rate 0.6\n";
            std::cout << "    agentpp-cbctl --config breakers.json --requests 500 --concurrency 8 --json\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        // Logging
        const LogLevel level = parse_log_level(result["log-level"].as<std::string>());
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_console_logger(level));
        }

        // Configuration
        ToolConfig config;
        if (result.count("config")) {
            auto loaded = load_config(result["config"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().message);
                return 1;
            }
            config = std::move(*loaded);
        }
        if (result.count("breaker")) {
            for (const auto& name : result["breaker"].as<std::vector<std::string>>()) {
                add_breaker_name(config, name);
            }
        }
        if (config.names.empty()) {
            config.names.push_back("default");
        }

        Workload workload;
        workload.requests = result["requests"].as<std::size_t>();
        workload.failure_rate = result["failure-rate"].as<double>();
        workload.latency = std::chrono::milliseconds{result["latency-ms"].as<int>()};
        workload.concurrency = result["concurrency"].as<std::size_t>();
        const int timeout_ms = result["timeout-ms"].as<int>();
        if (timeout_ms > 0) {
            workload.call_timeout = std::chrono::milliseconds{timeout_ms};
        }

        if (workload.failure_rate < 0.0 || workload.failure_rate > 1.0) {
            print_error("--failure-rate must be between 0.0 and 1.0");
            return 1;
        }
        if (workload.concurrency == 0) {
            print_error("--concurrency must be at least 1");
            return 1;
        }

        // Run
        MultiCircuitBreaker breakers(config.breaker);
        for (const auto& name : config.names) {
            breakers.get_or_create(name)->add_observer(std::make_shared<LoggingStateObserver>());
        }

        std::map<std::string, Tally> tallies;
        for (const auto& name : config.names) {
            tallies[name];
        }

        const auto started = std::chrono::steady_clock::now();
        run_workload(breakers, config, workload, tallies);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        );

        // Report
        if (json_output) {
            Json metrics = Json::object();
            for (const auto& [name, breaker] : breakers.get_all()) {
                metrics[name] = to_json(breaker->metrics());
            }
            Json out = {
                {"elapsed_ms", elapsed.count()},
                {"health", health_report(breakers)},
                {"metrics", metrics}
            };
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        print_header("Workload");
        std::cout << "  " << workload.requests << " requests per breaker, "
                  << workload.concurrency << " workers, failure rate " << workload.failure_rate
                  << ", " << elapsed.count() << " ms\n";

        print_header("Circuit Breakers");
        for (const auto& [name, breaker] : breakers.get_all()) {
            const auto stats = breaker->stats();
            const auto snapshot = breaker->metrics();
            const Tally& counts = tallies[name];

            std::cout << "  " << color::c(color::bold) << name << color::c(color::reset) << "  "
                      << color::c(state_color(stats.state)) << to_string(stats.state)
                      << color::c(color::reset) << "\n";
            std::cout << color::c(color::dim)
                      << "    ok " << counts.ok.load()
                      << "  failed " << counts.failed.load()
                      << "  rejected " << counts.rejected.load()
                      << "  timed out " << counts.timed_out.load()
                      << "  p95 " << std::chrono::duration_cast<std::chrono::microseconds>(snapshot.p95_latency).count()
                      << " us" << color::c(color::reset) << "\n";
        }

        print_header("Health");
        std::cout << health_report(breakers).dump(2) << "\n";

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }

    return 0;
}
