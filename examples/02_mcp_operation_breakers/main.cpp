// Example 02: Per-Operation Breakers for an MCP Gateway
//
// Each MCP operation gets its own breaker from one registry so a flaky
// tools/call cannot take down tools/list. Shows retry around connect,
// a cached fallback for list_tools, HTTP error mapping and the health report.

#include <agentpp/log/spdlog_logger.hpp>
#include <agentpp/resilience/breaker_json.hpp>
#include <agentpp/resilience/fallback.hpp>
#include <agentpp/resilience/multi_circuit_breaker.hpp>
#include <agentpp/resilience/retry.hpp>
#include <agentpp/resilience/state_observer.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace agentpp;
using namespace std::chrono_literals;

namespace {

// Stand-in for an MCP server that accepts connections but whose tool calls
// keep failing.
class FlakyServer {
public:
    BreakerResult<void> connect() {
        const int attempt = ++connect_attempts_;
        if (attempt < 2) {
            return tl::unexpected(BreakerError::failure("connection reset by peer", 104));
        }
        return {};
    }

    BreakerResult<std::vector<std::string>> list_tools() {
        return tl::unexpected(BreakerError::failure("tools/list timed out upstream", 504));
    }

    BreakerResult<void> call_tool(const std::string& tool) {
        return tl::unexpected(BreakerError::failure(tool + ": internal server error", 500));
    }

private:
    std::atomic<int> connect_attempts_{0};
};

}  // namespace

int main() {
    std::cout << "=== MCP Operation Breakers ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // Same settings the gateway uses for every MCP operation
    MultiCircuitBreaker breakers(
        CircuitBreakerConfig{}
            .with_failure_threshold(5)
            .with_success_threshold(2)
            .with_timeout(30s)
            .with_max_concurrent_requests(100)
    );

    for (const char* op : {"mcp_connect", "mcp_call_tool", "mcp_list_tools", "mcp_disconnect"}) {
        breakers.get_or_create(op)->add_observer(std::make_shared<LoggingStateObserver>());
    }

    // Shared with the operations below; a timed-out call may still be running
    // on its worker after main has moved on.
    auto server = std::make_shared<FlakyServer>();
    const auto ctx = Context::background().with_timeout(10s);

    // 1. Connect with retry
    CircuitBreakerWithRetry connect(
        breakers.get_or_create("mcp_connect"),
        RetryConfig{}.with_max_attempts(3).with_initial_delay(20ms)
    );
    auto connected = connect.execute(ctx, [server] { return server->connect(); });
    std::cout << "connect: " << (connected ? "ok" : connected.error().message) << "\n";

    // 2. list_tools falls back to the last known tool list
    const std::vector<std::string> cached_tools{"github.get_me", "slack.send_message"};
    CircuitBreakerWithFallback<std::vector<std::string>> list_tools(
        breakers.get_or_create("mcp_list_tools"),
        [cached_tools]() -> BreakerResult<std::vector<std::string>> { return cached_tools; }
    );
    auto tools = list_tools.execute(ctx, [server] { return server->list_tools(); });
    if (tools) {
        std::cout << "list_tools: " << tools->size() << " tools (served from cache)\n";
        std::cout << degraded_service_response("list_tools").dump(2) << "\n";
    }

    // 3. call_tool fails until its breaker opens, then maps to an HTTP response
    std::cout << "\n=== call_tool ===\n";
    for (int i = 0; i < 7; ++i) {
        auto result = breakers.execute(ctx, "mcp_call_tool", [server] { return server->call_tool("github.get_me"); });
        if (result) {
            continue;
        }

        auto response = breaker_error_response(result.error(), "call_tool",
                                               breakers.default_config().timeout);
        if (response) {
            std::cout << "HTTP " << response->http_status
                      << " Retry-After: " << response->retry_after_seconds << "\n"
                      << response->body.dump(2) << "\n";
            break;
        }
        std::cout << "call " << (i + 1) << ": " << result.error().message << "\n";
    }

    // 4. Health
    std::cout << "\n=== Health ===\n";
    std::cout << health_report(breakers).dump(2) << "\n";

    auto health = breakers.health_status();
    std::cout << "healthy " << health.healthy.size()
              << ", degraded " << health.degraded.size()
              << ", unhealthy " << health.unhealthy.size() << "\n";

    return 0;
}
