#include "agentpp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace agentpp {

// ─────────────────────────────────────────────────────────────────────────────
// ANSI Color Codes
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::string_view RESET   = "\033[0m";
constexpr std::string_view GRAY    = "\033[90m";
constexpr std::string_view CYAN    = "\033[36m";
constexpr std::string_view GREEN   = "\033[32m";
constexpr std::string_view YELLOW  = "\033[33m";
constexpr std::string_view RED     = "\033[31m";
constexpr std::string_view MAGENTA = "\033[35m";
constexpr std::string_view BOLD    = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Fatal: return MAGENTA;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_timestamp(
    const std::chrono::system_clock::time_point& tp
) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view extract_filename(const char* path) noexcept {
    std::string_view sv(path);
    const auto last_slash = sv.find_last_of('/');
    const bool found_slash = (last_slash != std::string_view::npos);
    if (found_slash) {
        return sv.substr(last_slash + 1);
    }
    return sv;
}

// Splits "[circuit breaker] db: opened" into "[circuit breaker]" and
// "db: opened". Messages without a leading tag come back with an empty tag.
[[nodiscard]] std::pair<std::string_view, std::string_view> split_component(std::string_view message) noexcept {
    const bool tagged = message.starts_with('[');
    if (tagged == false) {
        return {{}, message};
    }
    const auto close = message.find(']');
    if (close == std::string_view::npos) {
        return {{}, message};
    }
    auto rest = message.substr(close + 1);
    if (rest.starts_with(' ')) {
        rest.remove_prefix(1);
    }
    return {message.substr(0, close + 1), rest};
}

// Writes `text` wrapped in `color` when colors are on.
class Painter {
public:
    Painter(std::ostringstream& out, bool enabled)
        : out_(out)
        , enabled_(enabled)
    {}

    Painter& paint(std::string_view color, std::string_view text) {
        if (enabled_) {
            out_ << color << text << RESET;
        } else {
            out_ << text;
        }
        return *this;
    }

    Painter& plain(std::string_view text) {
        out_ << text;
        return *this;
    }

private:
    std::ostringstream& out_;
    bool enabled_;
};

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info")  return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger Implementation
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    const bool should_log_this = should_log(record.level);
    if (should_log_this == false) {
        return;
    }

    // HH:MM:SS.mmm LEVEL [component] message (file:line)
    std::ostringstream line;
    Painter painter(line, colors_enabled_);

    std::ostringstream level_name;
    level_name << std::setw(5) << std::left << to_string(record.level);

    const auto [component, text] = split_component(record.message);
    const std::string where = std::string(extract_filename(record.location.file_name())) +
                              ":" + std::to_string(record.location.line());

    painter.paint(GRAY, format_timestamp(record.timestamp)).plain(" ");
    if (colors_enabled_) {
        line << BOLD;
    }
    painter.paint(level_color(record.level), level_name.str()).plain(" ");
    if (component.empty() == false) {
        painter.paint(CYAN, component).plain(" ");
    }
    painter.plain(text).plain(" (").paint(GRAY, where).plain(")\n");

    // Breakers log from worker and observer threads
    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::shared_ptr<ILogger>& logger_instance() {
    static std::shared_ptr<ILogger> instance = std::make_shared<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

std::shared_ptr<ILogger> logger_handle() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    const bool is_valid = (logger != nullptr);
    if (is_valid) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_shared<NullLogger>();
    }
}

}  // namespace agentpp
