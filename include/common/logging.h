#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace tally {
namespace common {

/**
 * @brief Logging levels for conditional output
 *
 * Debug logging should stay disabled on hot paths in release configurations.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5  // Invariant violations that abort the current call
};

/**
 * @brief Structured log entry for JSON logging
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical"
std::optional<LogLevel> parse_log_level(const std::string &name);

/**
 * @brief Global logging configuration
 *
 * Thread-safe logger that can be adjusted at runtime. Performance-critical
 * paths should check the enabled status before formatting strings.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output (nullptr restores std::cout)
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cout;
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                       const std::string& message, const std::string& error_code = "",
                       const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

    /// Log critical failure; always emitted regardless of level
    void log_critical_failure(const std::string& module, const std::string& message,
                              const std::string& error_code = "",
                              const std::unordered_map<std::string, std::string>& context = {}) {
        LogEntry entry{
            std::chrono::system_clock::now(),
            LogLevel::CRITICAL,
            module,
            get_thread_id(),
            message,
            error_code,
            context
        };

        critical_count_.fetch_add(1, std::memory_order_relaxed);
        output_log_entry(entry);
    }

    /// Number of critical failures reported since startup
    uint64_t critical_failure_count() const noexcept {
        return critical_count_.load(std::memory_order_relaxed);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), critical_count_(0), output_(&std::cout) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::atomic<uint64_t> critical_count_;
    std::mutex output_mutex_;
    std::ostream* output_;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *output_ << line << std::endl;
    }

    std::string get_thread_id() const;
    std::string level_to_string(LogLevel level) const;
    std::string escape_json_string(const std::string& input) const;
};

} // namespace common
} // namespace tally

/**
 * @brief Performance-conscious logging macros
 *
 * The first argument is the module name, the rest are streamed into the message.
 */
#define LOG_TRACE(...) \
    do { \
        if (tally::common::Logger::instance().is_enabled(tally::common::LogLevel::TRACE)) { \
            tally::common::Logger::instance().log(tally::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (tally::common::Logger::instance().is_debug_enabled()) { \
            tally::common::Logger::instance().log(tally::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    tally::common::Logger::instance().log(tally::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    tally::common::Logger::instance().log(tally::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    tally::common::Logger::instance().log(tally::common::LogLevel::ERROR, __VA_ARGS__)

/**
 * @brief Structured logging macros
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    tally::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...) \
    tally::common::Logger::instance().log_critical_failure(module, message, ##__VA_ARGS__)

/**
 * @brief Module-specific critical failure macros
 */
#define LOG_PROGRAM_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("program", message, ##__VA_ARGS__)
