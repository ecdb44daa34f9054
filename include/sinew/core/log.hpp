#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <source_location>
#include <format>

namespace sinew::core {

// Log severity levels
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    General = 0,
    Anatomy = 1,
    Combat = 2,
    Equipment = 3,
    Assets = 4,
    Performance = 5
};

// Compile-time log level configuration
#ifdef NDEBUG
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Info;
    constexpr bool LOG_TO_CONSOLE = false;
#else
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Trace;
    constexpr bool LOG_TO_CONSOLE = true;
#endif

// RAII scoped timer for performance logging
class ScopedTimer {
public:
    ScopedTimer(std::string_view name, LogCategory category = LogCategory::Performance);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    LogCategory category_;
    std::chrono::steady_clock::time_point start_;
};

// Thread-safe logger writing to an optional file and the console
class Logger {
public:
    // Singleton access
    static Logger& instance();

    // Open the file sink. Console output works without calling this.
    void initialize(const std::string& log_file_path = "sinew.log",
                    bool append = false,
                    LogLevel min_level = COMPILE_TIME_LOG_LEVEL);

    // Shutdown and flush all pending logs
    void shutdown();

    // Set minimum log level at runtime
    void set_min_level(LogLevel level) noexcept;
    LogLevel get_min_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    // Enable/disable specific categories
    void enable_category(LogCategory category, bool enabled = true) noexcept;
    bool is_category_enabled(LogCategory category) const noexcept;

    // Silence console output (tests, tools that own stdout)
    void set_console_enabled(bool enabled) noexcept { console_enabled_.store(enabled, std::memory_order_relaxed); }
    bool is_console_enabled() const noexcept { return console_enabled_.load(std::memory_order_relaxed); }

    // Core logging function with compile-time optimization
    template<LogLevel Level, LogCategory Category = LogCategory::General>
    void log(std::string_view message,
             const std::source_location& location = std::source_location::current()) {
        if constexpr (Level < COMPILE_TIME_LOG_LEVEL) {
            return;
        }

        if (!should_log(Level, Category)) {
            return;
        }

        log_impl(Level, Category, message, location);
    }

    // Formatted logging with std::format support
    template<LogLevel Level, LogCategory Category = LogCategory::General, typename... Args>
    void log_fmt(const std::source_location& location, std::format_string<Args...> fmt, Args&&... args) {
        if constexpr (Level < COMPILE_TIME_LOG_LEVEL) {
            return;
        }

        if (!should_log(Level, Category)) {
            return;
        }

        try {
            std::string formatted = std::format(fmt, std::forward<Args>(args)...);
            log_impl(Level, Category, formatted, location);
        } catch (const std::exception& e) {
            log_impl(LogLevel::Error, LogCategory::General,
                     std::format("Log formatting error: {}", e.what()), location);
        }
    }

    // Flush pending logs to disk
    void flush();

    // Get statistics
    struct Stats {
        uint64_t total_logs = 0;
        uint64_t dropped_logs = 0;
        uint64_t file_writes = 0;
        uint64_t console_writes = 0;
    };
    Stats get_stats() const noexcept;

    // Public logging implementation for advanced use cases (e.g., ScopedTimer)
    void log_impl(LogLevel level, LogCategory category, std::string_view message,
                  const std::source_location& location);

    static const char* level_to_string(LogLevel level) noexcept;
    static const char* category_to_string(LogCategory category) noexcept;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(LogLevel level, LogCategory category) const noexcept {
        return level >= min_level_.load(std::memory_order_relaxed) && is_category_enabled(category);
    }

    void write_to_file(std::string_view formatted_message);
    void write_to_console(LogLevel level, std::string_view formatted_message);

    std::string format_log_entry(LogLevel level, LogCategory category,
                                 std::string_view message,
                                 const std::source_location& location) const;

    static const char* level_to_color_code(LogLevel level) noexcept;

    // Configuration
    std::atomic<LogLevel> min_level_{COMPILE_TIME_LOG_LEVEL};
    std::atomic<uint32_t> enabled_categories_{0xFFFFFFFF}; // All enabled by default
    std::atomic<bool> console_enabled_{LOG_TO_CONSOLE};

    // File handling
    std::ofstream log_file_;
    std::string log_file_path_;
    std::mutex file_mutex_;

    // Statistics
    mutable std::atomic<uint64_t> total_logs_{0};
    mutable std::atomic<uint64_t> dropped_logs_{0};
    mutable std::atomic<uint64_t> file_writes_{0};
    mutable std::atomic<uint64_t> console_writes_{0};

    // Initialization state
    std::atomic<bool> initialized_{false};
};

} // namespace sinew::core

// Convenience macros with compile-time optimization
#define LOG_TRACE(category, ...) \
    ::sinew::core::Logger::instance().log_fmt<::sinew::core::LogLevel::Trace, ::sinew::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(category, ...) \
    ::sinew::core::Logger::instance().log_fmt<::sinew::core::LogLevel::Debug, ::sinew::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(category, ...) \
    ::sinew::core::Logger::instance().log_fmt<::sinew::core::LogLevel::Info, ::sinew::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_WARNING(category, ...) \
    ::sinew::core::Logger::instance().log_fmt<::sinew::core::LogLevel::Warning, ::sinew::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(category, ...) \
    ::sinew::core::Logger::instance().log_fmt<::sinew::core::LogLevel::Error, ::sinew::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(category, ...) \
    ::sinew::core::Logger::instance().log_fmt<::sinew::core::LogLevel::Critical, ::sinew::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

// Scoped performance timing
#define LOG_SCOPE_TIMER(name) \
    ::sinew::core::ScopedTimer SINEW_UNIQUE_NAME(timer_)(name)

#define LOG_SCOPE_TIMER_CAT(name, category) \
    ::sinew::core::ScopedTimer SINEW_UNIQUE_NAME(timer_)(name, ::sinew::core::LogCategory::category)

// Helper macro for unique variable names
#define SINEW_CONCAT_IMPL(a, b) a##b
#define SINEW_CONCAT(a, b) SINEW_CONCAT_IMPL(a, b)
#define SINEW_UNIQUE_NAME(prefix) SINEW_CONCAT(prefix, __LINE__)
