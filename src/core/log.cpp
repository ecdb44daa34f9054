#include <sinew/core/log.hpp>

#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <ctime>

namespace sinew::core {

// ANSI color codes for console output
namespace {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* GRAY = "\033[90m";
    constexpr const char* CYAN = "\033[96m";
    constexpr const char* GREEN = "\033[92m";
    constexpr const char* YELLOW = "\033[93m";
    constexpr const char* RED = "\033[91m";
    constexpr const char* BOLD_RED = "\033[1;91m";

    std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm;
#ifdef _WIN32
        localtime_s(&tm, &time_t);
#else
        localtime_r(&time_t, &tm);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
}

// ScopedTimer Implementation
ScopedTimer::ScopedTimer(std::string_view name, LogCategory category)
    : name_(name)
    , category_(category)
    , start_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);

    Logger& logger = Logger::instance();
    if (!logger.is_category_enabled(category_) || LogLevel::Debug < logger.get_min_level()) {
        return;
    }

    std::string message = std::format("{} took {:.3f}ms", name_, duration.count() / 1000.0);
    logger.log_impl(LogLevel::Debug, category_, message, std::source_location::current());
}

// Logger Implementation
Logger::Logger() = default;

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path, bool append, LogLevel min_level) {
    if (initialized_.exchange(true, std::memory_order_acquire)) {
        return; // Already initialized
    }

    log_file_path_ = log_file_path;
    min_level_.store(min_level, std::memory_order_relaxed);

    // Create log directory if it doesn't exist
    std::filesystem::path log_path(log_file_path);
    if (log_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
        if (ec) {
            std::cerr << "Failed to create log directory: " << log_path.parent_path().string()
                      << " (" << ec.message() << ")" << std::endl;
        }
    }

    std::ios_base::openmode mode = std::ios::out;
    if (append) {
        mode |= std::ios::app;
    } else {
        mode |= std::ios::trunc;
    }

    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        log_file_.open(log_file_path, mode);
        opened = log_file_.is_open();
    }
    if (!opened) {
        std::cerr << "Failed to open log file: " << log_file_path << std::endl;
        return;
    }

    log_impl(LogLevel::Info, LogCategory::General,
             std::format("Sinew logger initialized - Log file: {}", log_file_path),
             std::source_location::current());

    log_impl(LogLevel::Info, LogCategory::General,
             std::format("Compile-time log level: {}", level_to_string(COMPILE_TIME_LOG_LEVEL)),
             std::source_location::current());
}

void Logger::shutdown() {
    if (!initialized_.load(std::memory_order_acquire)) {
        return;
    }

    log_impl(LogLevel::Info, LogCategory::General,
             "Logger shutting down",
             std::source_location::current());

    auto stats = get_stats();
    log_impl(LogLevel::Info, LogCategory::General,
             std::format("Logger stats - Total: {} | Dropped: {} | File writes: {} | Console writes: {}",
                         stats.total_logs, stats.dropped_logs, stats.file_writes, stats.console_writes),
             std::source_location::current());

    flush();

    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    initialized_.store(false, std::memory_order_release);
}

void Logger::set_min_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

void Logger::enable_category(LogCategory category, bool enabled) noexcept {
    uint32_t mask = 1u << static_cast<uint32_t>(category);

    if (enabled) {
        enabled_categories_.fetch_or(mask, std::memory_order_relaxed);
    } else {
        enabled_categories_.fetch_and(~mask, std::memory_order_relaxed);
    }
}

bool Logger::is_category_enabled(LogCategory category) const noexcept {
    uint32_t mask = 1u << static_cast<uint32_t>(category);
    return (enabled_categories_.load(std::memory_order_relaxed) & mask) != 0;
}

void Logger::log_impl(LogLevel level, LogCategory category, std::string_view message,
                      const std::source_location& location) {
    total_logs_.fetch_add(1, std::memory_order_relaxed);

    std::string formatted = format_log_entry(level, category, message, location);

    if (initialized_.load(std::memory_order_acquire)) {
        write_to_file(formatted);
    }

    if (console_enabled_.load(std::memory_order_relaxed)) {
        write_to_console(level, formatted);
    }
}

void Logger::write_to_file(std::string_view formatted_message) {
    std::lock_guard<std::mutex> lock(file_mutex_);

    if (log_file_.is_open()) {
        log_file_ << formatted_message << '\n';
        file_writes_.fetch_add(1, std::memory_order_relaxed);
    } else {
        dropped_logs_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Logger::write_to_console(LogLevel level, std::string_view formatted_message) {
    const char* color = level_to_color_code(level);

    if (level >= LogLevel::Error) {
        std::cerr << color << formatted_message << RESET << std::endl;
    } else {
        std::cout << color << formatted_message << RESET << std::endl;
    }

    console_writes_.fetch_add(1, std::memory_order_relaxed);
}

std::string Logger::format_log_entry(LogLevel level, LogCategory category,
                                     std::string_view message,
                                     const std::source_location& location) const {
    // Format: [TIMESTAMP] [LEVEL] [CATEGORY] message (file:line)
    std::ostringstream oss;

    oss << "[" << get_timestamp() << "] "
        << "[" << level_to_string(level) << "] "
        << "[" << category_to_string(category) << "] "
        << message;

    // Add source location for debug/trace levels
    if (level <= LogLevel::Debug) {
        std::filesystem::path file_path(location.file_name());
        oss << " (" << file_path.filename().string() << ":" << location.line() << ")";
    }

    return oss.str();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

Logger::Stats Logger::get_stats() const noexcept {
    Stats stats;
    stats.total_logs = total_logs_.load(std::memory_order_relaxed);
    stats.dropped_logs = dropped_logs_.load(std::memory_order_relaxed);
    stats.file_writes = file_writes_.load(std::memory_order_relaxed);
    stats.console_writes = console_writes_.load(std::memory_order_relaxed);
    return stats;
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRIT";
        default: return "UNKNOWN";
    }
}

const char* Logger::category_to_string(LogCategory category) noexcept {
    switch (category) {
        case LogCategory::General: return "General";
        case LogCategory::Anatomy: return "Anatomy";
        case LogCategory::Combat: return "Combat";
        case LogCategory::Equipment: return "Equipment";
        case LogCategory::Assets: return "Assets";
        case LogCategory::Performance: return "Perf";
        default: return "Unknown";
    }
}

const char* Logger::level_to_color_code(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info: return GREEN;
        case LogLevel::Warning: return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Critical: return BOLD_RED;
        default: return RESET;
    }
}

} // namespace sinew::core
