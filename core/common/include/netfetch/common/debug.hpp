#pragma once

/**
 * @file debug.hpp
 * @brief Debug and logging system for netfetch
 *
 * Features:
 * - Hierarchical log levels
 * - Category-based filtering
 * - Automatic source location capture
 * - Scope-based timing (spans)
 * - Thread-safe logging
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace netfetch::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    TRACE = 0,  // Finest granularity, very verbose
    DEBUG = 1,  // Debugging information
    INFO  = 2,  // Informational messages
    WARN  = 3,  // Warning conditions
    ERROR = 4,  // Error conditions
    FATAL = 5,  // Fatal errors
    OFF   = 6   // Logging disabled
};

/**
 * @brief Get log level name
 */
constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Get short level name (1 char)
 */
constexpr char level_char(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return 'T';
        case LogLevel::DEBUG:
            return 'D';
        case LogLevel::INFO:
            return 'I';
        case LogLevel::WARN:
            return 'W';
        case LogLevel::ERROR:
            return 'E';
        case LogLevel::FATAL:
            return 'F';
        default:
            return '?';
    }
}

/**
 * @brief Parse log level from string
 *
 * Unknown names map to INFO.
 */
NETFETCH_API LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

/**
 * @brief Predefined log categories for filtering
 */
namespace category {
constexpr std::string_view GENERAL   = "general";
constexpr std::string_view TRANSPORT = "transport";
constexpr std::string_view SECURITY  = "security";
constexpr std::string_view DOWNLOAD  = "download";
constexpr std::string_view CONFIG    = "config";
}  // namespace category

// ============================================================================
// LOG RECORD
// ============================================================================

/**
 * @brief A single log entry with all context
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;

    std::chrono::system_clock::time_point timestamp;

    uint64_t thread_id = 0;
};

// ============================================================================
// LOG SINK INTERFACE
// ============================================================================

/**
 * @brief Interface for log output destinations
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log record
     */
    virtual void write(const LogRecord& record) = 0;

    /**
     * @brief Flush pending writes
     */
    virtual void flush() = 0;

    /**
     * @brief Check if sink is ready to accept logs
     */
    virtual bool is_ready() const noexcept = 0;
};

// ============================================================================
// BUILT-IN LOG SINKS
// ============================================================================

/**
 * @brief Console log sink with optional color support
 *
 * Writes to stderr by default so that downloaded bytes sent to stdout
 * are never interleaved with log lines.
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool use_stderr        = true;
        bool include_timestamp = true;
        bool include_thread_id = false;
        bool include_location  = false;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * @brief File log sink with rotation support
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size = 10 * 1024 * 1024;  // 10MB
        uint32_t max_files   = 5;
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Callback-based sink for custom handling
 */
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void write(const LogRecord& record) override {
        if (callback_)
            callback_(record);
    }

    void flush() override {}
    bool is_ready() const noexcept override { return callback_ != nullptr; }

private:
    Callback callback_;
};

// ============================================================================
// LOG FILTER
// ============================================================================

/**
 * @brief Log filtering configuration
 */
class LogFilter {
public:
    LogFilter() = default;

    /**
     * @brief Set global minimum log level
     */
    void set_level(LogLevel level) noexcept { global_level_ = level; }

    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Set level for specific category
     */
    void set_category_level(std::string_view category, LogLevel level);

    /**
     * @brief Check if a log should be emitted
     */
    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /**
     * @brief Reset all filters to defaults
     */
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogLevel> category_levels_;
};

// ============================================================================
// LOGGER
// ============================================================================

/**
 * @brief Thread-safe logger with multiple sinks
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& instance() noexcept;

    /**
     * @brief Add a log sink
     */
    void add_sink(std::shared_ptr<ILogSink> sink);

    /**
     * @brief Remove all sinks
     */
    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    /**
     * @brief Check if logging is enabled for level/category
     */
    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    /**
     * @brief Log a message
     */
    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = NETFETCH_CURRENT_LOCATION);

    /**
     * @brief Flush all sinks
     */
    void flush();

private:
    Logger();
    ~Logger();

    void dispatch(const LogRecord& record);

    LogFilter filter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

// ============================================================================
// SPAN (TIMING SCOPE)
// ============================================================================

/**
 * @brief RAII scope for timing operations and logging duration
 */
class Span {
public:
    Span(std::string_view name, std::string_view category = category::GENERAL,
         SourceLocation loc = NETFETCH_CURRENT_LOCATION);
    ~Span();

    Span(const Span&)            = delete;
    Span& operator=(const Span&) = delete;

    Span& add_context(std::string_view key, std::string_view value);
    Span& add_context(std::string_view key, uint64_t value);

    /**
     * @brief Mark span as failed
     */
    void set_error(const Error& error);

    std::chrono::nanoseconds elapsed() const noexcept;

private:
    std::string name_;
    std::string_view category_;
    SourceLocation location_;
    std::chrono::steady_clock::time_point start_time_;
    std::vector<std::pair<std::string, std::string>> context_;

    bool has_error_       = false;
    ErrorCode error_code_ = ErrorCode::SUCCESS;
    std::string error_message_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define NETFETCH_LOG_ENABLED(level, cat)                  \
    ::netfetch::common::debug::Logger::instance().is_enabled( \
        ::netfetch::common::debug::LogLevel::level, cat)

#define NETFETCH_LOG_IMPL(level, category, ...)                                              \
    do {                                                                                     \
        auto& _nf_logger = ::netfetch::common::debug::Logger::instance();                    \
        if (_nf_logger.is_enabled(::netfetch::common::debug::LogLevel::level, category)) {   \
            std::ostringstream _nf_oss;                                                      \
            _nf_oss << __VA_ARGS__;                                                          \
            _nf_logger.log(::netfetch::common::debug::LogLevel::level, category,             \
                           _nf_oss.str(), NETFETCH_CURRENT_LOCATION);                        \
        }                                                                                    \
    } while (0)

#define NETFETCH_LOG_TRACE(cat, ...) NETFETCH_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define NETFETCH_LOG_DEBUG(cat, ...) NETFETCH_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define NETFETCH_LOG_INFO(cat, ...)  NETFETCH_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define NETFETCH_LOG_WARN(cat, ...)  NETFETCH_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define NETFETCH_LOG_ERROR(cat, ...) NETFETCH_LOG_IMPL(ERROR, cat, __VA_ARGS__)
#define NETFETCH_LOG_FATAL(cat, ...) NETFETCH_LOG_IMPL(FATAL, cat, __VA_ARGS__)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Initialize the logging system
 *
 * NETFETCH_LOG_LEVEL in the environment overrides @p level.
 */
NETFETCH_API void init_logging(LogLevel level = LogLevel::INFO);

/**
 * @brief Shutdown logging system cleanly
 */
NETFETCH_API void shutdown_logging();

}  // namespace netfetch::common::debug
