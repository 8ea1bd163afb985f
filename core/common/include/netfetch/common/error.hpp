#pragma once

/**
 * @file error.hpp
 * @brief Error handling system for netfetch
 *
 * This header provides:
 * - Hierarchical error codes organized by category
 * - Rich error context with source location
 * - Error propagation without masking
 * - Download-specific helpers (backend availability, HTTP status)
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(NETFETCH_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace netfetch::common {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Error categories for hierarchical classification
 *
 * Categories are grouped by functional area:
 * - 0x00xx: General/Common errors
 * - 0x01xx: I/O and Connection errors
 * - 0x02xx: Protocol errors
 * - 0x04xx: Configuration errors
 * - 0x05xx: Security errors
 * - 0x0Axx: Platform-specific errors
 * - 0x0Bxx: Download errors
 */
enum class ErrorCategory : uint8_t {
    GENERAL  = 0x00,
    IO       = 0x01,
    PROTOCOL = 0x02,
    CONFIG   = 0x04,
    SECURITY = 0x05,
    PLATFORM = 0x0A,
    DOWNLOAD = 0x0B,
};

/**
 * @brief Get category name as string
 */
constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:  return "General";
        case ErrorCategory::IO:       return "I/O";
        case ErrorCategory::PROTOCOL: return "Protocol";
        case ErrorCategory::CONFIG:   return "Configuration";
        case ErrorCategory::SECURITY: return "Security";
        case ErrorCategory::PLATFORM: return "Platform";
        case ErrorCategory::DOWNLOAD: return "Download";
        default:                      return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Error codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== General (0x00xx) ==========
    SUCCESS             = 0x0000,
    UNKNOWN_ERROR       = 0x0001,
    NOT_IMPLEMENTED     = 0x0002,
    INVALID_ARGUMENT    = 0x0003,
    INVALID_STATE       = 0x0004,
    OPERATION_CANCELLED = 0x0005,
    OPERATION_TIMEOUT   = 0x0006,
    NOT_FOUND           = 0x0008,

    // ========== I/O and Connection (0x01xx) ==========
    CONNECTION_FAILED   = 0x0100,
    CONNECTION_REFUSED  = 0x0101,
    CONNECTION_RESET    = 0x0102,
    CONNECTION_TIMEOUT  = 0x0103,
    CONNECTION_CLOSED   = 0x0104,
    DNS_RESOLUTION_FAILED = 0x0107,
    SOCKET_ERROR        = 0x0108,
    READ_ERROR          = 0x0109,
    WRITE_ERROR         = 0x010A,
    EOF_REACHED         = 0x010B,

    // ========== Protocol (0x02xx) ==========
    PROTOCOL_ERROR      = 0x0200,
    INVALID_MESSAGE     = 0x0201,
    INVALID_HEADER      = 0x0202,
    UNSUPPORTED_FEATURE = 0x0206,
    HANDSHAKE_FAILED    = 0x0207,
    TOO_MANY_REDIRECTS  = 0x020D,

    // ========== Configuration (0x04xx) ==========
    CONFIG_INVALID      = 0x0400,
    CONFIG_PARSE_ERROR  = 0x0402,
    CONFIG_TYPE_MISMATCH = 0x0404,
    CONFIG_FILE_NOT_FOUND = 0x0406,
    CONFIG_INVALID_VALUE = 0x0408,

    // ========== Security (0x05xx) ==========
    CERTIFICATE_ERROR   = 0x0502,
    CERTIFICATE_UNTRUSTED = 0x0505,
    SECURITY_SSL_INIT_FAILED = 0x050C,
    SECURITY_HANDSHAKE_FAILED = 0x050F,
    SECURITY_CRYPTO_ERROR = 0x0510,

    // ========== Platform (0x0Axx) ==========
    PLATFORM_ERROR      = 0x0A00,
    FEATURE_UNAVAILABLE = 0x0A01,
    SYSCALL_FAILED      = 0x0A02,
    FILE_NOT_FOUND      = 0x0A05,
    FILE_ACCESS_DENIED  = 0x0A06,

    // ========== Download (0x0Bxx) ==========
    BACKEND_UNAVAILABLE = 0x0B00,
    NO_WORKING_BACKENDS = 0x0B01,
    RESOURCE_NOT_FOUND  = 0x0B02,
    HTTP_STATUS         = 0x0B03,
    TRANSFER_STALLED    = 0x0B04,
    UNSUPPORTED_SCHEME  = 0x0B05,
    FILE_CREATE_FAILED  = 0x0B06,
    FILE_WRITE_FAILED   = 0x0B07,
    FILE_SYNC_FAILED    = 0x0B08,
    FILE_READ_FAILED    = 0x0B09,
    SOCKET_READ_FAILED  = 0x0B0A,
    TRANSFER_FAILED     = 0x0B0B,
};

/**
 * @brief Extract category from error code
 */
constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

/**
 * @brief Check if error code is success
 */
constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Get human-readable error name
 */
constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        // General
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR:        return "UNKNOWN_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:      return "NOT_IMPLEMENTED";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_STATE:        return "INVALID_STATE";
        case ErrorCode::OPERATION_CANCELLED:  return "OPERATION_CANCELLED";
        case ErrorCode::OPERATION_TIMEOUT:    return "OPERATION_TIMEOUT";
        case ErrorCode::NOT_FOUND:            return "NOT_FOUND";

        // I/O
        case ErrorCode::CONNECTION_FAILED:    return "CONNECTION_FAILED";
        case ErrorCode::CONNECTION_REFUSED:   return "CONNECTION_REFUSED";
        case ErrorCode::CONNECTION_RESET:     return "CONNECTION_RESET";
        case ErrorCode::CONNECTION_TIMEOUT:   return "CONNECTION_TIMEOUT";
        case ErrorCode::CONNECTION_CLOSED:    return "CONNECTION_CLOSED";
        case ErrorCode::DNS_RESOLUTION_FAILED: return "DNS_RESOLUTION_FAILED";
        case ErrorCode::SOCKET_ERROR:         return "SOCKET_ERROR";
        case ErrorCode::READ_ERROR:           return "READ_ERROR";
        case ErrorCode::WRITE_ERROR:          return "WRITE_ERROR";
        case ErrorCode::EOF_REACHED:          return "EOF_REACHED";

        // Protocol
        case ErrorCode::PROTOCOL_ERROR:       return "PROTOCOL_ERROR";
        case ErrorCode::INVALID_MESSAGE:      return "INVALID_MESSAGE";
        case ErrorCode::INVALID_HEADER:       return "INVALID_HEADER";
        case ErrorCode::UNSUPPORTED_FEATURE:  return "UNSUPPORTED_FEATURE";
        case ErrorCode::HANDSHAKE_FAILED:     return "HANDSHAKE_FAILED";
        case ErrorCode::TOO_MANY_REDIRECTS:   return "TOO_MANY_REDIRECTS";

        // Configuration
        case ErrorCode::CONFIG_INVALID:       return "CONFIG_INVALID";
        case ErrorCode::CONFIG_PARSE_ERROR:   return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_TYPE_MISMATCH: return "CONFIG_TYPE_MISMATCH";
        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";

        // Security
        case ErrorCode::CERTIFICATE_ERROR:    return "CERTIFICATE_ERROR";
        case ErrorCode::CERTIFICATE_UNTRUSTED: return "CERTIFICATE_UNTRUSTED";
        case ErrorCode::SECURITY_SSL_INIT_FAILED: return "SECURITY_SSL_INIT_FAILED";
        case ErrorCode::SECURITY_HANDSHAKE_FAILED: return "SECURITY_HANDSHAKE_FAILED";
        case ErrorCode::SECURITY_CRYPTO_ERROR: return "SECURITY_CRYPTO_ERROR";

        // Platform
        case ErrorCode::PLATFORM_ERROR:       return "PLATFORM_ERROR";
        case ErrorCode::FEATURE_UNAVAILABLE:  return "FEATURE_UNAVAILABLE";
        case ErrorCode::SYSCALL_FAILED:       return "SYSCALL_FAILED";
        case ErrorCode::FILE_NOT_FOUND:       return "FILE_NOT_FOUND";
        case ErrorCode::FILE_ACCESS_DENIED:   return "FILE_ACCESS_DENIED";

        // Download
        case ErrorCode::BACKEND_UNAVAILABLE:  return "BACKEND_UNAVAILABLE";
        case ErrorCode::NO_WORKING_BACKENDS:  return "NO_WORKING_BACKENDS";
        case ErrorCode::RESOURCE_NOT_FOUND:   return "RESOURCE_NOT_FOUND";
        case ErrorCode::HTTP_STATUS:          return "HTTP_STATUS";
        case ErrorCode::TRANSFER_STALLED:     return "TRANSFER_STALLED";
        case ErrorCode::UNSUPPORTED_SCHEME:   return "UNSUPPORTED_SCHEME";
        case ErrorCode::FILE_CREATE_FAILED:   return "FILE_CREATE_FAILED";
        case ErrorCode::FILE_WRITE_FAILED:    return "FILE_WRITE_FAILED";
        case ErrorCode::FILE_SYNC_FAILED:     return "FILE_SYNC_FAILED";
        case ErrorCode::FILE_READ_FAILED:     return "FILE_READ_FAILED";
        case ErrorCode::SOCKET_READ_FAILED:   return "SOCKET_READ_FAILED";
        case ErrorCode::TRANSFER_FAILED:      return "TRANSFER_FAILED";

        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for error tracking
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                            uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(NETFETCH_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(NETFETCH_HAS_SOURCE_LOCATION)
    #define NETFETCH_CURRENT_LOCATION ::netfetch::common::SourceLocation::current()
#else
    #define NETFETCH_CURRENT_LOCATION ::netfetch::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR CONTEXT
// ============================================================================

/**
 * @brief Rich error information with context
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept
        : code_(code) {}

    Error(ErrorCode code, std::string_view message) noexcept
        : code_(code), message_(message) {}

    Error(ErrorCode code, std::string_view message, SourceLocation loc) noexcept
        : code_(code), message_(message), location_(loc) {}

    // Copy constructor (deep copy cause chain)
    Error(const Error& other)
        : code_(other.code_)
        , message_(other.message_)
        , location_(other.location_)
        , context_(other.context_) {
        if (other.cause_) {
            cause_ = std::make_unique<Error>(*other.cause_);
        }
    }

    Error(Error&& other) noexcept = default;

    // Copy assignment (deep copy cause chain)
    Error& operator=(const Error& other) {
        if (this != &other) {
            code_ = other.code_;
            message_ = other.message_;
            location_ = other.location_;
            context_ = other.context_;
            cause_ = other.cause_ ? std::make_unique<Error>(*other.cause_) : nullptr;
        }
        return *this;
    }

    Error& operator=(Error&& other) noexcept = default;

    // Accessors
    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }

    // Status checks
    bool is_success() const noexcept { return netfetch::common::is_success(code_); }
    bool is_error() const noexcept { return !is_success(); }

    explicit operator bool() const noexcept { return is_success(); }

    // Get formatted error string
    std::string to_string() const;

    // Chain errors (for error wrapping)
    Error& with_cause(Error cause) {
        cause_ = std::make_unique<Error>(std::move(cause));
        return *this;
    }

    const Error* cause() const noexcept { return cause_.get(); }

    // Context addition
    Error& with_context(std::string_view key, std::string_view value);

    /// Value of the first context entry named @p key, if any
    std::optional<std::string_view> context(std::string_view key) const noexcept;

    const std::vector<std::pair<std::string, std::string>>& context_entries() const noexcept {
        return context_;
    }

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::unique_ptr<Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

/**
 * @brief Result type with rich error information
 */
template<typename T = void>
class Result;

// Specialization for void
template<>
class Result<void> {
public:
    // Success
    Result() noexcept = default;

    // Error from code
    Result(ErrorCode code) noexcept : error_(code) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = NETFETCH_CURRENT_LOCATION) noexcept
        : error_(code, message, loc) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Error access
    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const& noexcept { return error_; }
    Error&& error() && noexcept { return std::move(error_); }
    const std::string& message() const noexcept { return error_.message(); }

    // Chain errors
    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

    Result& with_context(std::string_view key, std::string_view value) {
        error_.with_context(key, value);
        return *this;
    }

private:
    Error error_;
};

// Specialization for non-void types
template<typename T>
class Result {
public:
    // Success with value
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (&storage_) T(std::move(value));
    }

    // Error from code
    Result(ErrorCode code) noexcept : error_(code), has_value_(false) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = NETFETCH_CURRENT_LOCATION) noexcept
        : error_(code, message, loc), has_value_(false) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)), has_value_(false) {}

    Result(const Result& other) : error_(other.error_), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(other.value_ref());
        }
    }

    Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : error_(std::move(other.error_)), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(std::move(other.value_ref()));
        }
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy_value();
            error_ = other.error_;
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(other.value_ref());
            }
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            destroy_value();
            error_ = std::move(other.error_);
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(std::move(other.value_ref()));
            }
        }
        return *this;
    }

    ~Result() {
        destroy_value();
    }

    // Status
    bool is_success() const noexcept { return has_value_; }
    bool is_error() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return is_success(); }

    // Value access (only call if is_success())
    T& value() & noexcept { return value_ref(); }
    const T& value() const& noexcept { return value_ref(); }
    T&& value() && noexcept { return std::move(value_ref()); }

    T value_or(T default_value) const& noexcept(std::is_nothrow_copy_constructible_v<T>) {
        return has_value_ ? value_ref() : std::move(default_value);
    }

    T value_or(T default_value) && noexcept(std::is_nothrow_move_constructible_v<T>) {
        return has_value_ ? std::move(value_ref()) : std::move(default_value);
    }

    // Error access
    ErrorCode code() const noexcept { return has_value_ ? ErrorCode::SUCCESS : error_.code(); }
    const Error& error() const& noexcept { return error_; }
    Error&& error() && noexcept { return std::move(error_); }
    const std::string& message() const noexcept { return error_.message(); }

    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    alignas(T) unsigned char storage_[sizeof(T)];
    Error error_;
    bool has_value_;

    T& value_ref() noexcept {
        return *reinterpret_cast<T*>(&storage_);
    }

    const T& value_ref() const noexcept {
        return *reinterpret_cast<const T*>(&storage_);
    }

    void destroy_value() noexcept {
        if (has_value_) {
            value_ref().~T();
            has_value_ = false;
        }
    }
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Result
 */
template<typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> ok() {
    return Result<void>();
}

/**
 * @brief Create an error Result
 */
template<typename T = void>
Result<T> err(ErrorCode code,
              std::string_view message = {},
              SourceLocation loc = NETFETCH_CURRENT_LOCATION) {
    return Result<T>(code, message, loc);
}

/**
 * @brief Create an error Result from Error object
 */
template<typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// DOWNLOAD ERROR HELPERS
// ============================================================================

/**
 * @brief A backend that was not compiled in
 *
 * The backend name is kept in the "backend" context entry.
 */
NETFETCH_API Error backend_unavailable(std::string_view backend_name,
                                       SourceLocation loc = NETFETCH_CURRENT_LOCATION);

/**
 * @brief Non-success HTTP status other than 404
 *
 * The numeric code is kept in the "http_status" context entry.
 */
NETFETCH_API Error http_status_error(uint32_t status,
                                     SourceLocation loc = NETFETCH_CURRENT_LOCATION);

/**
 * @brief Numeric status carried by an HTTP_STATUS error
 */
NETFETCH_API std::optional<uint32_t> http_status_of(const Error& error) noexcept;

/**
 * @brief Wrap a low-level failure, tagging it with the operation that failed
 */
NETFETCH_API Error io_failure(ErrorCode code, std::string_view operation, Error cause,
                              SourceLocation loc = NETFETCH_CURRENT_LOCATION);

/**
 * @brief Build an error from an errno value
 */
NETFETCH_API Error errno_error(ErrorCode code, int errnum, std::string_view what,
                               SourceLocation loc = NETFETCH_CURRENT_LOCATION);

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return early if result is error
 *
 * Usage: NETFETCH_TRY(some_function_returning_result());
 */
#define NETFETCH_TRY(expr)                                          \
    do {                                                            \
        auto _nf_result = (expr);                                   \
        if (NETFETCH_UNLIKELY(_nf_result.is_error())) {             \
            return std::move(_nf_result).error();                   \
        }                                                           \
    } while (0)

} // namespace netfetch::common
