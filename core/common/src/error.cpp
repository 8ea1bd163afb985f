#include <netfetch/common/error.hpp>

#include <charconv>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace netfetch::common {

// ============================================================================
// Error Implementation
// ============================================================================

std::string Error::to_string() const {
    std::ostringstream oss;

    // Format: [CATEGORY] ERROR_NAME (0xXXXX): message
    oss << "[" << category_name(category()) << "] " << error_name(code_) << " (0x" << std::hex
        << std::setw(4) << std::setfill('0') << static_cast<uint32_t>(code_) << ")";

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    if (location_.is_valid()) {
        oss << "\n    at " << location_.file << ":" << std::dec << location_.line;
        if (location_.function[0] != '\0') {
            oss << " in " << location_.function;
        }
    }

    for (const auto& [key, value] : context_) {
        oss << "\n    " << key << ": " << value;
    }

    if (cause_) {
        oss << "\n  Caused by: " << cause_->to_string();
    }

    return oss.str();
}

Error& Error::with_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

std::optional<std::string_view> Error::context(std::string_view key) const noexcept {
    for (const auto& [k, v] : context_) {
        if (k == key) {
            return std::string_view(v);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Download Error Helpers
// ============================================================================

Error backend_unavailable(std::string_view backend_name, SourceLocation loc) {
    Error error(ErrorCode::BACKEND_UNAVAILABLE,
                "download backend '" + std::string(backend_name) + "' is not available", loc);
    error.with_context("backend", backend_name);
    return error;
}

Error http_status_error(uint32_t status, SourceLocation loc) {
    auto text = std::to_string(status);
    Error error(ErrorCode::HTTP_STATUS, "http request returned an unsuccessful status code: " + text,
                loc);
    error.with_context("http_status", text);
    return error;
}

std::optional<uint32_t> http_status_of(const Error& error) noexcept {
    if (error.code() != ErrorCode::HTTP_STATUS) {
        return std::nullopt;
    }
    auto text = error.context("http_status");
    if (!text) {
        return std::nullopt;
    }
    uint32_t status = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), status);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        return std::nullopt;
    }
    return status;
}

Error io_failure(ErrorCode code, std::string_view operation, Error cause, SourceLocation loc) {
    Error error(code, "i/o failure during " + std::string(operation), loc);
    error.with_context("operation", operation);
    error.with_cause(std::move(cause));
    return error;
}

Error errno_error(ErrorCode code, int errnum, std::string_view what, SourceLocation loc) {
    std::string message(what);
    message += ": ";
    message += std::strerror(errnum);
    Error error(code, message, loc);
    error.with_context("errno", std::to_string(errnum));
    return error;
}

}  // namespace netfetch::common
