#pragma once

/**
 * @file tls_context.hpp
 * @brief TLS context and session interface
 *
 * This header provides a TLS interface that hides the underlying SSL
 * library. The implementation is selected at compile time
 * (NETFETCH_SSL_OPENSSL).
 *
 * Unlike a socket-bound TLS wrapper, a TLSSession never touches a file
 * descriptor: it consumes and produces ciphertext through in-memory
 * buffers, so any byte stream can carry it (see TlsStream).
 *
 * Features:
 * - Certificate and key management
 * - Client and server context creation
 * - TLS version control
 * - Certificate verification with SNI and host name checking
 */

#include <netfetch/common/error.hpp>
#include <netfetch/common/platform.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netfetch::security {

// ============================================================================
// SIMPLE RESULT TYPE FOR SECURITY OPERATIONS
// ============================================================================

/**
 * @brief Security error codes
 */
enum class SecurityError : uint32_t {
    SUCCESS = 0,
    INITIALIZATION_FAILED,
    CERTIFICATE_INVALID,
    KEY_INVALID,
    HANDSHAKE_FAILED,
    VERIFICATION_FAILED,
    CRYPTO_ERROR,
    FILE_NOT_FOUND,
    MEMORY_ALLOCATION_FAILED,
    CONFIG_INVALID,
    NOT_SUPPORTED,
    INTERNAL_ERROR
};

/**
 * @brief Result type for security operations
 */
template<typename T>
class SecurityResult {
public:
    SecurityResult(T value) : value_(std::move(value)), error_(SecurityError::SUCCESS) {}
    SecurityResult(SecurityError error, std::string msg = {})
        : error_(error), error_message_(std::move(msg)) {}

    bool is_success() const noexcept { return error_ == SecurityError::SUCCESS; }
    bool is_error() const noexcept { return error_ != SecurityError::SUCCESS; }
    explicit operator bool() const noexcept { return is_success(); }

    SecurityError error() const noexcept { return error_; }
    const std::string& error_message() const noexcept { return error_message_; }

    T& value() & { return *value_; }
    const T& value() const& { return *value_; }
    T&& value() && { return std::move(*value_); }

private:
    std::optional<T> value_;
    SecurityError error_;
    std::string error_message_;
};

template<>
class SecurityResult<void> {
public:
    SecurityResult() : error_(SecurityError::SUCCESS) {}
    SecurityResult(SecurityError error, std::string msg = {})
        : error_(error), error_message_(std::move(msg)) {}

    bool is_success() const noexcept { return error_ == SecurityError::SUCCESS; }
    bool is_error() const noexcept { return error_ != SecurityError::SUCCESS; }
    explicit operator bool() const noexcept { return is_success(); }

    SecurityError error() const noexcept { return error_; }
    const std::string& error_message() const noexcept { return error_message_; }

private:
    SecurityError error_;
    std::string error_message_;
};

template<typename T = void>
using Result = SecurityResult<T>;

/**
 * @brief Map a security error onto the common error taxonomy
 */
NETFETCH_API common::ErrorCode to_error_code(SecurityError error) noexcept;

/**
 * @brief Convert a failed security result into a common::Error
 */
template<typename T>
common::Error to_error(const SecurityResult<T>& result,
                       common::SourceLocation loc = NETFETCH_CURRENT_LOCATION) {
    return common::Error(to_error_code(result.error()), result.error_message(), loc);
}

// ============================================================================
// FORWARD DECLARATIONS
// ============================================================================

class TLSContext;
class TLSSession;
class Certificate;
class PrivateKey;

// ============================================================================
// ENUMS AND CONSTANTS
// ============================================================================

/**
 * @brief TLS protocol versions
 */
enum class TLSVersion : uint8_t {
    TLS_1_2 = 0x12,  // Minimum accepted
    TLS_1_3 = 0x13,
    AUTO    = 0xFF   // Let library choose best
};

/**
 * @brief TLS context mode
 */
enum class TLSMode : uint8_t {
    CLIENT,
    SERVER
};

/**
 * @brief Certificate verification mode
 */
enum class VerifyMode : uint8_t {
    NONE,           // No verification (insecure)
    PEER_OPTIONAL,  // Verify if presented
    REQUIRED        // Must verify successfully
};

/**
 * @brief Progress of a non-blocking TLS operation
 */
enum class SessionStatus : uint8_t {
    OK,           // Operation completed
    WANT_READ,    // Needs more ciphertext from the peer
    WANT_WRITE,   // Produced ciphertext that must be flushed first
    CLOSED,       // Peer sent close_notify
    FAILED        // Fatal protocol or verification error
};

// ============================================================================
// CERTIFICATE AND KEY CLASSES
// ============================================================================

/**
 * @brief X.509 Certificate wrapper
 */
class Certificate {
public:
    Certificate() = default;
    ~Certificate();

    Certificate(Certificate&& other) noexcept;
    Certificate& operator=(Certificate&& other) noexcept;

    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    /**
     * @brief Load every certificate of a PEM bundle
     *
     * Non-certificate PEM blocks are skipped. Fails when the file cannot
     * be read or holds no certificate at all.
     */
    static Result<std::vector<Certificate>> all_from_pem_file(const std::string& path);

    /**
     * @brief Load certificate from PEM string
     */
    static Result<Certificate> from_pem_string(std::string_view pem);

    std::string subject() const;

    /**
     * @brief Get the internal handle (backend-specific)
     */
    void* native_handle() const { return handle_; }

    /**
     * @brief Take ownership of a backend handle
     */
    static Certificate adopt(void* handle) noexcept;

private:
    void* handle_ = nullptr;
};

/**
 * @brief Private key wrapper
 */
class PrivateKey {
public:
    PrivateKey() = default;
    ~PrivateKey();

    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey& operator=(PrivateKey&& other) noexcept;

    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /**
     * @brief Load private key from PEM string
     */
    static Result<PrivateKey> from_pem_string(
        std::string_view pem,
        std::string_view password = {});

    void* native_handle() const { return handle_; }

    static PrivateKey adopt(void* handle) noexcept;

private:
    void* handle_ = nullptr;
};

// ============================================================================
// TLS CONTEXT CONFIGURATION
// ============================================================================

/**
 * @brief TLS context configuration
 */
struct TLSConfig {
    TLSMode mode = TLSMode::CLIENT;

    TLSVersion min_version = TLSVersion::TLS_1_2;
    TLSVersion max_version = TLSVersion::AUTO;

    VerifyMode verify_mode = VerifyMode::REQUIRED;
    int verify_depth = 8;

    // Certificates and keys (server side, or client certificates)
    std::string cert_file;
    std::string key_file;
    std::string key_password;

    // Trust anchors. With use_default_verify_paths the library's own
    // store is consulted in addition to these.
    std::string ca_file;
    std::string ca_path;
    bool use_default_verify_paths = false;

    std::string cipher_list;

    std::vector<std::string> alpn_protocols;

    static TLSConfig default_client() {
        TLSConfig config;
        config.mode = TLSMode::CLIENT;
        return config;
    }

    static TLSConfig default_server() {
        TLSConfig config;
        config.mode = TLSMode::SERVER;
        config.verify_mode = VerifyMode::NONE;
        return config;
    }
};

// ============================================================================
// TLS CONTEXT
// ============================================================================

/**
 * @brief Abstract TLS context
 *
 * Use TLSContext::create() to get the implementation for the configured
 * backend. A context is shared by every session created from it and must
 * outlive them.
 */
class TLSContext {
public:
    virtual ~TLSContext() = default;

    /**
     * @brief Create a TLS context with the configured backend
     */
    static Result<std::unique_ptr<TLSContext>> create(const TLSConfig& config);

    static std::string_view backend_name();
    static std::string backend_version();

    // -------------------------------------------------------------------------
    // Certificate Management
    // -------------------------------------------------------------------------

    virtual Result<void> load_certificate_chain(const std::string& path) = 0;

    virtual Result<void> load_private_key(
        const std::string& path,
        std::string_view password = {}) = 0;

    virtual Result<void> load_ca_certificates(const std::string& path) = 0;

    /**
     * @brief Use an in-memory certificate and key as this endpoint's identity
     */
    virtual Result<void> set_certificate(const Certificate& cert, const PrivateKey& key) = 0;

    /**
     * @brief Add a trust anchor to the verification store
     */
    virtual Result<void> add_trusted_certificate(const Certificate& cert) = 0;

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    virtual void set_version(TLSVersion min, TLSVersion max) = 0;
    virtual void set_verify_mode(VerifyMode mode) = 0;

    // -------------------------------------------------------------------------
    // Session Creation
    // -------------------------------------------------------------------------

    /**
     * @brief Create a memory-buffered TLS session
     * @param server_name SNI name and expected certificate host for clients,
     *                    ignored for servers
     */
    virtual Result<std::unique_ptr<TLSSession>> create_session(std::string_view server_name = {}) = 0;

    virtual bool is_valid() const = 0;

protected:
    TLSContext() = default;
};

// ============================================================================
// TLS SESSION
// ============================================================================

/**
 * @brief Transport-independent TLS session
 *
 * The session is a state machine fed with ciphertext received from the
 * peer (put_ciphertext) and drained of ciphertext to send to the peer
 * (take_ciphertext). Plaintext goes in and out through write() and read().
 * A session is not thread-safe.
 */
class TLSSession {
public:
    virtual ~TLSSession() = default;

    /**
     * @brief Advance the handshake
     */
    virtual SessionStatus handshake() = 0;

    virtual bool is_handshake_done() const = 0;

    /**
     * @brief Decrypt up to @p length bytes of application data
     * @param bytes_read Set to the number of bytes produced
     */
    virtual SessionStatus read(void* buffer, size_t length, size_t& bytes_read) = 0;

    /**
     * @brief Encrypt up to @p length bytes of application data
     * @param bytes_written Set to the number of bytes consumed
     */
    virtual SessionStatus write(const void* buffer, size_t length, size_t& bytes_written) = 0;

    /**
     * @brief Queue a close_notify alert
     */
    virtual SessionStatus shutdown() = 0;

    // -------------------------------------------------------------------------
    // Ciphertext exchange
    // -------------------------------------------------------------------------

    /**
     * @brief Feed ciphertext received from the peer
     * @return Number of bytes accepted
     */
    virtual size_t put_ciphertext(const void* data, size_t length) = 0;

    /**
     * @brief Signal that the peer will send no more ciphertext
     */
    virtual void put_eof() = 0;

    /**
     * @brief Bytes of ciphertext waiting to be sent to the peer
     */
    virtual size_t pending_ciphertext() const = 0;

    /**
     * @brief Move pending ciphertext into @p buffer
     * @return Number of bytes copied
     */
    virtual size_t take_ciphertext(void* buffer, size_t length) = 0;

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------

    virtual TLSVersion get_version() const = 0;
    virtual std::string get_cipher_name() const = 0;
    virtual Result<Certificate> get_peer_certificate() const = 0;

    /**
     * @brief Description of the last failure (library error queue and
     *        certificate verification result)
     */
    virtual std::string get_error_string() const = 0;

protected:
    TLSSession() = default;
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Initialize the TLS library (idempotent)
 */
Result<void> initialize();

/**
 * @brief Generate a random byte array
 */
Result<std::vector<uint8_t>> random_bytes(size_t count);

} // namespace netfetch::security
