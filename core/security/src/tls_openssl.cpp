/**
 * @file tls_openssl.cpp
 * @brief OpenSSL implementation of the TLS abstraction layer
 */

#include <netfetch/security/tls_context.hpp>
#include <netfetch/common/debug.hpp>

#if defined(NETFETCH_SSL_OPENSSL)

#include <atomic>
#include <cstring>
#include <mutex>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace netfetch::security {

using namespace common::debug;

namespace {

std::once_flag ssl_init_flag;
std::atomic<bool> ssl_initialized{false};

// Drain the thread's OpenSSL error queue into one message
std::string get_openssl_error() {
    std::string out;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) {
            out += "; ";
        }
        out += buf;
    }
    return out.empty() ? "Unknown error" : out;
}

int tls_version_to_openssl(TLSVersion version) {
    switch (version) {
        case TLSVersion::TLS_1_3:
            return TLS1_3_VERSION;
        case TLSVersion::TLS_1_2:
        case TLSVersion::AUTO:
        default:
            return TLS1_2_VERSION;
    }
}

TLSVersion openssl_version_to_tls(int version) {
    switch (version) {
        case TLS1_2_VERSION:
            return TLSVersion::TLS_1_2;
        case TLS1_3_VERSION:
            return TLSVersion::TLS_1_3;
        default:
            return TLSVersion::AUTO;
    }
}

}  // anonymous namespace

// ============================================================================
// Error mapping
// ============================================================================

common::ErrorCode to_error_code(SecurityError error) noexcept {
    using common::ErrorCode;
    switch (error) {
        case SecurityError::SUCCESS:
            return ErrorCode::SUCCESS;
        case SecurityError::INITIALIZATION_FAILED:
        case SecurityError::MEMORY_ALLOCATION_FAILED:
            return ErrorCode::SECURITY_SSL_INIT_FAILED;
        case SecurityError::CERTIFICATE_INVALID:
        case SecurityError::KEY_INVALID:
            return ErrorCode::CERTIFICATE_ERROR;
        case SecurityError::HANDSHAKE_FAILED:
            return ErrorCode::SECURITY_HANDSHAKE_FAILED;
        case SecurityError::VERIFICATION_FAILED:
            return ErrorCode::CERTIFICATE_UNTRUSTED;
        case SecurityError::FILE_NOT_FOUND:
            return ErrorCode::FILE_NOT_FOUND;
        case SecurityError::CONFIG_INVALID:
            return ErrorCode::CONFIG_INVALID_VALUE;
        case SecurityError::NOT_SUPPORTED:
            return ErrorCode::FEATURE_UNAVAILABLE;
        case SecurityError::CRYPTO_ERROR:
        case SecurityError::INTERNAL_ERROR:
        default:
            return ErrorCode::SECURITY_CRYPTO_ERROR;
    }
}

// ============================================================================
// Certificate Implementation
// ============================================================================

Certificate::~Certificate() {
    if (handle_) {
        X509_free(static_cast<X509*>(handle_));
    }
}

Certificate::Certificate(Certificate&& other) noexcept : handle_(other.handle_) {
    other.handle_ = nullptr;
}

Certificate& Certificate::operator=(Certificate&& other) noexcept {
    if (this != &other) {
        if (handle_) {
            X509_free(static_cast<X509*>(handle_));
        }
        handle_       = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

Certificate Certificate::adopt(void* handle) noexcept {
    Certificate cert;
    cert.handle_ = handle;
    return cert;
}

Result<std::vector<Certificate>> Certificate::all_from_pem_file(const std::string& path) {
    BIO* bio = BIO_new_file(path.c_str(), "r");
    if (!bio) {
        ERR_clear_error();
        return Result<std::vector<Certificate>>(SecurityError::FILE_NOT_FOUND,
                                                "Failed to open certificate file: " + path);
    }

    std::vector<Certificate> certs;
    // _AUX also accepts "TRUSTED CERTIFICATE" blocks
    while (X509* cert = PEM_read_bio_X509_AUX(bio, nullptr, nullptr, nullptr)) {
        certs.push_back(adopt(cert));
    }
    BIO_free(bio);

    // Reaching the end of the bundle leaves PEM_R_NO_START_LINE queued
    ERR_clear_error();

    if (certs.empty()) {
        return Result<std::vector<Certificate>>(SecurityError::CERTIFICATE_INVALID,
                                                "No certificate found in " + path);
    }
    return certs;
}

Result<Certificate> Certificate::from_pem_string(std::string_view pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return Result<Certificate>(SecurityError::MEMORY_ALLOCATION_FAILED, "Failed to create BIO");
    }

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) {
        return Result<Certificate>(SecurityError::CERTIFICATE_INVALID,
                                   "Failed to parse certificate: " + get_openssl_error());
    }

    return adopt(cert);
}

std::string Certificate::subject() const {
    if (!handle_)
        return {};

    X509_NAME* name = X509_get_subject_name(static_cast<X509*>(handle_));
    if (!name)
        return {};

    char buf[256];
    X509_NAME_oneline(name, buf, sizeof(buf));
    return buf;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::~PrivateKey() {
    if (handle_) {
        EVP_PKEY_free(static_cast<EVP_PKEY*>(handle_));
    }
}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept : handle_(other.handle_) {
    other.handle_ = nullptr;
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
        if (handle_) {
            EVP_PKEY_free(static_cast<EVP_PKEY*>(handle_));
        }
        handle_       = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

PrivateKey PrivateKey::adopt(void* handle) noexcept {
    PrivateKey key;
    key.handle_ = handle;
    return key;
}

Result<PrivateKey> PrivateKey::from_pem_string(std::string_view pem, std::string_view password) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return Result<PrivateKey>(SecurityError::MEMORY_ALLOCATION_FAILED, "Failed to create BIO");
    }

    std::string pass(password);
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr,
                                            pass.empty() ? nullptr : pass.data());
    BIO_free(bio);

    if (!key) {
        return Result<PrivateKey>(SecurityError::KEY_INVALID,
                                  "Failed to parse private key: " + get_openssl_error());
    }

    return adopt(key);
}

// ============================================================================
// OpenSSL TLS Context
// ============================================================================

class OpenSSLContext : public TLSContext {
public:
    explicit OpenSSLContext(const TLSConfig& config);
    ~OpenSSLContext() override;

    Result<void> load_certificate_chain(const std::string& path) override;
    Result<void> load_private_key(const std::string& path, std::string_view password) override;
    Result<void> load_ca_certificates(const std::string& path) override;
    Result<void> set_certificate(const Certificate& cert, const PrivateKey& key) override;
    Result<void> add_trusted_certificate(const Certificate& cert) override;

    void set_version(TLSVersion min, TLSVersion max) override;
    void set_verify_mode(VerifyMode mode) override;

    Result<std::unique_ptr<TLSSession>> create_session(std::string_view server_name) override;

    bool is_valid() const override { return ctx_ != nullptr; }

    /// First configuration failure, reported by TLSContext::create
    const std::optional<Result<void>>& setup_error() const noexcept { return setup_error_; }

private:
    void record(Result<void> result) {
        if (result.is_error() && !setup_error_) {
            setup_error_ = std::move(result);
        }
    }

    SSL_CTX* ctx_ = nullptr;
    TLSConfig config_;
    std::vector<uint8_t> alpn_data_;
    std::optional<Result<void>> setup_error_;
};

// ============================================================================
// OpenSSL TLS Session (memory BIO pair)
// ============================================================================

class OpenSSLSession : public TLSSession {
public:
    OpenSSLSession(SSL* ssl, BIO* rbio, BIO* wbio);
    ~OpenSSLSession() override;

    SessionStatus handshake() override;
    bool is_handshake_done() const override { return SSL_is_init_finished(ssl_) == 1; }

    SessionStatus read(void* buffer, size_t length, size_t& bytes_read) override;
    SessionStatus write(const void* buffer, size_t length, size_t& bytes_written) override;
    SessionStatus shutdown() override;

    size_t put_ciphertext(const void* data, size_t length) override;
    void put_eof() override;
    size_t pending_ciphertext() const override;
    size_t take_ciphertext(void* buffer, size_t length) override;

    TLSVersion get_version() const override;
    std::string get_cipher_name() const override;
    Result<Certificate> get_peer_certificate() const override;
    std::string get_error_string() const override { return last_error_; }

private:
    SessionStatus classify(int ret);

    SSL* ssl_;
    BIO* rbio_;  // ciphertext from the peer, owned by ssl_
    BIO* wbio_;  // ciphertext for the peer, owned by ssl_
    std::string last_error_;
};

OpenSSLContext::OpenSSLContext(const TLSConfig& config) : config_(config) {
    const SSL_METHOD* method =
        config.mode == TLSMode::SERVER ? TLS_server_method() : TLS_client_method();

    ctx_ = SSL_CTX_new(method);
    if (!ctx_) {
        return;
    }

    set_version(config.min_version, config.max_version);
    set_verify_mode(config.verify_mode);
    SSL_CTX_set_verify_depth(ctx_, config.verify_depth);

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Servers routinely close without close_notify once the body is sent
    SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (!config.cipher_list.empty() &&
        SSL_CTX_set_cipher_list(ctx_, config.cipher_list.c_str()) != 1) {
        record(Result<void>(SecurityError::CONFIG_INVALID,
                            "Invalid cipher list: " + get_openssl_error()));
    }

    if (!config.cert_file.empty()) {
        record(load_certificate_chain(config.cert_file));
    }
    if (!config.key_file.empty()) {
        record(load_private_key(config.key_file, config.key_password));
    }
    if (!config.ca_file.empty()) {
        record(load_ca_certificates(config.ca_file));
    }
    if (!config.ca_path.empty() &&
        SSL_CTX_load_verify_locations(ctx_, nullptr, config.ca_path.c_str()) != 1) {
        record(Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "Failed to load CA path: " + get_openssl_error()));
    }
    if (config.use_default_verify_paths && SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        record(Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "Failed to load default verify paths: " + get_openssl_error()));
    }

    if (!config.alpn_protocols.empty()) {
        for (const auto& proto : config.alpn_protocols) {
            alpn_data_.push_back(static_cast<uint8_t>(proto.size()));
            alpn_data_.insert(alpn_data_.end(), proto.begin(), proto.end());
        }
        if (config.mode == TLSMode::CLIENT &&
            SSL_CTX_set_alpn_protos(ctx_, alpn_data_.data(),
                                    static_cast<unsigned>(alpn_data_.size())) != 0) {
            record(Result<void>(SecurityError::CONFIG_INVALID, "Failed to set ALPN protocols"));
        }
    }
}

OpenSSLContext::~OpenSSLContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
}

Result<void> OpenSSLContext::load_certificate_chain(const std::string& path) {
    if (SSL_CTX_use_certificate_chain_file(ctx_, path.c_str()) != 1) {
        return Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "Failed to load certificate chain: " + get_openssl_error());
    }
    return Result<void>();
}

Result<void> OpenSSLContext::load_private_key(const std::string& path, std::string_view password) {
    std::string pass(password);
    if (!pass.empty()) {
        SSL_CTX_set_default_passwd_cb_userdata(ctx_, pass.data());
    }

    int rc = SSL_CTX_use_PrivateKey_file(ctx_, path.c_str(), SSL_FILETYPE_PEM);
    SSL_CTX_set_default_passwd_cb_userdata(ctx_, nullptr);
    if (rc != 1) {
        return Result<void>(SecurityError::KEY_INVALID,
                            "Failed to load private key: " + get_openssl_error());
    }

    if (SSL_CTX_check_private_key(ctx_) != 1) {
        return Result<void>(SecurityError::KEY_INVALID, "Private key does not match certificate");
    }

    return Result<void>();
}

Result<void> OpenSSLContext::load_ca_certificates(const std::string& path) {
    if (SSL_CTX_load_verify_locations(ctx_, path.c_str(), nullptr) != 1) {
        return Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "Failed to load CA certificates: " + get_openssl_error());
    }
    return Result<void>();
}

Result<void> OpenSSLContext::set_certificate(const Certificate& cert, const PrivateKey& key) {
    auto* x509 = static_cast<X509*>(cert.native_handle());
    auto* pkey = static_cast<EVP_PKEY*>(key.native_handle());
    if (!x509 || !pkey) {
        return Result<void>(SecurityError::CONFIG_INVALID, "Empty certificate or key");
    }

    // Both calls take their own reference
    if (SSL_CTX_use_certificate(ctx_, x509) != 1) {
        return Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "Failed to set certificate: " + get_openssl_error());
    }

    if (SSL_CTX_use_PrivateKey(ctx_, pkey) != 1) {
        return Result<void>(SecurityError::KEY_INVALID,
                            "Failed to set private key: " + get_openssl_error());
    }

    return Result<void>();
}

Result<void> OpenSSLContext::add_trusted_certificate(const Certificate& cert) {
    auto* x509 = static_cast<X509*>(cert.native_handle());
    if (!x509) {
        return Result<void>(SecurityError::CERTIFICATE_INVALID, "Empty certificate");
    }

    X509_STORE* store = SSL_CTX_get_cert_store(ctx_);
    if (X509_STORE_add_cert(store, x509) != 1) {
        unsigned long err = ERR_peek_last_error();
        if (ERR_GET_REASON(err) == X509_R_CERT_ALREADY_IN_HASH_TABLE) {
            ERR_clear_error();
            return Result<void>();
        }
        return Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "Failed to add trust anchor: " + get_openssl_error());
    }
    return Result<void>();
}

void OpenSSLContext::set_version(TLSVersion min, TLSVersion max) {
    SSL_CTX_set_min_proto_version(ctx_, tls_version_to_openssl(min));
    if (max != TLSVersion::AUTO) {
        SSL_CTX_set_max_proto_version(ctx_, tls_version_to_openssl(max));
    }
}

void OpenSSLContext::set_verify_mode(VerifyMode mode) {
    int ssl_mode;
    switch (mode) {
        case VerifyMode::NONE:
            if (config_.mode == TLSMode::CLIENT) {
                NETFETCH_LOG_WARN(category::SECURITY,
                                  "TLS certificate verification disabled, peer is not authenticated");
            }
            ssl_mode = SSL_VERIFY_NONE;
            break;
        case VerifyMode::PEER_OPTIONAL:
            ssl_mode = SSL_VERIFY_PEER;
            break;
        case VerifyMode::REQUIRED:
        default:
            ssl_mode = SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
            break;
    }
    SSL_CTX_set_verify(ctx_, ssl_mode, nullptr);
}

Result<std::unique_ptr<TLSSession>> OpenSSLContext::create_session(std::string_view server_name) {
    SSL* ssl = SSL_new(ctx_);
    if (!ssl) {
        return Result<std::unique_ptr<TLSSession>>(
            SecurityError::MEMORY_ALLOCATION_FAILED,
            "Failed to create SSL object: " + get_openssl_error());
    }

    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    if (!rbio || !wbio) {
        BIO_free(rbio);
        BIO_free(wbio);
        SSL_free(ssl);
        return Result<std::unique_ptr<TLSSession>>(SecurityError::MEMORY_ALLOCATION_FAILED,
                                                   "Failed to create memory BIO");
    }
    // An empty input buffer means "wait for more", not end of stream
    BIO_set_mem_eof_return(rbio, -1);
    SSL_set_bio(ssl, rbio, wbio);

    if (config_.mode == TLSMode::SERVER) {
        SSL_set_accept_state(ssl);
    } else {
        SSL_set_connect_state(ssl);
        if (!server_name.empty()) {
            std::string name(server_name);
            ASN1_OCTET_STRING* ip = a2i_IPADDRESS(name.c_str());
            if (ip) {
                // IP literals are checked against iPAddress SANs and get no SNI
                ASN1_OCTET_STRING_free(ip);
                X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), name.c_str());
            } else {
                SSL_set_tlsext_host_name(ssl, name.c_str());
                if (config_.verify_mode != VerifyMode::NONE) {
                    SSL_set1_host(ssl, name.c_str());
                }
            }
            ERR_clear_error();
        }
    }

    return Result<std::unique_ptr<TLSSession>>(std::make_unique<OpenSSLSession>(ssl, rbio, wbio));
}

// ============================================================================
// OpenSSL Session Implementation
// ============================================================================

OpenSSLSession::OpenSSLSession(SSL* ssl, BIO* rbio, BIO* wbio)
    : ssl_(ssl), rbio_(rbio), wbio_(wbio) {}

OpenSSLSession::~OpenSSLSession() {
    if (ssl_) {
        SSL_free(ssl_);
    }
}

SessionStatus OpenSSLSession::classify(int ret) {
    int err = SSL_get_error(ssl_, ret);
    switch (err) {
        case SSL_ERROR_NONE:
            return SessionStatus::OK;
        case SSL_ERROR_WANT_READ:
            return SessionStatus::WANT_READ;
        case SSL_ERROR_WANT_WRITE:
            return SessionStatus::WANT_WRITE;
        case SSL_ERROR_ZERO_RETURN:
            return SessionStatus::CLOSED;
        default: {
            last_error_ = get_openssl_error();
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK) {
                last_error_ += " (certificate verify failed: ";
                last_error_ += X509_verify_cert_error_string(verify);
                last_error_ += ")";
            }
            return SessionStatus::FAILED;
        }
    }
}

SessionStatus OpenSSLSession::handshake() {
    int ret = SSL_do_handshake(ssl_);
    if (ret == 1) {
        return SessionStatus::OK;
    }
    return classify(ret);
}

SessionStatus OpenSSLSession::read(void* buffer, size_t length, size_t& bytes_read) {
    bytes_read = 0;
    if (length == 0) {
        return SessionStatus::OK;
    }
    int ret = SSL_read_ex(ssl_, buffer, length, &bytes_read);
    if (ret == 1) {
        return SessionStatus::OK;
    }
    return classify(ret);
}

SessionStatus OpenSSLSession::write(const void* buffer, size_t length, size_t& bytes_written) {
    bytes_written = 0;
    if (length == 0) {
        return SessionStatus::OK;
    }
    int ret = SSL_write_ex(ssl_, buffer, length, &bytes_written);
    if (ret == 1) {
        return SessionStatus::OK;
    }
    return classify(ret);
}

SessionStatus OpenSSLSession::shutdown() {
    int ret = SSL_shutdown(ssl_);
    if (ret >= 0) {
        // 0: close_notify queued, peer's not yet seen; 1: both done
        return SessionStatus::OK;
    }
    return classify(ret);
}

size_t OpenSSLSession::put_ciphertext(const void* data, size_t length) {
    if (length == 0) {
        return 0;
    }
    int ret = BIO_write(rbio_, data, static_cast<int>(length));
    return ret > 0 ? static_cast<size_t>(ret) : 0;
}

void OpenSSLSession::put_eof() {
    BIO_set_mem_eof_return(rbio_, 0);
}

size_t OpenSSLSession::pending_ciphertext() const {
    return BIO_ctrl_pending(wbio_);
}

size_t OpenSSLSession::take_ciphertext(void* buffer, size_t length) {
    if (length == 0) {
        return 0;
    }
    int ret = BIO_read(wbio_, buffer, static_cast<int>(length));
    return ret > 0 ? static_cast<size_t>(ret) : 0;
}

TLSVersion OpenSSLSession::get_version() const {
    return openssl_version_to_tls(SSL_version(ssl_));
}

std::string OpenSSLSession::get_cipher_name() const {
    const SSL_CIPHER* cipher = SSL_get_current_cipher(ssl_);
    if (cipher) {
        return SSL_CIPHER_get_name(cipher);
    }
    return {};
}

Result<Certificate> OpenSSLSession::get_peer_certificate() const {
    X509* cert = SSL_get1_peer_certificate(ssl_);
    if (!cert) {
        return Result<Certificate>(SecurityError::CERTIFICATE_INVALID,
                                   "No peer certificate available");
    }
    return Certificate::adopt(cert);
}

// ============================================================================
// TLS Context Factory
// ============================================================================

Result<std::unique_ptr<TLSContext>> TLSContext::create(const TLSConfig& config) {
    auto init_result = initialize();
    if (!init_result.is_success()) {
        return Result<std::unique_ptr<TLSContext>>(init_result.error(),
                                                   init_result.error_message());
    }

    auto ctx = std::make_unique<OpenSSLContext>(config);
    if (!ctx->is_valid()) {
        return Result<std::unique_ptr<TLSContext>>(
            SecurityError::INITIALIZATION_FAILED,
            "Failed to create TLS context: " + get_openssl_error());
    }
    if (const auto& failure = ctx->setup_error()) {
        return Result<std::unique_ptr<TLSContext>>(failure->error(), failure->error_message());
    }

    return Result<std::unique_ptr<TLSContext>>(std::move(ctx));
}

std::string_view TLSContext::backend_name() {
    return "OpenSSL";
}

std::string TLSContext::backend_version() {
    return OpenSSL_version(OPENSSL_VERSION);
}

// ============================================================================
// Utility Functions
// ============================================================================

Result<void> initialize() {
    std::call_once(ssl_init_flag, []() {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr) == 1) {
            ssl_initialized.store(true);
        }
    });

    if (!ssl_initialized.load()) {
        return Result<void>(SecurityError::INITIALIZATION_FAILED, "Failed to initialize OpenSSL");
    }

    return Result<void>();
}

Result<std::vector<uint8_t>> random_bytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        return Result<std::vector<uint8_t>>(SecurityError::CRYPTO_ERROR,
                                            "Failed to generate random bytes");
    }
    return result;
}

}  // namespace netfetch::security

#endif  // NETFETCH_SSL_OPENSSL
