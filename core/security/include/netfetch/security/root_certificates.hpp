#pragma once

/**
 * @file root_certificates.hpp
 * @brief Process-wide set of trusted root certificates
 *
 * The set is built once per process, on first use or through an explicit
 * initialize() call, and is read-only afterwards. It is never torn down.
 * Concurrent first uses converge on a single initialization.
 */

#include "tls_context.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netfetch::security {

/**
 * @brief Trust anchors loaded from PEM files on disk
 */
class RootCertificateSet {
public:
    /// Environment lookup, injectable for tests
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    /**
     * @brief Load every certificate of @p files
     *
     * Files that cannot be read or hold no certificate are skipped with a
     * warning.
     */
    explicit RootCertificateSet(const std::vector<std::string>& files);

    RootCertificateSet(RootCertificateSet&&) noexcept            = default;
    RootCertificateSet& operator=(RootCertificateSet&&) noexcept = default;

    /**
     * @brief The process-wide set, discovered on disk on first call
     */
    static const RootCertificateSet& instance();

    /**
     * @brief Build the process-wide set from an explicit file list
     *
     * @return false when the set was already initialized, in which case
     *         @p files is ignored
     */
    static bool initialize(const std::vector<std::string>& files);

    /**
     * @brief Locate certificate files on this host
     *
     * Order: $SSL_CERT_FILE, then the first well-known bundle that exists,
     * then every *.pem and *.crt file of $SSL_CERT_DIR (or /etc/ssl/certs).
     */
    static std::vector<std::string> discover_files();
    static std::vector<std::string> discover_files(const EnvLookup& env);

    /**
     * @brief Add every certificate of the set to @p context's trust store
     */
    Result<void> apply_to(TLSContext& context) const;

    const std::vector<Certificate>& certificates() const noexcept { return certificates_; }
    const std::vector<std::string>& loaded_files() const noexcept { return loaded_files_; }

    size_t size() const noexcept { return certificates_.size(); }
    bool empty() const noexcept { return certificates_.empty(); }

private:
    std::vector<Certificate> certificates_;
    std::vector<std::string> loaded_files_;
};

}  // namespace netfetch::security
