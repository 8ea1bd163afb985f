#pragma once

/**
 * @file beast_backend.hpp
 * @brief Boost.Beast download backend
 *
 * One HTTP/1.1 exchange per connection, over plain TCP or TLS. The TLS
 * layer is either boost::asio::ssl or the netfetch TlsStream adapter; the
 * request and response handling is shared.
 *
 * Features:
 * - Proxies (absolute-form requests for http, CONNECT tunnels for https)
 * - Redirects resolved against the current URL
 * - Connect timeout and low-speed abort
 */

#include "../download_backend.hpp"

#include <memory>
#include <string>

namespace netfetch::transport::http {

/**
 * @brief TLS implementation under the Beast backend
 */
enum class BeastTls : uint8_t {
    ASIO_SSL,    ///< boost::asio::ssl::stream
    TLS_STREAM   ///< security::TlsStream over a TLSSession
};

/**
 * @brief Boost.Beast download backend
 *
 * Copies share the lazily created TLS context.
 */
class BeastBackend {
public:
    explicit BeastBackend(BeastTls tls, DownloadOptions options = {});

    /**
     * @brief Fetch @p url, streaming events to @p callback
     */
    common::Result<void> download(const common::Url& url, const EventCallback& callback) const;

    BeastTls tls() const noexcept { return tls_; }

    static bool available() noexcept;
    static std::string version(BeastTls tls);

private:
    struct TlsState;

    BeastTls tls_;
    DownloadOptions options_;
    std::shared_ptr<TlsState> state_;
};

}  // namespace netfetch::transport::http
