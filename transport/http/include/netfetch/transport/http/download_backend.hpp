#pragma once

/**
 * @file download_backend.hpp
 * @brief Download backends and the streaming event protocol
 *
 * A backend is a transport+TLS combination able to fetch a Url and stream
 * its bytes to an EventCallback. Which backends exist in a build is a
 * compile-time choice:
 * - CURL             libcurl (NETFETCH_HAS_CURL)
 * - BEAST_ASIO_SSL   Boost.Beast over boost::asio::ssl (NETFETCH_HAS_BEAST
 *                    and NETFETCH_SSL_OPENSSL)
 * - BEAST_TLS_STREAM Boost.Beast over TlsStream (NETFETCH_HAS_BEAST and
 *                    NETFETCH_SSL_OPENSSL)
 *
 * A backend missing from the build answers every call with
 * BACKEND_UNAVAILABLE and performs no I/O.
 */

#include "proxy.hpp"

#include <netfetch/common/error.hpp>
#include <netfetch/common/url.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace netfetch::transport::http {

//=============================================================================
// Backend Types
//=============================================================================

/**
 * @brief Available download backends
 */
enum class Backend : uint8_t {
    CURL,              ///< libcurl easy interface
    BEAST_ASIO_SSL,    ///< Boost.Beast, TLS by boost::asio::ssl
    BEAST_TLS_STREAM   ///< Boost.Beast, TLS by TlsStream
};

/**
 * @brief Fallback priority, shared by every download entry point
 */
inline constexpr std::array<Backend, 3> kBackendOrder = {
    Backend::CURL,
    Backend::BEAST_ASIO_SSL,
    Backend::BEAST_TLS_STREAM,
};

/**
 * @brief Get backend name
 */
constexpr std::string_view backend_name(Backend backend) noexcept {
    switch (backend) {
        case Backend::CURL:
            return "curl";
        case Backend::BEAST_ASIO_SSL:
            return "beast";
        case Backend::BEAST_TLS_STREAM:
            return "beast-tls";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a backend name as printed by backend_name()
 */
std::optional<Backend> parse_backend(std::string_view name) noexcept;

/**
 * @brief Check if a backend was compiled into this build
 */
bool is_backend_available(Backend backend) noexcept;

/**
 * @brief Backends compiled into this build, in fallback order
 */
std::vector<Backend> available_backends();

/**
 * @brief Library versions behind a backend, for diagnostics
 */
std::string backend_version(Backend backend);

//=============================================================================
// Events
//=============================================================================

/**
 * @brief Total body length advertised by the server
 */
struct ContentLengthReceived {
    uint64_t length = 0;
};

/**
 * @brief One chunk of body bytes
 *
 * The span borrows the producer's buffer and is only valid for the duration
 * of the callback invocation.
 */
struct DataReceived {
    std::span<const uint8_t> data;
};

using Event = std::variant<ContentLengthReceived, DataReceived>;

/**
 * @brief Receiver of transfer events
 *
 * Invoked sequentially on the calling thread. Returning an error aborts the
 * transfer; that error becomes the result of the download unchanged.
 */
using EventCallback = std::function<common::Result<void>(const Event&)>;

/// Body bytes are read and delivered in chunks of at most this size
inline constexpr size_t kChunkSize = 64 * 1024;

//=============================================================================
// Options
//=============================================================================

/**
 * @brief Transfer policy shared by all backends
 *
 * Fixed when the strategy table is built.
 */
struct DownloadOptions {
    /// Bound on TCP connect (and proxy tunnel / TLS handshake for Beast)
    std::chrono::milliseconds connect_timeout{30000};

    /// Abort when fewer than low_speed_limit bytes arrive in low_speed_time
    uint32_t low_speed_limit = 10;
    std::chrono::milliseconds low_speed_time{30000};

    bool follow_redirects  = true;
    uint32_t max_redirects = 10;

    std::string user_agent = "netfetch/" NETFETCH_VERSION_STRING;

    /// Verify the server certificate chain and host name
    bool verify_peer = true;

    /// Trust anchors for BEAST_TLS_STREAM; empty discovers them on disk
    std::vector<std::string> root_cert_files;

    /// Proxy lookup; proxy_from_env when empty
    std::function<std::optional<ProxyTarget>(const common::Url&)> proxy_resolver;
};

//=============================================================================
// Strategy Table
//=============================================================================

using DownloadFn = std::function<common::Result<void>(const common::Url&, const EventCallback&)>;

/**
 * @brief One row of the fallback table: a backend tag and its download function
 */
struct BackendStrategy {
    Backend backend;
    DownloadFn download;
};

/**
 * @brief The download function of one backend
 */
DownloadFn make_backend(Backend backend, const DownloadOptions& options = {});

/**
 * @brief One strategy per backend, in kBackendOrder
 */
std::vector<BackendStrategy> default_strategies(const DownloadOptions& options = {});

//=============================================================================
// Local files
//=============================================================================

/**
 * @brief Stream a file: URL in kChunkSize chunks
 *
 * Emits no ContentLengthReceived. A URL that does not denote an absolute
 * local path fails with INVALID_ARGUMENT, a missing path (or one that is
 * not a regular file) with RESOURCE_NOT_FOUND.
 */
common::Result<void> download_from_file_url(const common::Url& url,
                                            const EventCallback& callback);

}  // namespace netfetch::transport::http
