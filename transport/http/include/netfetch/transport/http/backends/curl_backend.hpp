#pragma once

/**
 * @file curl_backend.hpp
 * @brief libcurl download backend
 *
 * Features:
 * - HTTP/1.1 and HTTP/2 as negotiated by libcurl
 * - TLS with the system CA bundle
 * - Connection reuse through a per-thread easy handle cache
 * - Redirects, connect timeout and low-speed abort
 */

#include "../download_backend.hpp"
#include "../handle_cache.hpp"

#include <memory>
#include <string>

namespace netfetch::transport::http {

/**
 * @brief Destroys a libcurl easy handle
 */
struct CurlEasyDeleter {
    void operator()(void* handle) const noexcept;
};

/// libcurl's CURL is an opaque void
using CurlHandleCache = HandleCache<void, CurlEasyDeleter>;

/**
 * @brief libcurl download backend
 */
class CurlBackend {
public:
    /**
     * @param cache Handle cache to lease easy handles from; the process-wide
     *              cache when null
     */
    explicit CurlBackend(DownloadOptions options = {},
                         std::shared_ptr<CurlHandleCache> cache = nullptr);

    /**
     * @brief Fetch @p url, streaming events to @p callback
     */
    common::Result<void> download(const common::Url& url, const EventCallback& callback) const;

    const std::shared_ptr<CurlHandleCache>& cache() const noexcept { return cache_; }

    static bool available() noexcept;
    static std::string version();

    /**
     * @brief New cache creating and resetting libcurl easy handles
     */
    static std::shared_ptr<CurlHandleCache> make_cache();

    /**
     * @brief Cache shared by every CurlBackend built without one
     */
    static std::shared_ptr<CurlHandleCache> shared_cache();

private:
    DownloadOptions options_;
    std::shared_ptr<CurlHandleCache> cache_;
};

}  // namespace netfetch::transport::http
