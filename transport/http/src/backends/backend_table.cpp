/**
 * @file backend_table.cpp
 * @brief Backend registry and the default fallback table
 */

#include "netfetch/transport/http/download_backend.hpp"

#include "netfetch/transport/http/backends/beast_backend.hpp"
#include "netfetch/transport/http/backends/curl_backend.hpp"

namespace netfetch::transport::http {

std::optional<Backend> parse_backend(std::string_view name) noexcept {
    for (auto backend : kBackendOrder) {
        if (backend_name(backend) == name) {
            return backend;
        }
    }
    return std::nullopt;
}

bool is_backend_available(Backend backend) noexcept {
    switch (backend) {
        case Backend::CURL:
            return CurlBackend::available();
        case Backend::BEAST_ASIO_SSL:
        case Backend::BEAST_TLS_STREAM:
            return BeastBackend::available();
        default:
            return false;
    }
}

std::vector<Backend> available_backends() {
    std::vector<Backend> backends;
    for (auto backend : kBackendOrder) {
        if (is_backend_available(backend)) {
            backends.push_back(backend);
        }
    }
    return backends;
}

std::string backend_version(Backend backend) {
    switch (backend) {
        case Backend::CURL:
            return CurlBackend::version();
        case Backend::BEAST_ASIO_SSL:
            return BeastBackend::version(BeastTls::ASIO_SSL);
        case Backend::BEAST_TLS_STREAM:
            return BeastBackend::version(BeastTls::TLS_STREAM);
        default:
            return "unknown";
    }
}

DownloadFn make_backend(Backend backend, const DownloadOptions& options) {
    switch (backend) {
        case Backend::CURL: {
            CurlBackend curl(options);
            return [curl](const common::Url& url, const EventCallback& callback) {
                return curl.download(url, callback);
            };
        }
        case Backend::BEAST_ASIO_SSL:
        case Backend::BEAST_TLS_STREAM: {
            BeastBackend beast(backend == Backend::BEAST_ASIO_SSL ? BeastTls::ASIO_SSL
                                                                  : BeastTls::TLS_STREAM,
                               options);
            return [beast](const common::Url& url, const EventCallback& callback) {
                return beast.download(url, callback);
            };
        }
        default:
            return [backend](const common::Url&, const EventCallback&) {
                return common::Result<void>(common::backend_unavailable(backend_name(backend)));
            };
    }
}

std::vector<BackendStrategy> default_strategies(const DownloadOptions& options) {
    std::vector<BackendStrategy> strategies;
    strategies.reserve(kBackendOrder.size());
    for (auto backend : kBackendOrder) {
        strategies.push_back(BackendStrategy{backend, make_backend(backend, options)});
    }
    return strategies;
}

}  // namespace netfetch::transport::http
