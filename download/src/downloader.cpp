/**
 * @file downloader.cpp
 * @brief Backend fallback orchestrator implementation
 */

#include "netfetch/download/downloader.hpp"

#include "netfetch/download/file_sink.hpp"

#include <netfetch/common/debug.hpp>

#include <variant>
#include <vector>

namespace netfetch::download {

using namespace common::debug;
using common::ErrorCode;
using transport::http::DownloadFn;

namespace {

/**
 * @brief Run one backend into a freshly created file
 */
common::Result<void> fetch_into_file(const DownloadFn& download, const common::Url& url,
                                     const std::filesystem::path& path,
                                     const EventCallback& callback) {
    auto created = FileSink::create(path);
    if (created.is_error()) {
        return std::move(created).error();
    }
    FileSink sink = std::move(created).value();

    auto result = download(url, [&](const Event& event) -> common::Result<void> {
        if (const auto* data = std::get_if<DataReceived>(&event)) {
            NETFETCH_TRY(sink.write(data->data));
        }
        if (callback) {
            return callback(event);
        }
        return common::ok();
    });

    if (result.is_success()) {
        result = sink.commit();
    }
    if (result.is_error()) {
        sink.discard();
    }
    return result;
}

/**
 * @brief The fallback policy, shared by the streaming and file entry points
 */
template<typename Attempt>
common::Result<void> fall_back(std::span<const BackendStrategy> strategies,
                               const common::Url& url, Attempt&& attempt) {
    for (const auto& strategy : strategies) {
        Span span("backend attempt", category::DOWNLOAD);
        span.add_context("backend", transport::http::backend_name(strategy.backend));

        auto result = attempt(strategy);
        if (result.is_error()) {
            span.set_error(result.error());
        }
        if (result.is_error() && result.code() == ErrorCode::BACKEND_UNAVAILABLE) {
            NETFETCH_LOG_DEBUG(category::DOWNLOAD,
                               "Backend " << transport::http::backend_name(strategy.backend)
                                          << " unavailable, trying next");
            continue;
        }
        if (result.is_error()) {
            NETFETCH_LOG_WARN(category::DOWNLOAD,
                              "Download of " << url.to_string() << " with "
                                             << transport::http::backend_name(strategy.backend)
                                             << " failed: " << result.message());
        } else {
            NETFETCH_LOG_DEBUG(category::DOWNLOAD,
                               "Downloaded " << url.to_string() << " with "
                                             << transport::http::backend_name(strategy.backend));
        }
        return result;
    }

    NETFETCH_LOG_WARN(category::DOWNLOAD, "No working backend for " << url.to_string());
    return common::err(ErrorCode::NO_WORKING_BACKENDS, "no working backends");
}

}  // anonymous namespace

std::span<const BackendStrategy> default_strategy_table() {
    static const std::vector<BackendStrategy> table = transport::http::default_strategies();
    return table;
}

// ============================================================================
// STREAMING
// ============================================================================

common::Result<void> attempt_download(const common::Url& url, const EventCallback& callback) {
    return attempt_download(default_strategy_table(), url, callback);
}

common::Result<void> attempt_download(std::span<const BackendStrategy> strategies,
                                      const common::Url& url, const EventCallback& callback) {
    return fall_back(strategies, url, [&](const BackendStrategy& strategy) {
        return strategy.download(url, callback);
    });
}

common::Result<void> download_with_backend(Backend backend, const common::Url& url,
                                           const EventCallback& callback,
                                           const DownloadOptions& options) {
    return transport::http::make_backend(backend, options)(url, callback);
}

// ============================================================================
// TO FILE
// ============================================================================

common::Result<void> attempt_download_to_path(const common::Url& url,
                                              const std::filesystem::path& path,
                                              const EventCallback& callback) {
    return attempt_download_to_path(default_strategy_table(), url, path, callback);
}

common::Result<void> attempt_download_to_path(std::span<const BackendStrategy> strategies,
                                              const common::Url& url,
                                              const std::filesystem::path& path,
                                              const EventCallback& callback) {
    return fall_back(strategies, url, [&](const BackendStrategy& strategy) {
        return fetch_into_file(strategy.download, url, path, callback);
    });
}

common::Result<void> download_to_path_with_backend(Backend backend, const common::Url& url,
                                                   const std::filesystem::path& path,
                                                   const EventCallback& callback,
                                                   const DownloadOptions& options) {
    return fetch_into_file(transport::http::make_backend(backend, options), url, path, callback);
}

}  // namespace netfetch::download
