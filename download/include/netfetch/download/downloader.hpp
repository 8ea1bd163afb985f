#pragma once

/**
 * @file downloader.hpp
 * @brief Backend fallback orchestrator
 *
 * Every entry point walks the strategy table in order:
 * - BACKEND_UNAVAILABLE: try the next backend
 * - any other error: stop and return it unchanged
 * - success: stop
 *
 * When every backend is unavailable the result is NO_WORKING_BACKENDS.
 * A backend that failed is never retried and no later backend runs after a
 * real failure.
 */

#include <netfetch/transport/http/download_backend.hpp>

#include <filesystem>
#include <span>

namespace netfetch::download {

using transport::http::Backend;
using transport::http::BackendStrategy;
using transport::http::ContentLengthReceived;
using transport::http::DataReceived;
using transport::http::DownloadOptions;
using transport::http::Event;
using transport::http::EventCallback;

/**
 * @brief Process-wide table built from default DownloadOptions
 */
std::span<const BackendStrategy> default_strategy_table();

// ============================================================================
// STREAMING
// ============================================================================

/**
 * @brief Fetch @p url with the first available backend
 */
common::Result<void> attempt_download(const common::Url& url, const EventCallback& callback);

common::Result<void> attempt_download(std::span<const BackendStrategy> strategies,
                                      const common::Url& url, const EventCallback& callback);

/**
 * @brief Fetch @p url with @p backend only
 */
common::Result<void> download_with_backend(Backend backend, const common::Url& url,
                                           const EventCallback& callback,
                                           const DownloadOptions& options = {});

// ============================================================================
// TO FILE
// ============================================================================

/**
 * @brief Fetch @p url into @p path with the first available backend
 *
 * Each attempt creates @p path afresh. @p callback, when set, sees every
 * event after the data has been written. On failure the partial file is
 * removed; on success its data is synced to disk.
 */
common::Result<void> attempt_download_to_path(const common::Url& url,
                                              const std::filesystem::path& path,
                                              const EventCallback& callback = {});

common::Result<void> attempt_download_to_path(std::span<const BackendStrategy> strategies,
                                              const common::Url& url,
                                              const std::filesystem::path& path,
                                              const EventCallback& callback = {});

/**
 * @brief Fetch @p url into @p path with @p backend only
 */
common::Result<void> download_to_path_with_backend(Backend backend, const common::Url& url,
                                                   const std::filesystem::path& path,
                                                   const EventCallback& callback = {},
                                                   const DownloadOptions& options = {});

}  // namespace netfetch::download
