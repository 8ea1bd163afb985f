#pragma once

/**
 * @file config_loader.hpp
 * @brief Configuration loader for netfetch
 *
 * Loads transfer, TLS and logging settings from YAML (default) or JSON.
 * Unknown keys are ignored and values of the wrong type keep their defaults.
 *
 * @code
 * transport:
 *   connect_timeout_ms: 30000
 *   low_speed_limit: 10
 *   low_speed_time_ms: 30000
 *   follow_redirects: true
 *   max_redirects: 10
 *   user_agent: "netfetch/0.1.0"
 * tls:
 *   verify_peer: true
 *   root_cert_files: [/etc/ssl/certs/ca-certificates.crt]
 * logging:
 *   level: info
 *   output: console     # or "file"
 *   file_path: /var/log/netfetch.log
 * @endcode
 */

#include <netfetch/common/error.hpp>
#include <netfetch/transport/http/download_backend.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace netfetch::config {

/**
 * @brief Configuration file format
 */
enum class ConfigFormat : uint8_t {
    AUTO,  ///< Detect from extension or content
    YAML,
    JSON
};

// ============================================================================
// CONFIGURATION TYPES
// ============================================================================

struct TransportConfig {
    uint32_t connect_timeout_ms = 30000;
    uint32_t low_speed_limit    = 10;
    uint32_t low_speed_time_ms  = 30000;
    bool follow_redirects       = true;
    uint32_t max_redirects      = 10;
    std::string user_agent      = "netfetch/" NETFETCH_VERSION_STRING;
};

struct TlsConfig {
    /// Empty discovers the system trust store
    std::vector<std::string> root_cert_files;
    bool verify_peer = true;
};

struct LoggingConfig {
    std::string level  = "info";
    std::string output = "console";  ///< "console" or "file"
    std::string file_path;
    uint32_t max_file_size_mb = 10;
    uint32_t max_files        = 5;
    bool include_timestamp    = true;
    bool include_thread_id    = false;
    bool use_colors           = true;
};

struct NetfetchConfig {
    TransportConfig transport;
    TlsConfig tls;
    LoggingConfig logging;
};

// ============================================================================
// FORMAT DETECTION
// ============================================================================

/**
 * @brief JSON for .json, YAML otherwise
 */
ConfigFormat detect_format(const std::filesystem::path& path);

/**
 * @brief JSON when the first non-blank character opens an object or array
 */
ConfigFormat detect_format_from_content(std::string_view content);

// ============================================================================
// LOADING
// ============================================================================

/**
 * @brief Load a configuration file
 *
 * Fails with CONFIG_FILE_NOT_FOUND or CONFIG_PARSE_ERROR.
 */
common::Result<NetfetchConfig> load_config(const std::filesystem::path& path,
                                           ConfigFormat format = ConfigFormat::AUTO);

/**
 * @brief Parse configuration text
 *
 * Fails with CONFIG_PARSE_ERROR.
 */
common::Result<NetfetchConfig> parse_config(std::string_view content,
                                            ConfigFormat format = ConfigFormat::AUTO);

// ============================================================================
// APPLYING
// ============================================================================

transport::http::DownloadOptions to_download_options(const NetfetchConfig& config);

/**
 * @brief Replace the logger's sinks and level
 *
 * NETFETCH_LOG_LEVEL still overrides the configured level.
 */
common::Result<void> apply_logging_config(const LoggingConfig& config);

}  // namespace netfetch::config
