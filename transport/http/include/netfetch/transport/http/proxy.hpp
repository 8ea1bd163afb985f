#pragma once

/**
 * @file proxy.hpp
 * @brief Proxy selection from the process environment
 */

#include <netfetch/common/url.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace netfetch::transport::http {

/// Port used when the proxy URL does not name one
inline constexpr uint16_t kDefaultProxyPort = 8080;

/**
 * @brief Proxy endpoint for one request
 */
struct ProxyTarget {
    std::string host;
    uint16_t port = kDefaultProxyPort;

    bool operator==(const ProxyTarget& other) const = default;
};

/// Returns the value of an environment variable, std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/**
 * @brief Resolve the proxy for @p url from the environment
 *
 * Variables are consulted in this order, the first one that is set wins:
 * - https: https_proxy, HTTPS_PROXY, http_proxy, all_proxy, ALL_PROXY
 * - http:  http_proxy, all_proxy, ALL_PROXY
 * - other: all_proxy, ALL_PROXY
 *
 * A winning value that is not a URL with a host yields no proxy.
 */
std::optional<ProxyTarget> proxy_from_env(const common::Url& url);

/**
 * @brief Same as above with an injectable environment
 */
std::optional<ProxyTarget> proxy_from_env(const common::Url& url, const EnvLookup& env);

}  // namespace netfetch::transport::http
