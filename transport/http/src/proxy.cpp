/**
 * @file proxy.cpp
 * @brief Proxy selection from the process environment
 */

#include "netfetch/transport/http/proxy.hpp"

#include <netfetch/common/debug.hpp>
#include <netfetch/common/platform.hpp>

#include <span>

namespace netfetch::transport::http {

using namespace common::debug;

namespace {

constexpr std::string_view kHttpsVariables[] = {"https_proxy", "HTTPS_PROXY", "http_proxy",
                                                "all_proxy", "ALL_PROXY"};
constexpr std::string_view kHttpVariables[]  = {"http_proxy", "all_proxy", "ALL_PROXY"};
constexpr std::string_view kOtherVariables[] = {"all_proxy", "ALL_PROXY"};

std::span<const std::string_view> candidate_variables(std::string_view scheme) {
    if (scheme == "https") {
        return kHttpsVariables;
    }
    if (scheme == "http") {
        return kHttpVariables;
    }
    return kOtherVariables;
}

}  // anonymous namespace

std::optional<ProxyTarget> proxy_from_env(const common::Url& url) {
    return proxy_from_env(url, [](std::string_view name) {
        return common::platform::get_env_opt(name);
    });
}

std::optional<ProxyTarget> proxy_from_env(const common::Url& url, const EnvLookup& env) {
    for (auto name : candidate_variables(url.scheme)) {
        auto value = env(name);
        if (!value) {
            continue;
        }

        // The first variable that is set decides, even when it is unusable
        auto proxy_url = common::parse_url(*value);
        if (!proxy_url || proxy_url->host.empty()) {
            NETFETCH_LOG_WARN(category::TRANSPORT,
                              "Ignoring " << name << "='" << *value << "': not a proxy URL");
            return std::nullopt;
        }

        ProxyTarget target;
        target.host = proxy_url->host;
        target.port = proxy_url->port != 0 ? proxy_url->port : kDefaultProxyPort;

        NETFETCH_LOG_DEBUG(category::TRANSPORT,
                           "Using proxy " << target.host << ":" << target.port << " from " << name);
        return target;
    }
    return std::nullopt;
}

}  // namespace netfetch::transport::http
