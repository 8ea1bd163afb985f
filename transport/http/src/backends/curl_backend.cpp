/**
 * @file curl_backend.cpp
 * @brief libcurl download backend implementation
 */

#include "netfetch/transport/http/backends/curl_backend.hpp"

#include <netfetch/common/debug.hpp>

#ifdef NETFETCH_HAS_CURL

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <optional>

#include <curl/curl.h>

namespace netfetch::transport::http {

using namespace common::debug;
using common::ErrorCode;

//=============================================================================
// CURL Callbacks
//=============================================================================

namespace {

std::once_flag curl_init_flag;
CURLcode curl_init_result = CURLE_FAILED_INIT;

CURLcode ensure_curl_initialized() {
    std::call_once(curl_init_flag,
                   [] { curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return curl_init_result;
}

struct TransferState {
    CURL* handle                    = nullptr;
    const EventCallback* callback   = nullptr;
    std::optional<uint64_t> content_length;
    bool length_reported            = false;
    bool response_started           = false;
    std::optional<common::Error> callback_error;
};

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' ||
                          s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Forward one event; on failure keep the error for the caller and make
// libcurl abort the transfer
bool deliver(TransferState& state, const Event& event) {
    auto result = (*state.callback)(event);
    if (result.is_error()) {
        state.callback_error = std::move(result).error();
        return false;
    }
    return true;
}

size_t header_callback(char* buffer, size_t size, size_t nmemb, void* userdata) {
    auto* state       = static_cast<TransferState*>(userdata);
    size_t total_size = size * nmemb;
    std::string_view line(buffer, total_size);

    // Status line of a new response (redirect hop or 1xx): forget the
    // headers of the previous one
    if (line.substr(0, 5) == "HTTP/") {
        state->response_started = true;
        state->content_length.reset();
        return total_size;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos && iequals(line.substr(0, colon), "content-length")) {
        auto value      = trim(line.substr(colon + 1));
        uint64_t length = 0;
        auto [ptr, ec]  = std::from_chars(value.data(), value.data() + value.size(), length);
        if (ec == std::errc{} && ptr == value.data() + value.size()) {
            state->content_length = length;
        }
    }

    return total_size;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state       = static_cast<TransferState*>(userdata);
    size_t total_size = size * nmemb;

    long code = 0;
    curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &code);
    if (code != 200 && code != 0) {
        // Error page body; the status is reported once the transfer ends
        return total_size;
    }

    if (!state->length_reported) {
        state->length_reported = true;
        if (state->content_length &&
            !deliver(*state, ContentLengthReceived{*state->content_length})) {
            return 0;
        }
    }

    std::span<const uint8_t> data(reinterpret_cast<const uint8_t*>(ptr), total_size);
    if (!deliver(*state, DataReceived{data})) {
        return 0;
    }
    return total_size;
}

common::Error map_curl_error(const TransferState& state, CURLcode res, const char* detail) {
    std::string message = detail[0] != '\0' ? detail : curl_easy_strerror(res);

    switch (res) {
        case CURLE_OPERATION_TIMEDOUT: {
            // Connected (or already answering) means the low-speed limit fired
            curl_off_t connect_time = 0;
            curl_easy_getinfo(state.handle, CURLINFO_CONNECT_TIME_T, &connect_time);
            if (connect_time == 0 && !state.response_started) {
                return common::Error(ErrorCode::CONNECTION_TIMEOUT, message);
            }
            return common::Error(ErrorCode::TRANSFER_STALLED, message);
        }
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return common::Error(ErrorCode::DNS_RESOLUTION_FAILED, message);
        case CURLE_COULDNT_CONNECT:
            return common::Error(ErrorCode::CONNECTION_FAILED, message);
        case CURLE_TOO_MANY_REDIRECTS:
            return common::Error(ErrorCode::TOO_MANY_REDIRECTS, message);
        case CURLE_PEER_FAILED_VERIFICATION:
            return common::Error(ErrorCode::CERTIFICATE_UNTRUSTED, message);
        case CURLE_SSL_CONNECT_ERROR:
            return common::Error(ErrorCode::SECURITY_HANDSHAKE_FAILED, message);
        case CURLE_UNSUPPORTED_PROTOCOL:
            return common::Error(ErrorCode::UNSUPPORTED_SCHEME, message);
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return common::io_failure(ErrorCode::SOCKET_READ_FAILED, "read socket",
                                      common::Error(ErrorCode::READ_ERROR, message));
        default:
            return common::Error(ErrorCode::TRANSFER_FAILED, "error during download: " + message);
    }
}

long low_speed_seconds(std::chrono::milliseconds window) {
    auto seconds = std::chrono::ceil<std::chrono::seconds>(window).count();
    return static_cast<long>(std::max<decltype(seconds)>(seconds, 1));
}

}  // anonymous namespace

//=============================================================================
// CurlBackend Implementation
//=============================================================================

void CurlEasyDeleter::operator()(void* handle) const noexcept {
    if (handle) {
        curl_easy_cleanup(static_cast<CURL*>(handle));
    }
}

CurlBackend::CurlBackend(DownloadOptions options, std::shared_ptr<CurlHandleCache> cache)
    : options_(std::move(options)), cache_(cache ? std::move(cache) : shared_cache()) {}

bool CurlBackend::available() noexcept {
    return true;
}

std::string CurlBackend::version() {
    return curl_version();
}

std::shared_ptr<CurlHandleCache> CurlBackend::make_cache() {
    return std::make_shared<CurlHandleCache>(
        []() -> CurlHandleCache::pointer {
            if (ensure_curl_initialized() != CURLE_OK) {
                return nullptr;
            }
            return CurlHandleCache::pointer(curl_easy_init());
        },
        [](void* handle) { curl_easy_reset(static_cast<CURL*>(handle)); });
}

std::shared_ptr<CurlHandleCache> CurlBackend::shared_cache() {
    static const std::shared_ptr<CurlHandleCache> cache = make_cache();
    return cache;
}

common::Result<void> CurlBackend::download(const common::Url& url,
                                           const EventCallback& callback) const {
    if (url.scheme == "file") {
        return download_from_file_url(url, callback);
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return common::err(ErrorCode::UNSUPPORTED_SCHEME,
                           "unsupported url scheme '" + url.scheme + "'");
    }

    auto lease = cache_->acquire();
    if (!lease) {
        return common::err(ErrorCode::TRANSFER_FAILED, "failed to create libcurl handle");
    }
    CURL* curl = static_cast<CURL*>(lease.get());

    auto proxy = options_.proxy_resolver ? options_.proxy_resolver(url) : proxy_from_env(url);
    std::string proxy_url;
    if (proxy) {
        proxy_url = "http://" + proxy->host + ":" + std::to_string(proxy->port);
    }

    NETFETCH_LOG_DEBUG(category::TRANSPORT,
                       "curl: GET " << url.to_string()
                                    << (proxy ? " via proxy " + proxy_url : std::string()));

    std::string url_text = url.to_string();
    char error_buffer[CURL_ERROR_SIZE] = {0};

    TransferState state;
    state.handle   = curl;
    state.callback = &callback;

    curl_easy_setopt(curl, CURLOPT_URL, url_text.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());

    // An empty string disables libcurl's own environment proxy lookup
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy_url.c_str());

    // Setup redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options_.max_redirects));
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS,
                     static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif

    // Take at most connect_timeout to connect, abort when fewer than
    // low_speed_limit bytes arrive during low_speed_time
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(options_.low_speed_limit));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, low_speed_seconds(options_.low_speed_time));

    // Setup TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_peer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_peer ? 2L : 0L);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);

    CURLcode res = curl_easy_perform(curl);

    // Nothing may point into this frame once the handle goes back to the cache
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);

    if (res != CURLE_OK) {
        // An error raised by the callback wins over libcurl's generic write error
        if (state.callback_error) {
            return std::move(*state.callback_error);
        }
        auto error = map_curl_error(state, res, error_buffer);
        NETFETCH_LOG_DEBUG(category::TRANSPORT, "curl: " << error.to_string());
        return error;
    }

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    NETFETCH_LOG_DEBUG(category::TRANSPORT, "curl: " << url_text << " -> " << code);

    if (code == 404) {
        return common::err(ErrorCode::RESOURCE_NOT_FOUND, "not found: " + url_text);
    }
    if (code != 200 && code != 0) {
        return common::http_status_error(static_cast<uint32_t>(code));
    }

    // Empty body: the advertised length has not been reported yet
    if (!state.length_reported && state.content_length) {
        auto result = callback(ContentLengthReceived{*state.content_length});
        if (result.is_error()) {
            return result;
        }
    }

    return common::ok();
}

}  // namespace netfetch::transport::http

#else  // !NETFETCH_HAS_CURL

// Stub implementation when curl is not available
namespace netfetch::transport::http {

void CurlEasyDeleter::operator()(void*) const noexcept {}

CurlBackend::CurlBackend(DownloadOptions options, std::shared_ptr<CurlHandleCache> cache)
    : options_(std::move(options)), cache_(std::move(cache)) {}

bool CurlBackend::available() noexcept {
    return false;
}

std::string CurlBackend::version() {
    return "not available";
}

std::shared_ptr<CurlHandleCache> CurlBackend::make_cache() {
    return std::make_shared<CurlHandleCache>([] { return CurlHandleCache::pointer(); });
}

std::shared_ptr<CurlHandleCache> CurlBackend::shared_cache() {
    static const std::shared_ptr<CurlHandleCache> cache = make_cache();
    return cache;
}

common::Result<void> CurlBackend::download(const common::Url&, const EventCallback&) const {
    return common::backend_unavailable("curl");
}

}  // namespace netfetch::transport::http

#endif  // NETFETCH_HAS_CURL
