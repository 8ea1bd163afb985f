/**
 * @file beast_backend.cpp
 * @brief Boost.Beast download backend implementation
 */

#include "netfetch/transport/http/backends/beast_backend.hpp"

#include <netfetch/common/debug.hpp>

#if defined(NETFETCH_HAS_BEAST) && defined(NETFETCH_SSL_OPENSSL)

#include "netfetch/transport/http/net_stream.hpp"

#include <netfetch/security/root_certificates.hpp>
#include <netfetch/security/tls_stream.hpp>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <openssl/crypto.h>
#include <openssl/ssl.h>

#include <mutex>
#include <optional>
#include <vector>

namespace netfetch::transport::http {

using namespace common::debug;
using common::ErrorCode;

namespace asio  = boost::asio;
namespace ssl   = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

using RedirectResult = common::Result<std::optional<common::Url>>;

struct BeastBackend::TlsState {
    std::mutex mutex;
    std::unique_ptr<ssl::context> asio_context;
    std::shared_ptr<security::TLSContext> tls_context;
};

//=============================================================================
// Helpers
//=============================================================================

namespace {

bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    asio::ip::make_address(host, ec);
    return !ec;
}

/**
 * @brief Low-speed detector: fewer than @c limit bytes in @c window is a stall
 */
class RateWindow {
public:
    RateWindow(uint32_t limit, std::chrono::milliseconds window)
        : limit_(limit), window_(window), start_(std::chrono::steady_clock::now()) {}

    bool record(size_t bytes) {
        bytes_ += bytes;
        auto now = std::chrono::steady_clock::now();
        if (now - start_ >= window_) {
            if (bytes_ < limit_) {
                return false;
            }
            start_ = now;
            bytes_ = 0;
        }
        return true;
    }

private:
    uint64_t limit_;
    std::chrono::milliseconds window_;
    std::chrono::steady_clock::time_point start_;
    uint64_t bytes_ = 0;
};

common::Error read_failure(const boost::system::error_code& ec,
                           std::chrono::milliseconds window) {
    if (ec == asio::error::timed_out) {
        return common::Error(ErrorCode::TRANSFER_STALLED,
                             "no data received for " + std::to_string(window.count()) + "ms");
    }
    return common::io_failure(ErrorCode::SOCKET_READ_FAILED, "read socket",
                              common::Error(ErrorCode::READ_ERROR, ec.message()));
}

common::Error write_failure(const boost::system::error_code& ec, std::string_view what) {
    if (ec == asio::error::timed_out) {
        return common::Error(ErrorCode::CONNECTION_TIMEOUT,
                             "timed out sending " + std::string(what));
    }
    return common::Error(ErrorCode::CONNECTION_FAILED,
                         "sending " + std::string(what) + " failed: " + ec.message());
}

common::Error handshake_failure(const boost::system::error_code& ec, const std::string& host,
                                const std::string& detail) {
    if (ec == asio::error::timed_out) {
        return common::Error(ErrorCode::CONNECTION_TIMEOUT,
                             "TLS handshake with " + host + " timed out");
    }
    std::string message = "TLS handshake with " + host + " failed: " + ec.message();
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    return common::Error(ErrorCode::SECURITY_HANDSHAKE_FAILED, message);
}

void apply_timeouts(NetStream& net, std::chrono::milliseconds read_timeout,
                    std::chrono::milliseconds write_timeout) {
    boost::system::error_code ec;
    net.set_read_timeout(read_timeout, ec);
    if (ec) {
        NETFETCH_LOG_WARN(category::TRANSPORT, "Cannot set read timeout: " << ec.message());
    }
    net.set_write_timeout(write_timeout, ec);
    if (ec) {
        NETFETCH_LOG_WARN(category::TRANSPORT, "Cannot set write timeout: " << ec.message());
    }
}

//=============================================================================
// Proxy tunnel
//=============================================================================

common::Result<void> open_tunnel(NetStream& net, const common::Url& url,
                                 const DownloadOptions& options) {
    std::string authority = url.authority_host() + ":" + std::to_string(url.effective_port());

    bhttp::request<bhttp::empty_body> req{bhttp::verb::connect, authority, 11};
    req.set(bhttp::field::host, authority);
    req.set(bhttp::field::user_agent, options.user_agent);

    boost::system::error_code ec;
    bhttp::write(net, req, ec);
    if (ec) {
        return write_failure(ec, "proxy CONNECT");
    }

    // A CONNECT response never has a body
    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::empty_body> parser;
    parser.skip(true);
    bhttp::read(net, buffer, parser, ec);
    if (ec) {
        if (ec == asio::error::timed_out) {
            return common::err(ErrorCode::CONNECTION_TIMEOUT, "proxy did not answer CONNECT");
        }
        return common::err(ErrorCode::CONNECTION_FAILED,
                           "reading proxy CONNECT response failed: " + ec.message());
    }

    unsigned status = parser.get().result_int();
    if (status != 200) {
        return common::err(ErrorCode::CONNECTION_FAILED,
                           "proxy refused tunnel to " + authority + " with status " +
                               std::to_string(status));
    }

    NETFETCH_LOG_DEBUG(category::TRANSPORT, "Proxy tunnel open to " << authority);
    return common::ok();
}

//=============================================================================
// HTTP exchange
//=============================================================================

/**
 * @brief Send one GET and stream the response body
 *
 * @param net The TCP layer under @p stream, for timeout changes
 * @return The next URL when the response is a redirect to follow
 */
template<class Stream>
RedirectResult exchange(Stream& stream, NetStream& net, const common::Url& url,
                        bool absolute_target, const DownloadOptions& options,
                        const EventCallback& callback) {
    bhttp::request<bhttp::empty_body> req{bhttp::verb::get,
                                          absolute_target ? url.to_string() : url.target(), 11};
    req.set(bhttp::field::host, url.host_header());
    req.set(bhttp::field::user_agent, options.user_agent);
    req.set(bhttp::field::accept, "*/*");
    req.set(bhttp::field::connection, "close");

    boost::system::error_code ec;
    bhttp::write(stream, req, ec);
    if (ec) {
        return write_failure(ec, "request");
    }

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::buffer_body> parser;
    parser.body_limit(boost::none);

    bhttp::read_header(stream, buffer, parser, ec);
    if (ec) {
        return read_failure(ec, options.connect_timeout);
    }

    unsigned status = parser.get().result_int();
    NETFETCH_LOG_DEBUG(category::TRANSPORT, "beast: " << url.to_string() << " -> " << status);

    if (options.follow_redirects && is_redirect(status)) {
        auto location = parser.get()[bhttp::field::location];
        if (location.empty()) {
            return common::http_status_error(status);
        }
        auto next = common::resolve_reference(url, std::string_view(location.data(),
                                                                    location.size()));
        if (!next) {
            return common::Result<std::optional<common::Url>>(
                ErrorCode::PROTOCOL_ERROR,
                "invalid redirect location '" + std::string(location.data(), location.size()) +
                    "'");
        }
        return std::optional<common::Url>(std::move(*next));
    }

    if (status == 404) {
        return common::Result<std::optional<common::Url>>(ErrorCode::RESOURCE_NOT_FOUND,
                                                          "not found: " + url.to_string());
    }
    if (status != 200) {
        return common::http_status_error(status);
    }

    if (auto length = parser.content_length()) {
        NETFETCH_TRY(callback(ContentLengthReceived{*length}));
    }

    // The body may legitimately take longer than the connect bound
    apply_timeouts(net, options.low_speed_time, options.connect_timeout);

    std::vector<uint8_t> chunk(kChunkSize);
    RateWindow rate(options.low_speed_limit, options.low_speed_time);

    while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();

        bhttp::read_some(stream, buffer, parser, ec);
        if (ec == bhttp::error::need_buffer) {
            ec = {};
        }
        if (ec == ssl::error::stream_truncated) {
            // Peer closed without close_notify: fine when the body is delimited
            // by connection close, a truncation error otherwise
            parser.put_eof(ec);
        }
        if (ec) {
            return read_failure(ec, options.low_speed_time);
        }

        size_t received = chunk.size() - parser.get().body().size;
        if (received > 0) {
            NETFETCH_TRY(callback(DataReceived{std::span<const uint8_t>(chunk.data(), received)}));
        }

        if (!rate.record(received)) {
            return common::Result<std::optional<common::Url>>(
                ErrorCode::TRANSFER_STALLED,
                "transfer slower than " + std::to_string(options.low_speed_limit) + " bytes per " +
                    std::to_string(options.low_speed_time.count()) + "ms");
        }
    }

    return std::optional<common::Url>();
}

//=============================================================================
// TLS contexts
//=============================================================================

common::Result<void> init_asio_context(ssl::context& ctx, const DownloadOptions& options) {
    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                    ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                    ssl::context::no_tlsv1_1);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (!options.verify_peer) {
        ctx.set_verify_mode(ssl::verify_none);
        return common::ok();
    }
    ctx.set_verify_mode(ssl::verify_peer);

    boost::system::error_code ec;
    if (options.root_cert_files.empty()) {
        ctx.set_default_verify_paths(ec);
        if (ec) {
            return common::err(ErrorCode::SECURITY_SSL_INIT_FAILED,
                               "cannot load default verify paths: " + ec.message());
        }
        return common::ok();
    }

    for (const auto& file : options.root_cert_files) {
        ctx.load_verify_file(file, ec);
        if (ec) {
            return common::err(ErrorCode::SECURITY_SSL_INIT_FAILED,
                               "cannot load trust anchors from " + file + ": " + ec.message());
        }
    }
    return common::ok();
}

common::Result<std::shared_ptr<security::TLSContext>>
make_tls_context(const DownloadOptions& options) {
    auto config        = security::TLSConfig::default_client();
    config.verify_mode = options.verify_peer ? security::VerifyMode::REQUIRED
                                             : security::VerifyMode::NONE;

    auto created = security::TLSContext::create(config);
    if (created.is_error()) {
        return security::to_error(created);
    }
    std::shared_ptr<security::TLSContext> ctx = std::move(created).value();

    if (options.verify_peer) {
        security::Result<void> applied;
        if (options.root_cert_files.empty()) {
            applied = security::RootCertificateSet::instance().apply_to(*ctx);
        } else {
            applied = security::RootCertificateSet(options.root_cert_files).apply_to(*ctx);
        }
        if (applied.is_error()) {
            return security::to_error(applied);
        }
    }

    return ctx;
}

}  // anonymous namespace

//=============================================================================
// BeastBackend Implementation
//=============================================================================

BeastBackend::BeastBackend(BeastTls tls, DownloadOptions options)
    : tls_(tls), options_(std::move(options)), state_(std::make_shared<TlsState>()) {}

bool BeastBackend::available() noexcept {
    return true;
}

std::string BeastBackend::version(BeastTls tls) {
    std::string version = BOOST_BEAST_VERSION_STRING;
    if (tls == BeastTls::ASIO_SSL) {
        version += " ";
        version += OpenSSL_version(OPENSSL_VERSION);
    } else {
        version += " TlsStream/";
        version += security::TLSContext::backend_version();
    }
    return version;
}

common::Result<void> BeastBackend::download(const common::Url& url,
                                            const EventCallback& callback) const {
    if (url.scheme == "file") {
        return download_from_file_url(url, callback);
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return common::err(ErrorCode::UNSUPPORTED_SCHEME,
                           "unsupported url scheme '" + url.scheme + "'");
    }

    // TLS contexts are created on the first https hop and shared by copies
    auto asio_context = [this]() -> common::Result<ssl::context*> {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->asio_context) {
            auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
            NETFETCH_TRY(init_asio_context(*ctx, options_));
            state_->asio_context = std::move(ctx);
        }
        return state_->asio_context.get();
    };

    auto tls_context = [this]() -> common::Result<std::shared_ptr<security::TLSContext>> {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->tls_context) {
            auto ctx = make_tls_context(options_);
            if (ctx.is_error()) {
                return ctx;
            }
            state_->tls_context = std::move(ctx).value();
        }
        return state_->tls_context;
    };

    auto fetch_once = [&](const common::Url& current) -> RedirectResult {
        auto proxy = options_.proxy_resolver ? options_.proxy_resolver(current)
                                             : proxy_from_env(current);
        const std::string& host = proxy ? proxy->host : current.host;
        uint16_t port           = proxy ? proxy->port : current.effective_port();

        NETFETCH_LOG_DEBUG(category::TRANSPORT,
                           backend_name(tls_ == BeastTls::ASIO_SSL ? Backend::BEAST_ASIO_SSL
                                                                   : Backend::BEAST_TLS_STREAM)
                               << ": GET " << current.to_string()
                               << (proxy ? " via proxy " + host + ":" + std::to_string(port)
                                         : std::string()));

        asio::io_context io;
        auto connected = NetStream::connect(io, host, port, options_.connect_timeout);
        if (connected.is_error()) {
            return std::move(connected).error();
        }
        NetStream net = std::move(connected).value();
        apply_timeouts(net, options_.connect_timeout, options_.connect_timeout);

        if (current.scheme != "https") {
            return exchange(net, net, current, proxy.has_value(), options_, callback);
        }

        if (proxy) {
            NETFETCH_TRY(open_tunnel(net, current, options_));
        }

        boost::system::error_code ec;

        if (tls_ == BeastTls::ASIO_SSL) {
            auto ctx = asio_context();
            if (ctx.is_error()) {
                return std::move(ctx).error();
            }
            ssl::stream<NetStream> stream(std::move(net), *ctx.value());
            if (!is_ip_literal(current.host) &&
                !SSL_set_tlsext_host_name(stream.native_handle(), current.host.c_str())) {
                return common::Result<std::optional<common::Url>>(
                    ErrorCode::SECURITY_SSL_INIT_FAILED, "cannot set TLS server name");
            }
            if (options_.verify_peer) {
                stream.set_verify_callback(ssl::host_name_verification(current.host));
            }
            stream.handshake(ssl::stream_base::client, ec);
            if (ec) {
                return handshake_failure(ec, current.host, {});
            }
            return exchange(stream, stream.next_layer(), current, false, options_, callback);
        }

        auto ctx = tls_context();
        if (ctx.is_error()) {
            return std::move(ctx).error();
        }
        auto session = ctx.value()->create_session(current.host);
        if (session.is_error()) {
            return security::to_error(session);
        }
        security::TlsStream<NetStream> stream(std::move(net), std::move(session).value());
        stream.handshake(ec);
        if (ec) {
            return handshake_failure(ec, current.host, stream.last_error());
        }
        return exchange(stream, stream.next_layer(), current, false, options_, callback);
    };

    common::Url current = url;
    for (uint32_t redirects = 0;; ++redirects) {
        auto result = fetch_once(current);
        if (result.is_error()) {
            return std::move(result).error();
        }
        auto& next = result.value();
        if (!next) {
            return common::ok();
        }
        if (redirects >= options_.max_redirects) {
            return common::err(ErrorCode::TOO_MANY_REDIRECTS,
                               "more than " + std::to_string(options_.max_redirects) +
                                   " redirects");
        }
        if (next->scheme != "http" && next->scheme != "https") {
            return common::err(ErrorCode::UNSUPPORTED_SCHEME,
                               "redirect to unsupported scheme '" + next->scheme + "'");
        }
        NETFETCH_LOG_DEBUG(category::TRANSPORT, "Redirected to " << next->to_string());
        current = std::move(*next);
    }
}

}  // namespace netfetch::transport::http

#else  // !(NETFETCH_HAS_BEAST && NETFETCH_SSL_OPENSSL)

// Stub implementation when Beast or OpenSSL is not available
namespace netfetch::transport::http {

struct BeastBackend::TlsState {};

BeastBackend::BeastBackend(BeastTls tls, DownloadOptions options)
    : tls_(tls), options_(std::move(options)) {}

bool BeastBackend::available() noexcept {
    return false;
}

std::string BeastBackend::version(BeastTls) {
    return "not available";
}

common::Result<void> BeastBackend::download(const common::Url&, const EventCallback&) const {
    return common::backend_unavailable(backend_name(
        tls_ == BeastTls::ASIO_SSL ? Backend::BEAST_ASIO_SSL : Backend::BEAST_TLS_STREAM));
}

}  // namespace netfetch::transport::http

#endif
