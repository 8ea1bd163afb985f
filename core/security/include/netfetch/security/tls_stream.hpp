#pragma once

/**
 * @file tls_stream.hpp
 * @brief TLS adapter over an arbitrary blocking byte stream
 *
 * TlsStream<NextLayer> drives a memory-buffered TLSSession over any stream
 * that offers the netfetch stream capability set:
 *
 *   - read_some(MutableBufferSequence, error_code&) / write_some(...)
 *   - flush(error_code&)
 *   - peer_address(error_code&) -> tcp::endpoint
 *   - set_read_timeout(milliseconds, error_code&) / set_write_timeout(...)
 *   - shutdown(socket_base::shutdown_type, error_code&)
 *
 * The adapter offers the same set itself, plus the throwing read_some /
 * write_some overloads, so it satisfies Beast's SyncReadStream and
 * SyncWriteStream and plain and encrypted connections are interchangeable
 * in the HTTP client.
 *
 * The adapter owns its next layer exclusively. It is not thread-safe.
 */

#include "tls_context.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace netfetch::security {

// ============================================================================
// ERROR CODES
// ============================================================================

/**
 * @brief Failures raised by the TLS adapter itself
 */
enum class tls_errc {
    stream_broken = 1,  // An earlier operation failed, the session is unusable
    handshake_failed,
    protocol_error,
    session_closed      // Write after the peer sent close_notify
};

class tls_error_category : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "netfetch.tls"; }

    std::string message(int ev) const override {
        switch (static_cast<tls_errc>(ev)) {
            case tls_errc::stream_broken:
                return "TLS stream is broken by an earlier failure";
            case tls_errc::handshake_failed:
                return "TLS handshake failed";
            case tls_errc::protocol_error:
                return "TLS protocol error";
            case tls_errc::session_closed:
                return "TLS session closed by peer";
            default:
                return "unknown TLS error";
        }
    }
};

inline const boost::system::error_category& tls_category() {
    static const tls_error_category category;
    return category;
}

inline boost::system::error_code make_error_code(tls_errc e) {
    return {static_cast<int>(e), tls_category()};
}

}  // namespace netfetch::security

namespace boost::system {
template<>
struct is_error_code_enum<netfetch::security::tls_errc> : std::true_type {};
}  // namespace boost::system

namespace netfetch::security {

// ============================================================================
// TLS STREAM
// ============================================================================

template<class NextLayer>
class TlsStream {
public:
    using next_layer_type = NextLayer;

    /// Ciphertext is moved in and out in blocks of this size
    static constexpr size_t kRecordBufferSize = 17 * 1024;

    TlsStream(NextLayer next, std::unique_ptr<TLSSession> session)
        : next_(std::move(next))
        , session_(std::move(session))
        , in_buffer_(kRecordBufferSize)
        , out_buffer_(kRecordBufferSize) {}

    TlsStream(TlsStream&&)            = default;
    TlsStream& operator=(TlsStream&&) = default;

    TlsStream(const TlsStream&)            = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    NextLayer& next_layer() noexcept { return next_; }
    const NextLayer& next_layer() const noexcept { return next_; }

    TLSSession& session() noexcept { return *session_; }

    bool is_broken() const noexcept { return broken_; }

    /// Library diagnostics of the failure that broke the stream
    const std::string& last_error() const noexcept { return last_error_; }

    // -------------------------------------------------------------------------
    // Handshake
    // -------------------------------------------------------------------------

    void handshake(boost::system::error_code& ec) {
        ec = {};
        if (broken_) {
            ec = tls_errc::stream_broken;
            return;
        }

        for (;;) {
            auto status = session_->handshake();

            // Also carries the alert of a failed handshake
            boost::system::error_code flush_ec;
            flush_pending(flush_ec);

            switch (status) {
                case SessionStatus::OK:
                    if (flush_ec) {
                        ec = mark_broken(flush_ec);
                    }
                    return;
                case SessionStatus::WANT_WRITE:
                    if (flush_ec) {
                        ec = mark_broken(flush_ec);
                        return;
                    }
                    continue;
                case SessionStatus::WANT_READ:
                    if (flush_ec) {
                        ec = mark_broken(flush_ec);
                        return;
                    }
                    fill(ec);
                    if (ec == boost::asio::error::eof) {
                        ec = fail(tls_errc::handshake_failed,
                                  "connection closed during TLS handshake");
                        return;
                    }
                    if (ec) {
                        ec = mark_broken(ec);
                        return;
                    }
                    continue;
                case SessionStatus::CLOSED:
                case SessionStatus::FAILED:
                default:
                    ec = fail(tls_errc::handshake_failed, session_->get_error_string());
                    return;
            }
        }
    }

    void handshake() {
        boost::system::error_code ec;
        handshake(ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
    }

    // -------------------------------------------------------------------------
    // Plaintext I/O
    // -------------------------------------------------------------------------

    /**
     * @brief Read decrypted bytes, blocking until at least one is available
     *
     * Returns 0 with asio::error::eof once the peer closed the session.
     */
    size_t read(void* data, size_t size, boost::system::error_code& ec) {
        ec = {};
        if (broken_) {
            ec = tls_errc::stream_broken;
            return 0;
        }
        if (size == 0) {
            return 0;
        }

        for (;;) {
            size_t n    = 0;
            auto status = session_->read(data, size, n);
            switch (status) {
                case SessionStatus::OK:
                    return n;
                case SessionStatus::CLOSED:
                    ec = boost::asio::error::eof;
                    return 0;
                case SessionStatus::WANT_WRITE:
                    flush_pending(ec);
                    if (ec) {
                        ec = mark_broken(ec);
                        return 0;
                    }
                    continue;
                case SessionStatus::WANT_READ:
                    // Post-handshake messages may need an answer
                    flush_pending(ec);
                    if (ec) {
                        ec = mark_broken(ec);
                        return 0;
                    }
                    if (eof_received_) {
                        ec = boost::asio::error::eof;
                        return 0;
                    }
                    fill(ec);
                    if (ec == boost::asio::error::eof) {
                        session_->put_eof();
                        eof_received_ = true;
                        ec            = {};
                        continue;
                    }
                    if (ec) {
                        // Nothing was consumed, the session stays usable
                        return 0;
                    }
                    continue;
                case SessionStatus::FAILED:
                default:
                    ec = fail(tls_errc::protocol_error, session_->get_error_string());
                    return 0;
            }
        }
    }

    /**
     * @brief Encrypt bytes and push the resulting records to the next layer
     */
    size_t write(const void* data, size_t size, boost::system::error_code& ec) {
        ec = {};
        if (broken_) {
            ec = tls_errc::stream_broken;
            return 0;
        }
        if (size == 0) {
            return 0;
        }

        for (;;) {
            size_t n    = 0;
            auto status = session_->write(data, size, n);
            switch (status) {
                case SessionStatus::OK:
                    flush_pending(ec);
                    if (ec) {
                        ec = mark_broken(ec);
                        return 0;
                    }
                    return n;
                case SessionStatus::WANT_WRITE:
                    flush_pending(ec);
                    if (ec) {
                        ec = mark_broken(ec);
                        return 0;
                    }
                    continue;
                case SessionStatus::WANT_READ:
                    fill(ec);
                    if (ec) {
                        ec = mark_broken(ec);
                        return 0;
                    }
                    continue;
                case SessionStatus::CLOSED:
                    ec = tls_errc::session_closed;
                    return 0;
                case SessionStatus::FAILED:
                default:
                    ec = fail(tls_errc::protocol_error, session_->get_error_string());
                    return 0;
            }
        }
    }

    /**
     * @brief Push any queued ciphertext, then flush the next layer
     */
    void flush(boost::system::error_code& ec) {
        ec = {};
        if (broken_) {
            ec = tls_errc::stream_broken;
            return;
        }
        flush_pending(ec);
        if (ec) {
            ec = mark_broken(ec);
            return;
        }
        next_.flush(ec);
    }

    // -------------------------------------------------------------------------
    // Beast SyncReadStream / SyncWriteStream
    // -------------------------------------------------------------------------

    template<class MutableBufferSequence>
    size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec) {
        auto end = boost::asio::buffer_sequence_end(buffers);
        for (auto it = boost::asio::buffer_sequence_begin(buffers); it != end; ++it) {
            boost::asio::mutable_buffer buffer(*it);
            if (buffer.size() > 0) {
                return read(buffer.data(), buffer.size(), ec);
            }
        }
        ec = {};
        return 0;
    }

    template<class MutableBufferSequence>
    size_t read_some(const MutableBufferSequence& buffers) {
        boost::system::error_code ec;
        auto n = read_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

    template<class ConstBufferSequence>
    size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec) {
        auto end = boost::asio::buffer_sequence_end(buffers);
        for (auto it = boost::asio::buffer_sequence_begin(buffers); it != end; ++it) {
            boost::asio::const_buffer buffer(*it);
            if (buffer.size() > 0) {
                return write(buffer.data(), buffer.size(), ec);
            }
        }
        ec = {};
        return 0;
    }

    template<class ConstBufferSequence>
    size_t write_some(const ConstBufferSequence& buffers) {
        boost::system::error_code ec;
        auto n = write_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

    // -------------------------------------------------------------------------
    // Stream capabilities forwarded to the next layer
    // -------------------------------------------------------------------------

    boost::asio::ip::tcp::endpoint peer_address(boost::system::error_code& ec) const {
        return next_.peer_address(ec);
    }

    void set_read_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec) {
        next_.set_read_timeout(timeout, ec);
    }

    void set_write_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec) {
        next_.set_write_timeout(timeout, ec);
    }

    /**
     * @brief Close one or both directions
     *
     * Closing the send side first queues a close_notify alert.
     */
    void shutdown(boost::asio::socket_base::shutdown_type how, boost::system::error_code& ec) {
        ec = {};
        if (!broken_ && how != boost::asio::socket_base::shutdown_receive) {
            if (session_->shutdown() != SessionStatus::FAILED) {
                flush_pending(ec);
            }
            // The peer may already be gone; the socket shutdown below still runs
            ec = {};
        }
        next_.shutdown(how, ec);
    }

private:
    // Pull one block of ciphertext from the next layer into the session
    void fill(boost::system::error_code& ec) {
        size_t n = next_.read_some(boost::asio::buffer(in_buffer_), ec);
        if (n > 0) {
            session_->put_ciphertext(in_buffer_.data(), n);
            // A short read with an error still delivered usable bytes
            ec = {};
        }
    }

    // Write every queued ciphertext byte to the next layer
    void flush_pending(boost::system::error_code& ec) {
        ec = {};
        while (session_->pending_ciphertext() > 0) {
            size_t n = session_->take_ciphertext(out_buffer_.data(), out_buffer_.size());
            if (n == 0) {
                return;
            }
            boost::asio::write(next_, boost::asio::buffer(out_buffer_.data(), n), ec);
            if (ec) {
                return;
            }
        }
    }

    boost::system::error_code fail(tls_errc code, std::string detail) {
        broken_     = true;
        last_error_ = std::move(detail);
        return code;
    }

    boost::system::error_code mark_broken(boost::system::error_code ec) {
        broken_ = true;
        if (last_error_.empty()) {
            last_error_ = ec.message();
        }
        return ec;
    }

    NextLayer next_;
    std::unique_ptr<TLSSession> session_;
    std::vector<uint8_t> in_buffer_;
    std::vector<uint8_t> out_buffer_;
    bool broken_       = false;
    bool eof_received_ = false;
    std::string last_error_;
};

}  // namespace netfetch::security
