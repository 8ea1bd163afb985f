#pragma once

/**
 * @file net_stream.hpp
 * @brief Blocking TCP stream with per-direction timeouts
 *
 * NetStream is the plain (unencrypted) member of the stream capability set
 * described in tls_stream.hpp. Reads and writes go straight to the socket so
 * that SO_RCVTIMEO / SO_SNDTIMEO surface as asio::error::timed_out instead of
 * being retried forever.
 *
 * It also models the next layer Asio's ssl::stream expects (lowest_layer,
 * get_executor), so both TLS implementations can sit on top of it.
 */

#include <netfetch/common/error.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstdint>
#include <string_view>

namespace netfetch::transport::http {

class NetStream {
public:
    using socket_type       = boost::asio::ip::tcp::socket;
    using lowest_layer_type = socket_type::lowest_layer_type;
    using executor_type     = socket_type::executor_type;

    explicit NetStream(socket_type socket) : socket_(std::move(socket)) {}

    NetStream(NetStream&&)            = default;
    NetStream& operator=(NetStream&&) = default;

    /**
     * @brief Resolve @p host and connect, bounded by @p timeout overall
     *
     * Fails with DNS_RESOLUTION_FAILED, CONNECTION_REFUSED,
     * CONNECTION_FAILED or CONNECTION_TIMEOUT.
     */
    static common::Result<NetStream> connect(boost::asio::io_context& io, std::string_view host,
                                             uint16_t port, std::chrono::milliseconds timeout);

    // -------------------------------------------------------------------------
    // Stream capability set
    // -------------------------------------------------------------------------

    size_t read(void* data, size_t size, boost::system::error_code& ec);
    size_t write(const void* data, size_t size, boost::system::error_code& ec);

    /// Writes are unbuffered
    void flush(boost::system::error_code& ec) { ec = {}; }

    boost::asio::ip::tcp::endpoint peer_address(boost::system::error_code& ec) const {
        return socket_.remote_endpoint(ec);
    }

    /// A zero timeout blocks indefinitely
    void set_read_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec);
    void set_write_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec);

    void shutdown(boost::asio::socket_base::shutdown_type how, boost::system::error_code& ec) {
        socket_.shutdown(how, ec);
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
    // Asio next-layer requirements
    // -------------------------------------------------------------------------

    lowest_layer_type& lowest_layer() { return socket_.lowest_layer(); }
    const lowest_layer_type& lowest_layer() const { return socket_.lowest_layer(); }

    executor_type get_executor() { return socket_.get_executor(); }

    socket_type& socket() noexcept { return socket_; }

private:
    socket_type socket_;
};

}  // namespace netfetch::transport::http
