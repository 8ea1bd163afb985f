/**
 * @file net_stream.cpp
 * @brief Blocking TCP stream with per-direction timeouts
 */

#include "netfetch/transport/http/net_stream.hpp"

#include <netfetch/common/debug.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>

#include <cerrno>
#include <string>

#include <sys/socket.h>
#include <sys/time.h>

namespace netfetch::transport::http {

using namespace common::debug;
using common::ErrorCode;

namespace {

boost::system::error_code last_socket_error() {
    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK) {
        return boost::asio::error::timed_out;
    }
    return {err, boost::system::system_category()};
}

void set_timeout(int fd, int option, std::chrono::milliseconds timeout,
                 boost::system::error_code& ec) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) != 0) {
        ec = {errno, boost::system::system_category()};
        return;
    }
    ec = {};
}

}  // anonymous namespace

common::Result<NetStream> NetStream::connect(boost::asio::io_context& io, std::string_view host,
                                             uint16_t port, std::chrono::milliseconds timeout) {
    boost::asio::ip::tcp::resolver resolver(io);
    socket_type socket(io);

    enum class Stage { RESOLVING, CONNECTING, DONE } stage = Stage::RESOLVING;
    boost::system::error_code result;

    resolver.async_resolve(
        std::string(host), std::to_string(port),
        [&](const boost::system::error_code& ec,
            boost::asio::ip::tcp::resolver::results_type endpoints) {
            if (ec) {
                result = ec;
                stage  = Stage::DONE;
                return;
            }
            stage = Stage::CONNECTING;
            boost::asio::async_connect(
                socket, endpoints,
                [&](const boost::system::error_code& connect_ec,
                    const boost::asio::ip::tcp::endpoint&) {
                    result = connect_ec;
                    stage  = Stage::DONE;
                });
        });

    io.restart();
    io.run_for(timeout);

    if (stage != Stage::DONE) {
        // Let the cancelled handlers run before the locals they capture go away
        resolver.cancel();
        boost::system::error_code ignored;
        socket.close(ignored);
        io.restart();
        io.run();
        return common::Result<NetStream>(
            ErrorCode::CONNECTION_TIMEOUT,
            "timed out connecting to " + std::string(host) + ":" + std::to_string(port));
    }

    if (result) {
        std::string where = std::string(host) + ":" + std::to_string(port);
        ErrorCode code    = ErrorCode::CONNECTION_FAILED;
        if (result == boost::asio::error::connection_refused) {
            code = ErrorCode::CONNECTION_REFUSED;
        } else if (result == boost::asio::error::host_not_found ||
                   result == boost::asio::error::host_not_found_try_again ||
                   result == boost::asio::error::no_data) {
            code = ErrorCode::DNS_RESOLUTION_FAILED;
        }
        return common::Result<NetStream>(code, "cannot connect to " + where + ": " +
                                                   result.message());
    }

    // async_connect leaves the descriptor O_NONBLOCK; recv/send below rely on
    // blocking semantics for SO_RCVTIMEO / SO_SNDTIMEO to apply
    boost::system::error_code blocking_ec;
    socket.native_non_blocking(false, blocking_ec);
    if (blocking_ec) {
        return common::Result<NetStream>(ErrorCode::CONNECTION_FAILED,
                                         "cannot make socket blocking: " + blocking_ec.message());
    }

    NETFETCH_LOG_DEBUG(category::TRANSPORT, "Connected to " << host << ":" << port);
    return NetStream(std::move(socket));
}

size_t NetStream::read(void* data, size_t size, boost::system::error_code& ec) {
    ec = {};
    if (size == 0) {
        return 0;
    }
    for (;;) {
        ssize_t n = ::recv(socket_.native_handle(), data, size, 0);
        if (n > 0) {
            return static_cast<size_t>(n);
        }
        if (n == 0) {
            ec = boost::asio::error::eof;
            return 0;
        }
        if (errno == EINTR) {
            continue;
        }
        ec = last_socket_error();
        return 0;
    }
}

size_t NetStream::write(const void* data, size_t size, boost::system::error_code& ec) {
    ec = {};
    if (size == 0) {
        return 0;
    }
    for (;;) {
        ssize_t n = ::send(socket_.native_handle(), data, size, MSG_NOSIGNAL);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        ec = last_socket_error();
        return 0;
    }
}

void NetStream::set_read_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    set_timeout(socket_.native_handle(), SO_RCVTIMEO, timeout, ec);
}

void NetStream::set_write_timeout(std::chrono::milliseconds timeout,
                                  boost::system::error_code& ec) {
    set_timeout(socket_.native_handle(), SO_SNDTIMEO, timeout, ec);
}

}  // namespace netfetch::transport::http
