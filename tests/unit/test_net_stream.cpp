/**
 * @file test_net_stream.cpp
 * @brief Unit tests for the blocking TCP stream
 */

#include "http_test_server.hpp"

#include <gtest/gtest.h>
#include <netfetch/transport/http/net_stream.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace netfetch::transport::http;
using netfetch::common::ErrorCode;

namespace {

/**
 * @brief Accepts one connection, waits, then writes a fixed payload
 */
class DelayedPeer {
public:
    DelayedPeer(std::chrono::milliseconds delay, std::string payload)
        : acceptor_(io_, boost::asio::ip::tcp::endpoint(
                             boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_   = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, delay, payload = std::move(payload)] {
            boost::system::error_code ec;
            boost::asio::ip::tcp::socket peer(io_);
            acceptor_.accept(peer, ec);
            if (ec) {
                return;
            }
            std::this_thread::sleep_for(delay);
            if (!payload.empty()) {
                boost::asio::write(peer, boost::asio::buffer(payload), ec);
            }
            // Keep the connection open long enough for timeout tests
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        });
    }

    ~DelayedPeer() { thread_.join(); }

    uint16_t port() const { return port_; }

private:
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::thread thread_;
};

}  // namespace

class NetStreamTest : public ::testing::Test {
protected:
    NetStream connect_to(uint16_t port) {
        auto result = NetStream::connect(io_, "127.0.0.1", port, std::chrono::milliseconds(2000));
        EXPECT_TRUE(result.is_success()) << result.message();
        return std::move(result.value());
    }

    boost::asio::io_context io_;
};

// ============================================================================
// Blocking Read Tests
// ============================================================================

TEST_F(NetStreamTest, ReadWaitsForLateData) {
    DelayedPeer peer(std::chrono::milliseconds(200), "hello");
    auto stream = connect_to(peer.port());

    boost::system::error_code ec;
    stream.set_read_timeout(std::chrono::milliseconds(5000), ec);
    ASSERT_FALSE(ec) << ec.message();

    char buf[16];
    auto start = std::chrono::steady_clock::now();
    size_t n   = stream.read(buf, sizeof(buf), ec);
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(std::string(buf, n), "hello");
    EXPECT_GE(waited, std::chrono::milliseconds(100));
}

TEST_F(NetStreamTest, ReadTimeoutElapsesBeforeTimedOut) {
    DelayedPeer peer(std::chrono::milliseconds(800), "");
    auto stream = connect_to(peer.port());

    boost::system::error_code ec;
    stream.set_read_timeout(std::chrono::milliseconds(300), ec);
    ASSERT_FALSE(ec);

    char buf[16];
    auto start  = std::chrono::steady_clock::now();
    size_t n    = stream.read(buf, sizeof(buf), ec);
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(n, 0u);
    EXPECT_EQ(ec, boost::asio::error::timed_out);
    EXPECT_GE(waited, std::chrono::milliseconds(250));
}

TEST_F(NetStreamTest, WriteReachesPeer) {
    boost::asio::io_context server_io;
    boost::asio::ip::tcp::acceptor acceptor(
        server_io,
        boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    std::string received;
    std::thread server([&] {
        boost::asio::ip::tcp::socket peer(server_io);
        acceptor.accept(peer);
        char buf[32];
        boost::system::error_code ec;
        size_t n = boost::asio::read(peer, boost::asio::buffer(buf, 4), ec);
        received.assign(buf, n);
    });

    auto stream = connect_to(acceptor.local_endpoint().port());
    boost::system::error_code ec;
    EXPECT_EQ(stream.write("ping", 4, ec), 4u);
    EXPECT_FALSE(ec);
    server.join();

    EXPECT_EQ(received, "ping");
}

TEST_F(NetStreamTest, PeerCloseIsEof) {
    DelayedPeer peer(std::chrono::milliseconds(0), "");
    auto stream = connect_to(peer.port());

    boost::system::error_code ec;
    stream.set_read_timeout(std::chrono::milliseconds(2000), ec);

    char buf[4];
    EXPECT_EQ(stream.read(buf, sizeof(buf), ec), 0u);
    EXPECT_EQ(ec, boost::asio::error::eof);
}

// ============================================================================
// Connect Tests
// ============================================================================

TEST_F(NetStreamTest, RefusedConnection) {
    auto result = NetStream::connect(io_, "127.0.0.1", netfetch::test::unused_port(),
                                     std::chrono::milliseconds(2000));
    EXPECT_EQ(result.code(), ErrorCode::CONNECTION_REFUSED);
}
