/**
 * @file test_tls_stream.cpp
 * @brief Unit tests for the TLS adapter over arbitrary byte streams
 *
 * Both peers run TlsStream over an in-memory pipe, the server on a helper
 * thread.
 */

#include "tls_test_utils.hpp"

#include <gtest/gtest.h>
#include <netfetch/security/tls_stream.hpp>

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace netfetch::security;
using netfetch::test::make_client_context;
using netfetch::test::make_self_signed_identity;
using netfetch::test::make_server_context;
using netfetch::test::PipeStream;
using netfetch::test::TestIdentity;

namespace asio  = boost::asio;
namespace bhttp = boost::beast::http;

using Stream = TlsStream<PipeStream>;

class TlsStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity_ = make_self_signed_identity();
        ASSERT_FALSE(identity_.cert_pem.empty());
        server_ctx_ = make_server_context(identity_);
        ASSERT_NE(server_ctx_, nullptr);
    }

    void TearDown() override {
        release_ = true;
        if (server_.joinable()) {
            server_.join();
        }
    }

    /**
     * @brief Start the server end; @p body runs after a successful handshake
     */
    void start_server(PipeStream pipe, std::function<void(Stream&)> body) {
        auto session = server_ctx_->create_session();
        ASSERT_TRUE(session.is_success());
        server_ = std::thread([this, pipe = std::move(pipe), session = std::move(session).value(),
                               body = std::move(body)]() mutable {
            Stream stream(std::move(pipe), std::move(session));
            boost::system::error_code ec;
            stream.handshake(ec);
            server_handshake_ok_ = !ec;
            if (!ec && body) {
                body(stream);
            }
        });
    }

    std::unique_ptr<Stream> make_client(PipeStream pipe, const TestIdentity* trusted,
                                        std::string_view server_name = "localhost") {
        client_ctx_ = make_client_context(trusted);
        if (!client_ctx_) {
            return nullptr;
        }
        auto session = client_ctx_->create_session(server_name);
        if (!session) {
            return nullptr;
        }
        return std::make_unique<Stream>(std::move(pipe), std::move(session).value());
    }

    TestIdentity identity_;
    std::unique_ptr<TLSContext> server_ctx_;
    std::unique_ptr<TLSContext> client_ctx_;
    std::thread server_;
    std::atomic<bool> server_handshake_ok_{false};
    std::atomic<bool> release_{false};
    std::vector<uint8_t> payload_;
};

// ============================================================================
// Handshake Tests
// ============================================================================

TEST_F(TlsStreamTest, HandshakeAndEcho) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();

    start_server(std::move(server_pipe), [](Stream& stream) {
        char buffer[4];
        boost::system::error_code ec;
        asio::read(stream, asio::buffer(buffer), ec);
        if (!ec && std::string(buffer, 4) == "ping") {
            asio::write(stream, asio::buffer(std::string("pong")), ec);
        }
    });

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    ASSERT_FALSE(ec) << ec.message() << " " << client->last_error();
    EXPECT_TRUE(client->session().is_handshake_done());

    asio::write(*client, asio::buffer(std::string("ping")), ec);
    ASSERT_FALSE(ec);

    char reply[4];
    asio::read(*client, asio::buffer(reply), ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(std::string(reply, 4), "pong");

    server_.join();
    EXPECT_TRUE(server_handshake_ok_);
}

TEST_F(TlsStreamTest, UntrustedCertificateFailsHandshake) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), nullptr);

    auto client = make_client(std::move(client_pipe), nullptr);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    EXPECT_EQ(ec, make_error_code(tls_errc::handshake_failed));
    EXPECT_TRUE(client->is_broken());
    EXPECT_FALSE(client->last_error().empty());

    client.reset();
    server_.join();
    EXPECT_FALSE(server_handshake_ok_);
}

TEST_F(TlsStreamTest, HostNameMismatchFailsHandshake) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), nullptr);

    auto client = make_client(std::move(client_pipe), &identity_, "other.example");
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    EXPECT_EQ(ec, make_error_code(tls_errc::handshake_failed));

    client.reset();
    server_.join();
}

TEST_F(TlsStreamTest, PeerClosingDuringHandshake) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    {
        // Server end vanishes without answering
        PipeStream gone = std::move(server_pipe);
    }

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    EXPECT_EQ(ec, make_error_code(tls_errc::handshake_failed));
    EXPECT_NE(client->last_error().find("closed"), std::string::npos);
}

// ============================================================================
// Data Transfer Tests
// ============================================================================

TEST_F(TlsStreamTest, LargeTransferCrossesRecordBoundaries) {
    const size_t size = 300 * 1024;
    payload_.resize(size);
    for (size_t i = 0; i < size; ++i) {
        payload_[i] = static_cast<uint8_t>(i * 7);
    }

    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), [this](Stream& stream) {
        boost::system::error_code ec;
        asio::write(stream, asio::buffer(payload_), ec);
    });

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    ASSERT_FALSE(ec);

    std::vector<uint8_t> received(size);
    asio::read(*client, asio::buffer(received), ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(received, payload_);
}

TEST_F(TlsStreamTest, CloseNotifyReadsAsEof) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), [](Stream& stream) {
        boost::system::error_code ec;
        asio::write(stream, asio::buffer(std::string("bye")), ec);
        stream.shutdown(asio::socket_base::shutdown_both, ec);
    });

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    ASSERT_FALSE(ec);

    std::string received;
    char buffer[16];
    for (;;) {
        size_t n = client->read_some(asio::buffer(buffer), ec);
        received.append(buffer, n);
        if (ec) {
            break;
        }
    }
    EXPECT_EQ(ec, asio::error::eof);
    EXPECT_EQ(received, "bye");
    EXPECT_FALSE(client->is_broken());
}

TEST_F(TlsStreamTest, UncleanCloseReadsAsEof) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), [](Stream& stream) {
        boost::system::error_code ec;
        asio::write(stream, asio::buffer(std::string("tail")), ec);
        // Close the transport without close_notify
        stream.next_layer().shutdown(asio::socket_base::shutdown_both, ec);
    });

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    ASSERT_FALSE(ec);

    std::string received;
    char buffer[16];
    for (;;) {
        size_t n = client->read_some(asio::buffer(buffer), ec);
        received.append(buffer, n);
        if (ec) {
            break;
        }
    }
    EXPECT_EQ(ec, asio::error::eof);
    EXPECT_EQ(received, "tail");
}

TEST_F(TlsStreamTest, ReadTimeoutLeavesStreamUsable) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), [this](Stream& stream) {
        while (!release_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        boost::system::error_code ec;
        asio::write(stream, asio::buffer(std::string("late")), ec);
    });

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    ASSERT_FALSE(ec);

    client->set_read_timeout(std::chrono::milliseconds(50), ec);
    ASSERT_FALSE(ec);

    char buffer[4];
    size_t n = client->read_some(asio::buffer(buffer), ec);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(ec, asio::error::timed_out);
    EXPECT_FALSE(client->is_broken());

    release_ = true;
    client->set_read_timeout(std::chrono::milliseconds(5000), ec);
    asio::read(*client, asio::buffer(buffer), ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(std::string(buffer, 4), "late");
}

TEST_F(TlsStreamTest, BrokenStreamRejectsIo) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), nullptr);

    auto client = make_client(std::move(client_pipe), nullptr);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    client->handshake(ec);
    ASSERT_TRUE(ec);

    char buffer[4] = {};
    EXPECT_EQ(client->write(buffer, sizeof(buffer), ec), 0u);
    EXPECT_EQ(ec, make_error_code(tls_errc::stream_broken));
    EXPECT_EQ(client->read(buffer, sizeof(buffer), ec), 0u);
    EXPECT_EQ(ec, make_error_code(tls_errc::stream_broken));

    client.reset();
    server_.join();
}

TEST_F(TlsStreamTest, ForwardsPeerAddress) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);

    boost::system::error_code ec;
    auto endpoint = client->peer_address(ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(endpoint.port(), 443);
}

// ============================================================================
// Beast Compatibility Tests
// ============================================================================

TEST_F(TlsStreamTest, CarriesBeastHttpExchange) {
    auto [client_pipe, server_pipe] = PipeStream::make_pair();
    start_server(std::move(server_pipe), [](Stream& stream) {
        boost::beast::flat_buffer buffer;
        bhttp::request<bhttp::string_body> req;
        boost::system::error_code ec;
        bhttp::read(stream, buffer, req, ec);
        if (ec) {
            return;
        }
        bhttp::response<bhttp::string_body> res{bhttp::status::ok, 11};
        res.body() = "target=" + std::string(req.target());
        res.prepare_payload();
        bhttp::write(stream, res, ec);
    });

    auto client = make_client(std::move(client_pipe), &identity_);
    ASSERT_NE(client, nullptr);
    client->handshake();

    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, "/file.bin", 11};
    req.set(bhttp::field::host, "localhost");
    bhttp::write(*client, req);

    boost::beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> res;
    bhttp::read(*client, buffer, res);

    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(res.body(), "target=/file.bin");
}
