/**
 * @file test_downloader.cpp
 * @brief Unit tests for backend fallback and path downloads
 */

#include <gtest/gtest.h>
#include <netfetch/common/debug.hpp>
#include <netfetch/download/downloader.hpp>
#include <netfetch/download/file_sink.hpp>

#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

using namespace netfetch::download;
using netfetch::common::Error;
using netfetch::common::ErrorCode;
using netfetch::common::parse_url;
using netfetch::common::Result;
using netfetch::common::Url;

namespace http = netfetch::transport::http;

namespace {

const Url& test_url() {
    static const Url url = *parse_url("http://example.com/file.bin");
    return url;
}

std::vector<uint8_t> read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

}  // namespace

class DownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("netfetch_downloader_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    /// Strategy that records its invocation and answers with @p result
    BackendStrategy recorded(Backend backend, Result<void> result) {
        return BackendStrategy{backend, [this, backend, result](const Url&, const EventCallback&) {
                                   calls_.push_back(backend);
                                   return result;
                               }};
    }

    /// Strategy that streams @p payload in two chunks after announcing its length
    BackendStrategy serving(Backend backend, std::vector<uint8_t> payload) {
        return BackendStrategy{
            backend,
            [this, backend, payload](const Url&, const EventCallback& callback) -> Result<void> {
                calls_.push_back(backend);
                NETFETCH_TRY(callback(ContentLengthReceived{payload.size()}));
                size_t half = payload.size() / 2;
                std::span<const uint8_t> data(payload);
                NETFETCH_TRY(callback(DataReceived{data.first(half)}));
                return callback(DataReceived{data.subspan(half)});
            }};
    }

    static Result<void> unavailable(Backend backend) {
        return netfetch::common::backend_unavailable(http::backend_name(backend));
    }

    std::filesystem::path dir_;
    std::vector<Backend> calls_;
};

// ============================================================================
// Fallback Tests
// ============================================================================

TEST_F(DownloaderTest, SkipsUnavailableBackendsInOrder) {
    std::array<BackendStrategy, 3> strategies = {
        recorded(Backend::CURL, unavailable(Backend::CURL)),
        recorded(Backend::BEAST_ASIO_SSL, unavailable(Backend::BEAST_ASIO_SSL)),
        recorded(Backend::BEAST_TLS_STREAM, netfetch::common::ok()),
    };

    auto result = attempt_download(strategies, test_url(), [](const Event&) {
        return netfetch::common::ok();
    });

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(calls_, (std::vector<Backend>{Backend::CURL, Backend::BEAST_ASIO_SSL,
                                            Backend::BEAST_TLS_STREAM}));
}

TEST_F(DownloaderTest, StopsAtFirstSuccess) {
    std::array<BackendStrategy, 3> strategies = {
        recorded(Backend::CURL, netfetch::common::ok()),
        recorded(Backend::BEAST_ASIO_SSL, netfetch::common::ok()),
        recorded(Backend::BEAST_TLS_STREAM, netfetch::common::ok()),
    };

    ASSERT_TRUE(attempt_download(strategies, test_url(), [](const Event&) {
                    return netfetch::common::ok();
                }).is_success());
    EXPECT_EQ(calls_, std::vector<Backend>{Backend::CURL});
}

TEST_F(DownloaderTest, RealFailureIsNotRetried) {
    std::array<BackendStrategy, 3> strategies = {
        recorded(Backend::CURL, unavailable(Backend::CURL)),
        recorded(Backend::BEAST_ASIO_SSL,
                 netfetch::common::err(ErrorCode::CONNECTION_REFUSED, "refused")),
        recorded(Backend::BEAST_TLS_STREAM, netfetch::common::ok()),
    };

    auto result = attempt_download(strategies, test_url(), [](const Event&) {
        return netfetch::common::ok();
    });

    EXPECT_EQ(result.code(), ErrorCode::CONNECTION_REFUSED);
    EXPECT_EQ(result.message(), "refused");
    EXPECT_EQ(calls_, (std::vector<Backend>{Backend::CURL, Backend::BEAST_ASIO_SSL}));
}

TEST_F(DownloaderTest, AllUnavailableIsNoWorkingBackends) {
    std::array<BackendStrategy, 2> strategies = {
        recorded(Backend::CURL, unavailable(Backend::CURL)),
        recorded(Backend::BEAST_TLS_STREAM, unavailable(Backend::BEAST_TLS_STREAM)),
    };

    auto result = attempt_download(strategies, test_url(), [](const Event&) {
        return netfetch::common::ok();
    });
    EXPECT_EQ(result.code(), ErrorCode::NO_WORKING_BACKENDS);
    EXPECT_EQ(calls_.size(), 2u);
}

TEST_F(DownloaderTest, EmptyTableIsNoWorkingBackends) {
    auto result = attempt_download(std::span<const BackendStrategy>(), test_url(),
                                   [](const Event&) { return netfetch::common::ok(); });
    EXPECT_EQ(result.code(), ErrorCode::NO_WORKING_BACKENDS);
}

TEST_F(DownloaderTest, TimesEveryAttempt) {
    using namespace netfetch::common::debug;
    std::vector<std::string> messages;
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.add_sink(std::make_shared<CallbackSink>(
        [&messages](const LogRecord& record) { messages.push_back(record.message); }));
    logger.set_level(LogLevel::DEBUG);

    std::array<BackendStrategy, 2> strategies = {
        recorded(Backend::CURL, unavailable(Backend::CURL)),
        recorded(Backend::BEAST_TLS_STREAM, netfetch::common::ok()),
    };
    auto result = attempt_download(strategies, test_url(), [](const Event&) {
        return netfetch::common::ok();
    });

    logger.clear_sinks();
    logger.filter().reset();
    ASSERT_TRUE(result.is_success());

    auto logged = [&messages](std::string_view first, std::string_view second) {
        for (const auto& message : messages) {
            if (message.find(first) != std::string::npos &&
                message.find(second) != std::string::npos) {
                return true;
            }
        }
        return false;
    };
    EXPECT_TRUE(logged("Span completed with error: backend attempt", "BACKEND_UNAVAILABLE"));
    EXPECT_TRUE(logged("Span completed with error: backend attempt", "backend=curl"));
    EXPECT_TRUE(logged("Span completed: backend attempt", "backend=beast-tls"));
}

TEST_F(DownloaderTest, DefaultTableFollowsBackendOrder) {
    auto table = default_strategy_table();
    ASSERT_EQ(table.size(), http::kBackendOrder.size());
    for (size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(table[i].backend, http::kBackendOrder[i]);
    }
    EXPECT_EQ(default_strategy_table().data(), table.data());
}

// ============================================================================
// Path Download Tests
// ============================================================================

TEST_F(DownloaderTest, WritesFileAndForwardsEvents) {
    std::vector<uint8_t> payload(0x20001);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>((i * 7) & 0xFF);
    }
    std::array<BackendStrategy, 2> strategies = {
        recorded(Backend::CURL, unavailable(Backend::CURL)),
        serving(Backend::BEAST_ASIO_SSL, payload),
    };

    auto path = dir_ / "out.bin";
    std::vector<uint64_t> lengths;
    uint64_t seen = 0;
    auto result   = attempt_download_to_path(strategies, test_url(), path, [&](const Event& event) {
        if (auto* length = std::get_if<ContentLengthReceived>(&event)) {
            lengths.push_back(length->length);
        } else {
            seen += std::get<DataReceived>(event).data.size();
            // Data is on disk before the caller sees it
            EXPECT_EQ(std::filesystem::file_size(path), seen);
        }
        return netfetch::common::ok();
    });

    ASSERT_TRUE(result.is_success()) << result.message();
    EXPECT_EQ(lengths, std::vector<uint64_t>{payload.size()});
    EXPECT_EQ(read_all(path), payload);
}

TEST_F(DownloaderTest, NoWorkingBackendsLeavesNoFile) {
    std::array<BackendStrategy, 1> strategies = {
        recorded(Backend::CURL, unavailable(Backend::CURL)),
    };

    auto path   = dir_ / "never.bin";
    auto result = attempt_download_to_path(strategies, test_url(), path);

    EXPECT_EQ(result.code(), ErrorCode::NO_WORKING_BACKENDS);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(DownloaderTest, CallbackFailureRemovesPartialFile) {
    std::array<BackendStrategy, 2> strategies = {
        serving(Backend::CURL, std::vector<uint8_t>(1024, 0x5A)),
        serving(Backend::BEAST_TLS_STREAM, std::vector<uint8_t>(1024, 0x5A)),
    };

    auto path   = dir_ / "partial.bin";
    auto result = attempt_download_to_path(strategies, test_url(), path, [](const Event& event) {
        if (std::holds_alternative<DataReceived>(event)) {
            return netfetch::common::err(ErrorCode::OPERATION_CANCELLED, "user abort");
        }
        return netfetch::common::ok();
    });

    EXPECT_EQ(result.code(), ErrorCode::OPERATION_CANCELLED);
    EXPECT_EQ(result.message(), "user abort");
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(calls_, std::vector<Backend>{Backend::CURL});
}

TEST_F(DownloaderTest, ExistingFileIsReplaced) {
    auto path = dir_ / "existing.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(4096, 'o');
    }

    std::array<BackendStrategy, 1> strategies = {
        serving(Backend::CURL, std::vector<uint8_t>{1, 2, 3}),
    };
    ASSERT_TRUE(attempt_download_to_path(strategies, test_url(), path).is_success());
    EXPECT_EQ(read_all(path), (std::vector<uint8_t>{1, 2, 3}));
}

TEST_F(DownloaderTest, UncreatablePathFails) {
    std::array<BackendStrategy, 1> strategies = {
        serving(Backend::CURL, std::vector<uint8_t>{1}),
    };

    auto result = attempt_download_to_path(strategies, test_url(), dir_ / "no/such/dir/x.bin");
    EXPECT_EQ(result.code(), ErrorCode::FILE_CREATE_FAILED);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(DownloaderTest, FileUrlCopiesWithoutLengthEvent) {
    auto source = dir_ / "source.bin";
    {
        std::ofstream out(source, std::ios::binary);
        out << std::string(http::kChunkSize + 10, 'z');
    }

    std::array<BackendStrategy, 1> strategies = {
        BackendStrategy{Backend::CURL, http::download_from_file_url},
    };

    bool saw_length = false;
    auto target     = dir_ / "copy.bin";
    auto result     = attempt_download_to_path(
        strategies, *parse_url("file://" + source.string()), target, [&](const Event& event) {
            saw_length = saw_length || std::holds_alternative<ContentLengthReceived>(event);
            return netfetch::common::ok();
        });

    ASSERT_TRUE(result.is_success()) << result.message();
    EXPECT_FALSE(saw_length);
    EXPECT_EQ(read_all(target), read_all(source));
}

// ============================================================================
// FileSink Tests
// ============================================================================

class FileSinkTest : public DownloaderTest {};

TEST_F(FileSinkTest, WriteAndCommit) {
    auto created = FileSink::create(dir_ / "sink.bin");
    ASSERT_TRUE(created.is_success()) << created.message();
    FileSink sink = std::move(created).value();

    std::vector<uint8_t> data = {'a', 'b', 'c'};
    ASSERT_TRUE(sink.write(data).is_success());
    ASSERT_TRUE(sink.write(data).is_success());
    EXPECT_EQ(sink.bytes_written(), 6u);

    ASSERT_TRUE(sink.commit().is_success());
    EXPECT_FALSE(sink.is_open());
    EXPECT_EQ(read_all(dir_ / "sink.bin").size(), 6u);

    // Closed sinks refuse further use
    EXPECT_EQ(sink.write(data).code(), ErrorCode::INVALID_STATE);
}

TEST_F(FileSinkTest, DiscardRemovesFile) {
    auto created = FileSink::create(dir_ / "gone.bin");
    ASSERT_TRUE(created.is_success());
    FileSink sink = std::move(created).value();

    std::vector<uint8_t> data(100, 1);
    ASSERT_TRUE(sink.write(data).is_success());
    sink.discard();

    EXPECT_FALSE(sink.is_open());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "gone.bin"));
}

TEST_F(FileSinkTest, MoveTransfersOwnership) {
    auto created = FileSink::create(dir_ / "moved.bin");
    ASSERT_TRUE(created.is_success());
    FileSink first = std::move(created).value();

    FileSink second(std::move(first));
    EXPECT_FALSE(first.is_open());
    EXPECT_TRUE(second.is_open());
    EXPECT_EQ(second.path(), dir_ / "moved.bin");
}

TEST_F(FileSinkTest, CreateFailureCarriesErrno) {
    auto created = FileSink::create(dir_ / "missing" / "x.bin");
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.code(), ErrorCode::FILE_CREATE_FAILED);
    EXPECT_NE(created.error().to_string().find("Caused by"), std::string::npos);
}
