/**
 * @file test_error.cpp
 * @brief Unit tests for the netfetch error handling system
 *
 * Tests coverage for:
 * - ErrorCode: codes, categories, helper functions
 * - Error: context entries and cause chains
 * - Result<T>: value and void specializations, propagation macros
 * - Download helpers: backend_unavailable, http_status_error, io_failure
 */

#include <gtest/gtest.h>
#include <netfetch/common/error.hpp>

#include <cerrno>
#include <memory>
#include <string>

using namespace netfetch::common;

// ============================================================================
// ErrorCode Tests
// ============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, SuccessCode) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::UNKNOWN_ERROR));
}

TEST_F(ErrorCodeTest, CategoryExtraction) {
    EXPECT_EQ(get_category(ErrorCode::INVALID_ARGUMENT), ErrorCategory::GENERAL);
    EXPECT_EQ(get_category(ErrorCode::CONNECTION_TIMEOUT), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::TOO_MANY_REDIRECTS), ErrorCategory::PROTOCOL);
    EXPECT_EQ(get_category(ErrorCode::CONFIG_PARSE_ERROR), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::SECURITY_HANDSHAKE_FAILED), ErrorCategory::SECURITY);
    EXPECT_EQ(get_category(ErrorCode::FILE_NOT_FOUND), ErrorCategory::PLATFORM);
}

TEST_F(ErrorCodeTest, DownloadCodesShareCategory) {
    for (auto code : {ErrorCode::BACKEND_UNAVAILABLE, ErrorCode::NO_WORKING_BACKENDS,
                      ErrorCode::RESOURCE_NOT_FOUND, ErrorCode::HTTP_STATUS,
                      ErrorCode::TRANSFER_STALLED, ErrorCode::FILE_CREATE_FAILED,
                      ErrorCode::FILE_WRITE_FAILED, ErrorCode::FILE_SYNC_FAILED,
                      ErrorCode::SOCKET_READ_FAILED}) {
        EXPECT_EQ(get_category(code), ErrorCategory::DOWNLOAD) << error_name(code);
    }
}

TEST_F(ErrorCodeTest, ErrorNames) {
    EXPECT_EQ(error_name(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(error_name(ErrorCode::BACKEND_UNAVAILABLE), "BACKEND_UNAVAILABLE");
    EXPECT_EQ(error_name(ErrorCode::NO_WORKING_BACKENDS), "NO_WORKING_BACKENDS");
    EXPECT_EQ(error_name(ErrorCode::HTTP_STATUS), "HTTP_STATUS");
    EXPECT_EQ(category_name(ErrorCategory::DOWNLOAD), "Download");
}

// ============================================================================
// Error Tests
// ============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    Error error;
    EXPECT_TRUE(error.is_success());
    EXPECT_EQ(error.code(), ErrorCode::SUCCESS);
}

TEST_F(ErrorTest, CodeAndMessage) {
    Error error(ErrorCode::RESOURCE_NOT_FOUND, "not found: http://example.com/x");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.category(), ErrorCategory::DOWNLOAD);
    EXPECT_EQ(error.message(), "not found: http://example.com/x");
}

TEST_F(ErrorTest, ContextLookup) {
    Error error(ErrorCode::INVALID_ARGUMENT);
    error.with_context("url", "file:relative").with_context("url", "second");

    ASSERT_TRUE(error.context("url").has_value());
    EXPECT_EQ(*error.context("url"), "file:relative");
    EXPECT_FALSE(error.context("missing").has_value());
    EXPECT_EQ(error.context_entries().size(), 2u);
}

TEST_F(ErrorTest, CauseChainIsDeepCopied) {
    Error error(ErrorCode::FILE_WRITE_FAILED, "outer");
    error.with_cause(Error(ErrorCode::WRITE_ERROR, "inner"));

    Error copy = error;
    ASSERT_NE(copy.cause(), nullptr);
    EXPECT_NE(copy.cause(), error.cause());
    EXPECT_EQ(copy.cause()->code(), ErrorCode::WRITE_ERROR);
    EXPECT_EQ(copy.cause()->message(), "inner");
}

TEST_F(ErrorTest, ToStringIncludesChain) {
    Error error(ErrorCode::FILE_WRITE_FAILED, "outer");
    error.with_cause(Error(ErrorCode::WRITE_ERROR, "inner"));

    auto text = error.to_string();
    EXPECT_NE(text.find("FILE_WRITE_FAILED"), std::string::npos);
    EXPECT_NE(text.find("outer"), std::string::npos);
    EXPECT_NE(text.find("Caused by"), std::string::npos);
    EXPECT_NE(text.find("inner"), std::string::npos);
}

// ============================================================================
// Result Tests
// ============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, VoidSuccess) {
    Result<void> result = ok();
    EXPECT_TRUE(result.is_success());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultTest, VoidError) {
    Result<void> result = err(ErrorCode::TRANSFER_STALLED, "too slow");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::TRANSFER_STALLED);
    EXPECT_EQ(result.message(), "too slow");
}

TEST_F(ResultTest, ValueSuccess) {
    Result<std::string> result = ok(std::string("payload"));
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value(), "payload");
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultTest, ValueError) {
    Result<int> result(ErrorCode::NOT_FOUND, "nothing");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.value_or(7), 7);
}

TEST_F(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(42));
    ASSERT_TRUE(result.is_success());
    auto ptr = std::move(result).value();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 42);
}

TEST_F(ResultTest, ErrorMoveKeepsContext) {
    Result<void> result(backend_unavailable("curl"));
    Error error = std::move(result).error();
    EXPECT_EQ(error.code(), ErrorCode::BACKEND_UNAVAILABLE);
    EXPECT_EQ(error.context("backend"), std::optional<std::string_view>("curl"));
}

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return err<int>(ErrorCode::INVALID_ARGUMENT, "not positive");
    }
    return value;
}

Result<void> checked(int value) {
    NETFETCH_TRY(parse_positive(value));
    return ok();
}

}  // namespace

TEST_F(ResultTest, TryPropagatesUnchanged) {
    auto result = checked(0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.message(), "not positive");
}

// ============================================================================
// Download Helper Tests
// ============================================================================

class DownloadErrorTest : public ::testing::Test {};

TEST_F(DownloadErrorTest, BackendUnavailableCarriesName) {
    auto error = backend_unavailable("beast-tls");
    EXPECT_EQ(error.code(), ErrorCode::BACKEND_UNAVAILABLE);
    EXPECT_EQ(error.context("backend"), std::optional<std::string_view>("beast-tls"));
    EXPECT_NE(error.message().find("beast-tls"), std::string::npos);
}

TEST_F(DownloadErrorTest, HttpStatusRoundTrip) {
    auto error = http_status_error(503);
    EXPECT_EQ(error.code(), ErrorCode::HTTP_STATUS);
    EXPECT_EQ(http_status_of(error), std::optional<uint32_t>(503));
}

TEST_F(DownloadErrorTest, HttpStatusOfOtherCodes) {
    EXPECT_FALSE(http_status_of(Error(ErrorCode::RESOURCE_NOT_FOUND)).has_value());

    Error bogus(ErrorCode::HTTP_STATUS);
    bogus.with_context("http_status", "abc");
    EXPECT_FALSE(http_status_of(bogus).has_value());
}

TEST_F(DownloadErrorTest, IoFailureKeepsOperationAndCause) {
    auto error = io_failure(ErrorCode::FILE_SYNC_FAILED, "sync file",
                            errno_error(ErrorCode::FILE_SYNC_FAILED, EIO, "/tmp/out"));
    EXPECT_EQ(error.code(), ErrorCode::FILE_SYNC_FAILED);
    EXPECT_EQ(error.context("operation"), std::optional<std::string_view>("sync file"));
    ASSERT_NE(error.cause(), nullptr);
    EXPECT_EQ(error.cause()->context("errno"),
              std::optional<std::string_view>(std::to_string(EIO)));
    EXPECT_NE(error.cause()->message().find("/tmp/out"), std::string::npos);
}
