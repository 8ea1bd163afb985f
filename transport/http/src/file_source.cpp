/**
 * @file file_source.cpp
 * @brief Local-file fast path shared by every backend
 */

#include "netfetch/transport/http/download_backend.hpp"

#include <netfetch/common/debug.hpp>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace netfetch::transport::http {

using namespace common::debug;
using common::ErrorCode;

namespace {

struct FileCloser {
    void operator()(std::FILE* fp) const noexcept { std::fclose(fp); }
};

}  // anonymous namespace

common::Result<void> download_from_file_url(const common::Url& url,
                                            const EventCallback& callback) {
    auto path = url.to_file_path();
    if (!path) {
        return common::err(ErrorCode::INVALID_ARGUMENT, "bogus file url: '" + url.to_string() + "'");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*path, ec)) {
        return common::Result<void>(ErrorCode::RESOURCE_NOT_FOUND,
                                    "file not found: " + path->string());
    }

    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path->c_str(), "rb"));
    if (!file) {
        return common::io_failure(
            ErrorCode::FILE_READ_FAILED, "open file",
            common::errno_error(ErrorCode::FILE_READ_FAILED, errno, path->string()));
    }

    NETFETCH_LOG_DEBUG(category::TRANSPORT, "Reading local file " << path->string());

    std::vector<uint8_t> buffer(kChunkSize);
    for (;;) {
        size_t n = std::fread(buffer.data(), 1, buffer.size(), file.get());
        if (n == 0) {
            if (std::ferror(file.get())) {
                return common::io_failure(
                    ErrorCode::FILE_READ_FAILED, "read file",
                    common::errno_error(ErrorCode::FILE_READ_FAILED, errno, path->string()));
            }
            break;
        }

        auto result = callback(DataReceived{std::span<const uint8_t>(buffer.data(), n)});
        if (result.is_error()) {
            return result;
        }
    }

    return common::ok();
}

}  // namespace netfetch::transport::http
