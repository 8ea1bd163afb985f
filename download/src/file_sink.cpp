/**
 * @file file_sink.cpp
 * @brief Destination file of a path download
 */

#include "netfetch/download/file_sink.hpp"

#include <netfetch/common/debug.hpp>

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace netfetch::download {

using namespace common::debug;
using common::ErrorCode;

common::Result<FileSink> FileSink::create(const std::filesystem::path& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return common::io_failure(ErrorCode::FILE_CREATE_FAILED, "create file",
                                  common::errno_error(ErrorCode::FILE_CREATE_FAILED, errno,
                                                      path.string()));
    }
    return FileSink(path, fd);
}

FileSink::FileSink(std::filesystem::path path, int fd) noexcept
    : path_(std::move(path)), fd_(fd) {}

FileSink::FileSink(FileSink&& other) noexcept
    : path_(std::move(other.path_))
    , fd_(std::exchange(other.fd_, -1))
    , bytes_written_(other.bytes_written_) {}

FileSink& FileSink::operator=(FileSink&& other) noexcept {
    if (this != &other) {
        close();
        path_          = std::move(other.path_);
        fd_            = std::exchange(other.fd_, -1);
        bytes_written_ = other.bytes_written_;
    }
    return *this;
}

FileSink::~FileSink() {
    close();
}

common::Result<void> FileSink::write(std::span<const uint8_t> data) {
    if (fd_ < 0) {
        return common::err(ErrorCode::INVALID_STATE, "file sink is closed");
    }

    const uint8_t* ptr = data.data();
    size_t remaining   = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return common::io_failure(ErrorCode::FILE_WRITE_FAILED, "write file",
                                      common::errno_error(ErrorCode::FILE_WRITE_FAILED, errno,
                                                          path_.string()));
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }

    bytes_written_ += data.size();
    return common::ok();
}

common::Result<void> FileSink::commit() {
    if (fd_ < 0) {
        return common::err(ErrorCode::INVALID_STATE, "file sink is closed");
    }

    if (::fdatasync(fd_) != 0) {
        return common::io_failure(ErrorCode::FILE_SYNC_FAILED, "sync file",
                                  common::errno_error(ErrorCode::FILE_SYNC_FAILED, errno,
                                                      path_.string()));
    }

    int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0 && errno != EINTR) {
        return common::io_failure(ErrorCode::FILE_SYNC_FAILED, "close file",
                                  common::errno_error(ErrorCode::FILE_SYNC_FAILED, errno,
                                                      path_.string()));
    }

    NETFETCH_LOG_DEBUG(category::DOWNLOAD,
                       "Wrote " << bytes_written_ << " bytes to " << path_.string());
    return common::ok();
}

void FileSink::discard() noexcept {
    close();
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(path_, ec)) {
        std::filesystem::remove(path_, ec);
        if (ec) {
            NETFETCH_LOG_DEBUG(category::DOWNLOAD, "Cannot remove partial file "
                                                       << path_.string() << ": " << ec.message());
        }
    }
}

void FileSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace netfetch::download
