#pragma once

/**
 * @file file_sink.hpp
 * @brief Destination file of a path download
 *
 * A FileSink owns a freshly created (truncated) file. Bytes are appended as
 * they arrive; commit() makes them durable, discard() removes the partial
 * file. A sink that is destroyed without either only closes the file.
 */

#include <netfetch/common/error.hpp>

#include <cstdint>
#include <filesystem>
#include <span>

namespace netfetch::download {

class FileSink {
public:
    /**
     * @brief Create or truncate @p path
     *
     * Fails with FILE_CREATE_FAILED.
     */
    static common::Result<FileSink> create(const std::filesystem::path& path);

    FileSink(FileSink&& other) noexcept;
    FileSink& operator=(FileSink&& other) noexcept;

    FileSink(const FileSink&)            = delete;
    FileSink& operator=(const FileSink&) = delete;

    ~FileSink();

    /**
     * @brief Append @p data in full
     *
     * Fails with FILE_WRITE_FAILED.
     */
    common::Result<void> write(std::span<const uint8_t> data);

    /**
     * @brief Flush file data to the device and close the file
     *
     * Fails with FILE_SYNC_FAILED.
     */
    common::Result<void> commit();

    /**
     * @brief Close and remove the file; failures are ignored
     */
    void discard() noexcept;

    const std::filesystem::path& path() const noexcept { return path_; }
    uint64_t bytes_written() const noexcept { return bytes_written_; }
    bool is_open() const noexcept { return fd_ >= 0; }

private:
    FileSink(std::filesystem::path path, int fd) noexcept;

    void close() noexcept;

    std::filesystem::path path_;
    int fd_                = -1;
    uint64_t bytes_written_ = 0;
};

}  // namespace netfetch::download
