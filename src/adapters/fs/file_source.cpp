#include "file_source.hpp"
#include <fmt/core.h>
#include <cerrno>
#include <cstring>
#include <system_error>

#ifndef _WIN32
    #include <sys/stat.h>
    #include <fcntl.h>
    #include <unistd.h>
#endif

namespace chunkup::adapters::fs {

FileSource::FileSource(std::filesystem::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

#ifndef _WIN32

auto FileSource::open(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<FileSource>>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Cannot open {}: {}", path.string(), std::strerror(errno))));
    }

    struct stat sb;
    if (::fstat(fd, &sb) == -1) {
        const int err = errno;
        ::close(fd);
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("fstat failed for {}: {}", path.string(), std::strerror(err))));
    }
    if (!S_ISREG(sb.st_mode)) {
        ::close(fd);
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Not a regular file: {}", path.string())));
    }

    std::unique_ptr<FileSource> source(new FileSource(path, static_cast<std::uint64_t>(sb.st_size)));
    source->fd_ = fd;
    return source;
}

FileSource::~FileSource() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto FileSource::read(std::uint64_t offset, std::uint64_t length) const
    -> infra::Result<std::vector<char>>
{
    if (offset + length > size_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Range [{}, {}) is past end of {} ({} bytes)",
                                           offset, offset + length, path_.string(), size_)));
    }

    std::vector<char> buffer(length);
    std::uint64_t done = 0;
    // pread keeps no shared file position, so workers never race on seeks
    while (done < length) {
        const ssize_t n = ::pread(fd_, buffer.data() + done, length - done,
                                  static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                                   fmt::format("Read error at offset {} in {}: {}",
                                               offset + done, path_.string(), std::strerror(errno))));
        }
        if (n == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                                   fmt::format("{} shrank while reading (offset {})", path_.string(), offset + done)));
        }
        done += static_cast<std::uint64_t>(n);
    }
    return buffer;
}

#else

auto FileSource::open(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<FileSource>>
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Not a regular file: {}", path.string())));
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
    }

    std::unique_ptr<FileSource> source(new FileSource(path, size));
    source->stream_.open(path, std::ios::binary);
    if (!source->stream_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Cannot open {}", path.string())));
    }
    return source;
}

FileSource::~FileSource() = default;

auto FileSource::read(std::uint64_t offset, std::uint64_t length) const
    -> infra::Result<std::vector<char>>
{
    if (offset + length > size_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Range [{}, {}) is past end of {}", offset, offset + length, path_.string())));
    }

    std::vector<char> buffer(length);
    std::lock_guard lock(stream_mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_.read(buffer.data(), static_cast<std::streamsize>(length))) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                               fmt::format("Read error at offset {}", offset)));
    }
    return buffer;
}

#endif

} // namespace chunkup::adapters::fs
