#include "file_kv_store.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#ifndef _WIN32
    #include <fcntl.h>
    #include <unistd.h>
#endif

namespace chunkup::adapters::kv {

namespace {

#ifndef _WIN32

auto storage_error(std::string_view what, const std::filesystem::path& path, int err) -> infra::Error {
    return infra::make_error(infra::ErrorCode::StorageError,
                             fmt::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

// Writes `value` to `path` and fsyncs it before returning.
auto write_synced(const std::filesystem::path& path, std::string_view value) -> infra::VoidResult {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(storage_error("Cannot write", path, errno));
    }

    std::size_t done = 0;
    while (done < value.size()) {
        const ssize_t n = ::write(fd, value.data() + done, value.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            return std::unexpected(storage_error("Incomplete write to", path, err));
        }
        done += static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return std::unexpected(storage_error("fsync failed for", path, err));
    }
    if (::close(fd) != 0) {
        return std::unexpected(storage_error("Cannot close", path, errno));
    }
    return {};
}

// Makes a completed rename survive a crash.
void sync_directory(const std::filesystem::path& directory) {
    int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0 || ::fsync(fd) != 0) {
        spdlog::warn("Cannot sync directory {}: {}", directory.string(), std::strerror(errno));
    }
    if (fd >= 0) {
        ::close(fd);
    }
}

#else

auto write_synced(const std::filesystem::path& path, std::string_view value) -> infra::VoidResult {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Cannot write {}", path.string())));
    }
    ofs.write(value.data(), static_cast<std::streamsize>(value.size()));
    ofs.flush();
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Incomplete write to {}", path.string())));
    }
    return {};
}

void sync_directory(const std::filesystem::path&) {}

#endif

} // namespace

FileKeyValueStore::FileKeyValueStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto FileKeyValueStore::path_for(std::string_view key) const -> infra::Result<std::filesystem::path> {
    if (key.empty() || key.find_first_of("/\\") != std::string_view::npos || key.find("..") != std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Invalid storage key '{}'", key)));
    }
    return directory_ / fmt::format("{}.state", key);
}

auto FileKeyValueStore::get(std::string_view key) -> infra::Result<std::optional<std::string>> {
    auto path = path_for(key);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    std::ifstream ifs(*path, std::ios::binary);
    if (!ifs) {
        std::error_code ec;
        if (!std::filesystem::exists(*path, ec)) {
            return std::optional<std::string>{};
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Cannot open {}", path->string())));
    }

    std::string value{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    if (ifs.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Read error on {}", path->string())));
    }
    return std::optional<std::string>{std::move(value)};
}

auto FileKeyValueStore::set(std::string_view key, std::string_view value) -> infra::VoidResult {
    auto path = path_for(key);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    std::lock_guard lock(write_mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Cannot create {}: {}", directory_.string(), ec.message())));
    }

    auto tmp = *path;
    tmp += ".tmp";
    if (auto written = write_synced(tmp, value); !written) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return written;
    }

    std::filesystem::rename(tmp, *path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Cannot replace {}: {}", path->string(), ec.message())));
    }
    sync_directory(directory_);
    return {};
}

auto FileKeyValueStore::remove(std::string_view key) -> infra::VoidResult {
    auto path = path_for(key);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }

    std::lock_guard lock(write_mutex_);
    std::error_code ec;
    std::filesystem::remove(*path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Cannot remove {}: {}", path->string(), ec.message())));
    }
    spdlog::debug("Removed {}", path->string());
    return {};
}

} // namespace chunkup::adapters::kv
