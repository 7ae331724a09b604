#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

#ifdef _WIN32
    #include <fstream>
    #include <mutex>
#endif

namespace chunkup::adapters::fs {

// Read-only handle on the file being uploaded. read() is safe to call from
// several workers at once.
class FileSource {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> infra::Result<std::unique_ptr<FileSource>>;

    ~FileSource();

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto name() const -> std::string { return path_.filename().string(); }
    [[nodiscard]] auto size() const -> std::uint64_t { return size_; }

    // Exactly `length` bytes at `offset`, or ReadError.
    [[nodiscard]] auto read(std::uint64_t offset, std::uint64_t length) const
        -> infra::Result<std::vector<char>>;

private:
    FileSource(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::uint64_t size_ = 0;
#ifdef _WIN32
    mutable std::ifstream stream_;
    mutable std::mutex stream_mutex_;
#else
    int fd_ = -1;
#endif
};

} // namespace chunkup::adapters::fs
