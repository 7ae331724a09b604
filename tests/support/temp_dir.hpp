#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace chunkup::test_support {

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("chunkup_test_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    auto write_file(std::string_view name, std::string_view content) const -> std::filesystem::path {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }

private:
    std::filesystem::path path_;
};

// Deterministic, non-repeating-looking filler so distinct chunks differ.
inline auto make_content(std::size_t size, unsigned seed = 7) -> std::string {
    std::string content(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>((i * 31 + seed + i / 251) % 256);
    }
    return content;
}

} // namespace chunkup::test_support
