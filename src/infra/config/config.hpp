#pragma once

#include <cstdint>
#include <filesystem>
#include "../error_handler/error.hpp"
#include "../retry.hpp"

namespace chunkup::infra {

inline constexpr std::int64_t kDefaultChunkSize = 5 * 1024 * 1024;
inline constexpr int kDefaultConcurrency = 3;

struct Config {
    // Chunking / scheduling
    std::int64_t chunk_size = kDefaultChunkSize;   // bytes
    int concurrency = kDefaultConcurrency;

    // Failure handling
    RetryPolicy retry{};
    int max_finalize_rounds = 2;  // merges attempted before IncompleteUpload is final

    // Durable resume records
    std::filesystem::path state_dir = ".chunkup";
};

/// Loads configuration from YAML.
/// Search order:
///   1. ./.chunkup.yaml
///   2. $XDG_CONFIG_HOME/chunkup/config.yaml, else ~/.config/chunkup/config.yaml
/// Returns defaults when no file exists.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Loads an explicit YAML file. Missing keys keep their defaults.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path) -> Result<Config>;

[[nodiscard]] auto validate_config(const Config& config) -> VoidResult;

} // namespace chunkup::infra
