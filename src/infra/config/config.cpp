#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"

namespace chunkup::infra {

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        paths.push_back(".chunkup.yaml");

        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "chunkup" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "chunkup" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_file(const std::filesystem::path& path) -> Result<Config> {
        try {
            YAML::Node node = YAML::LoadFile(path.string());
            Config cfg{};

            if (node["chunk_size"]) cfg.chunk_size = node["chunk_size"].as<std::int64_t>();
            if (node["concurrency"]) cfg.concurrency = node["concurrency"].as<int>();
            if (node["max_finalize_rounds"]) cfg.max_finalize_rounds = node["max_finalize_rounds"].as<int>();
            if (node["state_dir"]) cfg.state_dir = node["state_dir"].as<std::string>();

            if (const auto retry = node["retry"]) {
                if (retry["max_attempts"]) cfg.retry.max_attempts = retry["max_attempts"].as<int>();
                if (retry["initial_delay_ms"]) {
                    cfg.retry.initial_delay = std::chrono::milliseconds(retry["initial_delay_ms"].as<std::int64_t>());
                }
                if (retry["backoff_factor"]) cfg.retry.backoff_factor = retry["backoff_factor"].as<double>();
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file() -> Result<Config> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from_file(path);
        }

        // No file is not an error
        return Config{};
    }

    auto validate_config(const Config& config) -> VoidResult {
        if (config.chunk_size <= 0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              fmt::format("chunk_size must be positive, got {}", config.chunk_size)));
        }
        if (config.concurrency < 1) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              fmt::format("concurrency must be at least 1, got {}", config.concurrency)));
        }
        if (config.retry.max_attempts < 1) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              fmt::format("retry.max_attempts must be at least 1, got {}", config.retry.max_attempts)));
        }
        if (config.retry.initial_delay.count() < 0 || config.retry.backoff_factor < 1.0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "retry backoff must be non-negative and non-shrinking"));
        }
        if (config.max_finalize_rounds < 1) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              fmt::format("max_finalize_rounds must be at least 1, got {}", config.max_finalize_rounds)));
        }
        return {};
    }

} // namespace chunkup::infra
