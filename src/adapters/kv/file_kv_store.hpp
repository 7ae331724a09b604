#pragma once

#include <filesystem>
#include <mutex>
#include "kv_store.hpp"

namespace chunkup::adapters::kv {

// One file per key under `directory` (<key>.state). Writes go to a temporary
// file that is renamed over the target, so readers never see a torn value.
class FileKeyValueStore final : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path directory);

    auto get(std::string_view key) -> infra::Result<std::optional<std::string>> override;
    auto set(std::string_view key, std::string_view value) -> infra::VoidResult override;
    auto remove(std::string_view key) -> infra::VoidResult override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    [[nodiscard]] auto path_for(std::string_view key) const -> infra::Result<std::filesystem::path>;

    std::filesystem::path directory_;
    std::mutex write_mutex_;
};

} // namespace chunkup::adapters::kv
