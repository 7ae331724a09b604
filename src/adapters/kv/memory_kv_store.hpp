#pragma once

#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include "kv_store.hpp"

namespace chunkup::adapters::kv {

// Per-process store for tests and embedders that bring their own persistence.
class MemoryKeyValueStore final : public KeyValueStore {
public:
    auto get(std::string_view key) -> infra::Result<std::optional<std::string>> override {
        std::shared_lock lock(mutex_);
        auto it = table_.find(std::string(key));
        if (it == table_.end()) {
            return std::optional<std::string>{};
        }
        return std::optional<std::string>{it->second};
    }

    auto set(std::string_view key, std::string_view value) -> infra::VoidResult override {
        std::unique_lock lock(mutex_);
        table_[std::string(key)] = std::string(value);
        return {};
    }

    auto remove(std::string_view key) -> infra::VoidResult override {
        std::unique_lock lock(mutex_);
        table_.erase(std::string(key));
        return {};
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return table_.size();
    }

private:
    std::unordered_map<std::string, std::string> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace chunkup::adapters::kv
