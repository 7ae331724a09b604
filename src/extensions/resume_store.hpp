// extensions/resume_store.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include "../adapters/kv/kv_store.hpp"
#include "../infra/error_handler/error.hpp"

namespace chunkup::extensions {

using ChunkIndexSet = std::set<std::uint32_t>;

// Confirmed chunk indices per fingerprint, persisted as `upload_<fingerprint>`
// holding a YAML flow sequence such as "[0, 1, 3]".
class ResumeStateStore {
public:
    explicit ResumeStateStore(adapters::kv::KeyValueStore& backend);

    ResumeStateStore(const ResumeStateStore&) = delete;
    ResumeStateStore& operator=(const ResumeStateStore&) = delete;

    // Empty set when nothing was recorded; StorageError on a corrupt record.
    [[nodiscard]] auto load(std::string_view fingerprint) -> infra::Result<ChunkIndexSet>;

    // Idempotent. Concurrent calls for one fingerprint are serialized.
    [[nodiscard]] auto record_chunk(std::string_view fingerprint, std::uint32_t index) -> infra::VoidResult;

    [[nodiscard]] auto clear(std::string_view fingerprint) -> infra::VoidResult;

    // Fingerprints with an operation in progress.
    [[nodiscard]] auto tracked_fingerprints() const -> std::size_t;

    [[nodiscard]] static auto key_for(std::string_view fingerprint) -> std::string;

    [[nodiscard]] static auto encode(const ChunkIndexSet& indices) -> std::string;
    [[nodiscard]] static auto decode(std::string_view text) -> infra::Result<ChunkIndexSet>;

private:
    // Holds the per-fingerprint mutex; on release, drops the map entry once
    // no other caller shares it.
    class FingerprintLock {
    public:
        FingerprintLock(ResumeStateStore& owner, std::string_view fingerprint);
        ~FingerprintLock();

        FingerprintLock(const FingerprintLock&) = delete;
        FingerprintLock& operator=(const FingerprintLock&) = delete;

    private:
        ResumeStateStore& owner_;
        std::string fingerprint_;
        std::shared_ptr<std::mutex> mutex_;
    };

    auto lock_for_(std::string_view fingerprint) -> std::shared_ptr<std::mutex>;
    void release_(const std::string& fingerprint, std::shared_ptr<std::mutex> held);

    adapters::kv::KeyValueStore& backend_;
    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace chunkup::extensions
