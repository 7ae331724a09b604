// resume_store.cpp
#include "resume_store.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <vector>

namespace chunkup::extensions {

ResumeStateStore::ResumeStateStore(adapters::kv::KeyValueStore& backend)
    : backend_(backend) {}

auto ResumeStateStore::key_for(std::string_view fingerprint) -> std::string {
    return fmt::format("upload_{}", fingerprint);
}

auto ResumeStateStore::encode(const ChunkIndexSet& indices) -> std::string {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginSeq;
    for (auto index : indices) {
        out << index;
    }
    out << YAML::EndSeq;
    return out.c_str();
}

auto ResumeStateStore::decode(std::string_view text) -> infra::Result<ChunkIndexSet> {
    try {
        YAML::Node node = YAML::Load(std::string(text));
        if (node.IsNull()) {
            return ChunkIndexSet{};
        }
        if (!node.IsSequence()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                                   "Resume record is not a sequence"));
        }
        auto indices = node.as<std::vector<std::uint32_t>>();
        return ChunkIndexSet(indices.begin(), indices.end());
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                               fmt::format("Corrupt resume record: {}", e.what())));
    }
}

auto ResumeStateStore::lock_for_(std::string_view fingerprint) -> std::shared_ptr<std::mutex> {
    std::lock_guard lock(locks_mutex_);
    auto& slot = locks_[std::string(fingerprint)];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void ResumeStateStore::release_(const std::string& fingerprint, std::shared_ptr<std::mutex> held) {
    std::lock_guard lock(locks_mutex_);
    auto it = locks_.find(fingerprint);
    // the map and `held` are the only owners: nobody else is waiting on it
    if (it != locks_.end() && it->second == held && held.use_count() == 2) {
        locks_.erase(it);
    }
}

auto ResumeStateStore::tracked_fingerprints() const -> std::size_t {
    std::lock_guard lock(locks_mutex_);
    return locks_.size();
}

ResumeStateStore::FingerprintLock::FingerprintLock(ResumeStateStore& owner, std::string_view fingerprint)
    : owner_(owner), fingerprint_(fingerprint), mutex_(owner.lock_for_(fingerprint)) {
    mutex_->lock();
}

ResumeStateStore::FingerprintLock::~FingerprintLock() {
    mutex_->unlock();
    owner_.release_(fingerprint_, std::move(mutex_));
}

auto ResumeStateStore::load(std::string_view fingerprint) -> infra::Result<ChunkIndexSet> {
    FingerprintLock lock(*this, fingerprint);

    auto raw = backend_.get(key_for(fingerprint));
    if (!raw) {
        return std::unexpected(std::move(raw.error()));
    }
    if (!raw->has_value()) {
        return ChunkIndexSet{};
    }
    return decode(**raw);
}

auto ResumeStateStore::record_chunk(std::string_view fingerprint, std::uint32_t index) -> infra::VoidResult {
    FingerprintLock lock(*this, fingerprint);

    const auto key = key_for(fingerprint);
    auto raw = backend_.get(key);
    if (!raw) {
        return std::unexpected(std::move(raw.error()));
    }

    ChunkIndexSet indices;
    if (raw->has_value()) {
        auto decoded = decode(**raw);
        if (!decoded) {
            // unreadable record is replaced by a fresh one
            spdlog::warn("Overwriting unreadable resume record {}: {}", key, decoded.error().message);
        } else {
            indices = std::move(*decoded);
        }
    }

    if (!indices.insert(index).second) {
        return {};
    }
    return backend_.set(key, encode(indices));
}

auto ResumeStateStore::clear(std::string_view fingerprint) -> infra::VoidResult {
    FingerprintLock lock(*this, fingerprint);
    return backend_.remove(key_for(fingerprint));
}

} // namespace chunkup::extensions
