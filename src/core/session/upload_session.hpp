#pragma once

#include <cstdint>
#include <mutex>
#include <set>
#include <string_view>

namespace chunkup::core {

enum class SessionStatus {
    Idle,
    Hashing,
    Reconciling,
    Uploading,
    Paused,
    Finalizing,
    Done,
    Failed
};

[[nodiscard]] constexpr auto to_string(SessionStatus status) -> std::string_view {
    switch (status) {
        case SessionStatus::Idle:        return "idle";
        case SessionStatus::Hashing:     return "hashing";
        case SessionStatus::Reconciling: return "reconciling";
        case SessionStatus::Uploading:   return "uploading";
        case SessionStatus::Paused:      return "paused";
        case SessionStatus::Finalizing:  return "finalizing";
        case SessionStatus::Done:        return "done";
        case SessionStatus::Failed:      return "failed";
    }
    return "unknown";
}

// confirmedIndices of the session, shared between workers and observers.
class ConfirmedSet {
public:
    void assign(std::set<std::uint32_t> indices) {
        std::lock_guard lock(mutex_);
        indices_ = std::move(indices);
    }

    // False if already present.
    bool insert(std::uint32_t index) {
        std::lock_guard lock(mutex_);
        return indices_.insert(index).second;
    }

    [[nodiscard]] auto contains(std::uint32_t index) const -> bool {
        std::lock_guard lock(mutex_);
        return indices_.contains(index);
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return indices_.size();
    }

    [[nodiscard]] auto snapshot() const -> std::set<std::uint32_t> {
        std::lock_guard lock(mutex_);
        return indices_;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        indices_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::set<std::uint32_t> indices_;
};

} // namespace chunkup::core
