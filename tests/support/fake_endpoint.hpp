#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>
#include <fmt/core.h>
#include "adapters/remote/remote_endpoint.hpp"

namespace chunkup::test_support {

// In-process server. Holds the chunks it has received per file hash, answers
// check() from them and refuses merge() with 409 while any are missing. Individual chunks
// can be scripted to fail with an HTTP status or to hang until cancelled.
class FakeEndpoint final : public adapters::remote::RemoteEndpoint {
public:
    using SendHook = std::function<void(std::uint32_t index, int attempt)>;

    // Chunks the server already holds for any file it has not seen yet.
    void set_server_chunks(std::set<std::uint32_t> indices) {
        std::lock_guard lock(mutex_);
        preloaded_ = std::move(indices);
    }

    // check() answers exactly this instead of the received set.
    void set_check_result(std::vector<std::uint32_t> indices) {
        std::lock_guard lock(mutex_);
        check_override_ = std::move(indices);
    }

    void fail_check(int status) {
        std::lock_guard lock(mutex_);
        check_status_ = status;
    }

    // The next `times` sends of `index` fail with `status`; -1 means always.
    void fail_chunk(std::uint32_t index, int status, int times = -1) {
        std::lock_guard lock(mutex_);
        failures_[index] = Failure{status, times};
    }

    // Sends of `index` never complete on their own; they return Cancelled once stopped.
    void hang_chunk(std::uint32_t index) {
        std::lock_guard lock(mutex_);
        hanging_.insert(index);
    }

    // Sends of `index` throw instead of returning an error.
    void throw_on_chunk(std::uint32_t index) {
        std::lock_guard lock(mutex_);
        throwing_.insert(index);
    }

    // Runs at the start of every send attempt, outside the endpoint lock.
    void set_on_send(SendHook hook) {
        std::lock_guard lock(mutex_);
        on_send_ = std::move(hook);
    }

    // Scripted merge answers, consumed in order before the normal behavior.
    void push_merge_status(int status) {
        std::lock_guard lock(mutex_);
        merge_statuses_.push_back(status);
    }

    auto check(std::string_view file_hash, std::string_view)
        -> infra::Result<std::vector<std::uint32_t>> override
    {
        std::lock_guard lock(mutex_);
        ++check_calls_;
        if (check_status_) {
            return std::unexpected(adapters::remote::error_from_status(*check_status_, "check refused"));
        }
        if (check_override_) {
            return *check_override_;
        }
        const auto& held = chunks_for_(file_hash);
        return std::vector<std::uint32_t>(held.begin(), held.end());
    }

    auto send_chunk(const adapters::remote::ChunkRequest& request,
                    const adapters::remote::ProgressCallback& on_progress,
                    std::stop_token stop)
        -> infra::VoidResult override
    {
        const auto index = request.chunk_index;
        SendHook hook;
        int attempt = 0;
        {
            std::lock_guard lock(mutex_);
            attempt = ++attempts_[index];
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
            last_total_chunks_ = request.total_chunks;
            hook = on_send_;
        }
        InFlightGuard guard{*this};

        if (hook) {
            hook(index, attempt);
        }

        if (is_throwing_(index)) {
            throw std::runtime_error(fmt::format("connection reset while sending chunk {}", index));
        }
        if (is_hanging_(index)) {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [] { return false; });
            return cancelled_(index);
        }
        if (stop.stop_requested()) {
            return cancelled_(index);
        }

        {
            std::lock_guard lock(mutex_);
            auto it = failures_.find(index);
            if (it != failures_.end() && it->second.remaining != 0) {
                if (it->second.remaining > 0) --it->second.remaining;
                return std::unexpected(adapters::remote::error_from_status(
                    it->second.status, fmt::format("chunk {} rejected", index)));
            }
        }

        const auto size = static_cast<std::uint64_t>(request.bytes.size());
        if (on_progress) {
            on_progress(size / 2, size);
            on_progress(size, size);
        }

        std::lock_guard lock(mutex_);
        chunks_for_(request.file_hash).insert(index);
        sent_.push_back(index);
        bytes_[index] = std::string(request.bytes.begin(), request.bytes.end());
        return {};
    }

    auto merge(std::string_view file_hash, std::string_view, std::uint32_t total_chunks)
        -> infra::VoidResult override
    {
        std::lock_guard lock(mutex_);
        ++merge_calls_;
        merged_total_ = total_chunks;
        if (!merge_statuses_.empty()) {
            const int status = merge_statuses_.front();
            merge_statuses_.pop_front();
            return std::unexpected(adapters::remote::error_from_status(status, "merge refused"));
        }
        const auto& held = chunks_for_(file_hash);
        for (std::uint32_t i = 0; i < total_chunks; ++i) {
            if (!held.contains(i)) {
                return std::unexpected(adapters::remote::error_from_status(
                    409, fmt::format("chunk {} missing", i)));
            }
        }
        merged_ = true;
        return {};
    }

    [[nodiscard]] auto sent() const -> std::vector<std::uint32_t> {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    // Chunks held for the most recently addressed file.
    [[nodiscard]] auto received() const -> std::set<std::uint32_t> {
        std::lock_guard lock(mutex_);
        auto it = received_.find(last_hash_);
        return it == received_.end() ? std::set<std::uint32_t>{} : it->second;
    }

    [[nodiscard]] auto attempts(std::uint32_t index) const -> int {
        std::lock_guard lock(mutex_);
        auto it = attempts_.find(index);
        return it == attempts_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto bytes_of(std::uint32_t index) const -> std::string {
        std::lock_guard lock(mutex_);
        auto it = bytes_.find(index);
        return it == bytes_.end() ? std::string{} : it->second;
    }

    [[nodiscard]] auto check_calls() const -> int {
        std::lock_guard lock(mutex_);
        return check_calls_;
    }

    [[nodiscard]] auto merge_calls() const -> int {
        std::lock_guard lock(mutex_);
        return merge_calls_;
    }

    [[nodiscard]] auto merged_total() const -> std::uint32_t {
        std::lock_guard lock(mutex_);
        return merged_total_;
    }

    [[nodiscard]] auto merged() const -> bool {
        std::lock_guard lock(mutex_);
        return merged_;
    }

    [[nodiscard]] auto max_in_flight() const -> int {
        std::lock_guard lock(mutex_);
        return max_in_flight_;
    }

    [[nodiscard]] auto last_total_chunks() const -> std::uint32_t {
        std::lock_guard lock(mutex_);
        return last_total_chunks_;
    }

private:
    struct Failure {
        int status = 500;
        int remaining = -1;
    };

    struct InFlightGuard {
        FakeEndpoint& owner;
        ~InFlightGuard() {
            std::lock_guard lock(owner.mutex_);
            --owner.in_flight_;
        }
    };

    auto chunks_for_(std::string_view file_hash) -> std::set<std::uint32_t>& {
        last_hash_ = std::string(file_hash);
        return received_.try_emplace(last_hash_, preloaded_).first->second;
    }

    [[nodiscard]] auto is_hanging_(std::uint32_t index) const -> bool {
        std::lock_guard lock(mutex_);
        return hanging_.contains(index);
    }

    [[nodiscard]] auto is_throwing_(std::uint32_t index) const -> bool {
        std::lock_guard lock(mutex_);
        return throwing_.contains(index);
    }

    static auto cancelled_(std::uint32_t index) -> infra::VoidResult {
        return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled,
                               fmt::format("send of chunk {} aborted", index)));
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;

    std::set<std::uint32_t> preloaded_;
    std::map<std::string, std::set<std::uint32_t>> received_;
    std::string last_hash_;
    std::optional<std::vector<std::uint32_t>> check_override_;
    std::optional<int> check_status_;
    std::map<std::uint32_t, Failure> failures_;
    std::set<std::uint32_t> hanging_;
    std::set<std::uint32_t> throwing_;
    std::deque<int> merge_statuses_;
    SendHook on_send_;

    std::vector<std::uint32_t> sent_;
    std::map<std::uint32_t, std::string> bytes_;
    std::map<std::uint32_t, int> attempts_;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
    int check_calls_ = 0;
    int merge_calls_ = 0;
    std::uint32_t merged_total_ = 0;
    std::uint32_t last_total_chunks_ = 0;
    bool merged_ = false;
};

} // namespace chunkup::test_support
