#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace chunkup::core {

// Session-wide upload progress:
//   percent = 100 * (confirmed bytes + in-flight bytes) / total bytes
// reported as a high-water mark, capped below 100 until complete().
class ProgressAggregator {
public:
    struct Stats {
        std::uint64_t total_bytes = 0;
        std::uint64_t confirmed_bytes = 0;
        std::uint64_t in_flight_bytes = 0;
        double percent = 0.0;
        bool completed = false;
    };

    // Invoked with the new value each time the reported percentage rises.
    // Called from worker threads with the counters unlocked, so it may read
    // percent() or get_stats(). It must not update the aggregator itself.
    using Listener = std::function<void(double)>;

    static constexpr double kPreFinalizeCap = 99.9;

    ProgressAggregator() = default;

    void set_listener(Listener listener);

    // New file: drops everything, including the high-water mark.
    void reset(std::uint64_t total_bytes);

    // Replaces the confirmed byte count, e.g. after reconciliation.
    void set_confirmed_bytes(std::uint64_t bytes);

    // Transport progress for a chunk, scaled onto the chunk's own length.
    void update_in_flight(std::uint32_t index, std::uint64_t chunk_length,
                          std::uint64_t sent, std::uint64_t total);

    // The chunk's in-flight bytes become confirmed bytes.
    void confirm(std::uint32_t index, std::uint64_t chunk_length);

    // Forget in-flight bytes of a cancelled or retried send.
    void discard(std::uint32_t index);

    // Finalization succeeded.
    void complete();

    [[nodiscard]] auto percent() const -> double;
    [[nodiscard]] auto get_stats() const -> Stats;

private:
    // Raises the high-water mark and returns it.
    [[nodiscard]] auto recompute_locked_() -> double;
    [[nodiscard]] auto in_flight_locked_() const -> std::uint64_t;
    void notify_(double value);

    mutable std::mutex mutex_;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t confirmed_bytes_ = 0;
    std::map<std::uint32_t, std::uint64_t> in_flight_;
    double reported_ = 0.0;
    bool completed_ = false;

    // Taken before mutex_, never while holding it. Serializes delivery so the
    // listener sees strictly rising values.
    std::mutex listener_mutex_;
    double delivered_ = 0.0;
    Listener listener_;
};

} // namespace chunkup::core
