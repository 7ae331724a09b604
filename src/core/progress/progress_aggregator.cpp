#include "progress_aggregator.hpp"
#include <algorithm>

namespace chunkup::core {

void ProgressAggregator::set_listener(Listener listener) {
    std::lock_guard lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ProgressAggregator::reset(std::uint64_t total_bytes) {
    std::lock_guard delivery(listener_mutex_);
    delivered_ = 0.0;
    std::lock_guard lock(mutex_);
    total_bytes_ = total_bytes;
    confirmed_bytes_ = 0;
    in_flight_.clear();
    reported_ = 0.0;
    completed_ = false;
}

void ProgressAggregator::set_confirmed_bytes(std::uint64_t bytes) {
    double value = 0.0;
    {
        std::lock_guard lock(mutex_);
        confirmed_bytes_ = std::min(bytes, total_bytes_);
        value = recompute_locked_();
    }
    notify_(value);
}

void ProgressAggregator::update_in_flight(std::uint32_t index, std::uint64_t chunk_length,
                                          std::uint64_t sent, std::uint64_t total) {
    if (total == 0) return;

    const auto scaled = static_cast<std::uint64_t>(
        static_cast<double>(chunk_length) * (static_cast<double>(std::min(sent, total)) / static_cast<double>(total)));

    double value = 0.0;
    {
        std::lock_guard lock(mutex_);
        in_flight_[index] = std::min(scaled, chunk_length);
        value = recompute_locked_();
    }
    notify_(value);
}

void ProgressAggregator::confirm(std::uint32_t index, std::uint64_t chunk_length) {
    double value = 0.0;
    {
        std::lock_guard lock(mutex_);
        in_flight_.erase(index);
        confirmed_bytes_ = std::min(confirmed_bytes_ + chunk_length, total_bytes_);
        value = recompute_locked_();
    }
    notify_(value);
}

void ProgressAggregator::discard(std::uint32_t index) {
    std::lock_guard lock(mutex_);
    in_flight_.erase(index);
}

void ProgressAggregator::complete() {
    double value = 0.0;
    {
        std::lock_guard lock(mutex_);
        completed_ = true;
        in_flight_.clear();
        confirmed_bytes_ = total_bytes_;
        value = recompute_locked_();
    }
    notify_(value);
}

auto ProgressAggregator::percent() const -> double {
    std::lock_guard lock(mutex_);
    return reported_;
}

auto ProgressAggregator::get_stats() const -> Stats {
    std::lock_guard lock(mutex_);
    return Stats{
        .total_bytes = total_bytes_,
        .confirmed_bytes = confirmed_bytes_,
        .in_flight_bytes = in_flight_locked_(),
        .percent = reported_,
        .completed = completed_
    };
}

auto ProgressAggregator::in_flight_locked_() const -> std::uint64_t {
    std::uint64_t bytes = 0;
    for (const auto& [index, sent] : in_flight_) {
        bytes += sent;
    }
    return bytes;
}

auto ProgressAggregator::recompute_locked_() -> double {
    double value = 0.0;
    if (completed_) {
        value = 100.0;
    } else if (total_bytes_ > 0) {
        const auto done = std::min(confirmed_bytes_ + in_flight_locked_(), total_bytes_);
        value = std::min(100.0 * static_cast<double>(done) / static_cast<double>(total_bytes_), kPreFinalizeCap);
    }
    reported_ = std::max(reported_, value);
    return reported_;
}

void ProgressAggregator::notify_(double value) {
    std::lock_guard lock(listener_mutex_);
    if (value <= delivered_) return;
    delivered_ = value;
    if (listener_) {
        listener_(value);
    }
}

} // namespace chunkup::core
