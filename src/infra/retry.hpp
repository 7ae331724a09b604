#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <type_traits>

namespace chunkup::infra {
/*

auto res = infra::with_retry([&]() {
    return endpoint.send_chunk(request, on_progress, stop);
}, infra::RetryPolicy{ .max_attempts = 5 }, stop);

*/
struct RetryPolicy {
    int max_attempts = 3; // total attempts, first one included
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(200);
    double backoff_factor = 2.0; // exponential backoff

    [[nodiscard]] auto delay_for(int attempt) const -> std::chrono::milliseconds {
        const double scaled = static_cast<double>(initial_delay.count()) * std::pow(backoff_factor, attempt);
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
    }
};

// Sleeps for `delay` unless `stop` fires first. Returns false when woken by a stop request.
inline bool sleep_unless_stopped(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    return !cv.wait_for(lock, stop, delay, [] { return false; }) && !stop.stop_requested();
}

// Runs `operation` until it succeeds, fails with a non-transient error, or the
// attempt budget is spent. The last error is returned unchanged; escalation is
// the caller's call. A stop request during backoff yields Cancelled.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy, std::stop_token stop = {})
    -> std::invoke_result_t<F&>
{
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 0;; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        if (!err.is_transient() || attempt + 1 >= attempts) {
            return result;
        }

        const auto delay = policy.delay_for(attempt);
        spdlog::warn("Attempt {}/{} failed: {}; retrying in {} ms",
                     attempt + 1, attempts, err.message, delay.count());

        if (!sleep_unless_stopped(delay, stop)) {
            return std::unexpected(make_error(ErrorCode::Cancelled, "Retry interrupted by stop request"));
        }
    }
}

} // namespace chunkup::infra
