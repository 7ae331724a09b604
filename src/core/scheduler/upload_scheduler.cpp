#include "upload_scheduler.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/thread_pool/thread_pool.hpp"

namespace chunkup::core {

UploadScheduler::UploadScheduler(adapters::remote::RemoteEndpoint& endpoint,
                                 const adapters::fs::FileSource& source,
                                 extensions::ResumeStateStore& store,
                                 ProgressAggregator& progress,
                                 ConfirmedSet& confirmed,
                                 infra::RetryPolicy retry)
    : endpoint_(endpoint)
    , source_(source)
    , store_(store)
    , progress_(progress)
    , confirmed_(confirmed)
    , retry_(retry) {}

auto UploadScheduler::run(const std::vector<ChunkTask>& tasks,
                          std::size_t concurrency,
                          const UploadContext& context,
                          std::stop_token stop)
    -> infra::Result<RunOutcome>
{
    if (concurrency == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig, "Concurrency must be at least 1"));
    }
    if (tasks.empty()) {
        return RunOutcome::Drained;
    }

    // Workers watch `abort`: it fires on the caller's stop or on the first fatal chunk error
    std::stop_source abort;
    std::stop_callback forward_stop(stop, [&abort] { abort.request_stop(); });
    const auto token = abort.get_token();

    std::mutex cursor_mutex;
    std::size_t cursor = 0;
    std::optional<infra::Error> first_error;
    std::atomic<std::size_t> uploaded{0};

    auto worker = [&]() {
        for (;;) {
            const ChunkTask* task = nullptr;
            {
                std::lock_guard lock(cursor_mutex);
                if (token.stop_requested() || cursor >= tasks.size()) {
                    return;
                }
                task = &tasks[cursor++];
            }

            infra::VoidResult res;
            try {
                res = upload_one_(*task, context, token);
            } catch (const std::exception& e) {
                // a throwing transport fails the run like any other fatal chunk error
                progress_.discard(task->index);
                res = std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                      fmt::format("Chunk {} of {}: {}", task->index, context.file_name, e.what())));
            }
            if (res) {
                uploaded.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            if (res.error().code == infra::ErrorCode::Cancelled) {
                return;
            }

            {
                std::lock_guard lock(cursor_mutex);
                if (!first_error) {
                    first_error = std::move(res.error());
                }
            }
            abort.request_stop();
            return;
        }
    };

    const std::size_t workers = std::min(concurrency, tasks.size());
    spdlog::debug("Uploading {} chunk(s) of {} with {} worker(s)", tasks.size(), context.file_name, workers);

    {
        infra::ThreadPool pool{workers};
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            futures.push_back(pool.submit(worker));
        }
        pool.wait();
        for (auto& future : futures) {
            future.get();
        }
    }

    if (first_error) {
        return std::unexpected(std::move(*first_error));
    }
    if (uploaded.load() == tasks.size()) {
        return RunOutcome::Drained;
    }
    return RunOutcome::Stopped;
}

auto UploadScheduler::upload_one_(const ChunkTask& task,
                                  const UploadContext& context,
                                  std::stop_token stop)
    -> infra::VoidResult
{
    auto bytes = source_.read(task.offset, task.length);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }

    const adapters::remote::ChunkRequest request{
        .file_hash = context.fingerprint,
        .file_name = context.file_name,
        .chunk_index = task.index,
        .total_chunks = context.total_chunks,
        .bytes = std::span<const char>(bytes->data(), bytes->size())
    };
    const adapters::remote::ProgressCallback on_progress =
        [this, &task](std::uint64_t sent, std::uint64_t total) {
            progress_.update_in_flight(task.index, task.length, sent, total);
        };

    auto sent = infra::with_retry([&]() {
        progress_.discard(task.index);
        return endpoint_.send_chunk(request, on_progress, stop);
    }, retry_, stop);

    if (!sent) {
        progress_.discard(task.index);
        auto& err = sent.error();

        if (err.code == infra::ErrorCode::Cancelled || (stop.stop_requested() && err.is_transient())) {
            spdlog::debug("Chunk {} of {} cancelled in flight", task.index, context.file_name);
            return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled,
                                   fmt::format("Chunk {} cancelled", task.index)));
        }
        if (err.is_transient()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NonRetryableUploadError,
                                   fmt::format("Chunk {} failed after {} attempts: {}",
                                               task.index, retry_.max_attempts, err.message)));
        }
        return std::unexpected(std::move(err));
    }

    // Acknowledged by the server: record it even if a stop arrived meanwhile
    confirmed_.insert(task.index);
    progress_.confirm(task.index, task.length);
    if (auto recorded = store_.record_chunk(context.fingerprint, task.index); !recorded) {
        spdlog::warn("Chunk {} of {} uploaded but not persisted locally: {}",
                     task.index, context.file_name, recorded.error().message);
    }

    spdlog::debug("Chunk {}/{} of {} confirmed", task.index + 1, context.total_chunks, context.file_name);
    return {};
}

} // namespace chunkup::core
