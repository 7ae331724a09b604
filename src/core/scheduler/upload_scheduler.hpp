#pragma once

#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>
#include "../../adapters/fs/file_source.hpp"
#include "../../adapters/remote/remote_endpoint.hpp"
#include "../../extensions/resume_store.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/retry.hpp"
#include "../chunk_planner/chunk_planner.hpp"
#include "../progress/progress_aggregator.hpp"
#include "../session/upload_session.hpp"

namespace chunkup::core {

struct UploadContext {
    std::string fingerprint;
    std::string file_name;
    std::uint32_t total_chunks = 0;
};

enum class RunOutcome {
    Drained,   // every task was sent and recorded
    Stopped    // the caller's stop token fired first
};

// Drains a list of pending chunks with `concurrency` workers sharing one
// cursor. A chunk is recorded (confirmed set, progress, resume store) only
// after the endpoint acknowledged it.
class UploadScheduler {
public:
    UploadScheduler(adapters::remote::RemoteEndpoint& endpoint,
                    const adapters::fs::FileSource& source,
                    extensions::ResumeStateStore& store,
                    ProgressAggregator& progress,
                    ConfirmedSet& confirmed,
                    infra::RetryPolicy retry);

    // Blocks until the tasks are drained, `stop` fires, or a chunk fails for
    // good. On failure the other in-flight sends are cancelled and the first
    // error is returned.
    [[nodiscard]] auto run(const std::vector<ChunkTask>& tasks,
                           std::size_t concurrency,
                           const UploadContext& context,
                           std::stop_token stop)
        -> infra::Result<RunOutcome>;

private:
    [[nodiscard]] auto upload_one_(const ChunkTask& task,
                                   const UploadContext& context,
                                   std::stop_token stop)
        -> infra::VoidResult;

    adapters::remote::RemoteEndpoint& endpoint_;
    const adapters::fs::FileSource& source_;
    extensions::ResumeStateStore& store_;
    ProgressAggregator& progress_;
    ConfirmedSet& confirmed_;
    infra::RetryPolicy retry_;
};

} // namespace chunkup::core
