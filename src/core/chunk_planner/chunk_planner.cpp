#include "chunk_planner.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <fmt/core.h>

namespace chunkup::core {

auto plan_chunks(std::uint64_t file_size, std::int64_t chunk_size)
    -> infra::Result<std::vector<ChunkTask>>
{
    if (chunk_size <= 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                               fmt::format("Chunk size must be positive, got {}", chunk_size)));
    }

    const auto size = static_cast<std::uint64_t>(chunk_size);
    const std::uint64_t num_chunks = file_size == 0 ? 1 : file_size / size + (file_size % size != 0 ? 1 : 0);
    if (num_chunks > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                               fmt::format("{} bytes in {}-byte chunks needs {} chunks, too many to index",
                                           file_size, chunk_size, num_chunks)));
    }

    std::vector<ChunkTask> tasks;
    tasks.reserve(num_chunks);
    for (std::uint64_t i = 0; i < num_chunks; ++i) {
        const std::uint64_t offset = i * size;
        tasks.push_back(ChunkTask{
            .index = static_cast<std::uint32_t>(i),
            .offset = offset,
            .length = std::min(size, file_size - offset)
        });
    }
    return tasks;
}

auto pending_chunks(const std::vector<ChunkTask>& tasks,
                    const std::set<std::uint32_t>& confirmed)
    -> std::vector<ChunkTask>
{
    std::vector<ChunkTask> pending;
    pending.reserve(tasks.size() - std::min(tasks.size(), confirmed.size()));
    std::ranges::copy_if(tasks, std::back_inserter(pending),
                         [&](const ChunkTask& task) { return !confirmed.contains(task.index); });
    return pending;
}

} // namespace chunkup::core
