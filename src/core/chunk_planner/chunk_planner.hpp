#pragma once

#include <cstdint>
#include <set>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace chunkup::core {

struct ChunkTask {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    [[nodiscard]] auto end() const -> std::uint64_t { return offset + length; }

    friend bool operator==(const ChunkTask&, const ChunkTask&) = default;
};

// Splits [0, file_size) into ceil(file_size / chunk_size) contiguous ranges in
// index order. Every range is chunk_size long except possibly the last. An
// empty file gets a single zero-length chunk so it still has something to merge.
// Same inputs, same partition: resumed sessions rely on indices lining up.
[[nodiscard]] auto plan_chunks(std::uint64_t file_size, std::int64_t chunk_size)
    -> infra::Result<std::vector<ChunkTask>>;

// Tasks whose index is not in `confirmed`, order preserved.
[[nodiscard]] auto pending_chunks(const std::vector<ChunkTask>& tasks,
                                  const std::set<std::uint32_t>& confirmed)
    -> std::vector<ChunkTask>;

} // namespace chunkup::core
