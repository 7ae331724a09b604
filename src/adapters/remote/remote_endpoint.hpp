#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace chunkup::adapters::remote {

struct ChunkRequest {
    std::string_view file_hash;
    std::string_view file_name;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::span<const char> bytes;
};

// (bytes_sent, bytes_total) as seen by the transport
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

// The three server operations the engine relies on. Implementations classify
// failures with error_from_status() and must abort an in-flight send promptly
// once `stop` fires, returning ErrorCode::Cancelled.
class RemoteEndpoint {
public:
    virtual ~RemoteEndpoint() = default;

    // Indices the server already holds for this file.
    [[nodiscard]] virtual auto check(std::string_view file_hash, std::string_view file_name)
        -> infra::Result<std::vector<std::uint32_t>> = 0;

    [[nodiscard]] virtual auto send_chunk(const ChunkRequest& request,
                                          const ProgressCallback& on_progress,
                                          std::stop_token stop)
        -> infra::VoidResult = 0;

    // IncompleteUpload when the server finds chunks missing.
    [[nodiscard]] virtual auto merge(std::string_view file_hash, std::string_view file_name,
                                     std::uint32_t total_chunks)
        -> infra::VoidResult = 0;
};

// 408, 429 and 5xx are transient; 409/412 mean the server is missing chunks;
// any other 4xx is final.
[[nodiscard]] auto error_from_status(int status, std::string_view message) -> infra::Error;

} // namespace chunkup::adapters::remote
