#include "merge_finalizer.hpp"
#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace chunkup::core {

MergeFinalizer::MergeFinalizer(adapters::remote::RemoteEndpoint& endpoint,
                               extensions::ResumeStateStore& store)
    : endpoint_(endpoint), store_(store) {}

auto MergeFinalizer::finalize(std::string_view fingerprint,
                              std::string_view file_name,
                              std::uint32_t total_chunks,
                              std::size_t confirmed_count)
    -> infra::VoidResult
{
    if (confirmed_count != total_chunks) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                               fmt::format("Cannot merge {}: {}/{} chunks confirmed",
                                           file_name, confirmed_count, total_chunks)));
    }

    infra::VoidResult merged;
    try {
        merged = endpoint_.merge(fingerprint, file_name, total_chunks);
    } catch (const std::exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                               fmt::format("Merge of {} failed: {}", file_name, e.what())));
    }
    if (!merged) {
        return merged;
    }

    if (auto cleared = store_.clear(fingerprint); !cleared) {
        spdlog::error("Merged {} but could not drop its resume record: {}",
                      file_name, cleared.error().message);
    }

    spdlog::info("Merged {} ({} chunk(s))", file_name, total_chunks);
    return {};
}

} // namespace chunkup::core
