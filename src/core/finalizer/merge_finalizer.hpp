#pragma once

#include <cstdint>
#include <string_view>
#include "../../adapters/remote/remote_endpoint.hpp"
#include "../../extensions/resume_store.hpp"

namespace chunkup::core {

class MergeFinalizer {
public:
    MergeFinalizer(adapters::remote::RemoteEndpoint& endpoint,
                   extensions::ResumeStateStore& store);

    // Asks the server to assemble the file. Refused with InvalidState unless
    // every chunk is locally confirmed. IncompleteUpload from the server is
    // passed through untouched. On success the resume record is dropped.
    [[nodiscard]] auto finalize(std::string_view fingerprint,
                                std::string_view file_name,
                                std::uint32_t total_chunks,
                                std::size_t confirmed_count)
        -> infra::VoidResult;

private:
    adapters::remote::RemoteEndpoint& endpoint_;
    extensions::ResumeStateStore& store_;
};

} // namespace chunkup::core
