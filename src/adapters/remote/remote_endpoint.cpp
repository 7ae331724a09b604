#include "remote_endpoint.hpp"
#include <fmt/core.h>

namespace chunkup::adapters::remote {

auto error_from_status(int status, std::string_view message) -> infra::Error {
    const auto text = fmt::format("HTTP {}: {}", status, message);

    if (status == 408 || status == 429 || (status >= 500 && status <= 599)) {
        return infra::make_error(infra::ErrorCode::TransientUploadError, text);
    }
    if (status == 409 || status == 412) {
        return infra::make_error(infra::ErrorCode::IncompleteUpload, text);
    }
    if (status >= 400 && status <= 499) {
        return infra::make_error(infra::ErrorCode::NonRetryableUploadError, text);
    }
    return infra::make_error(infra::ErrorCode::Unknown, text);
}

} // namespace chunkup::adapters::remote
