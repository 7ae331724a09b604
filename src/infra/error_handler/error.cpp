#include "error.hpp"
#include <fmt/core.h>

namespace chunkup::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::ReadError:
        case ErrorCode::NonRetryableUploadError:
        case ErrorCode::StorageError:
        case ErrorCode::InvalidState:
            return true;
        default:
            return false;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:           return "InvalidConfig";
        case ErrorCode::ReadError:               return "ReadError";
        case ErrorCode::NonRetryableUploadError: return "NonRetryableUploadError";
        case ErrorCode::StorageError:            return "StorageError";
        case ErrorCode::InvalidState:            return "InvalidState";
        case ErrorCode::ReconcileError:          return "ReconcileError";
        case ErrorCode::TransientUploadError:    return "TransientUploadError";
        case ErrorCode::IncompleteUpload:        return "IncompleteUpload";
        case ErrorCode::Cancelled:               return "Cancelled";
        case ErrorCode::Unknown:                 break;
    }
    return "Unknown";
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace chunkup::infra
