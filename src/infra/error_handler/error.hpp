#pragma once

#include <string>
#include <string_view>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace chunkup::infra {

enum class ErrorCode {
    // Fatal: the session moves to Failed
    InvalidConfig,
    ReadError,
    NonRetryableUploadError,
    StorageError,
    InvalidState,

    // Recoverable: degraded, retried or routed back
    ReconcileError,
    TransientUploadError,
    IncompleteUpload,
    Cancelled,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::TransientUploadError;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Logs at err for fatal codes, warn otherwise, and hands the error back.
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace chunkup::infra
