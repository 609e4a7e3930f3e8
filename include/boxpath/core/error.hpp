#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace boxpath {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    Forbidden,
    SandboxViolation,
    ResolutionFailed,
    IoError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// Path the failing operation was working on (attempted path for
    /// violations, offending component for resolution failures).
    [[nodiscard]] auto path() const noexcept -> std::string_view { return path_; }

    /// Canonical sandbox root, set on SandboxViolation errors.
    [[nodiscard]] auto sandbox_root() const noexcept -> std::string_view { return sandbox_root_; }

    /// Underlying OS error, set on ResolutionFailed, IoError and NotFound.
    [[nodiscard]] auto cause() const noexcept -> const std::error_code& { return cause_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

    auto with_path(std::string path) && -> Error {
        path_ = std::move(path);
        return std::move(*this);
    }

    auto with_sandbox_root(std::string root) && -> Error {
        sandbox_root_ = std::move(root);
        return std::move(*this);
    }

    auto with_cause(std::error_code cause) && -> Error {
        cause_ = cause;
        return std::move(*this);
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::string path_;
    std::string sandbox_root_;
    std::error_code cause_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// A path whose resolution lies outside the sandbox root.
inline auto sandbox_violation(std::string attempted_path, std::string sandbox_root) -> Error {
    auto detail = attempted_path + " not within " + sandbox_root;
    return Error(ErrorCode::SandboxViolation, "Path escapes sandbox", std::move(detail))
        .with_path(std::move(attempted_path))
        .with_sandbox_root(std::move(sandbox_root));
}

/// Canonicalization could not complete at `path`.
inline auto resolution_error(std::string path, std::error_code cause) -> Error {
    auto detail = path + ": " + cause.message();
    return Error(ErrorCode::ResolutionFailed, "Failed to resolve path", std::move(detail))
        .with_path(std::move(path))
        .with_cause(cause);
}

/// An I/O primitive failed on an already validated path.
/// ENOENT maps to NotFound, everything else to IoError.
inline auto io_error(std::string message, std::string path, std::error_code cause) -> Error {
    auto code = cause == std::errc::no_such_file_or_directory ? ErrorCode::NotFound
                                                              : ErrorCode::IoError;
    auto detail = path + ": " + cause.message();
    return Error(code, std::move(message), std::move(detail))
        .with_path(std::move(path))
        .with_cause(cause);
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Forbidden: return "FORBIDDEN";
        case ErrorCode::SandboxViolation: return "SANDBOX_VIOLATION";
        case ErrorCode::ResolutionFailed: return "RESOLUTION_FAILED";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace boxpath
