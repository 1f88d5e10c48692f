#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace xdgbase {

enum class ErrorCode {
    Unknown = 1,
    MissingConfiguration,
    PathEscape,
    FilesystemError,
    InvalidArgument,
    InvalidConfig,
    NotFound,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error(ErrorCode code, std::string message, std::string detail, std::error_code cause)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)),
          cause_(cause) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// OS-level cause, set for FilesystemError.
    [[nodiscard]] auto cause() const noexcept -> std::error_code { return cause_; }

    [[nodiscard]] auto what() const -> std::string {
        auto text = message_;
        if (!detail_.empty()) text += ": " + detail_;
        if (cause_) text += " (" + cause_.message() + ")";
        return text;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::error_code cause_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail,
                       std::error_code cause) -> Error {
    return Error(code, std::move(message), std::move(detail), cause);
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::MissingConfiguration: return "MISSING_CONFIGURATION";
        case ErrorCode::PathEscape: return "PATH_ESCAPE";
        case ErrorCode::FilesystemError: return "FILESYSTEM_ERROR";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::NotFound: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

} // namespace xdgbase
