#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>

namespace depfetch {

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    InvalidArgument,
    IoError,
    DatabaseError,
    ManifestInvalid,
    InvalidState,
    NotInitialized,
    OperationCancelled,
    Timeout,
    // Transfer and verification taxonomy
    TransportError,
    UnexpectedStatus,
    RangeNotSatisfied,
    SizeMismatch,
    DecompressionFailure,
    HashMismatch,
    LedgerStorageError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::ManifestInvalid: return "Invalid manifest";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::TransportError: return "Transport error";
        case ErrorCode::UnexpectedStatus: return "Unexpected HTTP status";
        case ErrorCode::RangeNotSatisfied: return "Range request not honored";
        case ErrorCode::SizeMismatch: return "Size mismatch";
        case ErrorCode::DecompressionFailure: return "Decompression failure";
        case ErrorCode::HashMismatch: return "Hash mismatch";
        case ErrorCode::LedgerStorageError: return "Ledger storage error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace depfetch

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<depfetch::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(depfetch::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", depfetch::errorToString(error));
    }
};

namespace depfetch {

// Common constants
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 8 * 1024;   // 8KB
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64KB

} // namespace depfetch
