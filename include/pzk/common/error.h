// =============================================================================
// pzkit - Error Handling Framework
// =============================================================================
// Error handling for the pzkit library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - PZKException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error
// - 3: No backend tool available for a codec
// - 4: Backend tool exited with failure
// - 5: Unsupported digest
// - 6: Checksum computation failed
// - 7: Operation on a released handle
// - 8: Invalid argument value
// =============================================================================

#ifndef PZK_COMMON_ERROR_H
#define PZK_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "pzk/common/types.h"

namespace pzk {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief No external tool is installed for the requested codec.
    kBackendUnavailable = 3,

    /// @brief External tool exited non-zero or was killed by a signal.
    kBackendProcessFailed = 4,

    /// @brief Requested digest kind has no implementation.
    kUnsupportedDigest = 5,

    /// @brief A checksum worker failed to read or digest its input.
    kChecksumComputationFailed = 6,

    /// @brief Operation attempted on an already-released handle.
    kInvalidState = 7,

    /// @brief Invalid argument value.
    kInvalidArgument = 8
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kBackendUnavailable:
            return "backend unavailable";
        case ErrorCode::kBackendProcessFailed:
            return "backend process failed";
        case ErrorCode::kUnsupportedDigest:
            return "unsupported digest";
        case ErrorCode::kChecksumComputationFailed:
            return "checksum computation failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief External tool associated with the error (if applicable).
    std::string tool;

    /// @brief Byte offset in the stream where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the external tool.
    /// @return Reference to this for method chaining.
    ErrorContext& withTool(std::string name) {
        tool = std::move(name);
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all pzkit errors.
/// @note Provides error code, message, and optional context.
class PZKException : public std::exception {
public:
    /// @brief Construct with error code and message.
    PZKException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    PZKException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~PZKException() override = default;

    PZKException(const PZKException&) = default;
    PZKException(PZKException&&) noexcept = default;
    PZKException& operator=(const PZKException&) = default;
    PZKException& operator=(PZKException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public PZKException {
public:
    explicit UsageError(std::string message)
        : PZKException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : PZKException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for open/read/write/rename failures, broken pipes, etc.
class IOError : public PZKException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : PZKException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with message and context.
    IOError(std::string message, ErrorContext context)
        : PZKException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : PZKException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : PZKException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    /// @brief Build an IOError from the current errno value.
    [[nodiscard]] static IOError fromErrno(std::string message, ErrorContext context = {});

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception raised when no tool is installed for a codec (exit code 3).
/// @note Fatal to the requested operation; never retried.
class BackendUnavailableError : public PZKException {
public:
    explicit BackendUnavailableError(CodecKind codec)
        : PZKException(ErrorCode::kBackendUnavailable, formatUnavailable(codec)),
          codec_(codec) {}

    BackendUnavailableError(CodecKind codec, ErrorContext context)
        : PZKException(ErrorCode::kBackendUnavailable, formatUnavailable(codec),
                       std::move(context)),
          codec_(codec) {}

    /// @brief Codec with no available backend.
    [[nodiscard]] CodecKind codec() const noexcept { return codec_; }

private:
    static std::string formatUnavailable(CodecKind codec);

    CodecKind codec_;
};

/// @brief Exception raised when an external tool fails (exit code 4).
/// @note Carries the raw exit status; callers may retry with another
///       parallelism preference, the library never retries on its own.
class BackendProcessFailedError : public PZKException {
public:
    /// @brief Construct from tool name and its wait status description.
    /// @param tool Tool name (e.g., "lbzip2").
    /// @param exitCode Exit code if the tool exited, -1 otherwise.
    /// @param signal Terminating signal if the tool was killed, 0 otherwise.
    BackendProcessFailedError(std::string tool, int exitCode, int signal)
        : PZKException(ErrorCode::kBackendProcessFailed,
                       formatFailure(tool, exitCode, signal),
                       ErrorContext{}.withTool(tool)),
          tool_(std::move(tool)),
          exitCode_(exitCode),
          signal_(signal) {}

    /// @brief Name of the failing tool.
    [[nodiscard]] const std::string& tool() const noexcept { return tool_; }

    /// @brief Exit code, or -1 when terminated by a signal.
    [[nodiscard]] int exitStatus() const noexcept { return exitCode_; }

    /// @brief Terminating signal, or 0 when the tool exited normally.
    [[nodiscard]] int signal() const noexcept { return signal_; }

private:
    static std::string formatFailure(const std::string& tool, int exitCode, int signal);

    std::string tool_;
    int exitCode_;
    int signal_;
};

/// @brief Exception raised for digests without an implementation (exit code 5).
class UnsupportedDigestError : public PZKException {
public:
    /// @brief Construct for a known digest kind with no available provider.
    explicit UnsupportedDigestError(DigestKind kind)
        : PZKException(ErrorCode::kUnsupportedDigest,
                       "no implementation available for digest: " +
                           std::string(pzk::digestName(kind))),
          digestName_(pzk::digestName(kind)) {}

    /// @brief Construct for an unknown digest name.
    explicit UnsupportedDigestError(std::string name)
        : PZKException(ErrorCode::kUnsupportedDigest, "unknown digest: " + name),
          digestName_(std::move(name)) {}

    /// @brief Name of the requested digest.
    [[nodiscard]] const std::string& digestName() const noexcept { return digestName_; }

private:
    std::string digestName_;
};

/// @brief Exception raised when a checksum worker fails (exit code 6).
/// @note Aggregate failure: no partial result accompanies it.
class ChecksumComputationFailedError : public PZKException {
public:
    ChecksumComputationFailedError(DigestKind kind, const std::string& cause)
        : PZKException(ErrorCode::kChecksumComputationFailed,
                       "checksum computation failed for " + std::string(pzk::digestName(kind)) +
                           ": " + cause),
          kind_(kind) {}

    ChecksumComputationFailedError(DigestKind kind, const std::string& cause,
                                   ErrorContext context)
        : PZKException(ErrorCode::kChecksumComputationFailed,
                       "checksum computation failed for " + std::string(pzk::digestName(kind)) +
                           ": " + cause,
                       std::move(context)),
          kind_(kind) {}

    /// @brief The digest kind whose worker failed.
    [[nodiscard]] DigestKind digestKind() const noexcept { return kind_; }

private:
    DigestKind kind_;
};

/// @brief Exception for operations on released handles (exit code 7).
class InvalidStateError : public PZKException {
public:
    explicit InvalidStateError(std::string message)
        : PZKException(ErrorCode::kInvalidState, std::move(message)) {}

    InvalidStateError(std::string message, ErrorContext context)
        : PZKException(ErrorCode::kInvalidState, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid argument values (exit code 8).
class InvalidArgumentError : public PZKException {
public:
    explicit InvalidArgumentError(std::string message)
        : PZKException(ErrorCode::kInvalidArgument, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Convert a Result to an exception if it contains an error.
/// @throws PZKException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

}  // namespace pzk

#endif  // PZK_COMMON_ERROR_H
