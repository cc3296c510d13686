// =============================================================================
// pzkit - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "pzk/common/error.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <fmt/format.h>

namespace pzk {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (!tool.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "tool: " << tool;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// PZKException Implementation
// =============================================================================

void PZKException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

IOError IOError::fromErrno(std::string message, ErrorContext context) {
    const int savedErrno = errno;
    return IOError(std::move(message), std::error_code(savedErrno, std::generic_category()),
                   std::move(context));
}

// =============================================================================
// Backend Error Implementation
// =============================================================================

std::string BackendUnavailableError::formatUnavailable(CodecKind codec) {
    return fmt::format("no backend tool available for codec: {}", codecName(codec));
}

std::string BackendProcessFailedError::formatFailure(const std::string& tool, int exitCode,
                                                     int signal) {
    if (signal != 0) {
        const char* signalName = ::strsignal(signal);
        return fmt::format("{} killed by signal {} ({})", tool, signal,
                           signalName != nullptr ? signalName : "unknown");
    }
    return fmt::format("{} exited with status {}", tool, exitCode);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kInvalidState:
            throw InvalidStateError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        default:
            break;
    }
    // Codes carrying structured payloads fall back to the base exception
    throw PZKException(code_, message_);
}

}  // namespace pzk
