// =============================================================================
// genome-cleaner - Error Handling Framework Implementation
// =============================================================================

#include "gcl/common/error.h"

#include <format>
#include <sstream>

namespace gcl {

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

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

    if (recordIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "record: " << *recordIndex;
    }

    return oss.str();
}

// =============================================================================
// GCLException Implementation
// =============================================================================

void GCLException::formatWhat() {
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
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
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
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kSuccess:
            throw GCLException(ErrorCode::kSuccess, message_);
    }
    throw GCLException(code_, message_);
}

}  // namespace gcl
