// =============================================================================
// genome-cleaner - Error Handling Framework
// =============================================================================
// Error handling for the genome-cleaner library and CLI.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - GCLException hierarchy for fatal, request-aborting errors
// - Result<T, E> type for recoverable checks (using std::expected)
//
// Per-record validation findings are NOT errors in this sense; they are
// data (see RecordError in types.h) and never abort processing.
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure, bad compressed data)
// - 3: Format error (input is neither FASTA nor FASTQ)
// =============================================================================

#ifndef GCL_COMMON_ERROR_H
#define GCL_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace gcl {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Invalid command-line arguments, out-of-range thresholds, etc.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, corrupt compressed input.
    kIOError = 2,

    /// @brief Format error.
    /// @note No FASTA/FASTQ start marker, malformed FASTQ block.
    kFormatError = 3
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
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

    /// @brief 1-based input line where the error occurred (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief 0-based record index where the error occurred (if applicable).
    std::optional<std::uint64_t> recordIndex;

    ErrorContext() = default;

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path) : filePath(std::move(path)) {}

    /// @brief Set the file path.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the line number.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Set the record index.
    ErrorContext& withRecord(std::uint64_t index) {
        recordIndex = index;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all genome-cleaner errors.
class GCLException : public std::exception {
public:
    GCLException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    GCLException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~GCLException() override = default;

    GCLException(const GCLException&) = default;
    GCLException(GCLException&&) noexcept = default;
    GCLException& operator=(const GCLException&) = default;
    GCLException& operator=(GCLException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

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
class UsageError : public GCLException {
public:
    explicit UsageError(std::string message)
        : GCLException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : GCLException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for missing files, read/write failures and undecodable
///       compressed input.
class IOError : public GCLException {
public:
    explicit IOError(std::string message)
        : GCLException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : GCLException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : GCLException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown when the input has no FASTA/FASTQ start marker or contains a
///       malformed FASTQ block. Fatal to the parse call.
class FormatError : public GCLException {
public:
    explicit FormatError(std::string message)
        : GCLException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : GCLException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a GCLException.
    explicit Error(const GCLException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
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

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Convert a Result to an exception if it contains an error.
/// @throws GCLException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Void version of unwrapOrThrow.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace gcl

#endif  // GCL_COMMON_ERROR_H
