// =============================================================================
// alnstore - Error Handling Framework
// =============================================================================
// Error handling for the alnstore library.
//
// This module provides:
// - ErrorCode enum covering the record, block, index and store failures
// - AlnException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, block, record, byte offset) for locating faults
//
// Decode paths return Result<T>; store and I/O paths throw.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef ALN_COMMON_ERROR_H
#define ALN_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace aln {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for every failure the library reports.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid argument value (bad option, bad region string, ...).
    kInvalidArgument = 1,

    /// @brief I/O error on the underlying storage.
    kIOError = 2,

    /// @brief Container format error (bad magic, unsupported version, bad header).
    kFormatError = 3,

    /// @brief Block checksum mismatch or undecodable block payload.
    kCorruptBlock = 4,

    /// @brief Unknown or unsupported compression codec.
    kUnsupportedCodec = 5,

    /// @brief Bad textual record encoding or invalid record field.
    kMalformedRecord = 6,

    /// @brief Binary record declares more bytes than are available.
    kTruncatedRecord = 7,

    /// @brief Record written out of the declared sort order.
    kOutOfOrderWrite = 8,

    /// @brief Store could not be opened.
    kOpenError = 9,

    /// @brief Failure while finalizing a block, the index or the trailer.
    kFlushError = 10,

    /// @brief Operation is not valid in the current state.
    kInvalidState = 11
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kCorruptBlock:
            return "corrupt block";
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
        case ErrorCode::kMalformedRecord:
            return "malformed record";
        case ErrorCode::kTruncatedRecord:
            return "truncated record";
        case ErrorCode::kOutOfOrderWrite:
            return "out of order write";
        case ErrorCode::kOpenError:
            return "open error";
        case ErrorCode::kFlushError:
            return "flush error";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code describes a decode failure.
/// @note Decode failures are the ones a skip policy may step over.
[[nodiscard]] constexpr bool isDecodeError(ErrorCode code) noexcept {
    return code == ErrorCode::kMalformedRecord || code == ErrorCode::kTruncatedRecord ||
           code == ErrorCode::kCorruptBlock;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Enough to locate a fault: file, block, record and byte offset.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Block index where the error occurred (if applicable).
    std::optional<std::uint32_t> blockId;

    /// @brief Record index (within the file or block) where the error occurred.
    std::optional<std::uint64_t> recordIndex;

    /// @brief Byte offset in file or buffer where error occurred (if applicable).
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
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the block index.
    ErrorContext& withBlock(std::uint32_t id) {
        blockId = id;
        return *this;
    }

    /// @brief Set the record index.
    ErrorContext& withRecord(std::uint64_t index) {
        recordIndex = index;
        return *this;
    }

    /// @brief Set the byte offset.
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

/// @brief Base exception class for all alnstore errors.
/// @note Provides error code, message, and optional context.
class AlnException : public std::exception {
public:
    /// @brief Construct with error code and message.
    AlnException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    AlnException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~AlnException() override = default;

    AlnException(const AlnException&) = default;
    AlnException(AlnException&&) noexcept = default;
    AlnException& operator=(const AlnException&) = default;
    AlnException& operator=(AlnException&&) noexcept = default;

    /// @brief Get the formatted message, including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

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

/// @brief Invalid argument (bad options, bad region text, unknown reference name).
class InvalidArgumentError : public AlnException {
public:
    explicit InvalidArgumentError(std::string message)
        : AlnException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief I/O error on the underlying storage.
/// @note Thrown for read/write/seek failures. Never retried internally.
class IOError : public AlnException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : AlnException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with message and context.
    IOError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : AlnException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : AlnException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

private:
    std::optional<std::error_code> systemError_;
};

/// @brief The store could not be opened (missing file, permissions, bad container).
class OpenError : public AlnException {
public:
    explicit OpenError(std::string message)
        : AlnException(ErrorCode::kOpenError, std::move(message)) {}

    OpenError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kOpenError, std::move(message), std::move(context)) {}
};

/// @brief Container format error: invalid magic, incompatible version, bad header.
class FormatError : public AlnException {
public:
    explicit FormatError(std::string message)
        : AlnException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief A block failed its checksum or could not be decompressed.
/// @note Never silently repaired.
class CorruptBlockError : public AlnException {
public:
    explicit CorruptBlockError(std::string message)
        : AlnException(ErrorCode::kCorruptBlock, std::move(message)) {}

    CorruptBlockError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kCorruptBlock, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual checksum values.
    CorruptBlockError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : AlnException(ErrorCode::kCorruptBlock,
                       formatChecksumMismatch(expected, actual),
                       std::move(context)),
          expected_(expected),
          actual_(actual) {}

    /// @brief Get the expected checksum value (if available).
    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    /// @brief Get the actual checksum value (if available).
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Unknown or unsupported compression codec.
class UnsupportedCodecError : public AlnException {
public:
    explicit UnsupportedCodecError(std::string message)
        : AlnException(ErrorCode::kUnsupportedCodec, std::move(message)) {}

    /// @brief Construct with the codec id found in the file.
    UnsupportedCodecError(std::uint8_t codecId, ErrorContext context)
        : AlnException(ErrorCode::kUnsupportedCodec,
                       formatUnsupportedCodec(codecId),
                       std::move(context)),
          codecId_(codecId) {}

    [[nodiscard]] std::optional<std::uint8_t> codecId() const noexcept { return codecId_; }

private:
    static std::string formatUnsupportedCodec(std::uint8_t codecId);

    std::optional<std::uint8_t> codecId_;
};

/// @brief Bad textual encoding or a record that violates a field invariant.
class MalformedRecordError : public AlnException {
public:
    explicit MalformedRecordError(std::string message)
        : AlnException(ErrorCode::kMalformedRecord, std::move(message)) {}

    MalformedRecordError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kMalformedRecord, std::move(message), std::move(context)) {}
};

/// @brief Binary record whose declared lengths exceed the remaining buffer.
class TruncatedRecordError : public AlnException {
public:
    explicit TruncatedRecordError(std::string message)
        : AlnException(ErrorCode::kTruncatedRecord, std::move(message)) {}

    TruncatedRecordError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kTruncatedRecord, std::move(message), std::move(context)) {}
};

/// @brief Record written out of declared (reference, position) order.
class OutOfOrderWriteError : public AlnException {
public:
    explicit OutOfOrderWriteError(std::string message)
        : AlnException(ErrorCode::kOutOfOrderWrite, std::move(message)) {}

    OutOfOrderWriteError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kOutOfOrderWrite, std::move(message), std::move(context)) {}
};

/// @brief Failure finalizing a block, the index or the trailer.
class FlushError : public AlnException {
public:
    explicit FlushError(std::string message)
        : AlnException(ErrorCode::kFlushError, std::move(message)) {}

    FlushError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kFlushError, std::move(message), std::move(context)) {}
};

/// @brief Operation not valid in the current state (closed store, second pass on a stream).
class InvalidStateError : public AlnException {
public:
    explicit InvalidStateError(std::string message)
        : AlnException(ErrorCode::kInvalidState, std::move(message)) {}

    InvalidStateError(std::string message, ErrorContext context)
        : AlnException(ErrorCode::kInvalidState, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, message and context.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct with error code, message and context.
    Error(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// @brief Construct from an AlnException.
    explicit Error(const AlnException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Attach or replace the context, keeping code and message.
    [[nodiscard]] Error withContext(ErrorContext context) const {
        return Error{code_, message_, std::move(context)};
    }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value or throw the exception matching the error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw if the void result holds an error.
inline void unwrapOrThrow(const VoidResult& result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace aln

#endif  // ALN_COMMON_ERROR_H
