// =============================================================================
// alnstore - Error Handling Framework Implementation
// =============================================================================

#include "aln/common/error.h"

#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace aln {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::vector<std::string> parts;
    if (!filePath.empty()) {
        parts.push_back(fmt::format("file: {}", filePath));
    }
    if (blockId) {
        parts.push_back(fmt::format("block: {}", *blockId));
    }
    if (recordIndex) {
        parts.push_back(fmt::format("record: {}", *recordIndex));
    }
    if (byteOffset) {
        parts.push_back(fmt::format("offset: 0x{:x}", *byteOffset));
    }
    if (parts.empty()) {
        return {};
    }

    std::string text = fmt::format("{}", fmt::join(parts, ", "));
#ifndef NDEBUG
    text += fmt::format(" (at {}:{})", location.file_name(), location.line());
#endif
    return text;
}

// =============================================================================
// AlnException Implementation
// =============================================================================

void AlnException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_) {
        if (auto contextText = context_->format(); !contextText.empty()) {
            what_ += fmt::format(" ({})", contextText);
        }
    }
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string CorruptBlockError::formatChecksumMismatch(std::uint64_t expected,
                                                      std::uint64_t actual) {
    return fmt::format("checksum mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

std::string UnsupportedCodecError::formatUnsupportedCodec(std::uint8_t codecId) {
    return fmt::format("unsupported codec: 0x{:02x}", codecId);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    ErrorContext context = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_, std::move(context));
        case ErrorCode::kIOError:
            throw IOError(message_, std::move(context));
        case ErrorCode::kFormatError:
            throw FormatError(message_, std::move(context));
        case ErrorCode::kCorruptBlock:
            throw CorruptBlockError(message_, std::move(context));
        case ErrorCode::kUnsupportedCodec:
            throw UnsupportedCodecError(message_);
        case ErrorCode::kMalformedRecord:
            throw MalformedRecordError(message_, std::move(context));
        case ErrorCode::kTruncatedRecord:
            throw TruncatedRecordError(message_, std::move(context));
        case ErrorCode::kOutOfOrderWrite:
            throw OutOfOrderWriteError(message_, std::move(context));
        case ErrorCode::kOpenError:
            throw OpenError(message_, std::move(context));
        case ErrorCode::kFlushError:
            throw FlushError(message_, std::move(context));
        case ErrorCode::kInvalidState:
            throw InvalidStateError(message_, std::move(context));
        case ErrorCode::kSuccess:
            break;
    }
    throw AlnException(code_, message_, std::move(context));
}

}  // namespace aln
