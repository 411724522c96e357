// =============================================================================
// alnstore - Common Type Definitions
// =============================================================================
// Core type definitions shared by every alnstore module.
//
// This module defines:
// - BlockId, FileOffset, Checksum, ReferenceId: Type aliases for IDs
// - CodecId: Block payload compression codec
// - ChecksumType: Block checksum algorithm
// - OpenMode: Store open mode
// - ErrorPolicy: Behaviour of iteration on corrupt blocks
// - StoreOptions: Configuration of an alignment store
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef ALN_COMMON_TYPES_H
#define ALN_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string_view>

#include "aln/common/error.h"

namespace aln {

namespace codec {
class Compressor;
}  // namespace codec

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Block identifiers, continuous from 0 in file order.
using BlockId = std::uint32_t;

/// @brief Absolute byte offset in a container file.
using FileOffset = std::uint64_t;

/// @brief Checksum values (xxHash64).
using Checksum = std::uint64_t;

/// @brief Index of a reference sequence in the header's reference table.
/// @note -1 means "no reference" (unplaced record).
using ReferenceId = std::int32_t;

/// @brief Compression level, interpreted by the selected codec.
using CompressionLevel = int;

// =============================================================================
// Constants
// =============================================================================

inline constexpr BlockId kInvalidBlockId = std::numeric_limits<BlockId>::max();

inline constexpr ReferenceId kNoReference = -1;

/// @brief Default uncompressed block size threshold (64 KiB).
inline constexpr std::size_t kDefaultBlockThreshold = 64 * 1024;

/// @brief Smallest accepted block size threshold (4 KiB).
inline constexpr std::size_t kMinBlockThreshold = 4 * 1024;

/// @brief Largest accepted block size threshold (16 MiB).
inline constexpr std::size_t kMaxBlockThreshold = 16 * 1024 * 1024;

/// @brief Largest uncompressed block payload (256 MiB). A single record
/// larger than the threshold gets a block of its own up to this size.
inline constexpr std::size_t kMaxBlockPayload = 256 * 1024 * 1024;

inline constexpr CompressionLevel kDefaultZstdLevel = 3;
inline constexpr CompressionLevel kMaxZstdLevel = 19;
inline constexpr CompressionLevel kDefaultDeflateLevel = 6;
inline constexpr CompressionLevel kMaxDeflateLevel = 9;

/// @brief Largest 1-based position a record may carry (2^31 - 1).
inline constexpr std::int64_t kMaxPosition = std::numeric_limits<std::int32_t>::max();

// =============================================================================
// Codec Enumeration
// =============================================================================

/// @brief Block payload codecs.
/// @note Stored per block in BlockHeader.codec and as the file default.
enum class CodecId : std::uint8_t {
    /// @brief Stored uncompressed.
    kRaw = 0,

    /// @brief Zstandard frame (default).
    kZstd = 1,

    /// @brief Raw deflate stream (zlib, no wrapper).
    kDeflate = 2
};

[[nodiscard]] constexpr std::string_view codecIdToString(CodecId id) noexcept {
    switch (id) {
        case CodecId::kRaw:
            return "raw";
        case CodecId::kZstd:
            return "zstd";
        case CodecId::kDeflate:
            return "deflate";
    }
    return "unknown";
}

/// @brief Check whether a stored codec byte names a known codec.
[[nodiscard]] constexpr bool isKnownCodec(std::uint8_t value) noexcept {
    return value <= static_cast<std::uint8_t>(CodecId::kDeflate);
}

// =============================================================================
// Checksum Type Enumeration
// =============================================================================

/// @brief Checksum algorithm types.
enum class ChecksumType : std::uint8_t {
    /// @brief xxHash64 over the uncompressed block payload.
    kXxHash64 = 0
};

// =============================================================================
// Store Enumerations
// =============================================================================

/// @brief How an alignment store is opened.
enum class OpenMode : std::uint8_t {
    /// @brief Read-only access to an existing container.
    kRead = 0,

    /// @brief Create or truncate. Published by rename on close.
    kWrite,

    /// @brief Add records to an existing container.
    kAppend
};

[[nodiscard]] constexpr std::string_view openModeToString(OpenMode mode) noexcept {
    switch (mode) {
        case OpenMode::kRead:
            return "read";
        case OpenMode::kWrite:
            return "write";
        case OpenMode::kAppend:
            return "append";
    }
    return "unknown";
}

/// @brief What iteration does when a block fails verification.
enum class ErrorPolicy : std::uint8_t {
    /// @brief Raise CorruptBlockError to the caller.
    kFail = 0,

    /// @brief Log a warning and continue with the next block.
    kSkipCorruptBlocks
};

// =============================================================================
// Store Options
// =============================================================================

/// @brief Configuration of an alignment store.
/// @note In append mode sorted, codec and blockThreshold come from the file.
struct StoreOptions {
    /// @brief Require (reference, position) order on write and index on close.
    bool sorted = false;

    /// @brief Uncompressed block size that triggers a flush.
    std::size_t blockThreshold = kDefaultBlockThreshold;

    CodecId codec = CodecId::kZstd;

    /// @brief Codec level. 0 selects the codec's default.
    CompressionLevel compressionLevel = 0;

    /// @brief Write the coordinate index on close (sorted mode only).
    bool indexOnClose = true;

    ErrorPolicy errorPolicy = ErrorPolicy::kFail;

    /// @brief Replaces the built-in codec for writing when set.
    std::shared_ptr<const codec::Compressor> compressor;

    /// @brief Check ranges and combinations.
    [[nodiscard]] VoidResult validate() const;

    /// @brief The level actually used for the configured codec.
    [[nodiscard]] CompressionLevel effectiveLevel() const noexcept;
};

static_assert(sizeof(CodecId) == 1, "CodecId must be 1 byte");
static_assert(sizeof(ChecksumType) == 1, "ChecksumType must be 1 byte");
static_assert(sizeof(FileOffset) == 8, "FileOffset must be 8 bytes");
static_assert(sizeof(Checksum) == 8, "Checksum must be 8 bytes");

}  // namespace aln

#endif  // ALN_COMMON_TYPES_H
