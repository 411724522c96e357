// =============================================================================
// alnstore - Container Format Definitions
// =============================================================================
// Binary layout of an alignment container. All integers little-endian.
//
// File Layout:
// +------------------+
// |  Magic Header    |  (9 bytes: 8 magic + version)
// +------------------+
// |  File Header     |  (variable: fixed fields, metadata text, references)
// +------------------+
// |  Block 0         |  (40-byte BlockHeader + compressed payload)
// +------------------+
// |  ...             |
// +------------------+
// |  Block N         |
// +------------------+
// |  Block Table     |  (16-byte header + 24-byte entries)
// +------------------+
// |  Coordinate Index|  (optional, 16-byte header + index bytes)
// +------------------+
// |  Trailer         |  (32 bytes)
// +------------------+
//
// Blocks are self-delimiting, so a non-seekable reader can walk them in
// order from the end of the file header until the block table magic.
// =============================================================================

#ifndef ALN_FORMAT_ALN_FORMAT_H
#define ALN_FORMAT_ALN_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "aln/common/types.h"

namespace aln::format {

// =============================================================================
// Magic Header Constants
// =============================================================================

/// @brief Magic bytes: 0x89 'A' 'L' 'N' 0x0D 0x0A 0x1A 0x0A.
/// @note The high-bit first byte and CR/LF/Ctrl-Z tail catch 7-bit transfers
///       and line-ending conversion.
inline constexpr std::array<std::uint8_t, 8> kMagicBytes = {
    0x89, 'A', 'L', 'N', 0x0D, 0x0A, 0x1A, 0x0A
};

/// @brief Magic header size (magic bytes + version).
inline constexpr std::size_t kMagicHeaderSize = 9;

/// @brief Major version. Readers reject files with a different major.
inline constexpr std::uint8_t kFormatVersionMajor = 1;

/// @brief Minor version. Newer minors are read with a warning.
inline constexpr std::uint8_t kFormatVersionMinor = 0;

/// @brief Encode version as single byte (major:4bit, minor:4bit).
[[nodiscard]] constexpr std::uint8_t encodeVersion(std::uint8_t major, std::uint8_t minor) noexcept {
    return static_cast<std::uint8_t>((major << 4) | (minor & 0x0F));
}

[[nodiscard]] constexpr std::uint8_t decodeMajorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version >> 4);
}

[[nodiscard]] constexpr std::uint8_t decodeMinorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version & 0x0F);
}

inline constexpr std::uint8_t kCurrentVersion =
    encodeVersion(kFormatVersionMajor, kFormatVersionMinor);

// =============================================================================
// Section Magics
// =============================================================================

/// @brief Four-character section tag stored as a little-endian u32.
[[nodiscard]] constexpr std::uint32_t sectionMagic(char a, char b, char c, char d) noexcept {
    return static_cast<std::uint32_t>(static_cast<std::uint8_t>(a)) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(b)) << 8) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(c)) << 16) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(d)) << 24);
}

inline constexpr std::uint32_t kBlockMagic = sectionMagic('A', 'B', 'L', 'K');
inline constexpr std::uint32_t kBlockTableMagic = sectionMagic('A', 'T', 'B', 'L');
inline constexpr std::uint32_t kIndexMagic = sectionMagic('A', 'I', 'D', 'X');

/// @brief Trailer end marker "ALN_EOF\0".
inline constexpr std::array<std::uint8_t, 8> kMagicEnd = {
    'A', 'L', 'N', '_', 'E', 'O', 'F', '\0'
};

// =============================================================================
// File Header Flags
// =============================================================================

namespace flags {

/// @brief Records were written in (reference, position) order.
inline constexpr std::uint64_t kSorted = 1ULL << 0;

/// @brief Reserved bits (must be 0).
inline constexpr std::uint64_t kReservedMask = ~((1ULL << 1) - 1);

}  // namespace flags

// =============================================================================
// FileHeader Structure
// =============================================================================

/// @brief File header following the magic header.
///
/// Layout:
/// - header_size (uint32): total size including variable fields
/// - flags (uint64)
/// - codec (uint8): default codec of the writer
/// - checksum_type (uint8)
/// - reserved (uint16)
/// - block_threshold (uint32)
/// - metadata_length (uint32), metadata (UTF-8, newline separated lines)
/// - reference_count (uint32), then per reference:
///   name_length (uint16), name, length (uint32)
struct FileHeader {
    std::uint32_t headerSize = 0;
    std::uint64_t flags = 0;
    std::uint8_t codec = static_cast<std::uint8_t>(CodecId::kZstd);
    std::uint8_t checksumType = static_cast<std::uint8_t>(ChecksumType::kXxHash64);
    std::uint16_t reserved = 0;
    std::uint32_t blockThreshold = static_cast<std::uint32_t>(kDefaultBlockThreshold);

    /// @brief Fixed part: 4 + 8 + 1 + 1 + 2 + 4 + 4 (metadata length) + 4 (ref count).
    static constexpr std::size_t kMinSize = 28;

    [[nodiscard]] bool isSorted() const noexcept { return (flags & flags::kSorted) != 0; }

    [[nodiscard]] bool isValid() const noexcept {
        if (reserved != 0) return false;
        if ((flags & flags::kReservedMask) != 0) return false;
        if (headerSize < kMinSize) return false;
        if (checksumType != static_cast<std::uint8_t>(ChecksumType::kXxHash64)) return false;
        return true;
    }
};

/// @brief Upper bound on the stored size of a block payload of
/// @p uncompressedSize bytes under any built-in codec.
[[nodiscard]] constexpr std::uint64_t maxCompressedSize(std::uint64_t uncompressedSize) noexcept {
    return uncompressedSize + uncompressedSize / 64 + 1024;
}

// =============================================================================
// BlockHeader Structure
// =============================================================================

/// @brief Header preceding every compressed block (40 bytes).
///
/// The checksum is xxHash64 of the uncompressed payload.
struct BlockHeader {
    std::uint32_t magic = kBlockMagic;
    std::uint32_t headerSize = kSize;
    std::uint32_t blockId = 0;
    std::uint8_t codec = static_cast<std::uint8_t>(CodecId::kZstd);
    std::uint8_t checksumType = static_cast<std::uint8_t>(ChecksumType::kXxHash64);
    std::uint16_t reserved1 = 0;
    std::uint32_t recordCount = 0;
    std::uint32_t uncompressedSize = 0;
    std::uint32_t compressedSize = 0;
    std::uint32_t reserved2 = 0;
    std::uint64_t checksum = 0;

    static constexpr std::size_t kSize = 40;

    [[nodiscard]] bool isValid() const noexcept {
        if (magic != kBlockMagic) return false;
        if (headerSize < kSize) return false;
        if (checksumType != static_cast<std::uint8_t>(ChecksumType::kXxHash64)) return false;
        return true;
    }
};

// =============================================================================
// Block Table
// =============================================================================

/// @brief One block table entry (24 bytes).
struct BlockTableEntry {
    /// @brief Absolute offset of the block header.
    FileOffset offset = 0;

    /// @brief Header plus payload size.
    std::uint64_t compressedSize = 0;

    std::uint32_t recordCount = 0;
    std::uint32_t uncompressedSize = 0;

    static constexpr std::size_t kSize = 24;

    bool operator==(const BlockTableEntry&) const = default;
};

/// @brief Block table header (16 bytes), followed by numBlocks entries.
struct BlockTableHeader {
    std::uint32_t magic = kBlockTableMagic;
    std::uint32_t entrySize = BlockTableEntry::kSize;
    std::uint64_t numBlocks = 0;

    static constexpr std::size_t kSize = 16;

    [[nodiscard]] bool isValid() const noexcept {
        return magic == kBlockTableMagic && entrySize >= BlockTableEntry::kSize;
    }
};

// =============================================================================
// Index Section
// =============================================================================

/// @brief Index section header (16 bytes), followed by payloadSize bytes.
struct IndexSectionHeader {
    std::uint32_t magic = kIndexMagic;
    std::uint32_t version = kCurrentIndexVersion;
    std::uint64_t payloadSize = 0;

    static constexpr std::uint32_t kCurrentIndexVersion = 1;
    static constexpr std::size_t kSize = 16;

    [[nodiscard]] bool isValid() const noexcept {
        return magic == kIndexMagic && version == kCurrentIndexVersion;
    }
};

// =============================================================================
// Trailer Structure
// =============================================================================

/// @brief Trailer at the end of the file (32 bytes).
struct Trailer {
    FileOffset blockTableOffset = 0;

    /// @brief Offset of the index section, 0 when absent.
    FileOffset indexOffset = 0;

    std::uint64_t recordCount = 0;

    std::array<std::uint8_t, 8> magicEnd = kMagicEnd;

    static constexpr std::size_t kSize = 32;

    [[nodiscard]] bool isValid() const noexcept { return magicEnd == kMagicEnd; }
    [[nodiscard]] bool hasIndex() const noexcept { return indexOffset != 0; }
};

// =============================================================================
// Validation Functions
// =============================================================================

[[nodiscard]] inline bool validateMagic(const std::array<std::uint8_t, 8>& magic) noexcept {
    return magic == kMagicBytes;
}

/// @brief Major version must match.
[[nodiscard]] inline bool isVersionCompatible(std::uint8_t version) noexcept {
    return decodeMajorVersion(version) == kFormatVersionMajor;
}

[[nodiscard]] inline bool isVersionNewer(std::uint8_t version) noexcept {
    const auto major = decodeMajorVersion(version);
    const auto minor = decodeMinorVersion(version);
    if (major > kFormatVersionMajor) return true;
    if (major == kFormatVersionMajor && minor > kFormatVersionMinor) return true;
    return false;
}

// =============================================================================
// Checksums
// =============================================================================

/// @brief xxHash64 of a buffer.
[[nodiscard]] Checksum calculateXxHash64(std::span<const std::uint8_t> data,
                                         std::uint64_t seed = 0);

}  // namespace aln::format

#endif  // ALN_FORMAT_ALN_FORMAT_H
