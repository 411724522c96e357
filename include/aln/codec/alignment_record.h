// =============================================================================
// alnstore - Alignment Record
// =============================================================================
// The in-memory alignment record shared by the text and binary codecs.
//
// This module defines:
// - flags: Named bits of the record flag
// - CigarOp / CigarElement: Alignment operations
// - Tag / TagArray: Optional typed attributes
// - AlignmentRecord: One alignment with all mandatory fields and tags
// - RecordSpan: Reference placement of a record, used for indexing
//
// Coordinates on AlignmentRecord are 1-based (position 0 = unplaced).
// RecordSpan and everything in the index use 0-based half-open ranges.
// =============================================================================

#ifndef ALN_CODEC_ALIGNMENT_RECORD_H
#define ALN_CODEC_ALIGNMENT_RECORD_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "aln/common/error.h"
#include "aln/common/types.h"

namespace aln::codec {

// =============================================================================
// Flag Bits
// =============================================================================

namespace flags {

inline constexpr std::uint16_t kPaired = 0x1;
inline constexpr std::uint16_t kProperPair = 0x2;
inline constexpr std::uint16_t kUnmapped = 0x4;
inline constexpr std::uint16_t kMateUnmapped = 0x8;
inline constexpr std::uint16_t kReverseStrand = 0x10;
inline constexpr std::uint16_t kMateReverseStrand = 0x20;
inline constexpr std::uint16_t kFirstOfPair = 0x40;
inline constexpr std::uint16_t kSecondOfPair = 0x80;
inline constexpr std::uint16_t kSecondary = 0x100;
inline constexpr std::uint16_t kQcFail = 0x200;
inline constexpr std::uint16_t kDuplicate = 0x400;
inline constexpr std::uint16_t kSupplementary = 0x800;

}  // namespace flags

// =============================================================================
// CIGAR
// =============================================================================

/// @brief CIGAR operations. Values are the 4-bit binary op codes.
enum class CigarOp : std::uint8_t {
    kMatch = 0,             // M
    kInsertion = 1,         // I
    kDeletion = 2,          // D
    kSkip = 3,              // N
    kSoftClip = 4,          // S
    kHardClip = 5,          // H
    kPadding = 6,           // P
    kSequenceMatch = 7,     // =
    kSequenceMismatch = 8   // X
};

/// @brief Operation characters indexed by binary op code.
inline constexpr std::string_view kCigarOpChars = "MIDNSHP=X";

/// @brief Longest length a single CIGAR element can carry (28 bits).
inline constexpr std::uint32_t kMaxCigarLength = (1U << 28) - 1;

[[nodiscard]] constexpr char cigarOpToChar(CigarOp op) noexcept {
    return kCigarOpChars[static_cast<std::size_t>(op)];
}

[[nodiscard]] constexpr std::optional<CigarOp> cigarOpFromChar(char c) noexcept {
    auto pos = kCigarOpChars.find(c);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return static_cast<CigarOp>(pos);
}

/// @brief M, D, N, = and X advance along the reference.
[[nodiscard]] constexpr bool consumesReference(CigarOp op) noexcept {
    return op == CigarOp::kMatch || op == CigarOp::kDeletion || op == CigarOp::kSkip ||
           op == CigarOp::kSequenceMatch || op == CigarOp::kSequenceMismatch;
}

/// @brief M, I, S, = and X consume bases of the read.
[[nodiscard]] constexpr bool consumesQuery(CigarOp op) noexcept {
    return op == CigarOp::kMatch || op == CigarOp::kInsertion || op == CigarOp::kSoftClip ||
           op == CigarOp::kSequenceMatch || op == CigarOp::kSequenceMismatch;
}

struct CigarElement {
    std::uint32_t length = 0;
    CigarOp op = CigarOp::kMatch;

    bool operator==(const CigarElement&) const = default;
};

using Cigar = std::vector<CigarElement>;

// =============================================================================
// Tags
// =============================================================================

/// @brief Numeric array value of a 'B' tag.
/// @note subtype is one of cCsSiIf; 'f' uses floats, the rest integers.
struct TagArray {
    char subtype = 'i';
    std::vector<std::int64_t> integers;
    std::vector<float> floats;

    [[nodiscard]] std::size_t size() const noexcept {
        return subtype == 'f' ? floats.size() : integers.size();
    }

    bool operator==(const TagArray&) const = default;
};

/// @brief Tag value. Alternative depends on Tag::type:
/// A -> char, i -> int64, f -> float, Z/H -> string, B -> TagArray.
using TagValue = std::variant<char, std::int64_t, float, std::string, TagArray>;

/// @brief One optional field, e.g. NM:i:3.
struct Tag {
    std::string key;
    char type = 'Z';
    TagValue value;

    bool operator==(const Tag&) const = default;

    /// @brief Check key syntax, type letter and value ranges.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// RecordSpan
// =============================================================================

/// @brief Reference interval covered by a record, 0-based half-open.
/// @note referenceId == kNoReference for unplaced records.
struct RecordSpan {
    ReferenceId referenceId = kNoReference;
    std::int64_t begin = 0;
    std::int64_t end = 0;

    [[nodiscard]] bool isPlaced() const noexcept { return referenceId != kNoReference; }

    [[nodiscard]] bool overlaps(std::int64_t queryBegin, std::int64_t queryEnd) const noexcept {
        return begin < queryEnd && end > queryBegin;
    }

    bool operator==(const RecordSpan&) const = default;
};

// =============================================================================
// AlignmentRecord
// =============================================================================

/// @brief Alphabet of the sequence field (the 4-bit code order).
inline constexpr std::string_view kSequenceAlphabet = "=ACMGRSVTWYHKDBN";

/// @brief Sentinel for "no value" in name and quality fields.
inline constexpr std::string_view kMissingField = "*";

/// @brief A single alignment.
/// @note Owns every field buffer. Nothing in the library caches records.
struct AlignmentRecord {
    /// @brief Query template name, 1..254 printable characters.
    std::string queryName = "*";

    std::uint16_t flag = 0;

    /// @brief Reference sequence name, "*" when unplaced.
    std::string referenceName = "*";

    /// @brief 1-based leftmost position, 0 when unplaced.
    std::int64_t position = 0;

    std::uint8_t mappingQuality = 0;

    Cigar cigar;

    /// @brief Mate reference name, "*" when absent. Never "=".
    std::string mateReferenceName = "*";

    /// @brief 1-based mate position, 0 when absent.
    std::int64_t matePosition = 0;

    /// @brief Observed template length. Must fit in int32.
    std::int64_t templateLength = 0;

    /// @brief Bases over kSequenceAlphabet, empty when absent.
    std::string sequence;

    /// @brief Phred+33 qualities, or "*" when unavailable.
    std::string quality = "*";

    std::vector<Tag> tags;

    bool operator==(const AlignmentRecord&) const = default;

    /// @brief Check every field invariant.
    /// @return kMalformedRecord naming the offending field on failure.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] bool isPaired() const noexcept { return (flag & flags::kPaired) != 0; }
    [[nodiscard]] bool isProperPair() const noexcept { return (flag & flags::kProperPair) != 0; }
    [[nodiscard]] bool isReverseStrand() const noexcept {
        return (flag & flags::kReverseStrand) != 0;
    }
    [[nodiscard]] bool isFirstOfPair() const noexcept { return (flag & flags::kFirstOfPair) != 0; }
    [[nodiscard]] bool isSecondOfPair() const noexcept {
        return (flag & flags::kSecondOfPair) != 0;
    }
    [[nodiscard]] bool isSecondary() const noexcept { return (flag & flags::kSecondary) != 0; }
    [[nodiscard]] bool isSupplementary() const noexcept {
        return (flag & flags::kSupplementary) != 0;
    }

    [[nodiscard]] bool hasReference() const noexcept { return referenceName != kMissingField; }
    [[nodiscard]] bool hasQuality() const noexcept { return quality != kMissingField; }

    /// @brief Unmapped flag set, no reference, or no position.
    [[nodiscard]] bool isUnmapped() const noexcept {
        return (flag & flags::kUnmapped) != 0 || !hasReference() || position == 0;
    }

    /// @brief Sequence length.
    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }

    /// @brief Reference bases covered by the CIGAR, at least 1.
    [[nodiscard]] std::int64_t referenceSpan() const noexcept;

    /// @brief 1-based inclusive end position.
    [[nodiscard]] std::int64_t endPosition() const noexcept {
        return position + referenceSpan() - 1;
    }

    /// @brief Sum of query-consuming CIGAR lengths.
    [[nodiscard]] std::int64_t cigarQueryLength() const noexcept;

    /// @brief First tag with the given key, or nullptr.
    [[nodiscard]] const Tag* findTag(std::string_view key) const noexcept;
};

/// @brief Reference span of @p cigar, at least 1.
[[nodiscard]] std::int64_t referenceSpan(const Cigar& cigar) noexcept;

/// @brief Check a sequence character against kSequenceAlphabet.
[[nodiscard]] constexpr bool isSequenceChar(char c) noexcept {
    return kSequenceAlphabet.find(c) != std::string_view::npos;
}

/// @brief Phred+33 quality characters are '!'..'~'.
[[nodiscard]] constexpr bool isQualityChar(char c) noexcept {
    return c >= '!' && c <= '~';
}

}  // namespace aln::codec

#endif  // ALN_CODEC_ALIGNMENT_RECORD_H
