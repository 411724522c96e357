// =============================================================================
// alnstore - Binary Record Codec
// =============================================================================
// BAM-style binary layout of an alignment record. All integers little-endian.
//
//   u32  blockSize        bytes that follow this field
//   i32  referenceId      -1 when unplaced
//   i32  position         0-based, -1 when unplaced
//   u8   nameLength       including the NUL terminator
//   u8   mappingQuality
//   u16  bin              hierarchical bin of [position, end)
//   u16  cigarCount
//   u16  flag
//   u32  sequenceLength
//   i32  mateReferenceId
//   i32  matePosition
//   i32  templateLength
//   char name[nameLength]
//   u32  cigar[cigarCount]          length << 4 | op
//   u8   sequence[(len + 1) / 2]    4-bit codes, high nibble first
//   u8   quality[len]               phred, all 0xFF when unavailable
//   ...  tags                       key[2] type value
//
// Integer tags are stored in the smallest of c/C/s/S/i/I and read back as
// type 'i'.
// =============================================================================

#ifndef ALN_CODEC_BINARY_CODEC_H
#define ALN_CODEC_BINARY_CODEC_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "aln/codec/alignment_record.h"
#include "aln/codec/reference_dictionary.h"
#include "aln/common/error.h"

namespace aln::codec {

/// @brief Size of the fixed core following the block size field.
inline constexpr std::size_t kBinaryCoreSize = 32;

/// @brief Size of the block size prefix.
inline constexpr std::size_t kBinarySizePrefix = 4;

/// @brief Binary record codec bound to a reference dictionary.
class BinaryCodec {
public:
    explicit BinaryCodec(ReferenceDictionary references);

    /// @brief Append the encoded record to @p out.
    /// @return kMalformedRecord for reference names missing from the dictionary.
    /// @note @p out is left unchanged on failure.
    [[nodiscard]] VoidResult encode(const AlignmentRecord& record,
                                    std::vector<std::uint8_t>& out) const;

    /// @brief Encode into a fresh buffer.
    [[nodiscard]] Result<std::vector<std::uint8_t>> encode(const AlignmentRecord& record) const;

    /// @brief Decode the record starting at @p offset and advance @p offset past it.
    /// @return kTruncatedRecord when a declared length exceeds the buffer,
    ///         kMalformedRecord for unknown reference ids, CIGAR ops or tag types.
    [[nodiscard]] Result<AlignmentRecord> decode(std::span<const std::uint8_t> data,
                                                 std::size_t& offset) const;

    /// @brief Decode the record at the start of @p data.
    [[nodiscard]] Result<AlignmentRecord> decode(std::span<const std::uint8_t> data) const;

    /// @brief Read only the placement of the record at @p offset and advance past it.
    [[nodiscard]] Result<RecordSpan> decodeSpan(std::span<const std::uint8_t> data,
                                                std::size_t& offset) const;

    /// @brief Placement of @p record in this codec's reference numbering.
    [[nodiscard]] Result<RecordSpan> spanOf(const AlignmentRecord& record) const;

    /// @brief Id of a reference name. "*" maps to kNoReference.
    [[nodiscard]] Result<ReferenceId> referenceId(std::string_view name) const;

    [[nodiscard]] const ReferenceDictionary& references() const noexcept { return references_; }

private:
    ReferenceDictionary references_;
};

}  // namespace aln::codec

#endif  // ALN_CODEC_BINARY_CODEC_H
