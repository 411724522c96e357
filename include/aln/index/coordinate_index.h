// =============================================================================
// alnstore - Coordinate Index
// =============================================================================
// Maps (reference id, bin) to the ordered, de-duplicated offsets of the
// blocks holding records in that bin. A query resolves every bin that may
// overlap the requested interval, so results are a superset: callers still
// filter records exactly.
//
// Unplaced records (no reference, unmapped flag or position 0) are not
// binned; they are only counted.
//
// Serialized layout (little-endian), version 1:
//   u32 referenceCount
//   per reference: u64 mappedCount, u32 binCount,
//                  per bin: u32 bin, u32 offsetCount, u64 offsets[offsetCount]
//   u64 unplacedCount
// =============================================================================

#ifndef ALN_INDEX_COORDINATE_INDEX_H
#define ALN_INDEX_COORDINATE_INDEX_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <vector>

#include "aln/codec/alignment_record.h"
#include "aln/common/error.h"
#include "aln/common/types.h"

namespace aln::index {

class CoordinateIndex {
public:
    /// @brief Spans of the records in the block at an offset, in record order.
    /// @note Called concurrently from build(); must be thread-safe.
    using BlockScanner = std::function<std::vector<codec::RecordSpan>(FileOffset)>;

    explicit CoordinateIndex(std::size_t referenceCount = 0);

    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Record that a record covering @p span lives in the block at
    ///        @p blockOffset. Unplaced spans only bump the unplaced count.
    /// @throws InvalidArgumentError for reference ids outside the index.
    void addRecord(const codec::RecordSpan& span, FileOffset blockOffset);

    /// @brief addRecord() for every span of one block.
    void addBlock(FileOffset blockOffset, std::span<const codec::RecordSpan> spans);

    void addUnplaced(std::uint64_t count = 1) noexcept { unplaced_ += count; }

    /// @brief Scan every block with @p scanner in parallel and merge the
    ///        results in file order.
    /// @param blockOffsets Block offsets in file order.
    [[nodiscard]] static CoordinateIndex build(std::span<const FileOffset> blockOffsets,
                                               std::size_t referenceCount,
                                               const BlockScanner& scanner);

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief Ascending offsets of blocks that may hold records of
    ///        @p referenceId overlapping [begin, end).
    [[nodiscard]] std::vector<FileOffset> query(ReferenceId referenceId, std::int64_t begin,
                                                std::int64_t end) const;

    /// @brief Number of placed records on @p referenceId.
    [[nodiscard]] std::uint64_t mappedCount(ReferenceId referenceId) const noexcept;

    [[nodiscard]] std::uint64_t unplacedCount() const noexcept { return unplaced_; }

    [[nodiscard]] std::size_t referenceCount() const noexcept { return references_.size(); }

    /// @brief Number of non-empty bins over all references.
    [[nodiscard]] std::size_t binCount() const noexcept;

    // =========================================================================
    // Serialization
    // =========================================================================

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    /// @return kFormatError when @p data is truncated or inconsistent.
    [[nodiscard]] static Result<CoordinateIndex> deserialize(std::span<const std::uint8_t> data);

    bool operator==(const CoordinateIndex&) const = default;

private:
    struct ReferenceBins {
        std::map<std::uint32_t, std::vector<FileOffset>> bins;
        std::uint64_t mapped = 0;

        bool operator==(const ReferenceBins&) const = default;
    };

    std::vector<ReferenceBins> references_;
    std::uint64_t unplaced_ = 0;
};

}  // namespace aln::index

#endif  // ALN_INDEX_COORDINATE_INDEX_H
