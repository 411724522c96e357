// =============================================================================
// alnstore - Lazy Record Streams
// =============================================================================
// RecordStream pulls records block by block; only the current block's
// records are held in memory. Over a seekable file a stream walks a fixed
// list of block offsets and can be restarted by calling begin() again. Over
// a non-seekable source it walks blocks in file order exactly once.
//
// Usage:
//   for (const auto& record : store.query("chr1", 0, 200)) { ... }
// =============================================================================

#ifndef ALN_STORE_RECORD_STREAM_H
#define ALN_STORE_RECORD_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "aln/algo/block_compressor.h"
#include "aln/codec/alignment_record.h"
#include "aln/common/types.h"
#include "aln/store/record_filter.h"

namespace aln::store {

/// @brief Where a record lives: block offset plus index within the block.
struct RecordLocation {
    FileOffset blockOffset = 0;
    std::uint32_t recordIndex = 0;

    bool operator==(const RecordLocation&) const = default;
};

/// @brief Exact interval a query stream keeps records from.
struct RegionBounds {
    std::string referenceName;

    /// @brief 0-based half-open.
    std::int64_t begin = 0;
    std::int64_t end = 0;
};

class RecordStream {
public:
    /// @brief Input iterator over the stream. end() is std::default_sentinel.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = codec::AlignmentRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        Iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(std::default_sentinel_t) const noexcept { return !current_.has_value(); }

    private:
        friend class RecordStream;

        explicit Iterator(RecordStream* stream) : stream_(stream) { advance(); }

        void advance();

        RecordStream* stream_ = nullptr;
        std::optional<codec::AlignmentRecord> current_;
    };

    /// @brief Stream over the blocks at @p blockOffsets of the file at @p path.
    /// @param region Keep only records overlapping this interval, if set.
    /// @throws OpenError if the file cannot be opened.
    RecordStream(const std::filesystem::path& path, std::vector<FileOffset> blockOffsets,
                 RecordFilter filter, ErrorPolicy policy,
                 std::optional<RegionBounds> region = std::nullopt);

    /// @brief Single-pass stream walking every block of @p reader in order.
    RecordStream(std::shared_ptr<algo::BlockReader> reader, RecordFilter filter,
                 ErrorPolicy policy);

    RecordStream(const RecordStream&) = delete;
    RecordStream& operator=(const RecordStream&) = delete;
    RecordStream(RecordStream&&) noexcept = default;
    RecordStream& operator=(RecordStream&&) noexcept = default;

    /// @brief Next accepted record, std::nullopt at the end.
    [[nodiscard]] std::optional<codec::AlignmentRecord> next();

    /// @brief Start a pass. Seekable streams restart from the first block.
    /// @throws InvalidStateError when a single-pass stream is begun twice.
    [[nodiscard]] Iterator begin();

    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    /// @brief Location of the record last returned by next().
    [[nodiscard]] const RecordLocation& location() const noexcept { return location_; }

    /// @brief Blocks skipped under ErrorPolicy::kSkipCorruptBlocks.
    [[nodiscard]] std::uint64_t skippedBlocks() const noexcept { return skippedBlocks_; }

    [[nodiscard]] bool isSeekable() const noexcept { return offsets_.has_value(); }

private:
    bool loadNextBlock();
    [[nodiscard]] bool accepts(const codec::AlignmentRecord& record) const;

    std::shared_ptr<algo::BlockReader> reader_;
    std::optional<std::vector<FileOffset>> offsets_;
    std::size_t nextBlock_ = 0;

    std::vector<codec::AlignmentRecord> block_;
    std::size_t cursor_ = 0;
    FileOffset blockOffset_ = 0;

    RecordFilter filter_;
    ErrorPolicy policy_ = ErrorPolicy::kFail;
    std::optional<RegionBounds> region_;

    RecordLocation location_;
    std::uint64_t skippedBlocks_ = 0;
    bool started_ = false;
};

}  // namespace aln::store

#endif  // ALN_STORE_RECORD_STREAM_H
