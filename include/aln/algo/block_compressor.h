// =============================================================================
// alnstore - Block Compressor Module
// =============================================================================
// Groups binary-encoded records into independently compressed blocks.
//
// - BlockCompressor: append() buffers encoded records, flush() compresses
//   the buffer as one unit and writes it through a ContainerWriter
// - BlockReader: reads a block back, verifies its xxHash64 checksum and
//   decodes its records
//
// Each block can be decompressed on its own, which is what makes indexed
// random access possible.
// =============================================================================

#ifndef ALN_ALGO_BLOCK_COMPRESSOR_H
#define ALN_ALGO_BLOCK_COMPRESSOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "aln/codec/alignment_record.h"
#include "aln/codec/binary_codec.h"
#include "aln/codec/compressor.h"
#include "aln/common/error.h"
#include "aln/common/types.h"
#include "aln/format/container_reader.h"
#include "aln/format/container_writer.h"

namespace aln::algo {

class BlockCompressorImpl;

// =============================================================================
// Block Descriptor
// =============================================================================

/// @brief What flush() wrote.
struct BlockDescriptor {
    BlockId blockId = kInvalidBlockId;

    /// @brief Absolute offset of the block header.
    FileOffset offset = 0;

    /// @brief Block header plus compressed payload.
    std::uint64_t compressedSize = 0;

    std::uint32_t uncompressedSize = 0;
    std::uint32_t recordCount = 0;

    /// @brief xxHash64 of the uncompressed payload.
    Checksum checksum = 0;

    CodecId codec = CodecId::kZstd;

    /// @brief Start of each record within the uncompressed payload.
    std::vector<std::uint32_t> recordOffsets;

    [[nodiscard]] bool empty() const noexcept { return recordCount == 0; }
};

/// @brief Called after each non-empty flush with the spans of the block's records.
using FlushObserver =
    std::function<void(const BlockDescriptor&, std::span<const codec::RecordSpan>)>;

// =============================================================================
// Configuration
// =============================================================================

struct BlockCompressorConfig {
    /// @brief Uncompressed size that triggers a flush.
    std::size_t blockThreshold = kDefaultBlockThreshold;

    /// @brief Payload codec. Zstd at the default level when unset.
    std::shared_ptr<const codec::Compressor> compressor;

    /// @brief Id of the first block written (non-zero when appending).
    BlockId firstBlockId = 0;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Block Compressor
// =============================================================================

/// @brief Buffers encoded records and writes them as compressed blocks.
///
/// Usage:
/// @code
/// BlockCompressor compressor(writer, codec, config);
/// compressor.setFlushObserver(onFlush);
/// for (const auto& record : records) {
///     compressor.append(record);
/// }
/// compressor.flush();
/// @endcode
class BlockCompressor {
public:
    /// @throws InvalidArgumentError if @p config does not validate.
    BlockCompressor(format::ContainerWriter& writer, const codec::BinaryCodec& codec,
                    BlockCompressorConfig config = {});

    ~BlockCompressor();

    BlockCompressor(const BlockCompressor&) = delete;
    BlockCompressor& operator=(const BlockCompressor&) = delete;
    BlockCompressor(BlockCompressor&&) noexcept;
    BlockCompressor& operator=(BlockCompressor&&) noexcept;

    /// @brief Encode @p record into the buffer, flushing first when the
    ///        record would take the buffer past the threshold.
    /// @throws MalformedRecordError if the record cannot be encoded; the
    ///         buffer is unchanged in that case.
    /// @throws IOError if the implied flush fails.
    void append(const codec::AlignmentRecord& record);

    /// @brief Compress and write the buffered records as one block.
    /// @return Empty descriptor when nothing is buffered.
    BlockDescriptor flush();

    void setFlushObserver(FlushObserver observer);

    [[nodiscard]] std::size_t bufferedBytes() const noexcept;
    [[nodiscard]] std::size_t bufferedRecords() const noexcept;
    [[nodiscard]] BlockId nextBlockId() const noexcept;

private:
    std::unique_ptr<BlockCompressorImpl> impl_;
};

// =============================================================================
// Block Reader
// =============================================================================

/// @brief Records of one block together with where they came from.
struct LoadedBlock {
    FileOffset offset = 0;
    BlockId blockId = kInvalidBlockId;
    std::vector<codec::AlignmentRecord> records;
};

/// @brief Reads, verifies and decodes blocks of one container.
///
/// Error Handling:
/// - CorruptBlockError on checksum mismatch, undecodable payload or a
///   record count that does not match the header
/// - UnsupportedCodecError for unknown codec ids
/// - MalformedRecordError / TruncatedRecordError for undecodable records
/// - IOError when the storage read fails
/// Every error carries the block id and block offset.
class BlockReader {
public:
    /// @brief Open @p path as a seekable container.
    explicit BlockReader(const std::filesystem::path& path);

    /// @brief Take over @p container, opening it if necessary.
    explicit BlockReader(std::unique_ptr<format::ContainerReader> container);

    /// @brief Records of the block at @p offset. Seekable containers only.
    [[nodiscard]] std::vector<codec::AlignmentRecord> readBlock(FileOffset offset);

    /// @brief Spans of the records of the block at @p offset.
    [[nodiscard]] std::vector<codec::RecordSpan> readSpans(FileOffset offset);

    /// @brief Next block in file order, std::nullopt at the end.
    [[nodiscard]] std::optional<LoadedBlock> readNextBlock();

    [[nodiscard]] format::ContainerReader& container() noexcept { return *container_; }
    [[nodiscard]] const codec::BinaryCodec& codec() const noexcept { return codec_; }

private:
    /// @brief Decompress and verify the payload of @p block.
    std::vector<std::uint8_t> unpack(const format::RawBlock& block);

    std::vector<codec::AlignmentRecord> decodeRecords(const format::RawBlock& block);

    const codec::Compressor& compressorFor(const format::RawBlock& block);

    [[nodiscard]] ErrorContext blockContext(const format::RawBlock& block) const;

    std::unique_ptr<format::ContainerReader> container_;
    codec::BinaryCodec codec_;
    std::array<std::shared_ptr<const codec::Compressor>, 3> compressors_;
};

}  // namespace aln::algo

#endif  // ALN_ALGO_BLOCK_COMPRESSOR_H
