// =============================================================================
// alnstore - Block Compressor Implementation
// =============================================================================

#include "aln/algo/block_compressor.h"

#include <utility>

#include <fmt/format.h>

#include "aln/common/logger.h"
#include "aln/format/aln_format.h"

namespace aln::algo {

// =============================================================================
// BlockCompressorConfig Implementation
// =============================================================================

VoidResult BlockCompressorConfig::validate() const {
    if (blockThreshold < kMinBlockThreshold || blockThreshold > kMaxBlockThreshold) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("blockThreshold must be in range [{}, {}]",
                                         kMinBlockThreshold, kMaxBlockThreshold));
    }
    if (firstBlockId == kInvalidBlockId) {
        return makeVoidError(ErrorCode::kInvalidArgument, "firstBlockId is out of range");
    }
    return makeVoidSuccess();
}

// =============================================================================
// BlockCompressorImpl - Implementation Class
// =============================================================================

class BlockCompressorImpl {
public:
    BlockCompressorImpl(format::ContainerWriter& writer, const codec::BinaryCodec& codec,
                        BlockCompressorConfig config)
        : writer_(writer), codec_(codec), config_(std::move(config)) {
        if (auto valid = config_.validate(); !valid) {
            throw InvalidArgumentError(valid.error().message());
        }
        if (!config_.compressor) {
            config_.compressor = std::make_shared<const codec::ZstdCompressor>();
        }
        nextBlockId_ = config_.firstBlockId;
        buffer_.reserve(config_.blockThreshold);
    }

    void append(const codec::AlignmentRecord& record);
    BlockDescriptor flush();

    FlushObserver observer_;
    format::ContainerWriter& writer_;
    const codec::BinaryCodec& codec_;
    BlockCompressorConfig config_;

    std::vector<std::uint8_t> buffer_;
    std::vector<std::uint8_t> scratch_;
    std::vector<std::uint32_t> recordOffsets_;
    std::vector<codec::RecordSpan> spans_;
    BlockId nextBlockId_ = 0;
};

void BlockCompressorImpl::append(const codec::AlignmentRecord& record) {
    scratch_.clear();
    if (auto encoded = codec_.encode(record, scratch_); !encoded) {
        throw MalformedRecordError(encoded.error().message());
    }
    auto span = codec_.spanOf(record);
    if (!span) {
        throw MalformedRecordError(span.error().message());
    }

    if (!buffer_.empty() && buffer_.size() + scratch_.size() > config_.blockThreshold) {
        flush();
    }
    if (buffer_.size() + scratch_.size() > kMaxBlockPayload) {
        throw MalformedRecordError(fmt::format("Record of {} bytes exceeds the block limit of {}",
                                               scratch_.size(), kMaxBlockPayload));
    }

    recordOffsets_.push_back(static_cast<std::uint32_t>(buffer_.size()));
    spans_.push_back(*span);
    buffer_.insert(buffer_.end(), scratch_.begin(), scratch_.end());
}

BlockDescriptor BlockCompressorImpl::flush() {
    if (recordOffsets_.empty()) {
        return {};
    }

    const auto& compressor = *config_.compressor;
    const Checksum checksum = format::calculateXxHash64(buffer_);

    auto compressed = compressor.compress(buffer_);
    if (!compressed) {
        throw IOError(fmt::format("Block {} compression failed: {}", nextBlockId_,
                                  compressed.error().message()),
                      ErrorContext(writer_.outputPath().string()).withBlock(nextBlockId_));
    }
    if (compressed->size() > format::maxCompressedSize(buffer_.size())) {
        throw IOError(fmt::format("Block {} compressed to {} bytes, above the bound for {} bytes",
                                  nextBlockId_, compressed->size(), buffer_.size()),
                      ErrorContext(writer_.outputPath().string()).withBlock(nextBlockId_));
    }

    format::BlockHeader header;
    header.blockId = nextBlockId_;
    header.codec = static_cast<std::uint8_t>(compressor.id());
    header.recordCount = static_cast<std::uint32_t>(recordOffsets_.size());
    header.uncompressedSize = static_cast<std::uint32_t>(buffer_.size());
    header.compressedSize = static_cast<std::uint32_t>(compressed->size());
    header.checksum = checksum;

    const FileOffset offset = writer_.writeBlock(header, *compressed);

    BlockDescriptor descriptor;
    descriptor.blockId = nextBlockId_;
    descriptor.offset = offset;
    descriptor.compressedSize = format::BlockHeader::kSize + compressed->size();
    descriptor.uncompressedSize = header.uncompressedSize;
    descriptor.recordCount = header.recordCount;
    descriptor.checksum = checksum;
    descriptor.codec = compressor.id();
    descriptor.recordOffsets = std::move(recordOffsets_);

    ++nextBlockId_;

    if (observer_) {
        observer_(descriptor, spans_);
    }

    ALN_LOG_DEBUG("Flushed block {}: records={}, {} -> {} bytes ({})", descriptor.blockId,
                  descriptor.recordCount, descriptor.uncompressedSize, header.compressedSize,
                  compressor.name());

    buffer_.clear();
    recordOffsets_.clear();
    spans_.clear();
    return descriptor;
}

// =============================================================================
// BlockCompressor Public Interface
// =============================================================================

BlockCompressor::BlockCompressor(format::ContainerWriter& writer,
                                 const codec::BinaryCodec& codec, BlockCompressorConfig config)
    : impl_(std::make_unique<BlockCompressorImpl>(writer, codec, std::move(config))) {}

BlockCompressor::~BlockCompressor() = default;

BlockCompressor::BlockCompressor(BlockCompressor&&) noexcept = default;
BlockCompressor& BlockCompressor::operator=(BlockCompressor&&) noexcept = default;

void BlockCompressor::append(const codec::AlignmentRecord& record) {
    impl_->append(record);
}

BlockDescriptor BlockCompressor::flush() {
    return impl_->flush();
}

void BlockCompressor::setFlushObserver(FlushObserver observer) {
    impl_->observer_ = std::move(observer);
}

std::size_t BlockCompressor::bufferedBytes() const noexcept {
    return impl_->buffer_.size();
}

std::size_t BlockCompressor::bufferedRecords() const noexcept {
    return impl_->recordOffsets_.size();
}

BlockId BlockCompressor::nextBlockId() const noexcept {
    return impl_->nextBlockId_;
}

// =============================================================================
// BlockReader Implementation
// =============================================================================

namespace {

codec::ReferenceDictionary openedReferences(format::ContainerReader& container) {
    container.open();
    return container.references();
}

}  // namespace

BlockReader::BlockReader(const std::filesystem::path& path)
    : BlockReader(std::make_unique<format::ContainerReader>(path)) {}

BlockReader::BlockReader(std::unique_ptr<format::ContainerReader> container)
    : container_(std::move(container)), codec_(openedReferences(*container_)) {}

std::vector<codec::AlignmentRecord> BlockReader::readBlock(FileOffset offset) {
    auto block = container_->readBlockAt(offset);
    return decodeRecords(block);
}

std::vector<codec::RecordSpan> BlockReader::readSpans(FileOffset offset) {
    auto block = container_->readBlockAt(offset);
    auto payload = unpack(block);

    std::vector<codec::RecordSpan> spans;
    spans.reserve(block.header.recordCount);

    std::size_t cursor = 0;
    while (cursor < payload.size()) {
        auto span = codec_.decodeSpan(payload, cursor);
        if (!span) {
            span.error()
                .withContext(blockContext(block).withRecord(spans.size()))
                .throwException();
        }
        spans.push_back(*span);
    }

    if (spans.size() != block.header.recordCount) {
        throw CorruptBlockError(fmt::format("Block holds {} records, header declares {}",
                                            spans.size(), block.header.recordCount),
                                blockContext(block));
    }
    return spans;
}

std::optional<LoadedBlock> BlockReader::readNextBlock() {
    auto block = container_->readNextBlock();
    if (!block) {
        return std::nullopt;
    }

    LoadedBlock loaded;
    loaded.offset = block->offset;
    loaded.blockId = block->header.blockId;
    loaded.records = decodeRecords(*block);
    return loaded;
}

std::vector<codec::AlignmentRecord> BlockReader::decodeRecords(const format::RawBlock& block) {
    auto payload = unpack(block);

    std::vector<codec::AlignmentRecord> records;
    records.reserve(block.header.recordCount);

    std::size_t cursor = 0;
    while (cursor < payload.size()) {
        auto record = codec_.decode(payload, cursor);
        if (!record) {
            record.error()
                .withContext(blockContext(block).withRecord(records.size()))
                .throwException();
        }
        records.push_back(std::move(*record));
    }

    if (records.size() != block.header.recordCount) {
        throw CorruptBlockError(fmt::format("Block holds {} records, header declares {}",
                                            records.size(), block.header.recordCount),
                                blockContext(block));
    }
    return records;
}

std::vector<std::uint8_t> BlockReader::unpack(const format::RawBlock& block) {
    const auto& compressor = compressorFor(block);

    auto payload = compressor.decompress(block.payload, block.header.uncompressedSize);
    if (!payload) {
        throw CorruptBlockError(fmt::format("Block {} failed to decompress: {}",
                                            block.header.blockId, payload.error().message()),
                                blockContext(block));
    }

    const Checksum actual = format::calculateXxHash64(*payload);
    if (actual != block.header.checksum) {
        throw CorruptBlockError(block.header.checksum, actual, blockContext(block));
    }
    return std::move(*payload);
}

const codec::Compressor& BlockReader::compressorFor(const format::RawBlock& block) {
    const std::uint8_t id = block.header.codec;
    if (!isKnownCodec(id)) {
        throw UnsupportedCodecError(id, blockContext(block));
    }

    auto& slot = compressors_[id];
    if (!slot) {
        auto created = codec::compressorForStoredId(id);
        if (!created) {
            created.error().withContext(blockContext(block)).throwException();
        }
        slot = std::move(*created);
    }
    return *slot;
}

ErrorContext BlockReader::blockContext(const format::RawBlock& block) const {
    return ErrorContext(container_->sourceName())
        .withBlock(block.header.blockId)
        .withOffset(block.offset);
}

}  // namespace aln::algo
