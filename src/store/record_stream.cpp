// =============================================================================
// alnstore - Lazy Record Streams Implementation
// =============================================================================

#include "aln/store/record_stream.h"

#include <utility>

#include "aln/common/error.h"
#include "aln/common/logger.h"

namespace aln::store {

// =============================================================================
// Iterator
// =============================================================================

void RecordStream::Iterator::advance() {
    if (stream_ == nullptr) {
        current_.reset();
        return;
    }
    current_ = stream_->next();
    if (!current_) {
        stream_ = nullptr;
    }
}

// =============================================================================
// RecordStream
// =============================================================================

RecordStream::RecordStream(const std::filesystem::path& path, std::vector<FileOffset> blockOffsets,
                           RecordFilter filter, ErrorPolicy policy,
                           std::optional<RegionBounds> region)
    : offsets_(std::move(blockOffsets)),
      filter_(std::move(filter)),
      policy_(policy),
      region_(std::move(region)) {
    // Streams with nothing to read never touch the file.
    if (!offsets_->empty()) {
        reader_ = std::make_shared<algo::BlockReader>(path);
    }
}

RecordStream::RecordStream(std::shared_ptr<algo::BlockReader> reader, RecordFilter filter,
                           ErrorPolicy policy)
    : reader_(std::move(reader)), filter_(std::move(filter)), policy_(policy) {}

RecordStream::Iterator RecordStream::begin() {
    if (isSeekable()) {
        nextBlock_ = 0;
        block_.clear();
        cursor_ = 0;
        skippedBlocks_ = 0;
    } else if (started_) {
        throw InvalidStateError("Stream-backed records can only be iterated once");
    }
    started_ = true;
    return Iterator(this);
}

std::optional<codec::AlignmentRecord> RecordStream::next() {
    started_ = true;
    while (true) {
        while (cursor_ < block_.size()) {
            const auto index = cursor_++;
            if (accepts(block_[index])) {
                location_ = RecordLocation{blockOffset_, static_cast<std::uint32_t>(index)};
                return std::move(block_[index]);
            }
        }
        if (!loadNextBlock()) {
            block_.clear();
            cursor_ = 0;
            return std::nullopt;
        }
    }
}

bool RecordStream::loadNextBlock() {
    while (true) {
        try {
            if (offsets_) {
                if (nextBlock_ >= offsets_->size()) {
                    return false;
                }
                blockOffset_ = (*offsets_)[nextBlock_++];
                block_ = reader_->readBlock(blockOffset_);
            } else {
                auto loaded = reader_->readNextBlock();
                if (!loaded) {
                    return false;
                }
                blockOffset_ = loaded->offset;
                block_ = std::move(loaded->records);
            }
            cursor_ = 0;
            return true;
        } catch (const AlnException& e) {
            if (policy_ != ErrorPolicy::kSkipCorruptBlocks || !isDecodeError(e.code())) {
                throw;
            }
            ++skippedBlocks_;
            block_.clear();
            cursor_ = 0;
            ALN_LOG_WARNING("Skipping corrupt block: {}", e.what());
        }
    }
}

bool RecordStream::accepts(const codec::AlignmentRecord& record) const {
    if (region_) {
        if (record.isUnmapped() || record.referenceName != region_->referenceName) {
            return false;
        }
        const std::int64_t begin = record.position - 1;
        const std::int64_t end = begin + record.referenceSpan();
        if (begin >= region_->end || end <= region_->begin) {
            return false;
        }
    }
    return store::accepts(filter_, record);
}

}  // namespace aln::store
