// =============================================================================
// alnstore - Coordinate Index Implementation
// =============================================================================

#include "aln/index/coordinate_index.h"

#include <algorithm>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "aln/common/byte_io.h"
#include "aln/common/logger.h"
#include "aln/index/bin_scheme.h"

namespace aln::index {

namespace {

/// @brief Bounds-checked little-endian reader over the serialized index.
class IndexCursor {
public:
    explicit IndexCursor(std::span<const std::uint8_t> data) : data_(data) {}

    template <typename T>
    bool read(T& value) {
        if (data_.size() - offset_ < sizeof(T)) {
            return false;
        }
        value = loadLE<T>(data_.data() + offset_);
        offset_ += sizeof(T);
        return true;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

Result<CoordinateIndex> truncatedIndex(const IndexCursor& cursor) {
    return makeError<CoordinateIndex>(
        ErrorCode::kFormatError,
        fmt::format("Coordinate index truncated at byte {}", cursor.offset()));
}

}  // namespace

CoordinateIndex::CoordinateIndex(std::size_t referenceCount) : references_(referenceCount) {}

// =============================================================================
// Construction
// =============================================================================

void CoordinateIndex::addRecord(const codec::RecordSpan& span, FileOffset blockOffset) {
    if (!span.isPlaced()) {
        ++unplaced_;
        return;
    }
    if (span.referenceId < 0 || static_cast<std::size_t>(span.referenceId) >= references_.size()) {
        throw InvalidArgumentError(fmt::format("Reference id {} outside index of {} references",
                                               span.referenceId, references_.size()));
    }

    auto& reference = references_[static_cast<std::size_t>(span.referenceId)];
    auto& offsets = reference.bins[regionToBin(span.begin, span.end)];
    if (offsets.empty() || offsets.back() != blockOffset) {
        offsets.push_back(blockOffset);
    }
    ++reference.mapped;
}

void CoordinateIndex::addBlock(FileOffset blockOffset, std::span<const codec::RecordSpan> spans) {
    for (const auto& span : spans) {
        addRecord(span, blockOffset);
    }
}

CoordinateIndex CoordinateIndex::build(std::span<const FileOffset> blockOffsets,
                                       std::size_t referenceCount, const BlockScanner& scanner) {
    std::vector<std::vector<codec::RecordSpan>> perBlock(blockOffsets.size());

    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, blockOffsets.size()),
                      [&](const tbb::blocked_range<std::size_t>& range) {
                          for (std::size_t i = range.begin(); i < range.end(); ++i) {
                              perBlock[i] = scanner(blockOffsets[i]);
                          }
                      });

    CoordinateIndex index(referenceCount);
    for (std::size_t i = 0; i < blockOffsets.size(); ++i) {
        index.addBlock(blockOffsets[i], perBlock[i]);
    }

    ALN_LOG_DEBUG("Coordinate index built: blocks={}, bins={}, unplaced={}", blockOffsets.size(),
                  index.binCount(), index.unplacedCount());
    return index;
}

// =============================================================================
// Queries
// =============================================================================

std::vector<FileOffset> CoordinateIndex::query(ReferenceId referenceId, std::int64_t begin,
                                               std::int64_t end) const {
    std::vector<FileOffset> result;
    if (referenceId < 0 || static_cast<std::size_t>(referenceId) >= references_.size()) {
        return result;
    }

    const auto& bins = references_[static_cast<std::size_t>(referenceId)].bins;
    for (auto bin : regionToBins(begin, end)) {
        auto it = bins.find(bin);
        if (it != bins.end()) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::uint64_t CoordinateIndex::mappedCount(ReferenceId referenceId) const noexcept {
    if (referenceId < 0 || static_cast<std::size_t>(referenceId) >= references_.size()) {
        return 0;
    }
    return references_[static_cast<std::size_t>(referenceId)].mapped;
}

std::size_t CoordinateIndex::binCount() const noexcept {
    std::size_t count = 0;
    for (const auto& reference : references_) {
        count += reference.bins.size();
    }
    return count;
}

// =============================================================================
// Serialization
// =============================================================================

std::vector<std::uint8_t> CoordinateIndex::serialize() const {
    std::vector<std::uint8_t> out;

    appendLE(out, static_cast<std::uint32_t>(references_.size()));
    for (const auto& reference : references_) {
        appendLE(out, reference.mapped);
        appendLE(out, static_cast<std::uint32_t>(reference.bins.size()));
        for (const auto& [bin, offsets] : reference.bins) {
            appendLE(out, bin);
            appendLE(out, static_cast<std::uint32_t>(offsets.size()));
            for (auto offset : offsets) {
                appendLE(out, offset);
            }
        }
    }
    appendLE(out, unplaced_);
    return out;
}

Result<CoordinateIndex> CoordinateIndex::deserialize(std::span<const std::uint8_t> data) {
    IndexCursor cursor(data);

    std::uint32_t referenceCount = 0;
    if (!cursor.read(referenceCount)) {
        return truncatedIndex(cursor);
    }
    if (referenceCount > cursor.remaining() / (sizeof(std::uint64_t) + sizeof(std::uint32_t))) {
        return makeError<CoordinateIndex>(
            ErrorCode::kFormatError,
            fmt::format("Coordinate index declares {} references", referenceCount));
    }

    CoordinateIndex index(referenceCount);
    for (auto& reference : index.references_) {
        std::uint32_t binCount = 0;
        if (!cursor.read(reference.mapped) || !cursor.read(binCount)) {
            return truncatedIndex(cursor);
        }

        for (std::uint32_t i = 0; i < binCount; ++i) {
            std::uint32_t bin = 0;
            std::uint32_t offsetCount = 0;
            if (!cursor.read(bin) || !cursor.read(offsetCount)) {
                return truncatedIndex(cursor);
            }
            if (bin >= kBinCount) {
                return makeError<CoordinateIndex>(
                    ErrorCode::kFormatError, fmt::format("Coordinate index holds bin {}", bin));
            }
            if (offsetCount > cursor.remaining() / sizeof(FileOffset)) {
                return truncatedIndex(cursor);
            }

            auto& offsets = reference.bins[bin];
            offsets.resize(offsetCount);
            for (auto& offset : offsets) {
                if (!cursor.read(offset)) {
                    return truncatedIndex(cursor);
                }
            }
            if (!std::is_sorted(offsets.begin(), offsets.end())) {
                return makeError<CoordinateIndex>(
                    ErrorCode::kFormatError,
                    fmt::format("Coordinate index bin {} offsets are not ascending", bin));
            }
        }
    }

    if (!cursor.read(index.unplaced_)) {
        return truncatedIndex(cursor);
    }
    if (cursor.remaining() != 0) {
        return makeError<CoordinateIndex>(
            ErrorCode::kFormatError,
            fmt::format("{} trailing bytes after coordinate index", cursor.remaining()));
    }
    return index;
}

}  // namespace aln::index
