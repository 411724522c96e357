// =============================================================================
// alnstore - Container Writer Implementation
// =============================================================================

#include "aln/format/container_writer.h"

#include <algorithm>
#include <csignal>
#include <limits>
#include <set>

#include <fmt/format.h>
#include <xxhash.h>

#include "aln/common/byte_io.h"
#include "aln/common/logger.h"

namespace aln::format {

// =============================================================================
// Signal Handler Management
// =============================================================================

namespace {

std::mutex gSignalMutex;

std::set<ContainerWriter*> gRegisteredWriters;

std::atomic<bool> gSignalHandlersInstalled{false};

void (*gPreviousSigintHandler)(int) = nullptr;
void (*gPreviousSigtermHandler)(int) = nullptr;

void signalHandler(int signum) {
    {
        std::lock_guard<std::mutex> lock(gSignalMutex);
        for (auto* writer : gRegisteredWriters) {
            if (writer != nullptr) {
                writer->abort();
            }
        }
        gRegisteredWriters.clear();
    }

    if (signum == SIGINT && gPreviousSigintHandler != nullptr &&
        gPreviousSigintHandler != SIG_DFL && gPreviousSigintHandler != SIG_IGN) {
        gPreviousSigintHandler(signum);
    } else if (signum == SIGTERM && gPreviousSigtermHandler != nullptr &&
               gPreviousSigtermHandler != SIG_DFL && gPreviousSigtermHandler != SIG_IGN) {
        gPreviousSigtermHandler(signum);
    } else {
        std::signal(signum, SIG_DFL);
        std::raise(signum);
    }
}

constexpr std::size_t kCopyChunkSize = 64 * 1024;

}  // namespace

void registerWriterForCleanup(ContainerWriter* writer) {
    std::lock_guard<std::mutex> lock(gSignalMutex);
    gRegisteredWriters.insert(writer);
}

void unregisterWriterForCleanup(ContainerWriter* writer) {
    std::lock_guard<std::mutex> lock(gSignalMutex);
    gRegisteredWriters.erase(writer);
}

void installSignalHandlers() {
    bool expected = false;
    if (!gSignalHandlersInstalled.compare_exchange_strong(expected, true)) {
        return;
    }

    std::lock_guard<std::mutex> lock(gSignalMutex);

    gPreviousSigintHandler = std::signal(SIGINT, signalHandler);
    if (gPreviousSigintHandler == SIG_ERR) {
        ALN_LOG_WARNING("Failed to install SIGINT handler");
        gPreviousSigintHandler = nullptr;
    }

    gPreviousSigtermHandler = std::signal(SIGTERM, signalHandler);
    if (gPreviousSigtermHandler == SIG_ERR) {
        ALN_LOG_WARNING("Failed to install SIGTERM handler");
        gPreviousSigtermHandler = nullptr;
    }
}

// =============================================================================
// Checksums
// =============================================================================

Checksum calculateXxHash64(std::span<const std::uint8_t> data, std::uint64_t seed) {
    return XXH64(data.data(), data.size(), seed);
}

// =============================================================================
// ContainerWriter Implementation
// =============================================================================

ContainerWriter::ContainerWriter(std::filesystem::path outputPath)
    : outputPath_(std::move(outputPath)), tempPath_(outputPath_.string() + ".tmp") {
    installSignalHandlers();

    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError("Failed to create temporary file: " + tempPath_.string(),
                      ErrorContext(tempPath_.string()));
    }

    registerWriterForCleanup(this);

    ALN_LOG_DEBUG("ContainerWriter created: output={}, temp={}", outputPath_.string(),
                  tempPath_.string());
}

ContainerWriter::~ContainerWriter() {
    unregisterWriterForCleanup(this);

    if (!finalized_ && !aborted_) {
        abort();
    }
}

void ContainerWriter::ensureWritable(std::string_view operation) const {
    if (finalized_ || aborted_) {
        throw FormatError(fmt::format("{}: writer is finalized or aborted", operation),
                          ErrorContext(tempPath_.string()));
    }
}

void ContainerWriter::writeFileHeader(const FileHeader& header, std::string_view metadata,
                                      const codec::ReferenceDictionary& references) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureWritable("writeFileHeader");

    if (headerWritten_) {
        throw FormatError("File header already written");
    }

    std::size_t headerSize = FileHeader::kMinSize + metadata.size();
    for (const auto& reference : references.entries()) {
        headerSize += sizeof(std::uint16_t) + reference.name.size() + sizeof(std::uint32_t);
    }
    if (headerSize > std::numeric_limits<std::uint32_t>::max()) {
        throw FormatError("File header exceeds 4 GiB");
    }

    writeBytes(kMagicBytes.data(), kMagicBytes.size());
    writeBytes(&kCurrentVersion, sizeof(kCurrentVersion));

    writeLE(static_cast<std::uint32_t>(headerSize));
    writeLE(header.flags);
    writeLE(header.codec);
    writeLE(header.checksumType);
    writeLE(header.reserved);
    writeLE(header.blockThreshold);

    writeLE(static_cast<std::uint32_t>(metadata.size()));
    writeBytes(metadata.data(), metadata.size());

    writeLE(static_cast<std::uint32_t>(references.size()));
    for (const auto& reference : references.entries()) {
        writeLE(static_cast<std::uint16_t>(reference.name.size()));
        writeBytes(reference.name.data(), reference.name.size());
        writeLE(reference.length);
    }

    headerWritten_ = true;

    ALN_LOG_DEBUG("File header written: references={}, metadataBytes={}, sorted={}",
                  references.size(), metadata.size(), header.isSorted());
}

void ContainerWriter::adoptPrefix(const std::filesystem::path& source, FileOffset length,
                                  std::vector<BlockTableEntry> blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureWritable("adoptPrefix");

    if (headerWritten_ || position_ != 0) {
        throw FormatError("Cannot adopt a prefix after writing");
    }

    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        throw IOError("Failed to open source file: " + source.string(),
                      ErrorContext(source.string()));
    }

    std::vector<char> buffer(kCopyChunkSize);
    FileOffset copied = 0;
    while (copied < length) {
        auto toRead = static_cast<std::size_t>(std::min<FileOffset>(kCopyChunkSize, length - copied));
        input.read(buffer.data(), static_cast<std::streamsize>(toRead));
        if (!input.good()) {
            throw IOError("Failed to read source file", ErrorContext(source.string()).withOffset(copied));
        }
        writeBytes(buffer.data(), toRead);
        copied += toRead;
    }

    blockTable_ = std::move(blocks);
    headerWritten_ = true;

    ALN_LOG_DEBUG("Adopted {} bytes and {} blocks from {}", length, blockTable_.size(),
                  source.string());
}

FileOffset ContainerWriter::writeBlock(const BlockHeader& header,
                                       std::span<const std::uint8_t> payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureWritable("writeBlock");

    if (!headerWritten_) {
        throw FormatError("File header must be written before blocks");
    }
    if (header.compressedSize != payload.size()) {
        throw FormatError(fmt::format("Block {} declares {} payload bytes, got {}", header.blockId,
                                      header.compressedSize, payload.size()));
    }

    const FileOffset blockOffset = position_;

    writeLE(header.magic);
    writeLE(header.headerSize);
    writeLE(header.blockId);
    writeLE(header.codec);
    writeLE(header.checksumType);
    writeLE(header.reserved1);
    writeLE(header.recordCount);
    writeLE(header.uncompressedSize);
    writeLE(header.compressedSize);
    writeLE(header.reserved2);
    writeLE(header.checksum);

    if (!payload.empty()) {
        writeBytes(payload.data(), payload.size());
    }

    BlockTableEntry entry;
    entry.offset = blockOffset;
    entry.compressedSize = BlockHeader::kSize + payload.size();
    entry.recordCount = header.recordCount;
    entry.uncompressedSize = header.uncompressedSize;
    blockTable_.push_back(entry);

    ALN_LOG_DEBUG("Block {} written: offset={}, records={}, compressedSize={}", header.blockId,
                  blockOffset, header.recordCount, header.compressedSize);
    return blockOffset;
}

void ContainerWriter::finalize(std::uint64_t recordCount,
                               std::span<const std::uint8_t> indexPayload) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (finalized_) {
        return;
    }
    if (aborted_) {
        throw FormatError("Cannot finalize aborted writer");
    }
    if (!headerWritten_) {
        throw FormatError("Cannot finalize without writing the file header");
    }

    writeBlockTable();
    indexOffset_ = 0;
    if (!indexPayload.empty()) {
        writeIndexSection(indexPayload);
    }
    writeTrailer(recordCount);

    stream_.flush();
    if (!stream_.good()) {
        throw IOError("Failed to flush output file", ErrorContext(tempPath_.string()));
    }
    stream_.close();

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(outputPath_.string()));
    }

    finalized_ = true;
    unregisterWriterForCleanup(this);

    ALN_LOG_INFO("Container finalized: {}, blocks={}, records={}, indexed={}",
                 outputPath_.string(), blockTable_.size(), recordCount, indexOffset_ != 0);
}

void ContainerWriter::abort() noexcept {
    bool expected = false;
    if (!aborted_.compare_exchange_strong(expected, true)) {
        return;
    }

    cleanupTempFile();
}

// =============================================================================
// Private Methods
// =============================================================================

void ContainerWriter::writeBytes(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    stream_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!stream_.good()) {
        throw IOError("Failed to write to file",
                      ErrorContext(tempPath_.string()).withOffset(position_));
    }
    position_ += size;
}

template <typename T>
void ContainerWriter::writeLE(T value) {
    value = toLittleEndian(value);
    writeBytes(&value, sizeof(T));
}

void ContainerWriter::writeBlockTable() {
    blockTableOffset_ = position_;

    BlockTableHeader tableHeader;
    tableHeader.numBlocks = blockTable_.size();

    writeLE(tableHeader.magic);
    writeLE(tableHeader.entrySize);
    writeLE(tableHeader.numBlocks);

    for (const auto& entry : blockTable_) {
        writeLE(entry.offset);
        writeLE(entry.compressedSize);
        writeLE(entry.recordCount);
        writeLE(entry.uncompressedSize);
    }

    ALN_LOG_DEBUG("Block table written: offset={}, numBlocks={}", blockTableOffset_,
                  blockTable_.size());
}

void ContainerWriter::writeIndexSection(std::span<const std::uint8_t> payload) {
    indexOffset_ = position_;

    IndexSectionHeader sectionHeader;
    sectionHeader.payloadSize = payload.size();

    writeLE(sectionHeader.magic);
    writeLE(sectionHeader.version);
    writeLE(sectionHeader.payloadSize);
    writeBytes(payload.data(), payload.size());

    ALN_LOG_DEBUG("Index section written: offset={}, bytes={}", indexOffset_, payload.size());
}

void ContainerWriter::writeTrailer(std::uint64_t recordCount) {
    Trailer trailer;
    trailer.blockTableOffset = blockTableOffset_;
    trailer.indexOffset = indexOffset_;
    trailer.recordCount = recordCount;

    writeLE(trailer.blockTableOffset);
    writeLE(trailer.indexOffset);
    writeLE(trailer.recordCount);
    writeBytes(trailer.magicEnd.data(), trailer.magicEnd.size());
}

void ContainerWriter::cleanupTempFile() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }

    std::error_code ec;
    if (std::filesystem::exists(tempPath_, ec)) {
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            ALN_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
        }
    }
}

}  // namespace aln::format
