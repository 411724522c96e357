// =============================================================================
// alnstore - Container Reader Implementation
// =============================================================================

#include "aln/format/container_reader.h"

#include <array>
#include <limits>

#include <fmt/format.h>

#include "aln/common/byte_io.h"
#include "aln/common/logger.h"

namespace aln::format {

namespace {

constexpr FileOffset kMinFileSize =
    kMagicHeaderSize + FileHeader::kMinSize + BlockTableHeader::kSize + Trailer::kSize;

}  // namespace

// =============================================================================
// Construction
// =============================================================================

ContainerReader::ContainerReader(std::filesystem::path path)
    : owned_(std::make_unique<std::ifstream>()),
      sourceName_(path.string()),
      path_(std::move(path)) {}

ContainerReader::ContainerReader(std::istream& stream, std::string sourceName)
    : stream_(&stream), sourceName_(std::move(sourceName)) {}

void ContainerReader::open() {
    if (isOpen_) {
        return;
    }

    if (isSeekable()) {
        owned_->open(path_, std::ios::binary);
        if (!owned_->is_open()) {
            throw OpenError("Failed to open container: " + sourceName_, context());
        }
        stream_ = owned_.get();

        stream_->seekg(0, std::ios::end);
        fileSize_ = static_cast<FileOffset>(stream_->tellg());
        stream_->seekg(0, std::ios::beg);

        if (fileSize_ < kMinFileSize) {
            throw FormatError("File too small to be an alignment container", context());
        }
    }

    readMagicHeader();
    readFileHeader();

    if (isSeekable()) {
        readTrailer();
        readBlockTable();
        seekTo(dataStart_);
    }

    isOpen_ = true;

    ALN_LOG_DEBUG("Container opened: {}, version={}.{}, references={}, seekable={}",
                  sourceName_, decodeMajorVersion(version_), decodeMinorVersion(version_),
                  references_.size(), isSeekable());
}

// =============================================================================
// Accessors
// =============================================================================

const FileHeader& ContainerReader::fileHeader() const {
    requireOpen();
    return fileHeader_;
}

const std::string& ContainerReader::metadata() const {
    requireOpen();
    return metadata_;
}

const codec::ReferenceDictionary& ContainerReader::references() const {
    requireOpen();
    return references_;
}

const Trailer& ContainerReader::trailer() const {
    requireOpen();
    requireSeekable("trailer");
    return trailer_;
}

const std::vector<BlockTableEntry>& ContainerReader::blockTable() const {
    requireOpen();
    requireSeekable("blockTable");
    return blockTable_;
}

// =============================================================================
// Blocks
// =============================================================================

RawBlock ContainerReader::readBlockAt(FileOffset offset) {
    requireOpen();
    requireSeekable("readBlockAt");

    if (offset < dataStart_ || offset + BlockHeader::kSize > trailer_.blockTableOffset) {
        throw FormatError(fmt::format("Block offset {} outside the data region", offset),
                          context().withOffset(offset));
    }

    seekTo(offset);
    auto magic = readLE<std::uint32_t>();
    return readBlockBody(offset, magic);
}

std::optional<RawBlock> ContainerReader::readNextBlock() {
    requireOpen();

    if (reachedEnd_) {
        return std::nullopt;
    }
    if (isSeekable() && position_ >= trailer_.blockTableOffset) {
        reachedEnd_ = true;
        return std::nullopt;
    }

    const FileOffset offset = position_;
    auto magic = readLE<std::uint32_t>();
    if (magic == kBlockTableMagic) {
        reachedEnd_ = true;
        return std::nullopt;
    }
    return readBlockBody(offset, magic);
}

RawBlock ContainerReader::readBlockBody(FileOffset offset, std::uint32_t magic) {
    RawBlock block;
    block.offset = offset;

    BlockHeader& header = block.header;
    header.magic = magic;
    header.headerSize = readLE<std::uint32_t>();
    header.blockId = readLE<std::uint32_t>();
    header.codec = readLE<std::uint8_t>();
    header.checksumType = readLE<std::uint8_t>();
    header.reserved1 = readLE<std::uint16_t>();
    header.recordCount = readLE<std::uint32_t>();
    header.uncompressedSize = readLE<std::uint32_t>();
    header.compressedSize = readLE<std::uint32_t>();
    header.reserved2 = readLE<std::uint32_t>();
    header.checksum = readLE<std::uint64_t>();

    if (!header.isValid()) {
        throw CorruptBlockError("Invalid block header", context().withOffset(offset));
    }

    if (header.uncompressedSize > kMaxBlockPayload ||
        header.compressedSize > maxCompressedSize(header.uncompressedSize)) {
        throw CorruptBlockError(
            fmt::format("Block sizes out of range: {} bytes stored for {} bytes of records",
                        header.compressedSize, header.uncompressedSize),
            context().withBlock(header.blockId).withOffset(offset));
    }

    const FileOffset payloadStart = offset + header.headerSize;
    if (isSeekable() &&
        payloadStart + header.compressedSize > trailer_.blockTableOffset) {
        throw CorruptBlockError(
            fmt::format("Block payload of {} bytes runs past the block table",
                        header.compressedSize),
            context().withBlock(header.blockId).withOffset(offset));
    }

    // Extension fields of newer writers.
    if (header.headerSize > BlockHeader::kSize) {
        seekTo(payloadStart);
    }

    block.payload.resize(header.compressedSize);
    if (!block.payload.empty()) {
        readBytes(block.payload.data(), block.payload.size());
    }
    return block;
}

std::optional<std::vector<std::uint8_t>> ContainerReader::readIndexSection() {
    requireOpen();
    requireSeekable("readIndexSection");

    if (!trailer_.hasIndex()) {
        return std::nullopt;
    }

    seekTo(trailer_.indexOffset);

    IndexSectionHeader sectionHeader;
    sectionHeader.magic = readLE<std::uint32_t>();
    sectionHeader.version = readLE<std::uint32_t>();
    sectionHeader.payloadSize = readLE<std::uint64_t>();

    if (!sectionHeader.isValid()) {
        throw FormatError("Invalid index section header",
                          context().withOffset(trailer_.indexOffset));
    }

    const FileOffset available =
        fileSize_ - Trailer::kSize - trailer_.indexOffset - IndexSectionHeader::kSize;
    if (sectionHeader.payloadSize > available) {
        throw FormatError("Index section runs past the trailer",
                          context().withOffset(trailer_.indexOffset));
    }

    std::vector<std::uint8_t> payload(sectionHeader.payloadSize);
    if (!payload.empty()) {
        readBytes(payload.data(), payload.size());
    }
    return payload;
}

// =============================================================================
// Private Methods
// =============================================================================

void ContainerReader::requireOpen() const {
    if (!isOpen_) {
        throw InvalidStateError("Container is not open", context());
    }
}

void ContainerReader::requireSeekable(std::string_view operation) const {
    if (!isSeekable()) {
        throw InvalidStateError(fmt::format("{} requires a seekable container", operation),
                                context());
    }
}

ErrorContext ContainerReader::context() const {
    return ErrorContext(sourceName_);
}

void ContainerReader::readMagicHeader() {
    std::array<std::uint8_t, 8> magic{};
    readBytes(magic.data(), magic.size());

    if (!validateMagic(magic)) {
        throw FormatError("Invalid magic header - not an alignment container", context());
    }

    version_ = readLE<std::uint8_t>();

    if (!isVersionCompatible(version_)) {
        throw FormatError(fmt::format("Incompatible format version: {}.{}",
                                      decodeMajorVersion(version_), decodeMinorVersion(version_)),
                          context());
    }

    if (isVersionNewer(version_)) {
        ALN_LOG_WARNING("Container version {}.{} is newer than reader version {}.{}",
                        decodeMajorVersion(version_), decodeMinorVersion(version_),
                        kFormatVersionMajor, kFormatVersionMinor);
    }
}

void ContainerReader::readFileHeader() {
    fileHeader_.headerSize = readLE<std::uint32_t>();
    fileHeader_.flags = readLE<std::uint64_t>();
    fileHeader_.codec = readLE<std::uint8_t>();
    fileHeader_.checksumType = readLE<std::uint8_t>();
    fileHeader_.reserved = readLE<std::uint16_t>();
    fileHeader_.blockThreshold = readLE<std::uint32_t>();

    if (!fileHeader_.isValid()) {
        throw FormatError("Invalid file header", context());
    }
    if (isSeekable() && kMagicHeaderSize + fileHeader_.headerSize > fileSize_) {
        throw FormatError("File header runs past end of file", context());
    }

    dataStart_ = kMagicHeaderSize + fileHeader_.headerSize;

    auto metadataLength = readLE<std::uint32_t>();
    if (position_ + metadataLength > dataStart_) {
        throw FormatError("Metadata length exceeds header size", context().withOffset(position_));
    }
    metadata_.resize(metadataLength);
    if (metadataLength > 0) {
        readBytes(metadata_.data(), metadataLength);
    }

    auto referenceCount = readLE<std::uint32_t>();
    for (std::uint32_t i = 0; i < referenceCount; ++i) {
        auto nameLength = readLE<std::uint16_t>();
        if (position_ + nameLength + sizeof(std::uint32_t) > dataStart_) {
            throw FormatError("Reference table exceeds header size",
                              context().withOffset(position_));
        }
        std::string name(nameLength, '\0');
        readBytes(name.data(), nameLength);
        auto length = readLE<std::uint32_t>();

        auto added = references_.add(std::move(name), length);
        if (!added) {
            throw FormatError("Invalid reference table: " + added.error().message(), context());
        }
    }

    if (position_ > dataStart_) {
        throw FormatError("File header overruns its declared size", context());
    }
    if (position_ < dataStart_) {
        seekTo(dataStart_);
    }
}

void ContainerReader::readTrailer() {
    seekTo(fileSize_ - Trailer::kSize);

    trailer_.blockTableOffset = readLE<std::uint64_t>();
    trailer_.indexOffset = readLE<std::uint64_t>();
    trailer_.recordCount = readLE<std::uint64_t>();
    readBytes(trailer_.magicEnd.data(), trailer_.magicEnd.size());

    if (!trailer_.isValid()) {
        throw FormatError("Invalid trailer - file may be truncated or corrupted", context());
    }

    const FileOffset sectionsEnd = fileSize_ - Trailer::kSize;
    if (trailer_.blockTableOffset < dataStart_ ||
        trailer_.blockTableOffset + BlockTableHeader::kSize > sectionsEnd) {
        throw FormatError("Trailer points outside the file", context());
    }
    if (trailer_.hasIndex() && (trailer_.indexOffset < trailer_.blockTableOffset ||
                                trailer_.indexOffset + IndexSectionHeader::kSize > sectionsEnd)) {
        throw FormatError("Trailer index offset points outside the file", context());
    }
}

void ContainerReader::readBlockTable() {
    seekTo(trailer_.blockTableOffset);

    BlockTableHeader tableHeader;
    tableHeader.magic = readLE<std::uint32_t>();
    tableHeader.entrySize = readLE<std::uint32_t>();
    tableHeader.numBlocks = readLE<std::uint64_t>();

    if (!tableHeader.isValid()) {
        throw FormatError("Invalid block table header",
                          context().withOffset(trailer_.blockTableOffset));
    }

    const FileOffset tableEnd =
        trailer_.hasIndex() ? trailer_.indexOffset : fileSize_ - Trailer::kSize;
    const FileOffset available = tableEnd - trailer_.blockTableOffset - BlockTableHeader::kSize;
    if (tableHeader.numBlocks > available / tableHeader.entrySize) {
        throw FormatError("Block table runs past its section",
                          context().withOffset(trailer_.blockTableOffset));
    }

    blockTable_.clear();
    blockTable_.reserve(tableHeader.numBlocks);

    for (std::uint64_t i = 0; i < tableHeader.numBlocks; ++i) {
        BlockTableEntry entry;
        entry.offset = readLE<std::uint64_t>();
        entry.compressedSize = readLE<std::uint64_t>();
        entry.recordCount = readLE<std::uint32_t>();
        entry.uncompressedSize = readLE<std::uint32_t>();

        if (entry.offset < dataStart_ ||
            entry.offset + entry.compressedSize > trailer_.blockTableOffset) {
            throw FormatError(fmt::format("Block table entry {} points outside the data region", i),
                              context().withBlock(static_cast<BlockId>(i)));
        }
        blockTable_.push_back(entry);

        if (tableHeader.entrySize > BlockTableEntry::kSize) {
            seekTo(position_ + (tableHeader.entrySize - BlockTableEntry::kSize));
        }
    }

    ALN_LOG_DEBUG("Block table loaded: {} blocks", blockTable_.size());
}

void ContainerReader::readBytes(void* buffer, std::size_t size) {
    stream_->read(static_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(stream_->gcount()) != size) {
        throw IOError(fmt::format("Failed to read {} bytes", size),
                      context().withOffset(position_));
    }
    position_ += size;
}

template <typename T>
T ContainerReader::readLE() {
    T value;
    readBytes(&value, sizeof(T));
    return toLittleEndian(value);
}

void ContainerReader::seekTo(FileOffset position) {
    if (isSeekable()) {
        stream_->clear();
        stream_->seekg(static_cast<std::streamoff>(position), std::ios::beg);
        if (!stream_->good()) {
            throw IOError("Failed to seek in file", context().withOffset(position));
        }
        position_ = position;
        return;
    }

    if (position < position_) {
        throw InvalidStateError("Cannot seek backwards in a sequential stream",
                                context().withOffset(position));
    }
    const auto skip = position - position_;
    if (skip > 0) {
        stream_->ignore(static_cast<std::streamsize>(skip));
        if (static_cast<FileOffset>(stream_->gcount()) != skip) {
            throw IOError("Unexpected end of stream", context().withOffset(position_));
        }
        position_ = position;
    }
}

}  // namespace aln::format
