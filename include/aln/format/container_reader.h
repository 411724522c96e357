// =============================================================================
// alnstore - Container Reader
// =============================================================================
// Reads the container layout written by ContainerWriter.
//
// Two access modes:
// - Seekable (constructed from a path): trailer and block table are loaded
//   on open, blocks are read at any offset, the index section is available.
// - Sequential (constructed from an std::istream): only the file header is
//   read on open, blocks are walked in order with readNextBlock() until the
//   block table magic is reached.
//
// Payloads are returned still compressed; algo::BlockReader decompresses
// and verifies them.
// =============================================================================

#ifndef ALN_FORMAT_CONTAINER_READER_H
#define ALN_FORMAT_CONTAINER_READER_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "aln/codec/reference_dictionary.h"
#include "aln/common/error.h"
#include "aln/common/types.h"
#include "aln/format/aln_format.h"

namespace aln::format {

/// @brief One block as stored: header plus compressed payload.
struct RawBlock {
    /// @brief Absolute offset of the block header.
    FileOffset offset = 0;
    BlockHeader header;
    std::vector<std::uint8_t> payload;
};

/// @brief Reader for the alignment container format.
///
/// Thread Safety: not thread-safe. Concurrent readers open their own
/// ContainerReader on the same path.
///
/// Error Handling:
/// - OpenError if the file cannot be opened
/// - FormatError for bad magic, incompatible version or a damaged header,
///   block table or trailer
/// - CorruptBlockError when a block header does not parse
/// - IOError on read failures
class ContainerReader {
public:
    /// @brief Seekable reader over a file.
    explicit ContainerReader(std::filesystem::path path);

    /// @brief Sequential reader over an already-open stream.
    /// @param sourceName Used in error contexts and logs.
    explicit ContainerReader(std::istream& stream, std::string sourceName = "<stream>");

    ~ContainerReader() = default;

    ContainerReader(const ContainerReader&) = delete;
    ContainerReader& operator=(const ContainerReader&) = delete;
    ContainerReader(ContainerReader&&) = delete;
    ContainerReader& operator=(ContainerReader&&) = delete;

    /// @brief Read magic, version and file header; in seekable mode also the
    ///        trailer and block table.
    void open();

    [[nodiscard]] bool isOpen() const noexcept { return isOpen_; }
    [[nodiscard]] bool isSeekable() const noexcept { return owned_ != nullptr; }

    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }
    [[nodiscard]] std::uint8_t version() const noexcept { return version_; }

    [[nodiscard]] const FileHeader& fileHeader() const;
    [[nodiscard]] const std::string& metadata() const;
    [[nodiscard]] const codec::ReferenceDictionary& references() const;

    /// @brief Offset of the first block, right after the file header.
    [[nodiscard]] FileOffset dataStart() const noexcept { return dataStart_; }

    /// @brief Trailer. Seekable mode only.
    [[nodiscard]] const Trailer& trailer() const;

    /// @brief Block table in file order. Seekable mode only.
    [[nodiscard]] const std::vector<BlockTableEntry>& blockTable() const;

    /// @brief Read the block whose header starts at @p offset. Seekable mode only.
    [[nodiscard]] RawBlock readBlockAt(FileOffset offset);

    /// @brief Read the block at the current position.
    /// @return std::nullopt once the block table is reached.
    [[nodiscard]] std::optional<RawBlock> readNextBlock();

    /// @brief Payload of the index section, if the file has one. Seekable mode only.
    [[nodiscard]] std::optional<std::vector<std::uint8_t>> readIndexSection();

private:
    void requireOpen() const;
    void requireSeekable(std::string_view operation) const;

    void readMagicHeader();
    void readFileHeader();
    void readTrailer();
    void readBlockTable();
    RawBlock readBlockBody(FileOffset offset, std::uint32_t magic);

    [[nodiscard]] ErrorContext context() const;

    void readBytes(void* buffer, std::size_t size);

    template <typename T>
    T readLE();

    void seekTo(FileOffset position);

    std::unique_ptr<std::ifstream> owned_;
    std::istream* stream_ = nullptr;
    std::string sourceName_;
    std::filesystem::path path_;

    bool isOpen_ = false;
    bool reachedEnd_ = false;
    std::uint8_t version_ = 0;
    FileOffset position_ = 0;
    FileOffset fileSize_ = 0;
    FileOffset dataStart_ = 0;

    FileHeader fileHeader_;
    std::string metadata_;
    codec::ReferenceDictionary references_;
    Trailer trailer_;
    std::vector<BlockTableEntry> blockTable_;
};

}  // namespace aln::format

#endif  // ALN_FORMAT_CONTAINER_READER_H
