// =============================================================================
// alnstore - Container Writer
// =============================================================================
// Writes an alignment container with atomic publication.
//
// This module provides:
// - ContainerWriter: sequential writer for the container layout
// - Atomic write: everything goes to "<path>.tmp", renamed on finalize()
// - Signal handling: temp files are removed on SIGINT/SIGTERM
// - Append support: an existing container's header and blocks are copied
//   into the temp file and writing continues after the last block
//
// Usage:
//   ContainerWriter writer("/path/to/out.aln");
//   writer.writeFileHeader(header, metadata, references);
//   writer.writeBlock(blockHeader, payload);
//   writer.finalize(recordCount, indexBytes);
// =============================================================================

#ifndef ALN_FORMAT_CONTAINER_WRITER_H
#define ALN_FORMAT_CONTAINER_WRITER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

#include "aln/codec/reference_dictionary.h"
#include "aln/common/error.h"
#include "aln/common/types.h"
#include "aln/format/aln_format.h"

namespace aln::format {

class ContainerWriter;

// =============================================================================
// Signal Handler Management
// =============================================================================

/// @brief Register a writer for signal-based cleanup. Thread-safe.
void registerWriterForCleanup(ContainerWriter* writer);

/// @brief Unregister a writer from signal-based cleanup. Thread-safe.
void unregisterWriterForCleanup(ContainerWriter* writer);

/// @brief Install SIGINT and SIGTERM handlers once per process.
void installSignalHandlers();

// =============================================================================
// ContainerWriter Class
// =============================================================================

/// @brief Writer for the alignment container format.
///
/// Thread Safety:
/// - Not thread-safe for concurrent writes
/// - abort() may be called from the signal handler
///
/// Error Handling:
/// - Throws IOError on file operation failures
/// - Throws FormatError on misuse (blocks before header, writes after finalize)
/// - The temp file is removed on destruction unless finalized
class ContainerWriter {
public:
    /// @brief Create "<outputPath>.tmp" for writing.
    /// @throws IOError if the temp file cannot be created.
    explicit ContainerWriter(std::filesystem::path outputPath);

    ~ContainerWriter();

    ContainerWriter(const ContainerWriter&) = delete;
    ContainerWriter& operator=(const ContainerWriter&) = delete;
    ContainerWriter(ContainerWriter&&) = delete;
    ContainerWriter& operator=(ContainerWriter&&) = delete;

    /// @brief Write magic, version and file header.
    /// @throws FormatError if already written.
    void writeFileHeader(const FileHeader& header, std::string_view metadata,
                         const codec::ReferenceDictionary& references);

    /// @brief Copy the first @p length bytes of @p source (magic, header, blocks)
    ///        and adopt its block table, so new blocks follow the old ones.
    /// @throws FormatError if anything was written already.
    void adoptPrefix(const std::filesystem::path& source, FileOffset length,
                     std::vector<BlockTableEntry> blocks);

    /// @brief Write a block header and its payload.
    /// @return Absolute offset of the block header.
    FileOffset writeBlock(const BlockHeader& header, std::span<const std::uint8_t> payload);

    /// @brief Write block table, optional index section and trailer, then
    ///        rename the temp file over the output path.
    /// @param indexPayload Serialized coordinate index, empty for none.
    /// @note Idempotent once it has succeeded.
    void finalize(std::uint64_t recordCount, std::span<const std::uint8_t> indexPayload = {});

    /// @brief Discard the temp file. Safe to call from a signal handler.
    void abort() noexcept;

    [[nodiscard]] FileOffset currentPosition() const noexcept { return position_; }

    [[nodiscard]] const std::vector<BlockTableEntry>& blockTable() const noexcept {
        return blockTable_;
    }

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_.load(); }
    [[nodiscard]] bool isAborted() const noexcept { return aborted_.load(); }

    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }
    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

private:
    void ensureWritable(std::string_view operation) const;
    void writeBytes(const void* data, std::size_t size);

    template <typename T>
    void writeLE(T value);

    void writeBlockTable();
    void writeIndexSection(std::span<const std::uint8_t> payload);
    void writeTrailer(std::uint64_t recordCount);
    void cleanupTempFile() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;

    std::vector<BlockTableEntry> blockTable_;
    FileOffset position_ = 0;
    FileOffset blockTableOffset_ = 0;
    FileOffset indexOffset_ = 0;

    bool headerWritten_ = false;
    std::atomic<bool> finalized_{false};
    std::atomic<bool> aborted_{false};

    /// @brief Serializes writer operations.
    mutable std::mutex mutex_;
};

}  // namespace aln::format

#endif  // ALN_FORMAT_CONTAINER_WRITER_H
