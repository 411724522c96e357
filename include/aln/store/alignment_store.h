// =============================================================================
// alnstore - Alignment Store
// =============================================================================
// Read, write and query alignment containers.
//
// Modes:
// - kRead: iterate and query an existing container
// - kWrite: create or truncate; everything goes to "<path>.tmp" and is
//   renamed over the path on close()
// - kAppend: the existing blocks are copied to "<path>.tmp", new blocks
//   follow them, and the index is rebuilt
// - openStream(): a non-seekable source, read once in file order
//
// Usage:
// @code
// auto header = unwrapOrThrow(store::HeaderInfo::fromText("@SQ\tSN:chr1\tLN:248956422\n"));
// auto out = store::AlignmentStore::open("reads.aln", OpenMode::kWrite, {.sorted = true}, header);
// out.write(record);
// out.close();
//
// auto in = store::AlignmentStore::open("reads.aln", OpenMode::kRead);
// for (const auto& r : in.query("chr1:1,000-2,000", store::filters::mapped())) { ... }
// @endcode
//
// Thread Safety:
// - Not safe for concurrent mutation
// - Queries on a store opened for reading may run concurrently; each
//   RecordStream owns its own file handle and the index is built once
// =============================================================================

#ifndef ALN_STORE_ALIGNMENT_STORE_H
#define ALN_STORE_ALIGNMENT_STORE_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "aln/codec/alignment_record.h"
#include "aln/common/error.h"
#include "aln/common/types.h"
#include "aln/index/coordinate_index.h"
#include "aln/store/header_info.h"
#include "aln/store/record_filter.h"
#include "aln/store/record_stream.h"
#include "aln/store/region.h"

namespace aln::store {

class AlignmentStoreImpl;

/// @brief Per-reference record counts.
struct ReferenceStats {
    std::string name;
    std::uint32_t length = 0;

    /// @brief Placed records on this reference.
    std::uint64_t mapped = 0;

    bool operator==(const ReferenceStats&) const = default;
};

struct IndexStats {
    std::vector<ReferenceStats> references;

    /// @brief Records without a placement (unmapped or no reference).
    std::uint64_t unplaced = 0;
};

using IndexFuture = std::shared_future<std::shared_ptr<const index::CoordinateIndex>>;

class AlignmentStore {
public:
    /// @brief Open a container file.
    /// @param header Header of a new file (kWrite only, may be set later
    ///        with setHeader() before the first write).
    /// @throws OpenError if the file cannot be opened, is not a valid
    ///         container, or the temp file cannot be created.
    /// @throws InvalidArgumentError if @p options do not validate.
    [[nodiscard]] static AlignmentStore open(const std::filesystem::path& path, OpenMode mode,
                                             StoreOptions options = {}, HeaderInfo header = {});

    /// @brief Read a container from a non-seekable stream, one pass only.
    /// @note @p input must outlive the store.
    [[nodiscard]] static AlignmentStore openStream(std::istream& input, StoreOptions options = {});

    /// @brief Closes the store if still open; errors are logged.
    ~AlignmentStore();

    AlignmentStore(const AlignmentStore&) = delete;
    AlignmentStore& operator=(const AlignmentStore&) = delete;
    AlignmentStore(AlignmentStore&&) noexcept;
    AlignmentStore& operator=(AlignmentStore&&) noexcept;

    // =========================================================================
    // Header
    // =========================================================================

    [[nodiscard]] const HeaderInfo& header() const;

    /// @brief Replace the header of a new file.
    /// @throws InvalidStateError unless in kWrite mode before the first write.
    void setHeader(HeaderInfo header);

    /// @brief Copy the header of @p other into this new file.
    void writeHeaderFrom(const AlignmentStore& other);

    // =========================================================================
    // Reading
    // =========================================================================

    /// @brief Every record in file order.
    /// @throws InvalidStateError in write/append mode, or on a second pass
    ///         over a stream-backed store.
    [[nodiscard]] RecordStream iterate(RecordFilter filter = {});

    /// @brief Records on @p reference overlapping [start, end), 0-based.
    /// @throws InvalidArgumentError for an unknown reference.
    /// @throws InvalidStateError on stream-backed or write-mode stores.
    [[nodiscard]] RecordStream query(std::string_view reference, std::int64_t start,
                                     std::int64_t end, RecordFilter filter = {});

    [[nodiscard]] RecordStream query(const Region& region, RecordFilter filter = {});

    /// @brief Query a region string such as "chr1:100-200". A string that is
    ///        exactly a reference name selects the whole reference.
    [[nodiscard]] RecordStream query(std::string_view region, RecordFilter filter = {});

    /// @brief Number of records accepted by @p filter.
    [[nodiscard]] std::uint64_t count(RecordFilter filter = {});

    [[nodiscard]] std::uint64_t count(const Region& region, RecordFilter filter = {});

    [[nodiscard]] std::uint64_t count(std::string_view region, RecordFilter filter = {});

    /// @brief Reference names in header order, optionally filtered.
    [[nodiscard]] std::vector<std::string> references(
        const std::function<bool(std::string_view)>& predicate = {}) const;

    /// @brief Mapped count per reference plus unplaced count, from the index.
    [[nodiscard]] IndexStats referenceStats();

    /// @brief Build the coordinate index on a background task.
    /// @note Repeated calls return the same future.
    [[nodiscard]] IndexFuture buildIndexAsync();

    /// @brief Whether the index is loaded or built already.
    [[nodiscard]] bool hasIndex() const;

    // =========================================================================
    // Writing
    // =========================================================================

    /// @brief Validate and buffer @p record.
    /// @throws MalformedRecordError for invalid records or unknown references.
    /// @throws OutOfOrderWriteError in sorted mode, before anything is buffered.
    /// @throws IOError when a block cannot be written; the error is remembered.
    void write(const codec::AlignmentRecord& record);

    /// @brief Write the buffered records as a block.
    void flush();

    /// @brief Flush, write block table, index and trailer, and publish the file.
    /// @throws FlushError if that fails, or the remembered write error.
    /// @note Idempotent.
    void close();

    /// @brief Forget a remembered write error.
    void clearError() noexcept;

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] OpenMode mode() const noexcept;
    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] bool isSeekable() const noexcept;
    [[nodiscard]] bool isSorted() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept;

    /// @brief Records in the file (read) or written so far (write/append).
    [[nodiscard]] std::uint64_t recordCount() const noexcept;

private:
    explicit AlignmentStore(std::unique_ptr<AlignmentStoreImpl> impl);

    std::unique_ptr<AlignmentStoreImpl> impl_;
};

}  // namespace aln::store

#endif  // ALN_STORE_ALIGNMENT_STORE_H
