// =============================================================================
// alnstore - Alignment Store Implementation
// =============================================================================

#include "aln/store/alignment_store.h"

#include <algorithm>
#include <compare>
#include <exception>
#include <limits>
#include <mutex>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <tbb/enumerable_thread_specific.h>

#include "aln/algo/block_compressor.h"
#include "aln/codec/binary_codec.h"
#include "aln/codec/compressor.h"
#include "aln/common/logger.h"
#include "aln/format/aln_format.h"
#include "aln/format/container_reader.h"
#include "aln/format/container_writer.h"

namespace aln::store {

namespace {

/// @brief (reference id, position) order; records without a reference last.
struct SortKey {
    std::int64_t reference = 0;
    std::int64_t position = 0;

    auto operator<=>(const SortKey&) const = default;
};

SortKey sortKeyOf(ReferenceId referenceId, std::int64_t position) {
    if (referenceId == kNoReference) {
        return {std::numeric_limits<std::int64_t>::max(), 0};
    }
    return {referenceId, position};
}

std::vector<FileOffset> blockOffsetsOf(const std::vector<format::BlockTableEntry>& table) {
    std::vector<FileOffset> offsets;
    offsets.reserve(table.size());
    for (const auto& entry : table) {
        offsets.push_back(entry.offset);
    }
    return offsets;
}

bool isStorageError(ErrorCode code) {
    return code == ErrorCode::kIOError || code == ErrorCode::kFlushError;
}

}  // namespace

// =============================================================================
// AlignmentStoreImpl - Implementation Class
// =============================================================================

class AlignmentStoreImpl {
public:
    AlignmentStoreImpl(std::filesystem::path path, OpenMode mode, StoreOptions options)
        : path_(std::move(path)), mode_(mode), options_(std::move(options)) {}

    ~AlignmentStoreImpl();

    void openForRead();
    void openForWrite(HeaderInfo header);
    void openForAppend();
    void openStream(std::istream& input);

    // Reading
    void requireReadable(std::string_view operation) const;
    void requireSeekable(std::string_view operation) const;
    RecordStream iterate(RecordFilter filter);
    RecordStream query(ReferenceId referenceId, std::int64_t start, std::int64_t end,
                       RecordFilter filter);
    ReferenceId resolveReference(std::string_view name) const;
    std::shared_ptr<const index::CoordinateIndex> ensureIndex();
    std::shared_ptr<const index::CoordinateIndex> publishedIndex() const;
    index::CoordinateIndex buildIndex() const;
    IndexFuture buildIndexAsync();

    // Writing
    void requireWritable(std::string_view operation) const;
    void setHeader(HeaderInfo header);
    void write(const codec::AlignmentRecord& record);
    void flush();
    void close();
    void commitHeader();
    void startWriter(BlockId firstBlockId);
    [[noreturn]] void rememberAndRethrow(const AlnException& e);

    std::filesystem::path path_;
    OpenMode mode_;
    StoreOptions options_;
    HeaderInfo header_;
    bool sorted_ = false;
    bool seekable_ = true;
    bool closed_ = false;

    // Read state
    std::vector<FileOffset> blockOffsets_;
    std::uint64_t recordCount_ = 0;
    std::shared_ptr<algo::BlockReader> streamReader_;
    bool streamConsumed_ = false;

    std::once_flag indexOnce_;
    mutable std::mutex indexMutex_;
    std::shared_ptr<const index::CoordinateIndex> index_;  // guarded by indexMutex_
    std::mutex futureMutex_;
    IndexFuture indexFuture_;

    // Write state
    std::unique_ptr<format::ContainerWriter> writer_;
    std::optional<codec::BinaryCodec> codec_;
    std::unique_ptr<algo::BlockCompressor> compressor_;
    std::shared_ptr<const codec::Compressor> payloadCompressor_;
    std::optional<index::CoordinateIndex> liveIndex_;
    std::optional<SortKey> lastKey_;
    bool headerCommitted_ = false;
    std::exception_ptr pendingError_;
};

AlignmentStoreImpl::~AlignmentStoreImpl() {
    if (indexFuture_.valid()) {
        indexFuture_.wait();
    }
}

// =============================================================================
// Opening
// =============================================================================

void AlignmentStoreImpl::openForRead() {
    auto container = std::make_unique<format::ContainerReader>(path_);
    try {
        container->open();

        auto header = HeaderInfo::fromText(container->metadata());
        if (!header) {
            throw FormatError("Invalid header metadata: " + header.error().message(),
                              ErrorContext(path_.string()));
        }
        if (!(header->references() == container->references())) {
            throw FormatError("Header @SQ lines do not match the reference table",
                              ErrorContext(path_.string()));
        }
        header_ = std::move(*header);
    } catch (const FormatError& e) {
        throw OpenError(fmt::format("Failed to open {}: {}", path_.string(), e.message()),
                        ErrorContext(path_.string()));
    } catch (const IOError& e) {
        throw OpenError(fmt::format("Failed to read {}: {}", path_.string(), e.message()),
                        ErrorContext(path_.string()));
    }

    sorted_ = container->fileHeader().isSorted();
    blockOffsets_ = blockOffsetsOf(container->blockTable());
    recordCount_ = container->trailer().recordCount;

    if (container->trailer().hasIndex()) {
        try {
            auto payload = container->readIndexSection();
            auto loaded = index::CoordinateIndex::deserialize(*payload);
            if (loaded && loaded->referenceCount() == header_.references().size()) {
                index_ = std::make_shared<const index::CoordinateIndex>(std::move(*loaded));
            } else {
                ALN_LOG_WARNING("Ignoring unusable coordinate index in {}", path_.string());
            }
        } catch (const FormatError& e) {
            ALN_LOG_WARNING("Ignoring unreadable coordinate index in {}: {}", path_.string(),
                            e.message());
        }
    }

    ALN_LOG_DEBUG("Opened {} for reading: blocks={}, records={}, sorted={}, indexed={}",
                  path_.string(), blockOffsets_.size(), recordCount_, sorted_, index_ != nullptr);
}

void AlignmentStoreImpl::openForWrite(HeaderInfo header) {
    header_ = std::move(header);
    sorted_ = options_.sorted;

    try {
        writer_ = std::make_unique<format::ContainerWriter>(path_);
    } catch (const IOError& e) {
        throw OpenError(fmt::format("Failed to create {}: {}", path_.string(), e.message()),
                        ErrorContext(path_.string()));
    }

    ALN_LOG_DEBUG("Opened {} for writing: sorted={}, codec={}", path_.string(), sorted_,
                  payloadCompressor_->name());
}

void AlignmentStoreImpl::openForAppend() {
    format::ContainerReader existing(path_);
    std::vector<format::BlockTableEntry> blocks;
    FileOffset prefixLength = 0;
    format::FileHeader fileHeader;
    try {
        existing.open();
        auto header = HeaderInfo::fromText(existing.metadata());
        if (!header) {
            throw FormatError("Invalid header metadata: " + header.error().message(),
                              ErrorContext(path_.string()));
        }
        header_ = std::move(*header);
        fileHeader = existing.fileHeader();
        blocks = existing.blockTable();
        prefixLength = existing.trailer().blockTableOffset;
        recordCount_ = existing.trailer().recordCount;
    } catch (const FormatError& e) {
        throw OpenError(fmt::format("Failed to open {}: {}", path_.string(), e.message()),
                        ErrorContext(path_.string()));
    } catch (const IOError& e) {
        throw OpenError(fmt::format("Failed to read {}: {}", path_.string(), e.message()),
                        ErrorContext(path_.string()));
    }

    sorted_ = fileHeader.isSorted();
    options_.sorted = sorted_;
    options_.blockThreshold = std::clamp<std::size_t>(fileHeader.blockThreshold,
                                                      kMinBlockThreshold, kMaxBlockThreshold);
    if (!options_.compressor && isKnownCodec(fileHeader.codec)) {
        options_.codec = static_cast<CodecId>(fileHeader.codec);
        payloadCompressor_ =
            unwrapOrThrow(codec::makeCompressor(options_.codec, options_.compressionLevel));
    }

    const auto oldOffsets = blockOffsetsOf(blocks);
    blockOffsets_ = oldOffsets;

    try {
        if (sorted_ && !oldOffsets.empty()) {
            algo::BlockReader reader(path_);
            const auto last = reader.readBlock(oldOffsets.back());
            if (!last.empty()) {
                auto referenceId = reader.codec().referenceId(last.back().referenceName);
                lastKey_ = sortKeyOf(referenceId.value_or(kNoReference), last.back().position);
            }
        }

        if (sorted_ && options_.indexOnClose) {
            liveIndex_ = buildIndex();
        }

        writer_ = std::make_unique<format::ContainerWriter>(path_);
        writer_->adoptPrefix(path_, prefixLength, std::move(blocks));
    } catch (const AlnException& e) {
        if (writer_) {
            writer_->abort();
        }
        throw OpenError(fmt::format("Failed to prepare {} for append: {}", path_.string(),
                                    e.message()),
                        ErrorContext(path_.string()));
    }

    headerCommitted_ = true;
    startWriter(static_cast<BlockId>(oldOffsets.size()));

    ALN_LOG_DEBUG("Opened {} for append: blocks={}, records={}, sorted={}", path_.string(),
                  oldOffsets.size(), recordCount_, sorted_);
}

void AlignmentStoreImpl::openStream(std::istream& input) {
    seekable_ = false;
    auto container = std::make_unique<format::ContainerReader>(input);
    try {
        streamReader_ = std::make_shared<algo::BlockReader>(std::move(container));
        const auto& reader = streamReader_->container();
        auto header = HeaderInfo::fromText(reader.metadata());
        if (!header) {
            throw FormatError("Invalid header metadata: " + header.error().message());
        }
        header_ = std::move(*header);
        sorted_ = reader.fileHeader().isSorted();
    } catch (const FormatError& e) {
        throw OpenError("Failed to open stream: " + e.message());
    } catch (const IOError& e) {
        throw OpenError("Failed to read stream: " + e.message());
    }
}

// =============================================================================
// Reading
// =============================================================================

void AlignmentStoreImpl::requireReadable(std::string_view operation) const {
    if (mode_ != OpenMode::kRead) {
        throw InvalidStateError(
            fmt::format("{}: store is open for {}", operation, openModeToString(mode_)),
            ErrorContext(path_.string()));
    }
    if (closed_) {
        throw InvalidStateError(fmt::format("{}: store is closed", operation),
                                ErrorContext(path_.string()));
    }
}

void AlignmentStoreImpl::requireSeekable(std::string_view operation) const {
    requireReadable(operation);
    if (!seekable_) {
        throw InvalidStateError(fmt::format("{} requires a seekable file", operation));
    }
}

RecordStream AlignmentStoreImpl::iterate(RecordFilter filter) {
    requireReadable("iterate");
    if (!seekable_) {
        if (streamConsumed_) {
            throw InvalidStateError("Stream-backed store can only be iterated once");
        }
        streamConsumed_ = true;
        return RecordStream(streamReader_, std::move(filter), options_.errorPolicy);
    }
    return RecordStream(path_, blockOffsets_, std::move(filter), options_.errorPolicy);
}

ReferenceId AlignmentStoreImpl::resolveReference(std::string_view name) const {
    auto id = header_.referenceId(name);
    if (!id) {
        throw InvalidArgumentError(fmt::format("Unknown reference '{}'", name),
                                   ErrorContext(path_.string()));
    }
    return *id;
}

RecordStream AlignmentStoreImpl::query(ReferenceId referenceId, std::int64_t start,
                                       std::int64_t end, RecordFilter filter) {
    requireSeekable("query");

    const auto* reference = header_.references().at(referenceId);
    RegionBounds bounds{reference->name, start, end};

    std::vector<FileOffset> offsets;
    if (end > start) {
        offsets = ensureIndex()->query(referenceId, start, end);
    }
    return RecordStream(path_, std::move(offsets), std::move(filter), options_.errorPolicy,
                        std::move(bounds));
}

std::shared_ptr<const index::CoordinateIndex> AlignmentStoreImpl::ensureIndex() {
    std::call_once(indexOnce_, [this] {
        if (publishedIndex()) {
            return;
        }
        auto built = std::make_shared<const index::CoordinateIndex>(buildIndex());
        std::lock_guard<std::mutex> lock(indexMutex_);
        index_ = std::move(built);
    });
    return publishedIndex();
}

std::shared_ptr<const index::CoordinateIndex> AlignmentStoreImpl::publishedIndex() const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    return index_;
}

index::CoordinateIndex AlignmentStoreImpl::buildIndex() const {
    ALN_LOG_DEBUG("Building coordinate index for {} ({} blocks)", path_.string(),
                  blockOffsets_.size());

    tbb::enumerable_thread_specific<std::unique_ptr<algo::BlockReader>> readers;
    const auto policy = options_.errorPolicy;
    const auto& path = path_;

    auto scanner = [&readers, &path, policy](FileOffset offset) {
        auto& reader = readers.local();
        if (!reader) {
            reader = std::make_unique<algo::BlockReader>(path);
        }
        try {
            return reader->readSpans(offset);
        } catch (const AlnException& e) {
            if (policy != ErrorPolicy::kSkipCorruptBlocks || !isDecodeError(e.code())) {
                throw;
            }
            ALN_LOG_WARNING("Index build skipping corrupt block: {}", e.what());
            return std::vector<codec::RecordSpan>{};
        }
    };

    return index::CoordinateIndex::build(blockOffsets_, header_.references().size(), scanner);
}

IndexFuture AlignmentStoreImpl::buildIndexAsync() {
    requireSeekable("buildIndexAsync");

    std::lock_guard<std::mutex> lock(futureMutex_);
    if (!indexFuture_.valid()) {
        indexFuture_ = std::async(std::launch::async, [this] { return ensureIndex(); }).share();
    }
    return indexFuture_;
}

// =============================================================================
// Writing
// =============================================================================

void AlignmentStoreImpl::requireWritable(std::string_view operation) const {
    if (mode_ == OpenMode::kRead) {
        throw InvalidStateError(fmt::format("{}: store is open for reading", operation),
                                ErrorContext(path_.string()));
    }
    if (closed_) {
        throw InvalidStateError(fmt::format("{}: store is closed", operation),
                                ErrorContext(path_.string()));
    }
}

void AlignmentStoreImpl::setHeader(HeaderInfo header) {
    if (mode_ != OpenMode::kWrite || headerCommitted_ || closed_) {
        throw InvalidStateError("Header can only be set on a new file before the first write",
                                ErrorContext(path_.string()));
    }
    header_ = std::move(header);
}

void AlignmentStoreImpl::commitHeader() {
    if (headerCommitted_) {
        return;
    }

    format::FileHeader fileHeader;
    fileHeader.flags = sorted_ ? format::flags::kSorted : 0;
    fileHeader.codec = static_cast<std::uint8_t>(payloadCompressor_->id());
    fileHeader.blockThreshold = static_cast<std::uint32_t>(options_.blockThreshold);

    writer_->writeFileHeader(fileHeader, header_.toText(), header_.references());
    headerCommitted_ = true;

    if (sorted_ && options_.indexOnClose) {
        liveIndex_.emplace(header_.references().size());
    }
    startWriter(0);
}

void AlignmentStoreImpl::startWriter(BlockId firstBlockId) {
    codec_.emplace(header_.references());

    algo::BlockCompressorConfig config;
    config.blockThreshold = options_.blockThreshold;
    config.compressor = payloadCompressor_;
    config.firstBlockId = firstBlockId;

    compressor_ = std::make_unique<algo::BlockCompressor>(*writer_, *codec_, std::move(config));
    if (liveIndex_) {
        compressor_->setFlushObserver(
            [this](const algo::BlockDescriptor& block, std::span<const codec::RecordSpan> spans) {
                liveIndex_->addBlock(block.offset, spans);
            });
    }
}

void AlignmentStoreImpl::rememberAndRethrow(const AlnException& e) {
    if (isStorageError(e.code()) && !pendingError_) {
        pendingError_ = std::current_exception();
    }
    throw;
}

void AlignmentStoreImpl::write(const codec::AlignmentRecord& record) {
    requireWritable("write");
    if (pendingError_) {
        std::rethrow_exception(pendingError_);
    }

    unwrapOrThrow(record.validate());

    try {
        commitHeader();
    } catch (const AlnException& e) {
        rememberAndRethrow(e);
    }

    auto referenceId = codec_->referenceId(record.referenceName);
    if (!referenceId) {
        throw MalformedRecordError(referenceId.error().message(),
                                   ErrorContext(path_.string()).withRecord(recordCount_));
    }

    const auto key = sortKeyOf(*referenceId, record.position);
    if (sorted_ && lastKey_ && key < *lastKey_) {
        throw OutOfOrderWriteError(
            fmt::format("Record '{}' at {}:{} written after a later record", record.queryName,
                        record.referenceName, record.position),
            ErrorContext(path_.string()).withRecord(recordCount_));
    }

    try {
        compressor_->append(record);
    } catch (const AlnException& e) {
        rememberAndRethrow(e);
    }

    lastKey_ = key;
    ++recordCount_;
}

void AlignmentStoreImpl::flush() {
    requireWritable("flush");
    if (pendingError_) {
        std::rethrow_exception(pendingError_);
    }
    try {
        commitHeader();
        compressor_->flush();
    } catch (const AlnException& e) {
        rememberAndRethrow(e);
    }
}

void AlignmentStoreImpl::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (mode_ == OpenMode::kRead) {
        streamReader_.reset();
        ALN_LOG_DEBUG("Closed {}", path_.string());
        return;
    }

    if (pendingError_) {
        writer_->abort();
        auto error = std::exchange(pendingError_, nullptr);
        std::rethrow_exception(error);
    }

    try {
        commitHeader();
        compressor_->flush();

        std::vector<std::uint8_t> indexPayload;
        if (liveIndex_) {
            indexPayload = liveIndex_->serialize();
        }
        writer_->finalize(recordCount_, indexPayload);
    } catch (const AlnException& e) {
        writer_->abort();
        if (isStorageError(e.code())) {
            throw FlushError(fmt::format("Failed to close {}: {}", path_.string(), e.message()),
                             ErrorContext(path_.string()));
        }
        throw;
    }

    ALN_LOG_INFO("Closed {}: records={}, indexed={}", path_.string(), recordCount_,
                 liveIndex_.has_value());
}

// =============================================================================
// AlignmentStore Public Interface
// =============================================================================

AlignmentStore::AlignmentStore(std::unique_ptr<AlignmentStoreImpl> impl)
    : impl_(std::move(impl)) {}

AlignmentStore AlignmentStore::open(const std::filesystem::path& path, OpenMode mode,
                                    StoreOptions options, HeaderInfo header) {
    if (auto valid = options.validate(); !valid) {
        throw InvalidArgumentError(valid.error().message());
    }
    if (mode != OpenMode::kWrite && !header.empty()) {
        throw InvalidArgumentError(
            fmt::format("A header can only be supplied in write mode, not {}",
                        openModeToString(mode)));
    }

    auto impl = std::make_unique<AlignmentStoreImpl>(path, mode, std::move(options));
    if (mode != OpenMode::kRead) {
        impl->payloadCompressor_ =
            impl->options_.compressor
                ? impl->options_.compressor
                : unwrapOrThrow(codec::makeCompressor(impl->options_.codec,
                                                      impl->options_.compressionLevel));
    }

    switch (mode) {
        case OpenMode::kRead:
            impl->openForRead();
            break;
        case OpenMode::kWrite:
            impl->openForWrite(std::move(header));
            break;
        case OpenMode::kAppend:
            impl->openForAppend();
            break;
    }
    return AlignmentStore(std::move(impl));
}

AlignmentStore AlignmentStore::openStream(std::istream& input, StoreOptions options) {
    if (auto valid = options.validate(); !valid) {
        throw InvalidArgumentError(valid.error().message());
    }
    auto impl = std::make_unique<AlignmentStoreImpl>("<stream>", OpenMode::kRead,
                                                     std::move(options));
    impl->openStream(input);
    return AlignmentStore(std::move(impl));
}

AlignmentStore::~AlignmentStore() {
    if (!impl_ || impl_->closed_) {
        return;
    }
    try {
        impl_->close();
    } catch (const std::exception& e) {
        ALN_LOG_ERROR("Closing {} on destruction failed: {}", impl_->path_.string(), e.what());
    }
}

AlignmentStore::AlignmentStore(AlignmentStore&&) noexcept = default;

AlignmentStore& AlignmentStore::operator=(AlignmentStore&& other) noexcept {
    if (this != &other) {
        if (impl_ && !impl_->closed_) {
            try {
                impl_->close();
            } catch (const std::exception& e) {
                ALN_LOG_ERROR("Closing {} on reassignment failed: {}", impl_->path_.string(),
                              e.what());
            }
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

const HeaderInfo& AlignmentStore::header() const {
    return impl_->header_;
}

void AlignmentStore::setHeader(HeaderInfo header) {
    impl_->setHeader(std::move(header));
}

void AlignmentStore::writeHeaderFrom(const AlignmentStore& other) {
    impl_->setHeader(other.header());
}

RecordStream AlignmentStore::iterate(RecordFilter filter) {
    return impl_->iterate(std::move(filter));
}

RecordStream AlignmentStore::query(std::string_view reference, std::int64_t start,
                                   std::int64_t end, RecordFilter filter) {
    impl_->requireSeekable("query");
    return impl_->query(impl_->resolveReference(reference), start, end, std::move(filter));
}

RecordStream AlignmentStore::query(const Region& region, RecordFilter filter) {
    impl_->requireSeekable("query");
    const auto referenceId = impl_->resolveReference(region.referenceName);
    return impl_->query(referenceId, region.begin, region.end.value_or(kMaxPosition),
                        std::move(filter));
}

RecordStream AlignmentStore::query(std::string_view region, RecordFilter filter) {
    if (impl_->header_.referenceId(region)) {
        return query(Region::whole(std::string(region)), std::move(filter));
    }
    return query(unwrapOrThrow(Region::parse(region)), std::move(filter));
}

std::uint64_t AlignmentStore::count(RecordFilter filter) {
    std::uint64_t total = 0;
    for (auto stream = iterate(std::move(filter)); stream.next();) {
        ++total;
    }
    return total;
}

std::uint64_t AlignmentStore::count(const Region& region, RecordFilter filter) {
    std::uint64_t total = 0;
    for (auto stream = query(region, std::move(filter)); stream.next();) {
        ++total;
    }
    return total;
}

std::uint64_t AlignmentStore::count(std::string_view region, RecordFilter filter) {
    std::uint64_t total = 0;
    for (auto stream = query(region, std::move(filter)); stream.next();) {
        ++total;
    }
    return total;
}

std::vector<std::string> AlignmentStore::references(
    const std::function<bool(std::string_view)>& predicate) const {
    std::vector<std::string> names;
    for (const auto& reference : impl_->header_.references().entries()) {
        if (!predicate || predicate(reference.name)) {
            names.push_back(reference.name);
        }
    }
    return names;
}

IndexStats AlignmentStore::referenceStats() {
    impl_->requireSeekable("referenceStats");
    auto index = impl_->ensureIndex();

    IndexStats stats;
    const auto& entries = impl_->header_.references().entries();
    stats.references.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        stats.references.push_back(
            {entries[i].name, entries[i].length, index->mappedCount(static_cast<ReferenceId>(i))});
    }
    stats.unplaced = index->unplacedCount();
    return stats;
}

IndexFuture AlignmentStore::buildIndexAsync() {
    return impl_->buildIndexAsync();
}

bool AlignmentStore::hasIndex() const {
    return impl_->publishedIndex() != nullptr;
}

void AlignmentStore::write(const codec::AlignmentRecord& record) {
    impl_->write(record);
}

void AlignmentStore::flush() {
    impl_->flush();
}

void AlignmentStore::close() {
    impl_->close();
}

void AlignmentStore::clearError() noexcept {
    impl_->pendingError_ = nullptr;
}

OpenMode AlignmentStore::mode() const noexcept {
    return impl_->mode_;
}

bool AlignmentStore::isOpen() const noexcept {
    return impl_ && !impl_->closed_;
}

bool AlignmentStore::isSeekable() const noexcept {
    return impl_->seekable_;
}

bool AlignmentStore::isSorted() const noexcept {
    return impl_->sorted_;
}

const std::filesystem::path& AlignmentStore::path() const noexcept {
    return impl_->path_;
}

std::uint64_t AlignmentStore::recordCount() const noexcept {
    return impl_->recordCount_;
}

}  // namespace aln::store
