// =============================================================================
// alnstore - Alignment Store Tests
// =============================================================================
// End-to-end write, read, query and append through AlignmentStore.
// =============================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "aln/codec/compressor.h"
#include "aln/format/aln_format.h"
#include "aln/format/container_reader.h"
#include "aln/store/alignment_store.h"
#include "test_support.h"

namespace aln::store::test {
namespace {

using aln::test::makeHeader;
using aln::test::makeRecord;
using aln::test::TempFileGuard;

const std::vector<std::pair<std::string, std::uint32_t>> kReferences = {
    {"chr1", 1'000'000}, {"chr2", 500'000}};

std::vector<codec::AlignmentRecord> sampleRecords() {
    return {makeRecord("r1", "chr1", 100), makeRecord("r2", "chr1", 5000),
            makeRecord("r3", "*", 0)};
}

void writeStore(const std::filesystem::path& path,
                const std::vector<codec::AlignmentRecord>& records, StoreOptions options = {}) {
    auto store = AlignmentStore::open(path, OpenMode::kWrite, options, makeHeader(kReferences));
    for (const auto& record : records) {
        store.write(record);
    }
    store.close();
}

std::vector<std::string> namesOf(RecordStream stream) {
    std::vector<std::string> names;
    for (const auto& record : stream) {
        names.push_back(record.queryName);
    }
    return names;
}

/// @brief Fails every compression with a storage error.
class FailingCompressor final : public codec::Compressor {
public:
    CodecId id() const noexcept override { return CodecId::kRaw; }

    Result<std::vector<std::uint8_t>> compress(std::span<const std::uint8_t>) const override {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kIOError, "device full");
    }

    Result<std::vector<std::uint8_t>> decompress(std::span<const std::uint8_t>,
                                                 std::size_t) const override {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kIOError, "unused");
    }
};

// =============================================================================
// Write and Read
// =============================================================================

TEST(AlignmentStoreTest, WriteThenIterateInOrder) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords());

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_EQ(store.mode(), OpenMode::kRead);
    EXPECT_TRUE(store.isSeekable());
    EXPECT_FALSE(store.isSorted());
    EXPECT_EQ(store.recordCount(), 3U);
    EXPECT_EQ(store.header(), makeHeader(kReferences));

    std::vector<codec::AlignmentRecord> restored;
    for (const auto& record : store.iterate()) {
        restored.push_back(record);
    }
    EXPECT_EQ(restored, sampleRecords());
    EXPECT_FALSE(std::filesystem::exists(guard.path().string() + ".tmp"));
}

TEST(AlignmentStoreTest, QueryReturnsOverlappingRecordsOnly) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords(), {.sorted = true});

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_TRUE(store.isSorted());
    EXPECT_TRUE(store.hasIndex());

    EXPECT_EQ(namesOf(store.query("chr1", 0, 200)), (std::vector<std::string>{"r1"}));
    EXPECT_EQ(namesOf(store.query("chr1", 108, 4999)), (std::vector<std::string>{"r1"}));
    EXPECT_TRUE(namesOf(store.query("chr1", 109, 4999)).empty());
    EXPECT_EQ(namesOf(store.query("chr1", 0, 1'000'000)),
              (std::vector<std::string>{"r1", "r2"}));
    EXPECT_TRUE(namesOf(store.query("chr2", 0, 500'000)).empty());
    EXPECT_TRUE(namesOf(store.query("chr1", 300, 300)).empty());
}

TEST(AlignmentStoreTest, QueryByRegionString) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords(), {.sorted = true});
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);

    EXPECT_EQ(namesOf(store.query("chr1:4,990-5,010")), (std::vector<std::string>{"r2"}));
    EXPECT_EQ(namesOf(store.query("chr1:200")), (std::vector<std::string>{"r2"}));
    EXPECT_EQ(namesOf(store.query("chr1")), (std::vector<std::string>{"r1", "r2"}));
    EXPECT_EQ(store.count("chr1:1-100"), 1U);
    EXPECT_EQ(store.count(Region::whole("chr2")), 0U);
}

TEST(AlignmentStoreTest, QueryFindsRecordsBeyondBinnedRange) {
    TempFileGuard guard;
    {
        auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, {.sorted = true},
                                          makeHeader({{"chr1", 700'000'000}}));
        store.write(makeRecord("near", "chr1", 100));
        store.write(makeRecord("far", "chr1", 600'000'001, 100));
        store.close();
    }

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    ASSERT_TRUE(store.hasIndex());
    EXPECT_EQ(namesOf(store.query("chr1", 600'000'000, 600'000'100)),
              (std::vector<std::string>{"far"}));
    EXPECT_EQ(namesOf(store.query("chr1:600,000,050-600,000,060")),
              (std::vector<std::string>{"far"}));
    EXPECT_TRUE(namesOf(store.query("chr1", 650'000'000, 650'000'100)).empty());
    EXPECT_EQ(namesOf(store.query("chr1", 0, 700'000'000)),
              (std::vector<std::string>{"near", "far"}));
}

TEST(AlignmentStoreTest, QueryRejectsUnknownReferenceAndBadRegion) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords(), {.sorted = true});
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);

    EXPECT_THROW((void)store.query("chrX", 0, 100), InvalidArgumentError);
    EXPECT_THROW((void)store.query("chrX:1-10"), InvalidArgumentError);
    EXPECT_THROW((void)store.query("chr1:abc"), InvalidArgumentError);
}

TEST(AlignmentStoreTest, FiltersAndCounts) {
    TempFileGuard guard;
    auto records = sampleRecords();
    records[1].flag = codec::flags::kPaired | codec::flags::kProperPair | codec::flags::kFirstOfPair;
    writeStore(guard.path(), records, {.sorted = true});
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);

    EXPECT_EQ(store.count(), 3U);
    EXPECT_EQ(store.count(filters::mapped()), 2U);
    EXPECT_EQ(store.count(filters::properlyPaired()), 1U);
    EXPECT_EQ(store.count(filters::firstOfProperPair()), 1U);
    EXPECT_EQ(store.count(filters::excludeFlags(codec::flags::kPaired)), 2U);
    EXPECT_EQ(namesOf(store.query("chr1", 0, 1'000'000, filters::properlyPaired())),
              (std::vector<std::string>{"r2"}));
}

TEST(AlignmentStoreTest, ReferencesAndStats) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords());
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);

    EXPECT_EQ(store.references(), (std::vector<std::string>{"chr1", "chr2"}));
    EXPECT_EQ(store.references([](std::string_view name) { return name.ends_with('2'); }),
              (std::vector<std::string>{"chr2"}));

    const auto stats = store.referenceStats();
    ASSERT_EQ(stats.references.size(), 2U);
    EXPECT_EQ(stats.references[0], (ReferenceStats{"chr1", 1'000'000, 2}));
    EXPECT_EQ(stats.references[1], (ReferenceStats{"chr2", 500'000, 0}));
    EXPECT_EQ(stats.unplaced, 1U);
}

TEST(AlignmentStoreTest, BuildIndexAsyncOnUnsortedFile) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords());
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_FALSE(store.hasIndex());

    auto future = store.buildIndexAsync();
    const auto index = future.get();
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->mappedCount(0), 2U);
    EXPECT_TRUE(store.hasIndex());
    EXPECT_EQ(store.buildIndexAsync().get(), index);

    EXPECT_EQ(namesOf(store.query("chr1", 0, 200)), (std::vector<std::string>{"r1"}));
}

TEST(AlignmentStoreTest, HasIndexWhileBackgroundBuildRuns) {
    TempFileGuard guard;
    std::vector<codec::AlignmentRecord> records;
    for (int i = 0; i < 2000; ++i) {
        records.push_back(makeRecord("r" + std::to_string(i), "chr1", 1 + i * 400, 50));
    }
    writeStore(guard.path(), records, {.blockThreshold = kMinBlockThreshold});

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    auto future = store.buildIndexAsync();
    // hasIndex() runs while the background task publishes the index.
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        (void)store.hasIndex();
    }
    EXPECT_TRUE(store.hasIndex());
    EXPECT_EQ(future.get()->mappedCount(0), records.size());
}

TEST(AlignmentStoreTest, WriteHeaderFromAnotherStore) {
    TempFileGuard source;
    TempFileGuard copy;
    writeStore(source.path(), sampleRecords());

    auto in = AlignmentStore::open(source.path(), OpenMode::kRead);
    {
        auto out = AlignmentStore::open(copy.path(), OpenMode::kWrite);
        out.writeHeaderFrom(in);
        for (const auto& record : in.iterate()) {
            out.write(record);
        }
        out.close();
        EXPECT_THROW(out.setHeader(HeaderInfo{}), InvalidStateError);
    }

    auto restored = AlignmentStore::open(copy.path(), OpenMode::kRead);
    EXPECT_EQ(restored.header(), in.header());
    EXPECT_EQ(restored.count(), 3U);
}

TEST(AlignmentStoreTest, HeaderIsFixedAfterFirstWrite) {
    TempFileGuard guard;
    auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, {}, makeHeader(kReferences));
    store.write(makeRecord("r1", "chr1", 1));
    EXPECT_THROW(store.setHeader(makeHeader(kReferences)), InvalidStateError);
    store.close();
}

// =============================================================================
// Sorted Writes and Append
// =============================================================================

TEST(AlignmentStoreTest, SortedStoreRejectsOutOfOrderWrite) {
    TempFileGuard guard;
    auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, {.sorted = true},
                                      makeHeader(kReferences));
    store.write(makeRecord("a", "chr1", 500));
    EXPECT_THROW(store.write(makeRecord("b", "chr1", 100)), OutOfOrderWriteError);
    store.write(makeRecord("c", "chr2", 10));
    EXPECT_THROW(store.write(makeRecord("d", "chr1", 900)), OutOfOrderWriteError);
    store.write(makeRecord("e", "*", 0));
    EXPECT_THROW(store.write(makeRecord("f", "chr2", 20)), OutOfOrderWriteError);
    store.close();

    auto reopened = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_EQ(namesOf(reopened.iterate()), (std::vector<std::string>{"a", "c", "e"}));
}

TEST(AlignmentStoreTest, WriteToUnknownReferenceIsMalformed) {
    TempFileGuard guard;
    auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, {}, makeHeader(kReferences));
    EXPECT_THROW(store.write(makeRecord("x", "chrUn", 10)), MalformedRecordError);
    store.write(makeRecord("y", "chr2", 10));
    store.close();
    EXPECT_EQ(AlignmentStore::open(guard.path(), OpenMode::kRead).count(), 1U);
}

TEST(AlignmentStoreTest, AppendExtendsFileAndRebuildsIndex) {
    TempFileGuard guard;
    writeStore(guard.path(), {makeRecord("r1", "chr1", 100), makeRecord("r2", "chr1", 5000)},
               {.sorted = true, .codec = CodecId::kDeflate});

    {
        auto store = AlignmentStore::open(guard.path(), OpenMode::kAppend);
        EXPECT_TRUE(store.isSorted());
        EXPECT_EQ(store.recordCount(), 2U);
        EXPECT_THROW(store.write(makeRecord("early", "chr1", 10)), OutOfOrderWriteError);
        store.write(makeRecord("r3", "chr1", 9000));
        store.write(makeRecord("r4", "chr2", 1));
        store.close();
    }

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_EQ(store.recordCount(), 4U);
    EXPECT_TRUE(store.hasIndex());
    EXPECT_EQ(namesOf(store.iterate()), (std::vector<std::string>{"r1", "r2", "r3", "r4"}));
    EXPECT_EQ(namesOf(store.query("chr1", 8000, 10'000)), (std::vector<std::string>{"r3"}));
    EXPECT_EQ(namesOf(store.query("chr2")), (std::vector<std::string>{"r4"}));

    format::ContainerReader reader(guard.path());
    reader.open();
    EXPECT_EQ(reader.fileHeader().codec, static_cast<std::uint8_t>(CodecId::kDeflate));
}

// =============================================================================
// Lifecycle and Errors
// =============================================================================

TEST(AlignmentStoreTest, CloseTwiceIsNoOp) {
    TempFileGuard guard;
    auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, {}, makeHeader(kReferences));
    store.write(makeRecord("r1", "chr1", 1));
    store.close();
    EXPECT_FALSE(store.isOpen());
    EXPECT_NO_THROW(store.close());
    EXPECT_THROW(store.write(makeRecord("r2", "chr1", 2)), InvalidStateError);
}

TEST(AlignmentStoreTest, EmptyStoreIsStillPublished) {
    TempFileGuard guard;
    writeStore(guard.path(), {}, {.sorted = true});

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_EQ(store.count(), 0U);
    EXPECT_TRUE(namesOf(store.query("chr1")).empty());
    EXPECT_EQ(store.references().size(), 2U);
}

TEST(AlignmentStoreTest, StorageErrorIsRememberedUntilClose) {
    TempFileGuard guard;
    StoreOptions options;
    options.compressor = std::make_shared<FailingCompressor>();

    auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, options,
                                      makeHeader(kReferences));
    store.write(makeRecord("r1", "chr1", 1));
    EXPECT_THROW(store.flush(), IOError);
    EXPECT_THROW(store.write(makeRecord("r2", "chr1", 2)), IOError);
    EXPECT_THROW(store.close(), IOError);
    EXPECT_FALSE(store.isOpen());
    EXPECT_FALSE(std::filesystem::exists(guard.path()));
    EXPECT_FALSE(std::filesystem::exists(guard.path().string() + ".tmp"));
}

TEST(AlignmentStoreTest, FailureDuringCloseIsFlushError) {
    TempFileGuard guard;
    StoreOptions options;
    options.compressor = std::make_shared<FailingCompressor>();

    auto store = AlignmentStore::open(guard.path(), OpenMode::kWrite, options,
                                      makeHeader(kReferences));
    store.write(makeRecord("r1", "chr1", 1));
    EXPECT_THROW(store.close(), FlushError);
    EXPECT_FALSE(std::filesystem::exists(guard.path()));
}

TEST(AlignmentStoreTest, OpenErrors) {
    TempFileGuard guard;
    EXPECT_THROW((void)AlignmentStore::open(guard.path(), OpenMode::kRead), OpenError);
    EXPECT_THROW((void)AlignmentStore::open(guard.path(), OpenMode::kAppend), OpenError);

    {
        std::ofstream junk(guard.path(), std::ios::binary);
        junk << "definitely not an alignment container";
    }
    EXPECT_THROW((void)AlignmentStore::open(guard.path(), OpenMode::kRead), OpenError);

    EXPECT_THROW(
        (void)AlignmentStore::open(guard.path(), OpenMode::kRead, {}, makeHeader(kReferences)),
        InvalidArgumentError);

    StoreOptions badOptions;
    badOptions.blockThreshold = 1;
    EXPECT_THROW((void)AlignmentStore::open(guard.path(), OpenMode::kWrite, badOptions),
                 InvalidArgumentError);
}

TEST(AlignmentStoreTest, ReadModeRejectsWrites) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords());
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    EXPECT_THROW(store.write(makeRecord("r9", "chr1", 1)), InvalidStateError);
    EXPECT_THROW(store.setHeader(makeHeader(kReferences)), InvalidStateError);
}

// =============================================================================
// Corruption
// =============================================================================

class CorruptStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<codec::AlignmentRecord> records;
        for (int i = 0; i < 200; ++i) {
            records.push_back(makeRecord("read" + std::to_string(i), "chr1", 1 + i * 1000, 100));
        }
        writeStore(guard_.path(), records,
                   {.sorted = true, .blockThreshold = kMinBlockThreshold, .codec = CodecId::kRaw});

        format::ContainerReader reader(guard_.path());
        reader.open();
        blocks_ = reader.blockTable();
        ASSERT_GE(blocks_.size(), 3U);

        corruptPayload(blocks_[1]);
    }

    void corruptPayload(const format::BlockTableEntry& block) const {
        const auto target = block.offset + format::BlockHeader::kSize + 7;
        std::fstream file(guard_.path(), std::ios::binary | std::ios::in | std::ios::out);
        file.seekg(static_cast<std::streamoff>(target));
        char byte = 0;
        file.read(&byte, 1);
        byte = static_cast<char>(byte ^ 0x5A);
        file.seekp(static_cast<std::streamoff>(target));
        file.write(&byte, 1);
    }

    TempFileGuard guard_;
    std::vector<format::BlockTableEntry> blocks_;
};

TEST_F(CorruptStoreTest, FailPolicyRaisesCorruptBlock) {
    auto store = AlignmentStore::open(guard_.path(), OpenMode::kRead);
    auto stream = store.iterate();

    std::uint32_t fromFirstBlock = 0;
    try {
        while (auto record = stream.next()) {
            EXPECT_EQ(stream.location().blockOffset, blocks_[0].offset);
            ++fromFirstBlock;
        }
        FAIL() << "expected CorruptBlockError";
    } catch (const CorruptBlockError& e) {
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->blockId, 1U);
    }
    EXPECT_EQ(fromFirstBlock, blocks_[0].recordCount);

    // Blocks the query never touches stay readable.
    EXPECT_EQ(store.count("chr1:1-50"), 1U);
}

TEST_F(CorruptStoreTest, SkipPolicyContinuesPastDamage) {
    auto store = AlignmentStore::open(guard_.path(), OpenMode::kRead,
                                      {.errorPolicy = ErrorPolicy::kSkipCorruptBlocks});
    auto stream = store.iterate();
    std::uint64_t seen = 0;
    while (stream.next()) {
        ++seen;
    }
    EXPECT_EQ(stream.skippedBlocks(), 1U);
    EXPECT_EQ(seen, 200U - blocks_[1].recordCount);
}

TEST_F(CorruptStoreTest, AppendToDamagedTailIsOpenError) {
    corruptPayload(blocks_.back());
    const auto sizeBefore = std::filesystem::file_size(guard_.path());

    EXPECT_THROW((void)AlignmentStore::open(guard_.path(), OpenMode::kAppend), OpenError);
    EXPECT_FALSE(std::filesystem::exists(guard_.path().string() + ".tmp"));
    EXPECT_EQ(std::filesystem::file_size(guard_.path()), sizeBefore);
}

TEST_F(CorruptStoreTest, AppendIndexRebuildFailureIsOpenError) {
    // Block 1 is damaged; rebuilding the index on append reads it.
    EXPECT_THROW((void)AlignmentStore::open(guard_.path(), OpenMode::kAppend), OpenError);
    EXPECT_FALSE(std::filesystem::exists(guard_.path().string() + ".tmp"));
}

// =============================================================================
// Streams
// =============================================================================

TEST(AlignmentStoreStreamTest, NonSeekableSourceAllowsOnePass) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords(), {.sorted = true});

    std::ifstream input(guard.path(), std::ios::binary);
    auto store = AlignmentStore::openStream(input);
    EXPECT_FALSE(store.isSeekable());
    EXPECT_TRUE(store.isSorted());
    EXPECT_EQ(store.header(), makeHeader(kReferences));

    EXPECT_THROW((void)store.query("chr1", 0, 200), InvalidStateError);
    EXPECT_THROW((void)store.referenceStats(), InvalidStateError);

    EXPECT_EQ(namesOf(store.iterate()), (std::vector<std::string>{"r1", "r2", "r3"}));
    EXPECT_THROW((void)store.iterate(), InvalidStateError);
}

TEST(AlignmentStoreStreamTest, SeekableStreamRestarts) {
    TempFileGuard guard;
    writeStore(guard.path(), sampleRecords());
    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);

    auto stream = store.iterate(filters::mapped());
    EXPECT_TRUE(stream.isSeekable());
    std::size_t first = 0;
    for (const auto& record : stream) {
        (void)record;
        ++first;
    }
    std::size_t second = 0;
    for (const auto& record : stream) {
        (void)record;
        ++second;
    }
    EXPECT_EQ(first, 2U);
    EXPECT_EQ(second, first);
}

}  // namespace
}  // namespace aln::store::test
