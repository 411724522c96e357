// =============================================================================
// alnstore - Coordinate Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <span>
#include <vector>

#include "aln/index/bin_scheme.h"
#include "aln/index/coordinate_index.h"

namespace aln::index::test {
namespace {

using codec::RecordSpan;

constexpr RecordSpan kUnplaced{};

CoordinateIndex sampleIndex() {
    CoordinateIndex index(2);
    index.addBlock(100, std::vector<RecordSpan>{{0, 99, 149}, {0, 4999, 5049}, kUnplaced});
    index.addBlock(900, std::vector<RecordSpan>{{0, 20'000, 20'050}, {1, 10, 20}});
    index.addBlock(1700, std::vector<RecordSpan>{{0, 2'000'000, 2'000'100}});
    return index;
}

TEST(CoordinateIndexTest, QueryReturnsCandidateBlocks) {
    const auto index = sampleIndex();

    EXPECT_EQ(index.query(0, 0, 200), (std::vector<FileOffset>{100}));
    EXPECT_EQ(index.query(0, 5000, 25'000), (std::vector<FileOffset>{100, 900}));
    EXPECT_EQ(index.query(0, 1'999'000, 2'000'050), (std::vector<FileOffset>{1700}));
    EXPECT_EQ(index.query(1, 0, 100), (std::vector<FileOffset>{900}));
    EXPECT_TRUE(index.query(0, 3'000'000, 4'000'000).empty());
}

TEST(CoordinateIndexTest, EmptyAndUnknownQueries) {
    const auto index = sampleIndex();
    EXPECT_TRUE(index.query(0, 500, 500).empty());
    EXPECT_TRUE(index.query(5, 0, 1000).empty());
    EXPECT_TRUE(index.query(kNoReference, 0, 1000).empty());
}

TEST(CoordinateIndexTest, CountsMappedAndUnplaced) {
    const auto index = sampleIndex();
    EXPECT_EQ(index.referenceCount(), 2U);
    EXPECT_EQ(index.mappedCount(0), 4U);
    EXPECT_EQ(index.mappedCount(1), 1U);
    EXPECT_EQ(index.mappedCount(7), 0U);
    EXPECT_EQ(index.unplacedCount(), 1U);
}

TEST(CoordinateIndexTest, BlockOffsetsAreNotRepeated) {
    CoordinateIndex index(1);
    index.addBlock(64, std::vector<RecordSpan>{{0, 10, 20}, {0, 11, 21}, {0, 12, 22}});

    EXPECT_EQ(index.query(0, 0, 100), (std::vector<FileOffset>{64}));
    EXPECT_EQ(index.binCount(), 1U);
    EXPECT_EQ(index.mappedCount(0), 3U);
}

TEST(CoordinateIndexTest, RejectsReferenceOutsideIndex) {
    CoordinateIndex index(1);
    EXPECT_THROW(index.addRecord(RecordSpan{3, 0, 10}, 64), InvalidArgumentError);
}

TEST(CoordinateIndexTest, ParallelBuildMatchesSequential) {
    std::map<FileOffset, std::vector<RecordSpan>> blocks;
    for (FileOffset block = 0; block < 64; ++block) {
        auto& spans = blocks[block * 1000 + 40];
        for (std::int64_t i = 0; i < 50; ++i) {
            const auto begin = static_cast<std::int64_t>(block) * 20'000 + i * 300;
            spans.push_back(i % 9 == 0 ? kUnplaced
                                       : RecordSpan{static_cast<ReferenceId>(i % 3), begin,
                                                    begin + 150});
        }
    }

    std::vector<FileOffset> offsets;
    CoordinateIndex sequential(3);
    for (const auto& [offset, spans] : blocks) {
        offsets.push_back(offset);
        sequential.addBlock(offset, spans);
    }

    std::atomic<int> scans{0};
    const auto built = CoordinateIndex::build(offsets, 3, [&](FileOffset offset) {
        ++scans;
        return blocks.at(offset);
    });

    EXPECT_EQ(scans.load(), 64);
    EXPECT_EQ(built, sequential);
}

// =============================================================================
// Serialization
// =============================================================================

TEST(CoordinateIndexTest, SerializeRoundTrip) {
    const auto index = sampleIndex();
    auto restored = CoordinateIndex::deserialize(index.serialize());
    ASSERT_TRUE(restored.has_value()) << restored.error().message();
    EXPECT_EQ(*restored, index);
    EXPECT_EQ(restored->query(0, 5000, 25'000), (std::vector<FileOffset>{100, 900}));
}

TEST(CoordinateIndexTest, TruncatedIndexIsFormatError) {
    const auto bytes = sampleIndex().serialize();
    for (std::size_t size : {std::size_t{0}, std::size_t{3}, bytes.size() / 2, bytes.size() - 1}) {
        auto result = CoordinateIndex::deserialize(std::span(bytes.data(), size));
        ASSERT_FALSE(result.has_value()) << "size " << size;
        EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
    }
}

TEST(CoordinateIndexTest, TrailingBytesAreFormatError) {
    auto bytes = sampleIndex().serialize();
    bytes.push_back(0);
    auto result = CoordinateIndex::deserialize(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(CoordinateIndexTest, OutOfRangeBinIsFormatError) {
    CoordinateIndex index(1);
    index.addRecord(RecordSpan{0, 10, 20}, 64);
    auto bytes = index.serialize();

    // u32 refCount, u64 mapped, u32 binCount, then the bin id.
    constexpr std::size_t kBinField = 4 + 8 + 4;
    const std::uint32_t badBin = kBinCount;
    std::copy_n(reinterpret_cast<const std::uint8_t*>(&badBin), sizeof(badBin),
                bytes.begin() + kBinField);

    auto result = CoordinateIndex::deserialize(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(CoordinateIndexProperty, QueryNeverMissesOverlappingBlock, ()) {
    const auto blockCount = *rc::gen::inRange<std::size_t>(1, 20);
    CoordinateIndex index(1);
    std::vector<std::pair<FileOffset, RecordSpan>> placed;

    for (std::size_t block = 0; block < blockCount; ++block) {
        const FileOffset offset = 64 + block * 4096;
        const auto recordCount = *rc::gen::inRange<std::size_t>(1, 30);
        for (std::size_t i = 0; i < recordCount; ++i) {
            const auto begin = *rc::gen::inRange<std::int64_t>(0, 5'000'000);
            const auto length = *rc::gen::inRange<std::int64_t>(1, 100'000);
            const RecordSpan span{0, begin, begin + length};
            index.addRecord(span, offset);
            placed.emplace_back(offset, span);
        }
    }

    const auto queryBegin = *rc::gen::inRange<std::int64_t>(0, 5'000'000);
    const auto queryEnd = queryBegin + *rc::gen::inRange<std::int64_t>(1, 1'000'000);
    const auto candidates = index.query(0, queryBegin, queryEnd);
    RC_ASSERT(std::is_sorted(candidates.begin(), candidates.end()));

    for (const auto& [offset, span] : placed) {
        if (span.overlaps(queryBegin, queryEnd)) {
            RC_ASSERT(std::binary_search(candidates.begin(), candidates.end(), offset));
        }
    }

    auto restored = CoordinateIndex::deserialize(index.serialize());
    RC_ASSERT(restored.has_value());
    RC_ASSERT(*restored == index);
}

}  // namespace
}  // namespace aln::index::test
