// =============================================================================
// alnstore - Binary Codec Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <vector>

#include "aln/codec/binary_codec.h"
#include "aln/codec/text_codec.h"
#include "aln/index/bin_scheme.h"
#include "test_support.h"

namespace aln::codec::test {
namespace {

using aln::test::makeRecord;

constexpr std::size_t kReferenceIdOffset = 4;
constexpr std::size_t kBinOffset = 14;
constexpr std::size_t kCigarCountOffset = 16;

ReferenceDictionary twoReferences() {
    ReferenceDictionary references;
    EXPECT_TRUE(references.add("chr1", 1'000'000).has_value());
    EXPECT_TRUE(references.add("chr2", 50'000).has_value());
    return references;
}

template <typename T>
T peek(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    T value{};
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

template <typename T>
void poke(std::vector<std::uint8_t>& bytes, std::size_t offset, T value) {
    std::memcpy(bytes.data() + offset, &value, sizeof(T));
}

TEST(BinaryCodecTest, RoundTripsPairedRecordWithTags) {
    BinaryCodec codec(twoReferences());
    auto record = TextCodec::decode(
        "pair/1\t99\tchr2\t1000\t42\t3S7M\tchr1\t500\t-320\tACGTNACGTA\t#####IIIII\t"
        "NM:i:-3\tXS:i:70000\tRG:Z:lib\tXB:B:f,0.5,2\tXA:A:z");
    ASSERT_TRUE(record.has_value()) << record.error().message();

    auto bytes = codec.encode(*record);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(peek<std::int32_t>(*bytes, kReferenceIdOffset), 1);

    std::size_t offset = 0;
    auto decoded = codec.decode(*bytes, offset);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
    EXPECT_EQ(offset, bytes->size());
    EXPECT_EQ(*decoded, *record);
}

TEST(BinaryCodecTest, StoresBinOfPlacement) {
    BinaryCodec codec(twoReferences());
    auto record = makeRecord("r", "chr1", 100, 50);
    auto bytes = codec.encode(record);
    ASSERT_TRUE(bytes.has_value());

    EXPECT_EQ(peek<std::uint16_t>(*bytes, kBinOffset), index::regionToBin(99, 149));

    auto span = codec.spanOf(record);
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(*span, (RecordSpan{0, 99, 149}));

    std::size_t offset = 0;
    auto decodedSpan = codec.decodeSpan(*bytes, offset);
    ASSERT_TRUE(decodedSpan.has_value());
    EXPECT_EQ(*decodedSpan, *span);
    EXPECT_EQ(offset, bytes->size());
}

TEST(BinaryCodecTest, UnmappedRecordHasNoPlacement) {
    BinaryCodec codec(twoReferences());
    auto record = makeRecord("u", "*", 0);
    auto bytes = codec.encode(record);
    ASSERT_TRUE(bytes.has_value());

    EXPECT_EQ(peek<std::int32_t>(*bytes, kReferenceIdOffset), kNoReference);
    auto span = codec.spanOf(record);
    ASSERT_TRUE(span.has_value());
    EXPECT_FALSE(span->isPlaced());

    auto decoded = codec.decode(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, record);
}

TEST(BinaryCodecTest, EncodeRejectsUnknownReference) {
    BinaryCodec codec(twoReferences());
    std::vector<std::uint8_t> out{1, 2, 3};

    auto result = codec.encode(makeRecord("r", "chrX", 5), out);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedRecord);
    EXPECT_EQ(out.size(), 3U);
}

TEST(BinaryCodecTest, DecodesConsecutiveRecords) {
    BinaryCodec codec(twoReferences());
    std::vector<std::uint8_t> buffer;
    ASSERT_TRUE(codec.encode(makeRecord("a", "chr1", 10), buffer).has_value());
    ASSERT_TRUE(codec.encode(makeRecord("b", "chr2", 20), buffer).has_value());

    std::size_t offset = 0;
    auto first = codec.decode(buffer, offset);
    auto second = codec.decode(buffer, offset);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->queryName, "a");
    EXPECT_EQ(second->queryName, "b");
    EXPECT_EQ(second->referenceName, "chr2");
    EXPECT_EQ(offset, buffer.size());
}

TEST(BinaryCodecTest, TruncatedBufferIsReported) {
    BinaryCodec codec(twoReferences());
    auto bytes = codec.encode(makeRecord("r", "chr1", 100));
    ASSERT_TRUE(bytes.has_value());

    for (std::size_t cut : {std::size_t{2}, std::size_t{20}, bytes->size() - 1}) {
        std::vector<std::uint8_t> shortened(bytes->begin(), bytes->begin() + cut);
        auto result = codec.decode(shortened);
        ASSERT_FALSE(result.has_value()) << "cut at " << cut;
        EXPECT_EQ(result.error().code(), ErrorCode::kTruncatedRecord);
    }
}

TEST(BinaryCodecTest, OversizedCigarCountIsTruncation) {
    BinaryCodec codec(twoReferences());
    auto bytes = codec.encode(makeRecord("r", "chr1", 100));
    ASSERT_TRUE(bytes.has_value());

    poke<std::uint16_t>(*bytes, kCigarCountOffset, 500);
    auto result = codec.decode(*bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kTruncatedRecord);
}

TEST(BinaryCodecTest, UnknownReferenceIdIsMalformed) {
    BinaryCodec codec(twoReferences());
    auto bytes = codec.encode(makeRecord("r", "chr1", 100));
    ASSERT_TRUE(bytes.has_value());

    poke<std::int32_t>(*bytes, kReferenceIdOffset, 7);
    auto result = codec.decode(*bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedRecord);
    EXPECT_NE(result.error().message().find("RNAME"), std::string::npos);
}

TEST(ReferenceDictionaryTest, RejectsDuplicates) {
    ReferenceDictionary references;
    auto first = references.add("chr1", 10);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 0);

    auto duplicate = references.add("chr1", 20);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::kInvalidArgument);

    EXPECT_EQ(references.find("chr1"), 0);
    EXPECT_FALSE(references.find("chr2").has_value());
    EXPECT_EQ(references.at(1), nullptr);
}

}  // namespace
}  // namespace aln::codec::test
