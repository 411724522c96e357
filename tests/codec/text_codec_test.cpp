// =============================================================================
// alnstore - Text Codec Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "aln/codec/text_codec.h"

namespace aln::codec::test {
namespace {

constexpr std::string_view kPairedLine =
    "read1\t99\tchr1\t100\t60\t5M1I4M\t=\t300\t210\tACGTAcgtac\tIIIIIIIIII\tNM:i:1\tRG:Z:grp1";

/// @brief Decode @p line and expect a malformed-record error mentioning @p column.
void expectMalformed(std::string_view line, std::string_view column) {
    auto result = TextCodec::decode(line);
    ASSERT_FALSE(result.has_value()) << line;
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedRecord);
    EXPECT_NE(result.error().message().find(column), std::string::npos)
        << result.error().message();
}

TEST(TextCodecTest, DecodesAllColumns) {
    auto result = TextCodec::decode(kPairedLine);
    ASSERT_TRUE(result.has_value()) << result.error().message();
    const auto& r = *result;

    EXPECT_EQ(r.queryName, "read1");
    EXPECT_EQ(r.flag, 99);
    EXPECT_TRUE(r.isPaired());
    EXPECT_TRUE(r.isProperPair());
    EXPECT_TRUE(r.isFirstOfPair());
    EXPECT_EQ(r.referenceName, "chr1");
    EXPECT_EQ(r.position, 100);
    EXPECT_EQ(r.mappingQuality, 60);
    ASSERT_EQ(r.cigar.size(), 3U);
    EXPECT_EQ(r.cigar[1], (CigarElement{1, CigarOp::kInsertion}));
    EXPECT_EQ(r.mateReferenceName, "chr1");
    EXPECT_EQ(r.matePosition, 300);
    EXPECT_EQ(r.templateLength, 210);
    EXPECT_EQ(r.sequence, "ACGTACGTAC");
    EXPECT_EQ(r.quality, "IIIIIIIIII");
    ASSERT_EQ(r.tags.size(), 2U);
    ASSERT_NE(r.findTag("NM"), nullptr);
    EXPECT_EQ(std::get<std::int64_t>(r.findTag("NM")->value), 1);
    EXPECT_EQ(std::get<std::string>(r.findTag("RG")->value), "grp1");
    EXPECT_EQ(r.referenceSpan(), 9);
    EXPECT_EQ(r.endPosition(), 108);
}

TEST(TextCodecTest, EncodeWritesSameReferenceMateAsEquals) {
    auto record = TextCodec::decode(kPairedLine);
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(TextCodec::encode(*record),
              "read1\t99\tchr1\t100\t60\t5M1I4M\t=\t300\t210\tACGTACGTAC\tIIIIIIIIII\t"
              "NM:i:1\tRG:Z:grp1");
}

TEST(TextCodecTest, UnmappedRecordWithMissingFields) {
    auto result = TextCodec::decode("r\t4\t*\t0\t0\t*\t*\t0\t0\t*\t*\r\n");
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_TRUE(result->isUnmapped());
    EXPECT_FALSE(result->hasReference());
    EXPECT_TRUE(result->cigar.empty());
    EXPECT_TRUE(result->sequence.empty());
    EXPECT_FALSE(result->hasQuality());
    EXPECT_EQ(TextCodec::encode(*result), "r\t4\t*\t0\t0\t*\t*\t0\t0\t*\t*");
}

TEST(TextCodecTest, ArrayAndFloatTags) {
    auto result = TextCodec::decode(
        "r\t0\tchr2\t5\t30\t4M\t*\t0\t0\tACGT\t*\tXB:B:s,1,-2,300\tXF:f:1.5\tXA:A:q\tXH:H:1AE3");
    ASSERT_TRUE(result.has_value()) << result.error().message();

    const auto* array = result->findTag("XB");
    ASSERT_NE(array, nullptr);
    const auto& values = std::get<TagArray>(array->value);
    EXPECT_EQ(values.subtype, 's');
    EXPECT_EQ(values.integers, (std::vector<std::int64_t>{1, -2, 300}));
    EXPECT_FLOAT_EQ(std::get<float>(result->findTag("XF")->value), 1.5F);
    EXPECT_EQ(std::get<char>(result->findTag("XA")->value), 'q');
    EXPECT_EQ(result->findTag("XH")->type, 'H');

    EXPECT_EQ(formatTag(*array), "XB:B:s,1,-2,300");
}

TEST(TextCodecTest, ReportsOffendingColumn) {
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t0\tACGT", "columns");
    expectMalformed("r\tabc\tchr1\t1\t0\t4M\t*\t0\t0\tACGT\t*", "FLAG");
    expectMalformed("r\t70000\tchr1\t1\t0\t4M\t*\t0\t0\tACGT\t*", "FLAG");
    expectMalformed("r\t0\tchr1\t-5\t0\t4M\t*\t0\t0\tACGT\t*", "POS");
    expectMalformed("r\t0\tchr1\t1\t256\t4M\t*\t0\t0\tACGT\t*", "MAPQ");
    expectMalformed("r\t0\tchr1\t1\t0\t4Q\t*\t0\t0\tACGT\t*", "CIGAR");
    expectMalformed("r\t0\tchr1\t1\t0\t5M\t*\t0\t0\tACGT\t*", "CIGAR");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\tx\t0\tACGT\t*", "PNEXT");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t3000000000\tACGT\t*", "TLEN");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t0\tAC!T\t*", "SEQ");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t0\tACGT\tIII", "QUAL");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t0\tACGT\t", "QUAL");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t0\tACGT\t*\tNM:i:1\tNM:i:2", "NM");
    expectMalformed("r\t0\tchr1\t1\t0\t4M\t*\t0\t0\tACGT\t*\tbadtag", "TAG");
}

TEST(CigarTest, ParseAndFormat) {
    auto cigar = parseCigar("3S10M2D5M");
    ASSERT_TRUE(cigar.has_value());
    ASSERT_EQ(cigar->size(), 4U);
    EXPECT_EQ(referenceSpan(*cigar), 17);
    EXPECT_EQ(formatCigar(*cigar), "3S10M2D5M");

    auto empty = parseCigar("*");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
    EXPECT_EQ(formatCigar(*empty), "*");
    EXPECT_EQ(referenceSpan(*empty), 1);

    EXPECT_FALSE(parseCigar("M10").has_value());
    EXPECT_FALSE(parseCigar("10").has_value());
}

}  // namespace
}  // namespace aln::codec::test
