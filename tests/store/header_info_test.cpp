// =============================================================================
// alnstore - Header Metadata Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "aln/store/header_info.h"

namespace aln::store::test {
namespace {

constexpr std::string_view kHeaderText =
    "@HD\tVN:1.6\tSO:coordinate\n"
    "@SQ\tSN:chr1\tLN:248956422\n"
    "@SQ\tSN:chrM\tLN:16569\tM5:c68f52674c9fb33aef52dcf399755519\r\n"
    "\n"
    "@RG\tID:grp1\tSM:sample\n"
    "@PG\tID:aligner\tPN:aligner\n";

TEST(HeaderInfoTest, ParsesLinesAndReferences) {
    auto header = HeaderInfo::fromText(kHeaderText);
    ASSERT_TRUE(header.has_value()) << header.error().message();

    ASSERT_EQ(header->lines().size(), 5U);
    EXPECT_EQ(header->lines()[0], "@HD\tVN:1.6\tSO:coordinate");
    EXPECT_EQ(header->lines()[2], "@SQ\tSN:chrM\tLN:16569\tM5:c68f52674c9fb33aef52dcf399755519");

    const auto& references = header->references();
    ASSERT_EQ(references.size(), 2U);
    EXPECT_EQ(references.entries()[0], (codec::ReferenceSequence{"chr1", 248'956'422}));
    EXPECT_EQ(references.entries()[1], (codec::ReferenceSequence{"chrM", 16'569}));
    EXPECT_EQ(header->referenceId("chrM"), 1);
    EXPECT_FALSE(header->referenceId("chr2").has_value());
}

TEST(HeaderInfoTest, TextRoundTrip) {
    auto header = HeaderInfo::fromText(kHeaderText);
    ASSERT_TRUE(header.has_value());

    auto again = HeaderInfo::fromText(header->toText());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *header);
    EXPECT_EQ(again->references(), header->references());
}

TEST(HeaderInfoTest, FreeTextBecomesComment) {
    HeaderInfo header;
    ASSERT_TRUE(header.addLine("converted from legacy input").has_value());
    ASSERT_EQ(header.lines().size(), 1U);
    EXPECT_EQ(header.lines()[0], "@CO\tconverted from legacy input");
}

TEST(HeaderInfoTest, AddReferenceAppendsSqLine) {
    HeaderInfo header;
    EXPECT_TRUE(header.empty());
    ASSERT_TRUE(header.addReference("chr5", 181'538'259).has_value());

    EXPECT_EQ(header.toText(), "@SQ\tSN:chr5\tLN:181538259\n");
    EXPECT_EQ(header.referenceId("chr5"), 0);
}

TEST(HeaderInfoTest, RejectsBadReferenceLines) {
    const char* badLines[] = {
        "@SQ\tLN:100",
        "@SQ\tSN:chr1",
        "@SQ\tSN:chr1\tLN:0",
        "@SQ\tSN:chr1\tLN:abc",
        "@SQ\tSN:chr1\tLN:3000000000",
        "@SQ\tSN:\tLN:10",
    };
    for (const char* line : badLines) {
        HeaderInfo header;
        auto result = header.addLine(line);
        ASSERT_FALSE(result.has_value()) << line;
        EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
        EXPECT_TRUE(header.empty());
    }
}

TEST(HeaderInfoTest, RejectsDuplicateReference) {
    auto header = HeaderInfo::fromText("@SQ\tSN:chr1\tLN:10\n@SQ\tSN:chr1\tLN:20\n");
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code(), ErrorCode::kInvalidArgument);

    HeaderInfo direct;
    ASSERT_TRUE(direct.addReference("chr1", 10).has_value());
    EXPECT_FALSE(direct.addReference("chr1", 10).has_value());
    EXPECT_FALSE(direct.addReference("chr2", 0).has_value());
    EXPECT_EQ(direct.lines().size(), 1U);
}

}  // namespace
}  // namespace aln::store::test
