// =============================================================================
// alnstore - Region Parsing Tests
// =============================================================================

#include <gtest/gtest.h>

#include "aln/store/region.h"

namespace aln::store::test {
namespace {

TEST(RegionTest, WholeReference) {
    auto region = Region::parse("chr1");
    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(*region, Region::whole("chr1"));
    EXPECT_EQ(region->toString(), "chr1");
}

TEST(RegionTest, StartAndEndAreOneBasedInclusive) {
    auto region = Region::parse("chr1:1,000-2,000");
    ASSERT_TRUE(region.has_value()) << region.error().message();
    EXPECT_EQ(region->referenceName, "chr1");
    EXPECT_EQ(region->begin, 999);
    EXPECT_EQ(region->end, 2000);
    EXPECT_EQ(region->toString(), "chr1:1000-2000");
}

TEST(RegionTest, StartOnlyRunsToReferenceEnd) {
    for (const char* text : {"chr2:500", "chr2:500-"}) {
        auto region = Region::parse(text);
        ASSERT_TRUE(region.has_value()) << text;
        EXPECT_EQ(region->begin, 499);
        EXPECT_FALSE(region->end.has_value());
    }
}

TEST(RegionTest, SingleBase) {
    auto region = Region::parse("chrM:7-7");
    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->begin, 6);
    EXPECT_EQ(region->end, 7);
}

TEST(RegionTest, NameEndsAtLastColon) {
    auto region = Region::parse("HLA-A*01:01:10-20");
    ASSERT_TRUE(region.has_value()) << region.error().message();
    EXPECT_EQ(region->referenceName, "HLA-A*01:01");
    EXPECT_EQ(region->begin, 9);
    EXPECT_EQ(region->end, 20);
}

TEST(RegionTest, RejectsMalformedText) {
    for (const char* text : {"", ":1-10", "chr1:", "chr1:abc", "chr1:0-10", "chr1:20-10",
                             "chr1:5-x", "chr1:-5"}) {
        auto region = Region::parse(text);
        ASSERT_FALSE(region.has_value()) << "'" << text << "'";
        EXPECT_EQ(region.error().code(), ErrorCode::kInvalidArgument);
    }
}

}  // namespace
}  // namespace aln::store::test
