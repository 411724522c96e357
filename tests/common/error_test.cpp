// =============================================================================
// alnstore - Error Handling Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "aln/common/error.h"

namespace aln::test {
namespace {

TEST(ErrorCodeTest, NamesAreDistinct) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kCorruptBlock), "corrupt block");
    EXPECT_EQ(errorCodeToString(ErrorCode::kOutOfOrderWrite), "out of order write");
    EXPECT_NE(errorCodeToString(ErrorCode::kMalformedRecord),
              errorCodeToString(ErrorCode::kTruncatedRecord));
}

TEST(ErrorCodeTest, DecodeErrors) {
    EXPECT_TRUE(isDecodeError(ErrorCode::kCorruptBlock));
    EXPECT_TRUE(isDecodeError(ErrorCode::kMalformedRecord));
    EXPECT_TRUE(isDecodeError(ErrorCode::kTruncatedRecord));
    EXPECT_FALSE(isDecodeError(ErrorCode::kIOError));
    EXPECT_FALSE(isDecodeError(ErrorCode::kFormatError));
    EXPECT_FALSE(isDecodeError(ErrorCode::kUnsupportedCodec));
}

TEST(ErrorContextTest, FormatsLocation) {
    ErrorContext context("reads.aln");
    context.withBlock(3).withRecord(17).withOffset(0x40);

    const auto text = context.format();
    EXPECT_NE(text.find("file: reads.aln"), std::string::npos);
    EXPECT_NE(text.find("block: 3"), std::string::npos);
    EXPECT_NE(text.find("record: 17"), std::string::npos);
    EXPECT_NE(text.find("offset: 0x40"), std::string::npos);
}

TEST(AlnExceptionTest, WhatIncludesCodeAndContext) {
    CorruptBlockError error(0x1234, 0x5678, ErrorContext("x.aln").withOffset(512));

    EXPECT_EQ(error.code(), ErrorCode::kCorruptBlock);
    EXPECT_EQ(error.expected(), 0x1234U);
    EXPECT_EQ(error.actual(), 0x5678U);
    const std::string what = error.what();
    EXPECT_NE(what.find("[corrupt block]"), std::string::npos);
    EXPECT_NE(what.find("0x0000000000001234"), std::string::npos);
    EXPECT_NE(what.find("x.aln"), std::string::npos);
}

TEST(ErrorTest, ThrowExceptionMapsCodes) {
    EXPECT_THROW(Error(ErrorCode::kMalformedRecord, "bad").throwException(), MalformedRecordError);
    EXPECT_THROW(Error(ErrorCode::kTruncatedRecord, "short").throwException(),
                 TruncatedRecordError);
    EXPECT_THROW(Error(ErrorCode::kInvalidArgument, "arg").throwException(),
                 InvalidArgumentError);
    EXPECT_THROW(Error(ErrorCode::kFormatError, "fmt").throwException(), FormatError);
    EXPECT_THROW(Error(ErrorCode::kUnsupportedCodec, "codec").throwException(),
                 UnsupportedCodecError);
    EXPECT_THROW(Error(ErrorCode::kFlushError, "flush").throwException(), FlushError);
    EXPECT_THROW(Error(ErrorCode::kInvalidState, "state").throwException(), InvalidStateError);
}

TEST(ErrorTest, WithContextKeepsCodeAndMessage) {
    const Error error(ErrorCode::kTruncatedRecord, "record too short");
    const auto located = error.withContext(ErrorContext{}.withBlock(2).withRecord(9));

    EXPECT_EQ(located.code(), ErrorCode::kTruncatedRecord);
    EXPECT_EQ(located.message(), "record too short");
    ASSERT_TRUE(located.context().has_value());
    EXPECT_EQ(located.context()->blockId, 2U);
    EXPECT_EQ(located.context()->recordIndex, 9U);

    try {
        located.throwException();
        FAIL() << "expected an exception";
    } catch (const TruncatedRecordError& e) {
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->recordIndex, 9U);
    }
}

TEST(ResultTest, UnwrapOrThrow) {
    Result<int> ok = 42;
    EXPECT_EQ(unwrapOrThrow(ok), 42);

    auto failed = makeError<int>(ErrorCode::kIOError, "disk gone");
    EXPECT_THROW((void)unwrapOrThrow(failed), IOError);

    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kOpenError, "nope")), OpenError);
}

}  // namespace
}  // namespace aln::test
