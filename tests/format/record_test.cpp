// =============================================================================
// naf-codec - Decoded Record Type Tests
// =============================================================================

#include "naf/format/record.h"

#include <gtest/gtest.h>

#include <sstream>

namespace naf::format {
namespace {

// =============================================================================
// Size Tests
// =============================================================================

TEST(SizeTest, CompressedRendersRatio) {
    const Size size("seq", 1000, 250);

    EXPECT_EQ(size.block(), "seq");
    EXPECT_EQ(size.original(), 1000u);
    EXPECT_EQ(size.compressed(), 250u);
    EXPECT_EQ(size.toString(), "seq: 250 / 1000 (25.000%)");
}

TEST(SizeTest, UncompressedRendersOriginalOnly) {
    const Size size("seq", 1000, std::nullopt);

    EXPECT_EQ(size.compressed(), 1000u);
    EXPECT_EQ(size.toString(), "seq: 1000");
}

TEST(SizeTest, EqualSizesRenderAsUncompressed) {
    EXPECT_EQ(Size("qual", 64, 64).toString(), "qual: 64");
}

TEST(SizeTest, FractionalRatio) {
    EXPECT_EQ(Size("ids", 3, 1).toString(), "ids: 1 / 3 (33.333%)");
}

TEST(SizeTest, StreamOperator) {
    std::ostringstream out;
    out << Size("len", 10, 5);
    EXPECT_EQ(out.str(), "len: 5 / 10 (50.000%)");
}

// =============================================================================
// Record Tests
// =============================================================================

TEST(RecordTest, DefaultIsEmpty) {
    const Record record;

    EXPECT_FALSE(record.id.has_value());
    EXPECT_FALSE(record.comment.has_value());
    EXPECT_FALSE(record.sequence.has_value());
    EXPECT_FALSE(record.quality.has_value());
    EXPECT_FALSE(record.length.has_value());
    EXPECT_TRUE(record.validate().has_value());
}

TEST(RecordTest, MatchingQualityIsValid) {
    Record record;
    record.id = "r1";
    record.sequence = "ACGT";
    record.quality = "IIII";
    record.length = 4;

    EXPECT_TRUE(record.validate().has_value());
}

TEST(RecordTest, QualityMustMatchSequence) {
    Record record;
    record.sequence = "ACGT";
    record.quality = "III";

    auto status = record.validate();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::kFormatError);
}

TEST(RecordTest, QualityMustMatchLength) {
    Record record;
    record.quality = "IIII";
    record.length = 5;

    auto status = record.validate();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().message(), "quality length 4 does not match record length 5");
}

// =============================================================================
// MaskUnit Tests
// =============================================================================

TEST(MaskUnitTest, BuildsRuns) {
    auto masked = makeMaskUnit(true, 12);
    ASSERT_TRUE(masked.has_value());
    EXPECT_TRUE(masked->isMasked());
    EXPECT_EQ(*masked, MaskUnit::masked(12));

    auto unmasked = makeMaskUnit(false, 3);
    ASSERT_TRUE(unmasked.has_value());
    EXPECT_FALSE(unmasked->isMasked());
    EXPECT_EQ(unmasked->length, 3u);
}

TEST(MaskUnitTest, RejectsZeroLength) {
    auto unit = makeMaskUnit(true, 0);

    ASSERT_FALSE(unit.has_value());
    EXPECT_EQ(unit.error().code(), ErrorCode::kFormatError);
    EXPECT_EQ(unit.error().message(), "zero-length masked mask run");
}

}  // namespace
}  // namespace naf::format
