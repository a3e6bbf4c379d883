// =============================================================================
// naf-codec - NAF Format Definition Tests
// =============================================================================
// Unit and property tests for header flags, sequence types and defaults.
// =============================================================================

#include "naf/format/naf_format.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>

namespace naf::format::test {

// =============================================================================
// Flag Tests
// =============================================================================

TEST(FlagsTest, BitValues) {
    EXPECT_EQ(flagByte(Flag::kQuality), 0x01);
    EXPECT_EQ(flagByte(Flag::kSequence), 0x02);
    EXPECT_EQ(flagByte(Flag::kMask), 0x04);
    EXPECT_EQ(flagByte(Flag::kLength), 0x08);
    EXPECT_EQ(flagByte(Flag::kComment), 0x10);
    EXPECT_EQ(flagByte(Flag::kId), 0x20);
    EXPECT_EQ(flagByte(Flag::kTitle), 0x40);
    EXPECT_EQ(flagByte(Flag::kExtended), 0x80);
}

TEST(FlagsTest, CombiningSetsExactlyThoseBits) {
    const Flags flags = Flag::kId | Flag::kComment;

    EXPECT_EQ(flags.asByte(), 0x30);
    EXPECT_TRUE(flags.test(Flag::kId));
    EXPECT_TRUE(flags.test(Flag::kComment));
    for (Flag flag : kAllFlags) {
        if (flag != Flag::kId && flag != Flag::kComment) {
            EXPECT_FALSE(flags.test(flag)) << flagName(flag);
        }
    }
}

TEST(FlagsTest, SetAndUnset) {
    Flags flags;
    EXPECT_TRUE(flags.empty());

    flags.set(Flag::kQuality);
    flags.set(Flag::kQuality);
    EXPECT_EQ(flags.asByte(), 0x01);

    flags |= Flag::kMask;
    EXPECT_EQ(flags.asByte(), 0x05);

    flags.unset(Flag::kQuality);
    EXPECT_FALSE(flags.test(Flag::kQuality));
    EXPECT_TRUE(flags.test(Flag::kMask));

    flags.unset(Flag::kTitle);
    EXPECT_EQ(flags.asByte(), 0x04);
}

TEST(FlagsTest, Names) {
    EXPECT_EQ(flagName(Flag::kQuality), "quality");
    EXPECT_EQ(flagName(Flag::kTitle), "title");
    EXPECT_EQ(flagName(Flag::kExtended), "extended");
}

RC_GTEST_PROP(FlagsPropertyTest, TestMatchesRawBits, (std::uint8_t bits)) {
    const Flags flags = Flags::fromByte(bits);
    RC_ASSERT(flags.asByte() == bits);
    for (Flag flag : kAllFlags) {
        RC_ASSERT(flags.test(flag) == ((bits & flagByte(flag)) != 0));
    }
}

RC_GTEST_PROP(FlagsPropertyTest, UnsetClearsOnlyOneBit, (std::uint8_t bits)) {
    const Flag flag = *rc::gen::elementOf(kAllFlags);
    Flags flags = Flags::fromByte(bits);
    flags.unset(flag);
    RC_ASSERT(flags.asByte() == static_cast<std::uint8_t>(bits & ~flagByte(flag)));
}

// =============================================================================
// SequenceType Tests
// =============================================================================

TEST(SequenceTypeTest, DecodesKnownBytes) {
    EXPECT_EQ(sequenceTypeFromByte(0), SequenceType::kDna);
    EXPECT_EQ(sequenceTypeFromByte(1), SequenceType::kRna);
    EXPECT_EQ(sequenceTypeFromByte(2), SequenceType::kProtein);
    EXPECT_EQ(sequenceTypeFromByte(3), SequenceType::kText);
    EXPECT_FALSE(sequenceTypeFromByte(4).has_value());
}

TEST(SequenceTypeTest, NucleotideAlphabets) {
    EXPECT_TRUE(isNucleotide(SequenceType::kDna));
    EXPECT_TRUE(isNucleotide(SequenceType::kRna));
    EXPECT_FALSE(isNucleotide(SequenceType::kProtein));
    EXPECT_FALSE(isNucleotide(SequenceType::kText));
    EXPECT_EQ(sequenceTypeName(SequenceType::kProtein), "protein");
}

TEST(FormatVersionTest, OnlyVersionsOneAndTwo) {
    EXPECT_FALSE(formatVersionFromByte(0).has_value());
    EXPECT_EQ(formatVersionFromByte(1), FormatVersion::kV1);
    EXPECT_EQ(formatVersionFromByte(2), FormatVersion::kV2);
    EXPECT_FALSE(formatVersionFromByte(3).has_value());
}

// =============================================================================
// Header Tests
// =============================================================================

TEST(HeaderTest, Defaults) {
    constexpr Header header;

    static_assert(header.formatVersion() == FormatVersion::kV1);
    EXPECT_EQ(header.sequenceType(), SequenceType::kDna);
    EXPECT_TRUE(header.flags().empty());
    EXPECT_EQ(header.nameSeparator(), ' ');
    EXPECT_EQ(header.lineLength(), 60u);
    EXPECT_EQ(header.numberOfSequences(), 0u);
}

TEST(HeaderTest, Equality) {
    const Header a(FormatVersion::kV2, SequenceType::kRna, Flag::kSequence, '_', 80, 10);
    const Header b(FormatVersion::kV2, SequenceType::kRna, Flag::kSequence, '_', 80, 10);
    const Header c(FormatVersion::kV2, SequenceType::kRna, Flag::kSequence, '_', 80, 11);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, Header{});
}

}  // namespace naf::format::test
