// =============================================================================
// naf-codec - NAF Archive Format Definitions
// =============================================================================
// Value types describing the header of a Nucleotide Archive Format file.
//
// This module defines:
// - Magic bytes (3 bytes)
// - FormatVersion and SequenceType enumerations
// - Flag / Flags bit set for optional sections
// - Header snapshot
//
// Header Layout:
// +-------------------+
// |  Magic (3 bytes)  |  0x01 0xF9 0xEC
// +-------------------+
// |  Format version   |  1 byte (1 or 2)
// +-------------------+
// |  Sequence type    |  1 byte, version 2 only
// +-------------------+
// |  Flags            |  1 byte
// +-------------------+
// |  Name separator   |  1 byte
// +-------------------+
// |  Line length      |  variable-length integer
// +-------------------+
// |  Sequence count   |  variable-length integer
// +-------------------+
// =============================================================================

#ifndef NAF_FORMAT_NAF_FORMAT_H
#define NAF_FORMAT_NAF_FORMAT_H

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "naf/common/types.h"

namespace naf::format {

// =============================================================================
// Magic Header Constants
// =============================================================================

/// @brief Magic bytes opening every NAF archive.
inline constexpr std::array<std::uint8_t, 3> kMagicBytes = {0x01, 0xF9, 0xEC};

// =============================================================================
// FormatVersion
// =============================================================================

/// @brief Supported binary layout versions.
enum class FormatVersion : std::uint8_t {
    kV1 = 1,
    kV2 = 2
};

/// @brief Decode a format version byte.
/// @return std::nullopt for versions this library does not know.
[[nodiscard]] constexpr std::optional<FormatVersion> formatVersionFromByte(
    std::uint8_t value) noexcept {
    switch (value) {
        case 1:
            return FormatVersion::kV1;
        case 2:
            return FormatVersion::kV2;
        default:
            return std::nullopt;
    }
}

// =============================================================================
// SequenceType
// =============================================================================

/// @brief Alphabet of the sequences stored in an archive.
enum class SequenceType : std::uint8_t {
    /// @brief DNA sequence - ATCG(N-).
    kDna = 0,
    /// @brief RNA sequence - AUCG(N-).
    kRna = 1,
    /// @brief Protein sequence - single character amino acids.
    kProtein = 2,
    /// @brief Arbitrary text.
    kText = 3
};

/// @brief Check whether a sequence type is a nucleotide alphabet.
[[nodiscard]] constexpr bool isNucleotide(SequenceType type) noexcept {
    return type == SequenceType::kDna || type == SequenceType::kRna;
}

/// @brief Decode a sequence type byte.
/// @return std::nullopt for unknown sequence types.
[[nodiscard]] constexpr std::optional<SequenceType> sequenceTypeFromByte(
    std::uint8_t value) noexcept {
    if (value > static_cast<std::uint8_t>(SequenceType::kText)) {
        return std::nullopt;
    }
    return static_cast<SequenceType>(value);
}

/// @brief Human-readable name of a sequence type.
[[nodiscard]] std::string_view sequenceTypeName(SequenceType type) noexcept;

// =============================================================================
// Flag
// =============================================================================

/// @brief A single optional-section flag of the header flags byte.
enum class Flag : std::uint8_t {
    /// @brief Sequence qualities are stored.
    kQuality = 0x01,
    /// @brief Sequences are stored.
    kSequence = 0x02,
    /// @brief Sequence masks are stored.
    kMask = 0x04,
    /// @brief Sequence lengths are stored.
    kLength = 0x08,
    /// @brief Record comments are stored.
    kComment = 0x10,
    /// @brief Record identifiers are stored.
    kId = 0x20,
    /// @brief The archive has a title.
    kTitle = 0x40,
    /// @brief Reserved for future extension of the format.
    kExtended = 0x80
};

/// @brief All individual flags, lowest bit first.
inline constexpr std::array<Flag, 8> kAllFlags = {
    Flag::kQuality, Flag::kSequence, Flag::kMask,  Flag::kLength,
    Flag::kComment, Flag::kId,       Flag::kTitle, Flag::kExtended
};

/// @brief View a flag as its single-bit mask.
[[nodiscard]] constexpr std::uint8_t flagByte(Flag flag) noexcept {
    return static_cast<std::uint8_t>(flag);
}

/// @brief Human-readable name of a flag.
[[nodiscard]] std::string_view flagName(Flag flag) noexcept;

// =============================================================================
// Flags
// =============================================================================

/// @brief Set of optional sections present in an archive.
class Flags {
public:
    /// @brief Create a set with no flag set.
    constexpr Flags() noexcept = default;

    /// @brief Create a set holding a single flag.
    constexpr Flags(Flag flag) noexcept : bits_(flagByte(flag)) {}

    /// @brief Create a set from a raw flags byte.
    [[nodiscard]] static constexpr Flags fromByte(std::uint8_t bits) noexcept {
        Flags flags;
        flags.bits_ = bits;
        return flags;
    }

    /// @brief Check if the given flag is set.
    [[nodiscard]] constexpr bool test(Flag flag) const noexcept {
        return (bits_ & flagByte(flag)) != 0;
    }

    /// @brief Set the given flag.
    constexpr void set(Flag flag) noexcept { bits_ |= flagByte(flag); }

    /// @brief Unset the given flag.
    constexpr void unset(Flag flag) noexcept {
        bits_ &= static_cast<std::uint8_t>(~flagByte(flag));
    }

    /// @brief View the set as a single byte.
    [[nodiscard]] constexpr std::uint8_t asByte() const noexcept { return bits_; }

    /// @brief Check if no flag is set.
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

    constexpr Flags& operator|=(Flags other) noexcept {
        bits_ |= other.bits_;
        return *this;
    }

    friend constexpr Flags operator|(Flags a, Flags b) noexcept {
        return Flags::fromByte(static_cast<std::uint8_t>(a.bits_ | b.bits_));
    }

    friend constexpr bool operator==(const Flags&, const Flags&) noexcept = default;

private:
    std::uint8_t bits_ = 0;
};

/// @brief Combine two flags into a set.
[[nodiscard]] constexpr Flags operator|(Flag a, Flag b) noexcept {
    return Flags(a) | Flags(b);
}

// =============================================================================
// Header
// =============================================================================

/// @brief The header section of a NAF archive.
/// @note Headers are the only mandatory section of NAF files. They describe
///       the stored sequences and how records are formatted on output.
class Header {
public:
    /// @brief Default header: version 1, DNA, no flags, ' ' separator,
    ///        line length 60, no sequences.
    constexpr Header() noexcept = default;

    constexpr Header(FormatVersion formatVersion,
                     SequenceType sequenceType,
                     Flags flags,
                     char nameSeparator,
                     std::uint64_t lineLength,
                     std::uint64_t numberOfSequences) noexcept
        : formatVersion_(formatVersion),
          sequenceType_(sequenceType),
          flags_(flags),
          nameSeparator_(nameSeparator),
          lineLength_(lineLength),
          numberOfSequences_(numberOfSequences) {}

    [[nodiscard]] constexpr FormatVersion formatVersion() const noexcept { return formatVersion_; }

    [[nodiscard]] constexpr SequenceType sequenceType() const noexcept { return sequenceType_; }

    [[nodiscard]] constexpr Flags flags() const noexcept { return flags_; }

    [[nodiscard]] constexpr char nameSeparator() const noexcept { return nameSeparator_; }

    /// @brief Line length used to re-wrap sequence text on output.
    [[nodiscard]] constexpr std::uint64_t lineLength() const noexcept { return lineLength_; }

    [[nodiscard]] constexpr std::uint64_t numberOfSequences() const noexcept {
        return numberOfSequences_;
    }

    friend constexpr bool operator==(const Header&, const Header&) noexcept = default;

private:
    FormatVersion formatVersion_ = FormatVersion::kV1;
    SequenceType sequenceType_ = SequenceType::kDna;
    Flags flags_;
    char nameSeparator_ = kDefaultNameSeparator;
    std::uint64_t lineLength_ = kDefaultLineLength;
    std::uint64_t numberOfSequences_ = 0;
};

}  // namespace naf::format

#endif  // NAF_FORMAT_NAF_FORMAT_H
