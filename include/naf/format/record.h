// =============================================================================
// naf-codec - Decoded Record Types
// =============================================================================
// Plain data carriers produced by the archive decoder.
//
// This module defines:
// - MaskUnit: one run of the mask block (masked or unmasked residues)
// - Record: one decoded sequence entry, every field optional
// - Size: original vs. compressed size of one archive block
// =============================================================================

#ifndef NAF_FORMAT_RECORD_H
#define NAF_FORMAT_RECORD_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "naf/common/error.h"
#include "naf/common/types.h"

namespace naf::format {

// =============================================================================
// MaskUnit
// =============================================================================

/// @brief A single run decoded from the mask block.
struct MaskUnit {
    enum class Kind : std::uint8_t {
        kMasked = 0,
        kUnmasked = 1
    };

    Kind kind = Kind::kUnmasked;

    /// @brief Run length in residues.
    SequenceLength length = 0;

    [[nodiscard]] static constexpr MaskUnit masked(SequenceLength length) noexcept {
        return MaskUnit{Kind::kMasked, length};
    }

    [[nodiscard]] static constexpr MaskUnit unmasked(SequenceLength length) noexcept {
        return MaskUnit{Kind::kUnmasked, length};
    }

    [[nodiscard]] constexpr bool isMasked() const noexcept { return kind == Kind::kMasked; }

    friend constexpr bool operator==(const MaskUnit&, const MaskUnit&) noexcept = default;
};

/// @brief Build a mask run decoded from an archive.
/// @param masked Whether the run covers masked residues.
/// @param length Run length in residues.
/// @return The run, or a format error for a zero-length run.
[[nodiscard]] Result<MaskUnit> makeMaskUnit(bool masked, SequenceLength length);

// =============================================================================
// Record
// =============================================================================

/// @brief A single sequence record from a NAF archive.
///
/// If set, the quality string length equals the sequence length and the
/// record length. Quality is stored as raw text, so it may hold other
/// per-residue annotation such as secondary structure.
struct Record {
    /// @brief Record identifier (accession number).
    std::optional<std::string> id;

    /// @brief Record comment (description).
    std::optional<std::string> comment;

    /// @brief Record sequence.
    std::optional<std::string> sequence;

    /// @brief Record quality string.
    std::optional<std::string> quality;

    /// @brief Record sequence length.
    std::optional<SequenceLength> length;

    /// @brief Check the quality/sequence/length consistency of the record.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Size
// =============================================================================

/// @brief Original and compressed size of one archive block.
class Size {
public:
    /// @param block Block label (e.g. "seq", "qual").
    /// @param original Uncompressed size in bytes.
    /// @param compressed Compressed size in bytes, defaults to original.
    Size(std::string block, std::uint64_t original, std::optional<std::uint64_t> compressed);

    [[nodiscard]] const std::string& block() const noexcept { return block_; }

    [[nodiscard]] std::uint64_t original() const noexcept { return original_; }

    [[nodiscard]] std::uint64_t compressed() const noexcept { return compressed_; }

    /// @brief Render as "<block>: <original>" or
    ///        "<block>: <compressed> / <original> (<pct>%)".
    [[nodiscard]] std::string toString() const;

private:
    std::string block_;
    std::uint64_t original_;
    std::uint64_t compressed_;
};

std::ostream& operator<<(std::ostream& os, const Size& size);

}  // namespace naf::format

#endif  // NAF_FORMAT_RECORD_H
