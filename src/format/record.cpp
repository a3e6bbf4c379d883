// =============================================================================
// naf-codec - Decoded Record Types Implementation
// =============================================================================

#include "naf/format/record.h"

#include <utility>

#include <fmt/format.h>

namespace naf::format {

// =============================================================================
// MaskUnit Implementation
// =============================================================================

Result<MaskUnit> makeMaskUnit(bool masked, SequenceLength length) {
    if (length == 0) {
        return makeError<MaskUnit>(ErrorCode::kFormatError,
                                   fmt::format("zero-length {} mask run",
                                               masked ? "masked" : "unmasked"));
    }
    return masked ? MaskUnit::masked(length) : MaskUnit::unmasked(length);
}

// =============================================================================
// Record Implementation
// =============================================================================

VoidResult Record::validate() const {
    if (!quality.has_value()) {
        return makeVoidSuccess();
    }

    if (sequence.has_value() && sequence->size() != quality->size()) {
        return makeVoidError(ErrorCode::kFormatError,
                             fmt::format("quality length {} does not match sequence length {}",
                                         quality->size(), sequence->size()));
    }

    if (length.has_value() && *length != quality->size()) {
        return makeVoidError(ErrorCode::kFormatError,
                             fmt::format("quality length {} does not match record length {}",
                                         quality->size(), *length));
    }

    return makeVoidSuccess();
}

// =============================================================================
// Size Implementation
// =============================================================================

Size::Size(std::string block, std::uint64_t original, std::optional<std::uint64_t> compressed)
    : block_(std::move(block)), original_(original), compressed_(compressed.value_or(original)) {}

std::string Size::toString() const {
    if (original_ == compressed_) {
        return fmt::format("{}: {}", block_, original_);
    }
    const double percentage =
        static_cast<double>(compressed_) * 100.0 / static_cast<double>(original_);
    return fmt::format("{}: {} / {} ({:.3f}%)", block_, compressed_, original_, percentage);
}

std::ostream& operator<<(std::ostream& os, const Size& size) {
    return os << size.toString();
}

}  // namespace naf::format
