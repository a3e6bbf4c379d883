// =============================================================================
// naf-codec - NAF Archive Format Definitions Implementation
// =============================================================================

#include "naf/format/naf_format.h"

namespace naf::format {

std::string_view sequenceTypeName(SequenceType type) noexcept {
    switch (type) {
        case SequenceType::kDna:
            return "dna";
        case SequenceType::kRna:
            return "rna";
        case SequenceType::kProtein:
            return "protein";
        case SequenceType::kText:
            return "text";
    }
    return "unknown";
}

std::string_view flagName(Flag flag) noexcept {
    switch (flag) {
        case Flag::kQuality:
            return "quality";
        case Flag::kSequence:
            return "sequence";
        case Flag::kMask:
            return "mask";
        case Flag::kLength:
            return "length";
        case Flag::kComment:
            return "comment";
        case Flag::kId:
            return "id";
        case Flag::kTitle:
            return "title";
        case Flag::kExtended:
            return "extended";
    }
    return "unknown";
}

}  // namespace naf::format
