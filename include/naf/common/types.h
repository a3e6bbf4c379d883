// =============================================================================
// naf-codec - Common Type Definitions
// =============================================================================
// Type aliases and default constants shared by the format and io modules.
// =============================================================================

#ifndef NAF_COMMON_TYPES_H
#define NAF_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>

namespace naf {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Number of residues in a sequence or mask run.
using SequenceLength = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Line length used when a header does not say otherwise.
inline constexpr std::uint64_t kDefaultLineLength = 60;

/// @brief Separator between record id and comment in the default header.
inline constexpr char kDefaultNameSeparator = ' ';

/// @brief Default stream buffer size for native files.
inline constexpr std::size_t kDefaultNativeBufferSize = 64 * 1024;

}  // namespace naf

#endif  // NAF_COMMON_TYPES_H
