// =============================================================================
// naf-codec - NAF Header Reader
// =============================================================================
// Reads the mandatory header (and the optional title) at the start of an
// archive from a StreamSource. Block decoding is left to the decoder.
//
// Variable-length integers are big-endian base-128: every byte contributes
// its low 7 bits and a set high bit means another byte follows.
//
// Usage:
//   auto source = io::StreamSource::openFile(path);
//   auto header = format::readHeader(*source);
//   if (header && header->flags().test(Flag::kTitle)) {
//       auto title = format::readTitle(*source);
//   }
// =============================================================================

#ifndef NAF_FORMAT_HEADER_READER_H
#define NAF_FORMAT_HEADER_READER_H

#include <cstdint>
#include <string>

#include "naf/common/error.h"
#include "naf/format/naf_format.h"
#include "naf/io/stream_source.h"

namespace naf::format {

/// @brief Read one variable-length integer.
/// @return The value, or kFormatError on overflow or premature end of stream.
[[nodiscard]] Result<std::uint64_t> readVarint(io::StreamSource& source);

/// @brief Read and validate the archive header.
/// @note The source must be positioned at the start of the archive.
[[nodiscard]] Result<Header> readHeader(io::StreamSource& source);

/// @brief Read the archive title following the header.
/// @note Only present when the header has Flag::kTitle.
[[nodiscard]] Result<std::string> readTitle(io::StreamSource& source);

}  // namespace naf::format

#endif  // NAF_FORMAT_HEADER_READER_H
