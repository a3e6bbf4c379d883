// =============================================================================
// naf-codec - NAF Header Reader Implementation
// =============================================================================

#include "naf/format/header_reader.h"

#include <algorithm>
#include <array>
#include <limits>
#include <span>
#include <utility>

#include <fmt/format.h>

#include "naf/common/logger.h"

namespace naf::format {

namespace {

/// @brief Titles are read in chunks so a corrupt length cannot force a
///        single huge allocation.
constexpr std::size_t kTitleChunkSize = 4096;

[[nodiscard]] Result<std::uint8_t> readByte(io::StreamSource& source) {
    std::array<std::uint8_t, 1> byte{};
    auto status = source.readExact(byte);
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }
    return byte[0];
}

}  // namespace

Result<std::uint64_t> readVarint(io::StreamSource& source) {
    std::uint64_t value = 0;
    while (true) {
        auto byte = readByte(source);
        if (!byte) {
            return std::unexpected(std::move(byte.error()));
        }
        if (value > (std::numeric_limits<std::uint64_t>::max() >> 7)) {
            return makeError<std::uint64_t>(ErrorCode::kFormatError,
                                            "variable-length integer overflows 64 bits");
        }
        value = (value << 7) | (*byte & 0x7F);
        if ((*byte & 0x80) == 0) {
            return value;
        }
    }
}

Result<Header> readHeader(io::StreamSource& source) {
    std::array<std::uint8_t, kMagicBytes.size()> magic{};
    if (auto status = source.readExact(magic); !status) {
        return std::unexpected(std::move(status.error()));
    }
    if (magic != kMagicBytes) {
        return makeError<Header>(
            ErrorCode::kFormatError,
            fmt::format("invalid magic bytes {:02x} {:02x} {:02x}", magic[0], magic[1], magic[2]));
    }

    auto versionByte = readByte(source);
    if (!versionByte) {
        return std::unexpected(std::move(versionByte.error()));
    }
    const auto version = formatVersionFromByte(*versionByte);
    if (!version) {
        return makeError<Header>(ErrorCode::kFormatError,
                                 fmt::format("unsupported format version {}", *versionByte));
    }

    // Version 1 archives have no sequence type byte and always store DNA.
    SequenceType sequenceType = SequenceType::kDna;
    if (*version == FormatVersion::kV2) {
        auto typeByte = readByte(source);
        if (!typeByte) {
            return std::unexpected(std::move(typeByte.error()));
        }
        const auto decoded = sequenceTypeFromByte(*typeByte);
        if (!decoded) {
            return makeError<Header>(ErrorCode::kFormatError,
                                     fmt::format("unknown sequence type {}", *typeByte));
        }
        sequenceType = *decoded;
    }

    auto flagsByte = readByte(source);
    if (!flagsByte) {
        return std::unexpected(std::move(flagsByte.error()));
    }

    auto separator = readByte(source);
    if (!separator) {
        return std::unexpected(std::move(separator.error()));
    }

    auto lineLength = readVarint(source);
    if (!lineLength) {
        return std::unexpected(std::move(lineLength.error()));
    }

    auto numberOfSequences = readVarint(source);
    if (!numberOfSequences) {
        return std::unexpected(std::move(numberOfSequences.error()));
    }

    Header header(*version, sequenceType, Flags::fromByte(*flagsByte),
                  static_cast<char>(*separator), *lineLength, *numberOfSequences);

    NAF_LOG_DEBUG("read header: version={}, type={}, flags=0x{:02x}, sequences={}",
                  static_cast<int>(*versionByte), sequenceTypeName(sequenceType),
                  static_cast<unsigned>(*flagsByte), *numberOfSequences);
    return header;
}

Result<std::string> readTitle(io::StreamSource& source) {
    auto length = readVarint(source);
    if (!length) {
        return std::unexpected(std::move(length.error()));
    }

    std::string title;
    std::array<std::uint8_t, kTitleChunkSize> chunk{};
    std::uint64_t remaining = *length;
    while (remaining > 0) {
        const auto count = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining, chunk.size()));
        auto status = source.readExact(std::span(chunk).first(count));
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
        title.append(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(count));
        remaining -= count;
    }
    return title;
}

}  // namespace naf::format
