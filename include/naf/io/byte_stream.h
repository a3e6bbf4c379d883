// =============================================================================
// naf-codec - Byte Stream Contract
// =============================================================================
// The seekable byte-stream contract consumed by the archive decoder:
//
//   Result<std::size_t>   read(std::span<std::uint8_t> buffer)
//   Result<std::uint64_t> seek(SeekFrom position)
//
// read() returns the number of bytes written to the front of the buffer,
// 0 meaning end of stream. seek() returns the new absolute position.
// =============================================================================

#ifndef NAF_IO_BYTE_STREAM_H
#define NAF_IO_BYTE_STREAM_H

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

#include "naf/common/error.h"

namespace naf::io {

// =============================================================================
// SeekFrom
// =============================================================================

/// @brief Target of a seek: a signed offset relative to an origin.
struct SeekFrom {
    /// @brief Origin of the offset; values match the host `whence` argument.
    enum class Origin : std::uint8_t {
        kStart = 0,
        kCurrent = 1,
        kEnd = 2
    };

    Origin origin = Origin::kStart;
    std::int64_t offset = 0;

    /// @brief Absolute position from the start of the stream.
    /// @note Positions past INT64_MAX saturate; no stream can reach them.
    [[nodiscard]] static constexpr SeekFrom start(std::uint64_t position) noexcept {
        constexpr auto kMaxOffset =
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        return SeekFrom{Origin::kStart,
                        static_cast<std::int64_t>(std::min(position, kMaxOffset))};
    }

    /// @brief Offset relative to the current position.
    [[nodiscard]] static constexpr SeekFrom current(std::int64_t offset) noexcept {
        return SeekFrom{Origin::kCurrent, offset};
    }

    /// @brief Offset relative to the end of the stream.
    [[nodiscard]] static constexpr SeekFrom end(std::int64_t offset) noexcept {
        return SeekFrom{Origin::kEnd, offset};
    }

    /// @brief The host `whence` value for this origin (0, 1 or 2).
    [[nodiscard]] constexpr int whence() const noexcept { return static_cast<int>(origin); }

    friend constexpr bool operator==(const SeekFrom&, const SeekFrom&) noexcept = default;
};

// =============================================================================
// ByteStream Concept
// =============================================================================

/// @brief A seekable source of bytes.
template <typename T>
concept ByteStream = requires(T& stream, std::span<std::uint8_t> buffer, SeekFrom position) {
    { stream.read(buffer) } -> std::same_as<Result<std::size_t>>;
    { stream.seek(position) } -> std::same_as<Result<std::uint64_t>>;
};

}  // namespace naf::io

#endif  // NAF_IO_BYTE_STREAM_H
