// =============================================================================
// naf-codec - Stream Source
// =============================================================================
// The byte source handed to the archive decoder: either a native file or a
// host file-like object behind a ForeignStreamAdapter. The decoder is written
// once against read()/seek() and never learns which variant it was given.
//
// Usage:
//   auto source = StreamSource::openFile("/path/to/archive.naf");
//   auto source = StreamSource::fromHostObject(object, runtime);
// =============================================================================

#ifndef NAF_IO_STREAM_SOURCE_H
#define NAF_IO_STREAM_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <variant>

#include "naf/common/error.h"
#include "naf/io/byte_stream.h"
#include "naf/io/foreign_stream.h"
#include "naf/io/native_file.h"

namespace naf::io {

class StreamSource {
public:
    explicit StreamSource(NativeFile file) noexcept;

    explicit StreamSource(ForeignStreamAdapter adapter) noexcept;

    /// @brief Open a native file by path.
    [[nodiscard]] static Result<StreamSource> openFile(
        const std::filesystem::path& path, const NativeFile::Options& options = {});

    /// @brief Wrap a host file-like object (probes it first).
    [[nodiscard]] static Result<StreamSource> fromHostObject(std::shared_ptr<HostObject> object,
                                                             HostRuntime& runtime);

    StreamSource(StreamSource&&) noexcept = default;
    StreamSource& operator=(StreamSource&&) noexcept = default;

    /// @brief Read up to buffer.size() bytes, 0 at end of stream.
    [[nodiscard]] Result<std::size_t> read(std::span<std::uint8_t> buffer);

    /// @brief Move the read position, returning the new absolute position.
    [[nodiscard]] Result<std::uint64_t> seek(SeekFrom position);

    /// @brief Fill the whole buffer.
    /// @return kFormatError if the stream ends first; source errors unchanged.
    [[nodiscard]] VoidResult readExact(std::span<std::uint8_t> buffer);

    /// @brief Current absolute position.
    [[nodiscard]] Result<std::uint64_t> position();

    /// @brief Check whether the source is a host object.
    [[nodiscard]] bool isForeign() const noexcept {
        return std::holds_alternative<ForeignStreamAdapter>(source_);
    }

private:
    std::variant<NativeFile, ForeignStreamAdapter> source_;
};

static_assert(ByteStream<StreamSource>);

}  // namespace naf::io

#endif  // NAF_IO_STREAM_SOURCE_H
