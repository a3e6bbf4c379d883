// =============================================================================
// naf-codec - Native File Source
// =============================================================================
// Byte stream over a file opened by path. No host lock is involved.
// =============================================================================

#ifndef NAF_IO_NATIVE_FILE_H
#define NAF_IO_NATIVE_FILE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>

#include "naf/common/error.h"
#include "naf/common/types.h"
#include "naf/io/byte_stream.h"

namespace naf::io {

class NativeFile {
public:
    /// @brief Options for opening a native file.
    struct Options {
        /// @brief Size of the stream buffer given to the file stream.
        std::size_t bufferSize = kDefaultNativeBufferSize;
    };

    /// @brief Open a file for binary reading.
    /// @return The file, or kIOError carrying the OS error code.
    [[nodiscard]] static Result<NativeFile> open(const std::filesystem::path& path,
                                                 const Options& options);

    /// @brief Open a file for binary reading with default options.
    [[nodiscard]] static Result<NativeFile> open(const std::filesystem::path& path);

    NativeFile(const NativeFile&) = delete;
    NativeFile& operator=(const NativeFile&) = delete;
    NativeFile(NativeFile&&) noexcept = default;
    NativeFile& operator=(NativeFile&&) noexcept = default;
    ~NativeFile() = default;

    /// @brief Read up to buffer.size() bytes.
    /// @return Bytes read, 0 at end of file.
    [[nodiscard]] Result<std::size_t> read(std::span<std::uint8_t> buffer);

    /// @brief Move the read position.
    /// @return The new absolute position, or kSeekFailed.
    [[nodiscard]] Result<std::uint64_t> seek(SeekFrom position);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    NativeFile(std::filesystem::path path, std::unique_ptr<std::ifstream> stream,
               std::unique_ptr<char[]> buffer) noexcept;

    std::filesystem::path path_;
    // The stream buffer must outlive the stream using it.
    std::unique_ptr<char[]> buffer_;
    std::unique_ptr<std::ifstream> stream_;
};

static_assert(ByteStream<NativeFile>);

}  // namespace naf::io

#endif  // NAF_IO_NATIVE_FILE_H
