// =============================================================================
// naf-codec - Native File Source Implementation
// =============================================================================

#include "naf/io/native_file.h"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "naf/common/logger.h"

namespace naf::io {

namespace {

[[nodiscard]] std::ios::seekdir toSeekDir(SeekFrom::Origin origin) noexcept {
    switch (origin) {
        case SeekFrom::Origin::kStart:
            return std::ios::beg;
        case SeekFrom::Origin::kCurrent:
            return std::ios::cur;
        case SeekFrom::Origin::kEnd:
            return std::ios::end;
    }
    return std::ios::beg;
}

}  // namespace

NativeFile::NativeFile(std::filesystem::path path, std::unique_ptr<std::ifstream> stream,
                       std::unique_ptr<char[]> buffer) noexcept
    : path_(std::move(path)), buffer_(std::move(buffer)), stream_(std::move(stream)) {}

Result<NativeFile> NativeFile::open(const std::filesystem::path& path) {
    return open(path, Options{});
}

Result<NativeFile> NativeFile::open(const std::filesystem::path& path, const Options& options) {
    auto stream = std::make_unique<std::ifstream>();
    std::unique_ptr<char[]> buffer;
    if (options.bufferSize > 0) {
        // Must be installed before open() to take effect.
        buffer = std::make_unique<char[]>(options.bufferSize);
        stream->rdbuf()->pubsetbuf(buffer.get(),
                                   static_cast<std::streamsize>(options.bufferSize));
    }

    errno = 0;
    stream->open(path, std::ios::binary);
    if (!stream->is_open()) {
        const int code = errno != 0 ? errno : EIO;
        return makeError<NativeFile>(Error{fmt::format("failed to open {}", path.string()),
                                           std::error_code(code, std::system_category())});
    }

    NAF_LOG_DEBUG("opened native file: {}", path.string());
    return NativeFile(path, std::move(stream), std::move(buffer));
}

Result<std::size_t> NativeFile::read(std::span<std::uint8_t> buffer) {
    stream_->read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = stream_->gcount();

    if (stream_->bad()) {
        return makeError<std::size_t>(ErrorCode::kIOError,
                                      fmt::format("failed to read from {}", path_.string()));
    }
    if (stream_->eof()) {
        // A short read at end of file is not an error; keep the stream usable.
        stream_->clear();
    }
    return static_cast<std::size_t>(count);
}

Result<std::uint64_t> NativeFile::seek(SeekFrom position) {
    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(position.offset), toSeekDir(position.origin));
    if (stream_->fail()) {
        stream_->clear();
        return makeError<std::uint64_t>(
            ErrorCode::kSeekFailed,
            fmt::format("failed to seek {} (whence {}) in {}", position.offset,
                        position.whence(), path_.string()));
    }

    const std::streamoff newPosition = stream_->tellg();
    if (newPosition < 0) {
        stream_->clear();
        return makeError<std::uint64_t>(ErrorCode::kSeekFailed,
                                        fmt::format("failed to tell position in {}",
                                                    path_.string()));
    }
    return static_cast<std::uint64_t>(newPosition);
}

}  // namespace naf::io
