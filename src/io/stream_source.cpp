// =============================================================================
// naf-codec - Stream Source Implementation
// =============================================================================

#include "naf/io/stream_source.h"

#include <utility>

#include <fmt/format.h>

namespace naf::io {

StreamSource::StreamSource(NativeFile file) noexcept : source_(std::move(file)) {}

StreamSource::StreamSource(ForeignStreamAdapter adapter) noexcept
    : source_(std::move(adapter)) {}

Result<StreamSource> StreamSource::openFile(const std::filesystem::path& path,
                                            const NativeFile::Options& options) {
    auto file = NativeFile::open(path, options);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    return StreamSource(std::move(*file));
}

Result<StreamSource> StreamSource::fromHostObject(std::shared_ptr<HostObject> object,
                                                  HostRuntime& runtime) {
    auto adapter = ForeignStreamAdapter::fromObject(std::move(object), runtime);
    if (!adapter) {
        return std::unexpected(std::move(adapter.error()));
    }
    return StreamSource(std::move(*adapter));
}

Result<std::size_t> StreamSource::read(std::span<std::uint8_t> buffer) {
    return std::visit([buffer](auto& source) { return source.read(buffer); }, source_);
}

Result<std::uint64_t> StreamSource::seek(SeekFrom position) {
    return std::visit([position](auto& source) { return source.seek(position); }, source_);
}

VoidResult StreamSource::readExact(std::span<std::uint8_t> buffer) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto count = read(buffer.subspan(filled));
        if (!count) {
            return std::unexpected(std::move(count.error()));
        }
        if (*count == 0) {
            return makeVoidError(ErrorCode::kFormatError,
                                 fmt::format("unexpected end of stream: {} of {} bytes read",
                                             filled, buffer.size()));
        }
        filled += *count;
    }
    return makeVoidSuccess();
}

Result<std::uint64_t> StreamSource::position() {
    return seek(SeekFrom::current(0));
}

}  // namespace naf::io
