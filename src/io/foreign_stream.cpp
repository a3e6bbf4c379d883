// =============================================================================
// naf-codec - Foreign Stream Adapter Implementation
// =============================================================================

#include "naf/io/foreign_stream.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "naf/common/logger.h"
#include "naf/io/foreign_error.h"

namespace naf::io {

namespace {

constexpr std::string_view kReadFailedMessage = "read method failed";

}  // namespace

// =============================================================================
// Error Reinterpretation
// =============================================================================

Error reinterpret(const HostException& error, std::string_view fallbackMessage) {
    if (const std::optional<int> code = error.osErrorCode()) {
        return Error{error.typeName(), std::error_code(*code, std::system_category())};
    }
    return Error{ErrorCode::kIOError, std::string(fallbackMessage)};
}

// =============================================================================
// ForeignStreamAdapter Implementation
// =============================================================================

ForeignStreamAdapter::ForeignStreamAdapter(std::shared_ptr<HostObject> object,
                                           HostRuntime& runtime) noexcept
    : object_(std::move(object)), runtime_(&runtime) {}

Result<ForeignStreamAdapter> ForeignStreamAdapter::fromObject(std::shared_ptr<HostObject> object,
                                                              HostRuntime& runtime) {
    if (!object) {
        return makeError<ForeignStreamAdapter>(ErrorCode::kInvalidArgument,
                                               "host object is null");
    }

    ForeignStreamAdapter adapter(std::move(object), runtime);
    std::string typeName;
    {
        HostLock lock(runtime);
        auto probe = adapter.object_->callRead(0);
        if (!probe) {
            HostExceptionPtr hostError = std::move(probe.error());
            Error error = reinterpret(*hostError, kReadFailedMessage);
            return std::unexpected(parkHostError(std::move(error), std::move(hostError)));
        }
        if (!probe->isBytes()) {
            return std::unexpected(adapter.typeMismatch("bytes", *probe));
        }
        typeName = adapter.object_->typeName();
    }

    NAF_LOG_DEBUG("wrapped host file object of type {}", typeName);
    return adapter;
}

Result<std::size_t> ForeignStreamAdapter::read(std::span<std::uint8_t> buffer) {
    HostLock lock(*runtime_);

    auto result = object_->callRead(buffer.size());
    if (!result) {
        HostExceptionPtr hostError = std::move(result.error());
        NAF_LOG_DEBUG("host read({}) raised {}", buffer.size(), hostError->typeName());
        Error error = reinterpret(*hostError, kReadFailedMessage);
        return std::unexpected(parkHostError(std::move(error), std::move(hostError)));
    }

    if (!result->isBytes()) {
        return std::unexpected(typeMismatch("bytes", *result));
    }

    const std::span<const std::uint8_t> bytes = result->asBytes();
    if (bytes.size() > buffer.size()) {
        return std::unexpected(contractViolation(fmt::format(
            "read returned {} bytes, at most {} requested", bytes.size(), buffer.size())));
    }

    std::copy(bytes.begin(), bytes.end(), buffer.begin());
    return bytes.size();
}

Result<std::uint64_t> ForeignStreamAdapter::seek(SeekFrom position) {
    HostLock lock(*runtime_);

    auto result = object_->callSeek(position.offset, position.whence());
    if (!result) {
        // Many file-like objects under-implement seek, so the failure is not
        // reinterpreted as an OS error.
        HostExceptionPtr hostError = std::move(result.error());
        NAF_LOG_DEBUG("host seek({}, {}) raised {}", position.offset, position.whence(),
                      hostError->typeName());
        Error error{ErrorCode::kUnsupportedOperation,
                    fmt::format("{}: {}", hostError->typeName(), hostError->message())};
        return std::unexpected(parkHostError(std::move(error), std::move(hostError)));
    }

    const std::optional<std::int64_t> newPosition = result->asInteger();
    if (!newPosition) {
        return std::unexpected(typeMismatch("int", *result));
    }
    if (*newPosition < 0) {
        return std::unexpected(
            contractViolation(fmt::format("seek returned negative position {}", *newPosition)));
    }
    return static_cast<std::uint64_t>(*newPosition);
}

Error ForeignStreamAdapter::parkHostError(Error error, HostExceptionPtr hostError) {
    ForeignErrorSlot::instance().set(std::move(hostError));
    error.markHostOrigin();
    return error;
}

Error ForeignStreamAdapter::typeMismatch(std::string_view expected, const HostValue& value) {
    std::string message = TypeMismatchError::formatMismatch(expected, value.typeName());
    HostExceptionPtr hostError = runtime_->newTypeError(message);
    return parkHostError(Error{ErrorCode::kTypeMismatch, std::move(message)},
                         std::move(hostError));
}

Error ForeignStreamAdapter::contractViolation(std::string message) {
    HostExceptionPtr hostError = runtime_->newValueError(message);
    return parkHostError(Error{ErrorCode::kIOError, std::move(message)}, std::move(hostError));
}

}  // namespace naf::io
