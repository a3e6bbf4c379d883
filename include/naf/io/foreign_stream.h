// =============================================================================
// naf-codec - Foreign Stream Adapter
// =============================================================================
// Byte stream backed by a host-supplied file-like object.
//
// The adapter checks once, at construction, that the object's read() yields
// bytes (a read(0) probe that consumes nothing). Afterwards every read() and
// seek() forwards to the object under the runtime's global lock and
// translates the outcome:
//
//   read returns bytes (len <= n)  -> number of bytes copied
//   read returns more than n bytes -> kIOError
//   read returns anything else     -> kTypeMismatch
//   read raises                    -> reinterpret(): kIOError with the OS
//                                     error code when the host exposes one
//   seek returns int >= 0          -> new position
//   seek returns int < 0           -> kIOError
//   seek returns anything else     -> kTypeMismatch
//   seek raises                    -> kUnsupportedOperation
//
// Every failure of a host call is host-originated: the returned Error is
// marked hostOrigin() and a host exception is parked in the calling
// thread's ForeignErrorSlot. Raised exceptions are parked as is, type
// mismatches park a host TypeError and contract violations a ValueError.
//
// Usage:
//   auto adapter = ForeignStreamAdapter::fromObject(object, runtime);
//   if (!adapter) { ... }
//   std::array<std::uint8_t, 4096> buffer;
//   auto n = adapter->read(buffer);
// =============================================================================

#ifndef NAF_IO_FOREIGN_STREAM_H
#define NAF_IO_FOREIGN_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "naf/common/error.h"
#include "naf/io/byte_stream.h"
#include "naf/io/host_object.h"

namespace naf::io {

/// @brief Translate a host exception into a native I/O error.
/// @param error Exception raised by the host object.
/// @param fallbackMessage Message used when no OS error code is available.
/// @return kIOError carrying the host's OS error code when it exposes one,
///         a generic kIOError with fallbackMessage otherwise.
[[nodiscard]] Error reinterpret(const HostException& error, std::string_view fallbackMessage);

class ForeignStreamAdapter {
public:
    /// @brief Wrap a host object after probing its read() return type.
    /// @param object The host file-like object.
    /// @param runtime Runtime owning the object. Must outlive the adapter.
    /// @return The adapter, or kTypeMismatch naming the type read(0) returned.
    [[nodiscard]] static Result<ForeignStreamAdapter> fromObject(
        std::shared_ptr<HostObject> object, HostRuntime& runtime);

    ForeignStreamAdapter(const ForeignStreamAdapter&) = delete;
    ForeignStreamAdapter& operator=(const ForeignStreamAdapter&) = delete;
    ForeignStreamAdapter(ForeignStreamAdapter&&) noexcept = default;
    ForeignStreamAdapter& operator=(ForeignStreamAdapter&&) noexcept = default;
    ~ForeignStreamAdapter() = default;

    /// @brief Read up to buffer.size() bytes.
    /// @return Bytes copied to the front of buffer, 0 at end of stream.
    [[nodiscard]] Result<std::size_t> read(std::span<std::uint8_t> buffer);

    /// @brief Move the host object's position.
    /// @return The new absolute position reported by the host.
    [[nodiscard]] Result<std::uint64_t> seek(SeekFrom position);

    /// @brief The wrapped host object.
    [[nodiscard]] const HostObject& object() const noexcept { return *object_; }

private:
    ForeignStreamAdapter(std::shared_ptr<HostObject> object, HostRuntime& runtime) noexcept;

    /// @brief Park hostError in the calling thread's slot and mark error as
    ///        host-originated.
    static Error parkHostError(Error error, HostExceptionPtr hostError);

    /// @brief Report a host value of the wrong type on both error channels.
    /// @note Called with the runtime lock held.
    Error typeMismatch(std::string_view expected, const HostValue& value);

    /// @brief Report a value breaking the read/seek contract (kIOError plus
    ///        a host ValueError).
    /// @note Called with the runtime lock held.
    Error contractViolation(std::string message);

    std::shared_ptr<HostObject> object_;
    HostRuntime* runtime_;
};

static_assert(ByteStream<ForeignStreamAdapter>);

}  // namespace naf::io

#endif  // NAF_IO_FOREIGN_STREAM_H
