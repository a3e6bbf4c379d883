// =============================================================================
// naf-codec - Host Object Interface
// =============================================================================
// Capability set of a file-like object supplied by an embedding runtime.
//
// A host object is only known to answer two calls:
//   read(n)                -> byte buffer of length <= n (0 = end of stream)
//   seek(offset, whence)   -> new absolute position
// Neither return type is guaranteed, so results come back as HostValue and
// are checked by the caller. Failures raised by the host come back as a
// HostException, an opaque handle on the host's own exception object that
// can be handed back to the runtime later.
//
// Every call on a HostObject must be made while holding the runtime's
// global lock (HostLock). Host objects are not re-entrant without it.
// =============================================================================

#ifndef NAF_IO_HOST_OBJECT_H
#define NAF_IO_HOST_OBJECT_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace naf::io {

// =============================================================================
// HostValue
// =============================================================================

/// @brief Value returned by a host call, classified by type.
class HostValue {
public:
    /// @brief A byte buffer.
    [[nodiscard]] static HostValue bytes(std::vector<std::uint8_t> data) {
        return HostValue(std::move(data), "bytes");
    }

    /// @brief An integer.
    [[nodiscard]] static HostValue integer(std::int64_t value) {
        return HostValue(value, "int");
    }

    /// @brief Any other value, known only by its type name.
    [[nodiscard]] static HostValue other(std::string typeName) {
        return HostValue(std::monostate{}, std::move(typeName));
    }

    [[nodiscard]] bool isBytes() const noexcept {
        return std::holds_alternative<std::vector<std::uint8_t>>(value_);
    }

    [[nodiscard]] bool isInteger() const noexcept {
        return std::holds_alternative<std::int64_t>(value_);
    }

    /// @brief Byte content. Empty unless isBytes().
    [[nodiscard]] std::span<const std::uint8_t> asBytes() const noexcept {
        if (const auto* data = std::get_if<std::vector<std::uint8_t>>(&value_)) {
            return *data;
        }
        return {};
    }

    /// @brief Integer content, std::nullopt unless isInteger().
    [[nodiscard]] std::optional<std::int64_t> asInteger() const noexcept {
        if (const auto* value = std::get_if<std::int64_t>(&value_)) {
            return *value;
        }
        return std::nullopt;
    }

    /// @brief Host-side type name of the value.
    [[nodiscard]] const std::string& typeName() const noexcept { return typeName_; }

private:
    using Storage = std::variant<std::monostate, std::vector<std::uint8_t>, std::int64_t>;

    HostValue(Storage value, std::string typeName)
        : value_(std::move(value)), typeName_(std::move(typeName)) {}

    Storage value_;
    std::string typeName_;
};

// =============================================================================
// HostException
// =============================================================================

/// @brief Handle on an exception object raised by the host runtime.
class HostException {
public:
    virtual ~HostException() = default;

    /// @brief Host-side type name of the exception (e.g. "FileNotFoundError").
    [[nodiscard]] virtual std::string typeName() const = 0;

    /// @brief Exception message as rendered by the host.
    [[nodiscard]] virtual std::string message() const = 0;

    /// @brief OS error number carried by the exception, if the host exposes one.
    [[nodiscard]] virtual std::optional<int> osErrorCode() const = 0;

    /// @brief Hand the exception back to the host runtime's error indicator.
    /// @note The runtime lock must be held. A restored exception is consumed;
    ///       restoring it a second time has no effect.
    virtual void restore() = 0;
};

using HostExceptionPtr = std::shared_ptr<HostException>;

/// @brief Outcome of a host call.
template <typename T>
using HostResult = std::expected<T, HostExceptionPtr>;

// =============================================================================
// HostObject
// =============================================================================

/// @brief A duck-typed file-like object living in the host runtime.
class HostObject {
public:
    virtual ~HostObject() = default;

    /// @brief Call `read(n)` on the object.
    [[nodiscard]] virtual HostResult<HostValue> callRead(std::size_t size) = 0;

    /// @brief Call `seek(offset, whence)` on the object.
    [[nodiscard]] virtual HostResult<HostValue> callSeek(std::int64_t offset, int whence) = 0;

    /// @brief Host-side type name of the object itself.
    [[nodiscard]] virtual std::string typeName() const = 0;
};

// =============================================================================
// HostRuntime
// =============================================================================

/// @brief The embedding runtime: global lock plus exception factory.
class HostRuntime {
public:
    /// @brief Opaque state returned by acquire() and given back to release().
    using LockState = int;

    virtual ~HostRuntime() = default;

    /// @brief Acquire the runtime's global lock. Must be re-entrant.
    [[nodiscard]] virtual LockState acquire() = 0;

    /// @brief Release a lock acquired with acquire().
    virtual void release(LockState state) noexcept = 0;

    /// @brief Create a host TypeError carrying the given message.
    /// @note Called with the lock held.
    [[nodiscard]] virtual HostExceptionPtr newTypeError(std::string_view message) = 0;

    /// @brief Create a host ValueError carrying the given message.
    /// @note Called with the lock held.
    [[nodiscard]] virtual HostExceptionPtr newValueError(std::string_view message) = 0;
};

/// @brief Scoped guard holding the runtime's global lock.
class HostLock {
public:
    explicit HostLock(HostRuntime& runtime) : runtime_(runtime), state_(runtime.acquire()) {}

    ~HostLock() { runtime_.release(state_); }

    HostLock(const HostLock&) = delete;
    HostLock& operator=(const HostLock&) = delete;

private:
    HostRuntime& runtime_;
    HostRuntime::LockState state_;
};

}  // namespace naf::io

#endif  // NAF_IO_HOST_OBJECT_H
