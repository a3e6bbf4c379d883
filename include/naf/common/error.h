// =============================================================================
// naf-codec - Error Handling Framework
// =============================================================================
// Byte sources and the header reader report failures through Result<T>, a
// std::expected carrying an Error. An Error keeps the OS error code when one
// was recovered from the host, so callers can tell "file not found" from
// "permission denied" without parsing the message.
//
// The NAFException hierarchy mirrors the ErrorCode categories and is only
// thrown when a caller opts into exceptions through unwrapOrThrow().
// =============================================================================

#ifndef NAF_COMMON_ERROR_H
#define NAF_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace naf {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error categories reported by the library.
enum class ErrorCode : std::uint8_t {
    /// @brief No error.
    kSuccess = 0,

    /// @brief I/O error.
    /// @note Carries an OS error code when one could be recovered.
    kIOError = 1,

    /// @brief Format error in archive data.
    /// @note Bad magic, unknown version, truncated header, etc.
    kFormatError = 2,

    /// @brief A host call returned a value of the wrong type.
    kTypeMismatch = 3,

    /// @brief The byte source does not support the requested operation.
    /// @note Raised when a host object fails to seek.
    kUnsupportedOperation = 4,

    /// @brief The caller passed an unusable argument (e.g. a null host object).
    kInvalidArgument = 5,

    /// @brief Seek operation on a native file failed.
    kSeekFailed = 6,

    /// @brief The source is not in a state that allows the call.
    kInvalidState = 7
};

/// @brief Category name used as the what() prefix.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kTypeMismatch:
            return "type mismatch";
        case ErrorCode::kUnsupportedOperation:
            return "unsupported operation";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kSeekFailed:
            return "seek failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all naf-codec errors.
class NAFException : public std::exception {
public:
    /// @brief Construct with error code and message.
    NAFException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ~NAFException() override = default;

    NAFException(const NAFException&) = default;
    NAFException(NAFException&&) noexcept = default;
    NAFException& operator=(const NAFException&) = default;
    NAFException& operator=(NAFException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Message without the category prefix.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for I/O errors.
/// @note Thrown for file not found, read failures, permission denied, etc.
class IOError : public NAFException {
public:
    explicit IOError(std::string message)
        : NAFException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief The message is suffixed with the OS description of @p ec.
    IOError(std::string message, std::error_code ec)
        : NAFException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief OS error code, if one was recovered.
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

    /// @brief Build the message used for I/O errors carrying an OS code.
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    /// @brief Wrap a message already built by formatWithSystemError().
    [[nodiscard]] static IOError fromFormatted(std::string message, std::error_code ec) {
        return IOError(Formatted{}, std::move(message), ec);
    }

private:
    struct Formatted {};

    IOError(Formatted, std::string message, std::error_code ec)
        : NAFException(ErrorCode::kIOError, std::move(message)), systemError_(ec) {}

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed archive data.
class FormatError : public NAFException {
public:
    explicit FormatError(std::string message)
        : NAFException(ErrorCode::kFormatError, std::move(message)) {}
};

/// @brief Exception for host calls returning a value of the wrong type.
class TypeMismatchError : public NAFException {
public:
    explicit TypeMismatchError(std::string message)
        : NAFException(ErrorCode::kTypeMismatch, std::move(message)) {}

    /// @brief Construct from the expected and observed type names.
    /// @param expected Type the contract requires (e.g. "bytes").
    /// @param found Type actually returned by the host.
    TypeMismatchError(std::string_view expected, std::string_view found)
        : NAFException(ErrorCode::kTypeMismatch, formatMismatch(expected, found)),
          foundType_(found) {}

    /// @brief Observed type name (if available).
    [[nodiscard]] const std::optional<std::string>& foundType() const noexcept {
        return foundType_;
    }

    /// @brief Build the "expected X, found Y" message.
    static std::string formatMismatch(std::string_view expected, std::string_view found);

private:
    std::optional<std::string> foundType_;
};

/// @brief Exception for operations the byte source cannot perform.
class UnsupportedOperationError : public NAFException {
public:
    explicit UnsupportedOperationError(std::string message)
        : NAFException(ErrorCode::kUnsupportedOperation, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Failure value carried by Result.
/// @note An optional OS error code is kept for I/O errors so callers can
///       discriminate "file not found" from "permission denied".
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct an I/O error carrying an OS error code.
    Error(std::string message, std::error_code ec)
        : code_(ErrorCode::kIOError),
          message_(IOError::formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from a NAFException.
    explicit Error(const NAFException& ex) : code_(ex.code()), message_(ex.message()) {}

    /// @brief Construct from an IOError, keeping its system error code.
    explicit Error(const IOError& ex)
        : code_(ex.code()), message_(ex.message()), systemError_(ex.systemError()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief OS error code recovered for this error, if any.
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

    /// @brief Mark the error as raised by a host object.
    /// @note The host's own exception is then parked in the calling thread's
    ///       io::ForeignErrorSlot.
    Error& markHostOrigin() noexcept {
        hostOrigin_ = true;
        return *this;
    }

    /// @brief Check whether the failure originated in a host object.
    [[nodiscard]] bool hostOrigin() const noexcept { return hostOrigin_; }

    /// @brief Throw the NAFException subclass matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<std::error_code> systemError_;
    bool hostOrigin_ = false;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Unwrap a Result, throwing on error.
/// @throws NAFException subclass matching the error category.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace naf

#endif  // NAF_COMMON_ERROR_H
