// =============================================================================
// naf-codec - Error Handling Framework Implementation
// =============================================================================

#include "naf/common/error.h"

#include <fmt/format.h>

namespace naf {

// =============================================================================
// NAFException Implementation
// =============================================================================

void NAFException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
}

// =============================================================================
// IOError / TypeMismatchError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string TypeMismatchError::formatMismatch(std::string_view expected, std::string_view found) {
    return fmt::format("expected {}, found {}", expected, found);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kIOError:
            // The message already carries the formatted OS error text.
            if (systemError_) {
                throw IOError::fromFormatted(message_, *systemError_);
            }
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kTypeMismatch:
            throw TypeMismatchError(message_);
        case ErrorCode::kUnsupportedOperation:
            throw UnsupportedOperationError(message_);
        default:
            break;
    }
    throw NAFException(code_, message_);
}

}  // namespace naf
