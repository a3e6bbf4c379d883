// =============================================================================
// naf-codec - Foreign Error Slot
// =============================================================================
// Per-thread slot holding the last exception raised by a host object.
//
// Stream operations report failures to their caller as naf::Error. When the
// failure came from the host, the returned Error is marked hostOrigin() and
// the host's own exception object is parked here as well, so that the
// outermost host-facing caller can re-raise the original exception instead
// of a translated one.
//
// Lifecycle: set() on failure, cleared by take(), restore() or clear().
// A parked exception is only meaningful together with the host-origin Error
// it was parked for; callers raising any other error drop it.
// =============================================================================

#ifndef NAF_IO_FOREIGN_ERROR_H
#define NAF_IO_FOREIGN_ERROR_H

#include "naf/io/host_object.h"

namespace naf::io {

class ForeignErrorSlot {
public:
    /// @brief The calling thread's slot.
    [[nodiscard]] static ForeignErrorSlot& instance();

    ForeignErrorSlot() = default;
    ForeignErrorSlot(const ForeignErrorSlot&) = delete;
    ForeignErrorSlot& operator=(const ForeignErrorSlot&) = delete;

    /// @brief Park a host exception, replacing any undrained one.
    void set(HostExceptionPtr error);

    /// @brief Check whether an exception is waiting to be drained.
    [[nodiscard]] bool pending() const noexcept { return pending_ != nullptr; }

    /// @brief Remove and return the parked exception (nullptr if none).
    [[nodiscard]] HostExceptionPtr take() noexcept;

    /// @brief Drain the slot into the host runtime's error indicator.
    /// @note The runtime lock must be held.
    /// @return true if an exception was restored.
    bool restore();

    /// @brief Drop the parked exception without restoring it.
    void clear();

private:
    HostExceptionPtr pending_;
};

}  // namespace naf::io

#endif  // NAF_IO_FOREIGN_ERROR_H
