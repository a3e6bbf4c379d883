// =============================================================================
// naf-codec - Foreign Error Slot Implementation
// =============================================================================

#include "naf/io/foreign_error.h"

#include <utility>

#include "naf/common/logger.h"

namespace naf::io {

ForeignErrorSlot& ForeignErrorSlot::instance() {
    // Each host thread raises its own exceptions.
    thread_local ForeignErrorSlot slot;
    return slot;
}

void ForeignErrorSlot::set(HostExceptionPtr error) {
    HostExceptionPtr previous = std::exchange(pending_, std::move(error));
    if (previous) {
        NAF_LOG_DEBUG("dropping undrained host exception: {}", previous->typeName());
    }
}

HostExceptionPtr ForeignErrorSlot::take() noexcept {
    return std::exchange(pending_, nullptr);
}

bool ForeignErrorSlot::restore() {
    HostExceptionPtr error = take();
    if (!error) {
        return false;
    }
    error->restore();
    return true;
}

void ForeignErrorSlot::clear() {
    if (HostExceptionPtr dropped = take()) {
        NAF_LOG_DEBUG("dropping stale host exception: {}", dropped->typeName());
    }
}

}  // namespace naf::io
