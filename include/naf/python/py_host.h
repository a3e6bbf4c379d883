// =============================================================================
// naf-codec - CPython Host Runtime
// =============================================================================
// Implementation of the host interface for Python file-like objects.
//
// This module provides:
// - PyRuntime: the GIL as the runtime's global lock
// - PyHostException: a fetched Python exception (type, value, traceback)
// - PyHostObject: strong reference to a Python object with read()/seek()
// - openSource(): path-or-file dispatch used by the Python entry points
// - raisePending(): sets the Python error indicator for a failed call
//
// Unless stated otherwise, functions here must be called with the GIL held,
// which is always the case when called from a Python extension function.
// =============================================================================

#ifndef NAF_PYTHON_PY_HOST_H
#define NAF_PYTHON_PY_HOST_H

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "naf/common/error.h"
#include "naf/io/host_object.h"
#include "naf/io/stream_source.h"

namespace naf::python {

// =============================================================================
// PyRuntime
// =============================================================================

/// @brief The CPython interpreter seen as a host runtime.
class PyRuntime final : public io::HostRuntime {
public:
    /// @brief The runtime of the current interpreter.
    [[nodiscard]] static PyRuntime& instance();

    /// @brief PyGILState_Ensure(); safe whether or not the GIL is held.
    [[nodiscard]] LockState acquire() override;

    /// @brief PyGILState_Release() with the state returned by acquire().
    void release(LockState state) noexcept override;

    /// @brief Create a TypeError instance carrying the message.
    [[nodiscard]] io::HostExceptionPtr newTypeError(std::string_view message) override;

    /// @brief Create a ValueError instance carrying the message.
    [[nodiscard]] io::HostExceptionPtr newValueError(std::string_view message) override;
};

// =============================================================================
// PyHostException
// =============================================================================

/// @brief A Python exception taken out of the interpreter's error indicator.
class PyHostException final : public io::HostException {
public:
    /// @brief Take the currently raised exception, clearing the indicator.
    [[nodiscard]] static std::shared_ptr<PyHostException> fetch();

    /// @brief Take ownership of a normalized exception triple (steals references).
    PyHostException(PyObject* type, PyObject* value, PyObject* traceback);

    ~PyHostException() override;

    PyHostException(const PyHostException&) = delete;
    PyHostException& operator=(const PyHostException&) = delete;

    [[nodiscard]] std::string typeName() const override { return typeName_; }

    [[nodiscard]] std::string message() const override { return message_; }

    /// @brief `errno` of an OSError instance, when it is an integer.
    [[nodiscard]] std::optional<int> osErrorCode() const override { return osErrorCode_; }

    /// @brief PyErr_Restore() the exception; later calls do nothing.
    void restore() override;

    /// @brief The exception instance (borrowed), nullptr once restored.
    [[nodiscard]] PyObject* value() const noexcept { return value_; }

private:
    PyObject* type_;
    PyObject* value_;
    PyObject* traceback_;
    std::string typeName_;
    std::string message_;
    std::optional<int> osErrorCode_;
};

// =============================================================================
// PyHostObject
// =============================================================================

/// @brief A Python file-like object.
class PyHostObject final : public io::HostObject {
public:
    /// @brief Take a new strong reference to the object.
    explicit PyHostObject(PyObject* object);

    /// @brief Drop the reference, acquiring the GIL if needed.
    ~PyHostObject() override;

    PyHostObject(const PyHostObject&) = delete;
    PyHostObject& operator=(const PyHostObject&) = delete;

    [[nodiscard]] io::HostResult<io::HostValue> callRead(std::size_t size) override;

    [[nodiscard]] io::HostResult<io::HostValue> callSeek(std::int64_t offset,
                                                        int whence) override;

    [[nodiscard]] std::string typeName() const override;

    /// @brief The wrapped object (borrowed reference).
    [[nodiscard]] PyObject* get() const noexcept { return object_; }

private:
    PyObject* object_;
};

// =============================================================================
// Entry Points
// =============================================================================

/// @brief Short type name of a Python object, as `type(obj).__name__`.
[[nodiscard]] std::string pythonTypeName(PyObject* object);

/// @brief Open a byte source from a Python argument.
/// @param fileOrPath `str`, `bytes` or `os.PathLike` to open a native file;
///                   any other object is wrapped as a file-like object.
[[nodiscard]] Result<io::StreamSource> openSource(PyObject* fileOrPath,
                                                  const io::NativeFile::Options& options = {});

/// @brief Raise a failed call into Python.
/// @note For a host-originated error the original exception parked in the
///       thread's foreign error slot is restored as is. Otherwise a Python
///       exception is built from error and any stale parked exception is
///       dropped.
/// @return Always nullptr, for `return raisePending(error);`.
PyObject* raisePending(const Error& error);

}  // namespace naf::python

#endif  // NAF_PYTHON_PY_HOST_H
