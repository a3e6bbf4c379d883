// =============================================================================
// naf-codec - CPython Host Runtime Implementation
// =============================================================================

#include "naf/python/py_host.h"

#include <climits>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "naf/common/logger.h"
#include "naf/io/foreign_error.h"

namespace naf::python {

namespace {

/// @brief str(object) as UTF-8, never raising.
[[nodiscard]] std::string safeStr(PyObject* object) {
    if (object == nullptr) {
        return {};
    }
    PyObject* text = PyObject_Str(object);
    if (text == nullptr) {
        PyErr_Clear();
        return "<unprintable object>";
    }
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text, &size);
    std::string result;
    if (data == nullptr) {
        PyErr_Clear();
        result = "<unprintable object>";
    } else {
        result.assign(data, static_cast<std::size_t>(size));
    }
    Py_DECREF(text);
    return result;
}

/// @brief errno of an OSError instance, when it is set to an int.
[[nodiscard]] std::optional<int> extractErrno(PyObject* type, PyObject* value) {
    if (value == nullptr || !PyErr_GivenExceptionMatches(type, PyExc_OSError)) {
        return std::nullopt;
    }
    PyObject* code = PyObject_GetAttrString(value, "errno");
    if (code == nullptr) {
        PyErr_Clear();
        return std::nullopt;
    }

    std::optional<int> result;
    if (PyLong_Check(code)) {
        const long number = PyLong_AsLong(code);
        if (number == -1 && PyErr_Occurred() != nullptr) {
            PyErr_Clear();
        } else if (number >= INT_MIN && number <= INT_MAX) {
            result = static_cast<int>(number);
        }
    }
    Py_DECREF(code);
    return result;
}

/// @brief Classify the value returned by read() (steals the reference).
/// @note Only bytes are converted; anything else is known by its type name.
[[nodiscard]] io::HostValue readValue(PyObject* result) {
    if (!PyBytes_Check(result)) {
        std::string typeName = pythonTypeName(result);
        Py_DECREF(result);
        return io::HostValue::other(std::move(typeName));
    }

    const auto* data = reinterpret_cast<const std::uint8_t*>(PyBytes_AS_STRING(result));
    std::vector<std::uint8_t> bytes(data, data + PyBytes_GET_SIZE(result));
    Py_DECREF(result);
    return io::HostValue::bytes(std::move(bytes));
}

/// @brief Classify the value returned by seek() (steals the reference).
/// @return An OverflowError for integers outside the 64-bit range.
[[nodiscard]] io::HostResult<io::HostValue> seekValue(PyObject* result) {
    if (!PyLong_Check(result)) {
        std::string typeName = pythonTypeName(result);
        Py_DECREF(result);
        return io::HostValue::other(std::move(typeName));
    }

    const long long number = PyLong_AsLongLong(result);
    Py_DECREF(result);
    if (number == -1 && PyErr_Occurred() != nullptr) {
        return std::unexpected(PyHostException::fetch());
    }
    return io::HostValue::integer(static_cast<std::int64_t>(number));
}

/// @brief Instantiate a built-in exception type with a message.
[[nodiscard]] io::HostExceptionPtr newException(PyObject* type, std::string_view message) {
    PyObject* value =
        PyObject_CallFunction(type, "s#", message.data(), static_cast<Py_ssize_t>(message.size()));
    if (value == nullptr) {
        return PyHostException::fetch();
    }
    Py_INCREF(type);
    return std::make_shared<PyHostException>(type, value, nullptr);
}

}  // namespace

// =============================================================================
// PyRuntime Implementation
// =============================================================================

PyRuntime& PyRuntime::instance() {
    static PyRuntime runtime;
    return runtime;
}

io::HostRuntime::LockState PyRuntime::acquire() {
    return static_cast<LockState>(PyGILState_Ensure());
}

void PyRuntime::release(LockState state) noexcept {
    PyGILState_Release(static_cast<PyGILState_STATE>(state));
}

io::HostExceptionPtr PyRuntime::newTypeError(std::string_view message) {
    return newException(PyExc_TypeError, message);
}

io::HostExceptionPtr PyRuntime::newValueError(std::string_view message) {
    return newException(PyExc_ValueError, message);
}

// =============================================================================
// PyHostException Implementation
// =============================================================================

std::shared_ptr<PyHostException> PyHostException::fetch() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);

    if (type == nullptr) {
        // A call failed without setting an exception.
        type = PyExc_SystemError;
        Py_INCREF(type);
        value = PyUnicode_FromString("error return without exception set");
    }

    PyErr_NormalizeException(&type, &value, &traceback);
    if (traceback != nullptr && value != nullptr) {
        PyException_SetTraceback(value, traceback);
    }
    return std::make_shared<PyHostException>(type, value, traceback);
}

PyHostException::PyHostException(PyObject* type, PyObject* value, PyObject* traceback)
    : type_(type),
      value_(value),
      traceback_(traceback),
      typeName_(value != nullptr ? pythonTypeName(value) : "unknown"),
      message_(safeStr(value)),
      osErrorCode_(extractErrno(type, value)) {}

PyHostException::~PyHostException() {
    if (type_ == nullptr && value_ == nullptr && traceback_ == nullptr) {
        return;
    }
    if (!Py_IsInitialized()) {
        // The interpreter is gone and took the objects with it.
        return;
    }
    io::HostLock lock(PyRuntime::instance());
    Py_XDECREF(type_);
    Py_XDECREF(value_);
    Py_XDECREF(traceback_);
}

void PyHostException::restore() {
    if (type_ == nullptr) {
        return;
    }
    io::HostLock lock(PyRuntime::instance());
    PyErr_Restore(std::exchange(type_, nullptr), std::exchange(value_, nullptr),
                  std::exchange(traceback_, nullptr));
}

// =============================================================================
// PyHostObject Implementation
// =============================================================================

PyHostObject::PyHostObject(PyObject* object) : object_(object) {
    Py_XINCREF(object_);
}

PyHostObject::~PyHostObject() {
    if (object_ == nullptr || !Py_IsInitialized()) {
        return;
    }
    io::HostLock lock(PyRuntime::instance());
    Py_DECREF(object_);
}

io::HostResult<io::HostValue> PyHostObject::callRead(std::size_t size) {
    PyObject* result =
        PyObject_CallMethod(object_, "read", "n", static_cast<Py_ssize_t>(size));
    if (result == nullptr) {
        return std::unexpected(PyHostException::fetch());
    }
    return readValue(result);
}

io::HostResult<io::HostValue> PyHostObject::callSeek(std::int64_t offset, int whence) {
    PyObject* result = PyObject_CallMethod(object_, "seek", "Li",
                                           static_cast<long long>(offset), whence);
    if (result == nullptr) {
        return std::unexpected(PyHostException::fetch());
    }
    return seekValue(result);
}

std::string PyHostObject::typeName() const {
    return pythonTypeName(object_);
}

// =============================================================================
// Entry Points
// =============================================================================

std::string pythonTypeName(PyObject* object) {
    // tp_name holds "module.Name" for static types; keep the last component.
    std::string_view name = Py_TYPE(object)->tp_name;
    if (const auto dot = name.rfind('.'); dot != std::string_view::npos) {
        name.remove_prefix(dot + 1);
    }
    return std::string(name);
}

Result<io::StreamSource> openSource(PyObject* fileOrPath, const io::NativeFile::Options& options) {
    const bool isPath = PyUnicode_Check(fileOrPath) || PyBytes_Check(fileOrPath) ||
                        PyObject_HasAttrString(fileOrPath, "__fspath__");
    if (!isPath) {
        auto object = std::make_shared<PyHostObject>(fileOrPath);
        return io::StreamSource::fromHostObject(std::move(object), PyRuntime::instance());
    }

    PyObject* encoded = nullptr;
    if (PyUnicode_FSConverter(fileOrPath, &encoded) == 0) {
        auto error = PyHostException::fetch();
        std::string message = fmt::format("{}: {}", error->typeName(), error->message());
        io::ForeignErrorSlot::instance().set(std::move(error));
        return makeError<io::StreamSource>(
            Error{ErrorCode::kInvalidArgument, std::move(message)}.markHostOrigin());
    }
    std::string path(PyBytes_AS_STRING(encoded),
                     static_cast<std::size_t>(PyBytes_GET_SIZE(encoded)));
    Py_DECREF(encoded);

    return io::StreamSource::openFile(path, options);
}

PyObject* raisePending(const Error& error) {
    io::ForeignErrorSlot& slot = io::ForeignErrorSlot::instance();
    if (error.hostOrigin()) {
        if (slot.restore()) {
            return nullptr;
        }
    } else {
        // Left over from a host failure the caller handled itself.
        slot.clear();
    }

    switch (error.code()) {
        case ErrorCode::kIOError:
            if (const auto& systemError = error.systemError()) {
                // OSError(errno, strerror) picks the matching subclass,
                // e.g. FileNotFoundError for ENOENT.
                PyObject* args = Py_BuildValue("(is)", systemError->value(),
                                               systemError->message().c_str());
                if (args != nullptr) {
                    PyErr_SetObject(PyExc_OSError, args);
                    Py_DECREF(args);
                }
                return nullptr;
            }
            PyErr_SetString(PyExc_OSError, error.message().c_str());
            return nullptr;
        case ErrorCode::kUnsupportedOperation:
        case ErrorCode::kSeekFailed:
            PyErr_SetString(PyExc_OSError, error.message().c_str());
            return nullptr;
        case ErrorCode::kTypeMismatch:
            PyErr_SetString(PyExc_TypeError, error.message().c_str());
            return nullptr;
        case ErrorCode::kFormatError:
        case ErrorCode::kInvalidArgument:
            PyErr_SetString(PyExc_ValueError, error.message().c_str());
            return nullptr;
        default:
            break;
    }
    NAF_LOG_WARNING("raising unexpected error category: {}", errorCodeToString(error.code()));
    PyErr_SetString(PyExc_RuntimeError, error.message().c_str());
    return nullptr;
}

}  // namespace naf::python
