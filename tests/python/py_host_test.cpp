// =============================================================================
// naf-codec - CPython Host Tests
// =============================================================================
// Runs the foreign stream adapter against real Python file objects inside an
// embedded interpreter. The interpreter is started once for the whole binary
// by a GoogleTest environment.
// =============================================================================

#include "naf/python/py_host.h"

#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <utility>

#include "naf/format/header_reader.h"
#include "naf/io/foreign_error.h"

namespace naf::python {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

class PythonEnvironment : public ::testing::Environment {
public:
    void SetUp() override { Py_Initialize(); }

    void TearDown() override {
        // Parked exceptions hold Python references.
        io::ForeignErrorSlot::instance().clear();
        Py_FinalizeEx();
    }
};

/// @brief Owned Python reference.
class PyRef {
public:
    explicit PyRef(PyObject* object = nullptr) noexcept : object_(object) {}

    ~PyRef() { Py_XDECREF(object_); }

    PyRef(PyRef&& other) noexcept : object_(std::exchange(other.object_, nullptr)) {}

    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;
    PyRef& operator=(PyRef&&) = delete;

    [[nodiscard]] PyObject* get() const noexcept { return object_; }

    explicit operator bool() const noexcept { return object_ != nullptr; }

private:
    PyObject* object_;
};

/// @brief Evaluate a Python expression in a namespace with `io` imported
///        and a few test classes defined.
[[nodiscard]] PyRef evaluate(const char* expression) {
    static PyObject* globals = [] {
        PyObject* dict = PyDict_New();
        PyDict_SetItemString(dict, "__builtins__", PyEval_GetBuiltins());
        PyRef result(PyRun_String(R"(
import io, errno

class TextReader:
    def read(self, n):
        return "ACGT"[:n]

class MissingFile:
    def read(self, n):
        raise FileNotFoundError(errno.ENOENT, "No such file or directory")

class BrokenReader:
    def __init__(self):
        self.calls = 0
    def read(self, n):
        self.calls += 1
        if self.calls > 1:
            raise ValueError("stream exploded")
        return b""

class NoSeek:
    def read(self, n):
        return b""
    def seek(self, offset, whence=0):
        raise io.UnsupportedOperation("seek")

class StringSeek(io.BytesIO):
    def seek(self, offset, whence=0):
        return "zero"

class HugeIntReader:
    def read(self, n):
        return 2 ** 80

class Overflowing:
    def read(self, n):
        return b"ACGT" * (n + 1) if n else b""

class VanishingFile:
    def __init__(self):
        self.calls = 0
    def read(self, n):
        self.calls += 1
        if self.calls == 2:
            raise FileNotFoundError(errno.ENOENT, "No such file or directory")
        return b""
)",
                                  Py_file_input, dict, dict));
        if (!result) {
            PyErr_Print();
        }
        return dict;
    }();

    PyRef value(PyRun_String(expression, Py_eval_input, globals, globals));
    if (!value) {
        PyErr_Print();
    }
    return value;
}

[[nodiscard]] Result<io::StreamSource> sourceFor(const char* expression) {
    PyRef object = evaluate(expression);
    EXPECT_NE(object.get(), nullptr);
    return openSource(object.get());
}

class PyHostTest : public ::testing::Test {
protected:
    void SetUp() override {
        io::ForeignErrorSlot::instance().clear();
        PyErr_Clear();
    }

    void TearDown() override {
        io::ForeignErrorSlot::instance().clear();
        PyErr_Clear();
    }
};

// =============================================================================
// Adapter Over Python Objects
// =============================================================================

TEST_F(PyHostTest, ReadsBytesIO) {
    auto source = sourceFor("io.BytesIO(b'ACGTNNNN')");
    ASSERT_TRUE(source.has_value()) << source.error().message();
    EXPECT_TRUE(source->isForeign());

    std::array<std::uint8_t, 4> buffer{};
    ASSERT_EQ(source->read(buffer).value(), 4u);
    EXPECT_EQ(std::string(buffer.begin(), buffer.end()), "ACGT");

    EXPECT_EQ(source->seek(io::SeekFrom::end(-1)).value(), 7u);
    ASSERT_EQ(source->read(buffer).value(), 1u);
    EXPECT_EQ(buffer[0], 'N');
    EXPECT_EQ(source->read(buffer).value(), 0u);
}

TEST_F(PyHostTest, TextReaderIsTypeMismatch) {
    auto source = sourceFor("TextReader()");

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code(), ErrorCode::kTypeMismatch);
    EXPECT_EQ(source.error().message(), "expected bytes, found str");

    EXPECT_EQ(raisePending(source.error()), nullptr);
    ASSERT_NE(PyErr_Occurred(), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_TypeError));
}

TEST_F(PyHostTest, OsErrorIsReinterpretedAndReraised) {
    auto source = sourceFor("MissingFile()");

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code(), ErrorCode::kIOError);
    ASSERT_TRUE(source.error().systemError().has_value());
    EXPECT_EQ(source.error().systemError()->value(), ENOENT);

    auto pending = io::ForeignErrorSlot::instance().take();
    ASSERT_NE(pending, nullptr);
    EXPECT_EQ(pending->typeName(), "FileNotFoundError");
    EXPECT_EQ(pending->osErrorCode(), ENOENT);

    // The original exception object survives the round trip.
    pending->restore();
    ASSERT_NE(PyErr_Occurred(), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_FileNotFoundError));
}

TEST_F(PyHostTest, OpaqueFailureRestoresOriginalException) {
    PyRef object = evaluate("BrokenReader()");
    ASSERT_NE(object.get(), nullptr);
    auto source = openSource(object.get());
    ASSERT_TRUE(source.has_value());

    std::array<std::uint8_t, 4> buffer{};
    auto count = source->read(buffer);

    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code(), ErrorCode::kIOError);
    EXPECT_FALSE(count.error().systemError().has_value());

    EXPECT_EQ(raisePending(count.error()), nullptr);
    ASSERT_NE(PyErr_Occurred(), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_ValueError));
    EXPECT_FALSE(io::ForeignErrorSlot::instance().pending());
}

TEST_F(PyHostTest, LargeIntegerFromReadIsTypeMismatch) {
    auto source = sourceFor("HugeIntReader()");

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code(), ErrorCode::kTypeMismatch);
    EXPECT_EQ(source.error().message(), "expected bytes, found int");
    EXPECT_EQ(PyErr_Occurred(), nullptr);
}

TEST_F(PyHostTest, OversizedReadRaisesValueError) {
    auto source = sourceFor("Overflowing()");
    ASSERT_TRUE(source.has_value());

    std::array<std::uint8_t, 4> buffer{};
    auto count = source->read(buffer);

    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code(), ErrorCode::kIOError);
    EXPECT_EQ(raisePending(count.error()), nullptr);
    ASSERT_NE(PyErr_Occurred(), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_ValueError));
}

TEST_F(PyHostTest, HandledHostErrorDoesNotLeakIntoLaterErrors) {
    auto failing = sourceFor("VanishingFile()");
    ASSERT_TRUE(failing.has_value());

    std::array<std::uint8_t, 4> buffer{};
    auto count = failing->read(buffer);
    ASSERT_FALSE(count.has_value());
    ASSERT_TRUE(count.error().hostOrigin());
    // The caller recovers from the failure and keeps going.
    ASSERT_TRUE(failing->read(buffer).has_value());

    auto badMagic = sourceFor("io.BytesIO(bytes([0x00, 0xF9, 0xEC, 0x02]))");
    ASSERT_TRUE(badMagic.has_value());
    auto header = format::readHeader(*badMagic);
    ASSERT_FALSE(header.has_value());
    ASSERT_EQ(header.error().code(), ErrorCode::kFormatError);

    EXPECT_EQ(raisePending(header.error()), nullptr);
    ASSERT_NE(PyErr_Occurred(), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_ValueError));
    EXPECT_FALSE(PyErr_ExceptionMatches(PyExc_FileNotFoundError));
    EXPECT_FALSE(io::ForeignErrorSlot::instance().pending());
}

TEST_F(PyHostTest, SeekFailureIsUnsupported) {
    auto source = sourceFor("NoSeek()");
    ASSERT_TRUE(source.has_value());

    auto position = source->seek(io::SeekFrom::start(0));

    ASSERT_FALSE(position.has_value());
    EXPECT_EQ(position.error().code(), ErrorCode::kUnsupportedOperation);
    EXPECT_EQ(position.error().message(), "UnsupportedOperation: seek");
    EXPECT_TRUE(io::ForeignErrorSlot::instance().pending());
}

TEST_F(PyHostTest, NonIntegerSeekIsTypeMismatch) {
    auto source = sourceFor("StringSeek(b'ACGT')");
    ASSERT_TRUE(source.has_value());

    auto position = source->seek(io::SeekFrom::start(0));

    ASSERT_FALSE(position.has_value());
    EXPECT_EQ(position.error().code(), ErrorCode::kTypeMismatch);
    EXPECT_EQ(position.error().message(), "expected int, found str");
}

TEST_F(PyHostTest, ReadsHeaderFromBytesIO) {
    // Version 2, RNA, sequences only, line length 60, 3 sequences.
    auto source =
        sourceFor("io.BytesIO(bytes([0x01, 0xF9, 0xEC, 0x02, 0x01, 0x02, 0x20, 0x3C, 0x03]))");
    ASSERT_TRUE(source.has_value());

    auto header = format::readHeader(*source);

    ASSERT_TRUE(header.has_value()) << header.error().message();
    EXPECT_EQ(header->sequenceType(), format::SequenceType::kRna);
    EXPECT_EQ(header->numberOfSequences(), 3u);
}

// =============================================================================
// Path Dispatch
// =============================================================================

TEST_F(PyHostTest, PathOpensNativeFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("naf_py_host_test_" + std::to_string(std::random_device{}()) + ".bin");
    {
        std::ofstream out(path, std::ios::binary);
        out << "ACGT";
    }

    PyRef pathObject(PyUnicode_DecodeFSDefault(path.c_str()));
    ASSERT_NE(pathObject.get(), nullptr);
    auto source = openSource(pathObject.get());

    ASSERT_TRUE(source.has_value()) << source.error().message();
    EXPECT_FALSE(source->isForeign());
    std::array<std::uint8_t, 8> buffer{};
    EXPECT_EQ(source->read(buffer).value(), 4u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_F(PyHostTest, MissingPathRaisesFileNotFoundError) {
    PyRef pathObject(PyUnicode_FromString("/nonexistent/naf/archive.naf"));
    auto source = openSource(pathObject.get());

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code(), ErrorCode::kIOError);

    EXPECT_EQ(raisePending(source.error()), nullptr);
    ASSERT_NE(PyErr_Occurred(), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_FileNotFoundError));
}

TEST_F(PyHostTest, RaisePendingMapsCategories) {
    EXPECT_EQ(raisePending(Error(ErrorCode::kFormatError, "invalid magic bytes")), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_ValueError));
    PyErr_Clear();

    EXPECT_EQ(raisePending(Error(ErrorCode::kUnsupportedOperation, "seek")), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_OSError));
    PyErr_Clear();

    EXPECT_EQ(raisePending(Error(ErrorCode::kInvalidState, "closed")), nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_RuntimeError));
}

TEST_F(PyHostTest, TypeNames) {
    PyRef bytesIO = evaluate("io.BytesIO()");
    PyRef text = evaluate("'x'");
    ASSERT_NE(bytesIO.get(), nullptr);
    ASSERT_NE(text.get(), nullptr);

    EXPECT_EQ(pythonTypeName(bytesIO.get()), "BytesIO");
    EXPECT_EQ(pythonTypeName(text.get()), "str");
}

}  // namespace
}  // namespace naf::python

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new naf::python::PythonEnvironment());
    return RUN_ALL_TESTS();
}
