#pragma once

#include <string>

#include <pybind11/embed.h>
#include <pybind11/pybind11.h>

#include "sandbox/isolated_worker.hpp"

namespace codeact::sandbox {

namespace py = pybind11;

// Starts the process-wide interpreter on first use. It is never finalized.
// All sandbox calls must happen on the thread that holds the GIL.
void EnsureInterpreter();

// Declared first in classes owning py:: members so the interpreter exists
// before those members are constructed.
struct InterpreterHandle {
    InterpreterHandle() { EnsureInterpreter(); }
};

ForkHooks InterpreterForkHooks();

// str(value) as UTF-8. Unencodable code points (lone surrogates) are
// backslash-escaped instead of failing the conversion.
std::string ToUtf8(py::handle value);

struct PythonError {
    std::string message;
    std::string traceback;
};

PythonError DescribeError(py::error_already_set& error);

// Redirects sys.stdout and sys.stderr to in-memory buffers for its lifetime.
class OutputCapture {
public:
    OutputCapture();
    ~OutputCapture();
    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    std::string Text() const;

private:
    py::module_ sys_;
    py::object saved_stdout_;
    py::object saved_stderr_;
    py::object stdout_buffer_;
    py::object stderr_buffer_;
};

}  // namespace codeact::sandbox
