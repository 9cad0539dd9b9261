#include "sandbox/python_runtime.hpp"

#include <mutex>

#include "sandbox/capability_policy.hpp"
#include "utils/logging.hpp"

namespace codeact::sandbox {
namespace {

using codeact::utils::LogLevel;

void TranslateCapabilityDenied(std::exception_ptr pending) {
    try {
        if (pending) {
            std::rethrow_exception(pending);
        }
    } catch (const CapabilityDenied& denied) {
        PyErr_SetString(denied.Kind() == CapabilityKind::kImport ? PyExc_ImportError
                                                                 : PyExc_PermissionError,
                        denied.what());
    }
}

}  // namespace

void EnsureInterpreter() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!Py_IsInitialized()) {
            py::initialize_interpreter();
            codeact::utils::Log(LogLevel::kDebug, "sandbox", "python interpreter started",
                                {{"version", Py_GetVersion()}});
        }
        py::register_exception_translator(&TranslateCapabilityDenied);
    });
}

ForkHooks InterpreterForkHooks() {
    ForkHooks hooks{};
    hooks.before_fork = [] { PyOS_BeforeFork(); };
    hooks.after_fork_parent = [] { PyOS_AfterFork_Parent(); };
    hooks.after_fork_child = [] { PyOS_AfterFork_Child(); };
    return hooks;
}

std::string ToUtf8(py::handle value) {
    py::bytes encoded = py::str(value).attr("encode")("utf-8", "backslashreplace");
    return static_cast<std::string>(encoded);
}

PythonError DescribeError(py::error_already_set& error) {
    PythonError described{};
    try {
        described.message = ToUtf8(error.value());
        py::object lines = py::module_::import("traceback")
                               .attr("format_exception")(error.type(), error.value(), error.trace());
        described.traceback = ToUtf8(py::str("").attr("join")(lines));
    } catch (const py::error_already_set& nested) {
        described.message = error.what();
        described.traceback = std::string("traceback unavailable: ") + nested.what();
    }
    return described;
}

OutputCapture::OutputCapture()
    : sys_(py::module_::import("sys"))
    , saved_stdout_(sys_.attr("stdout"))
    , saved_stderr_(sys_.attr("stderr")) {
    py::object string_io = py::module_::import("io").attr("StringIO");
    stdout_buffer_ = string_io();
    stderr_buffer_ = string_io();
    sys_.attr("stdout") = stdout_buffer_;
    sys_.attr("stderr") = stderr_buffer_;
}

OutputCapture::~OutputCapture() {
    try {
        sys_.attr("stdout") = saved_stdout_;
        sys_.attr("stderr") = saved_stderr_;
    } catch (const py::error_already_set& ex) {
        codeact::utils::Log(LogLevel::kError, "sandbox", "failed to restore standard streams",
                            {{"error", ex.what()}});
    }
}

std::string OutputCapture::Text() const {
    return ToUtf8(stdout_buffer_.attr("getvalue")()) + ToUtf8(stderr_buffer_.attr("getvalue")());
}

}  // namespace codeact::sandbox
