#include "sandbox/sandbox_executor.hpp"

#include <chrono>
#include <set>
#include <utility>
#include <stdexcept>

#include <pybind11/stl.h>

#include "sandbox/isolated_worker.hpp"
#include "utils/logging.hpp"

namespace codeact::sandbox {
namespace {

using codeact::utils::LogLevel;

constexpr const char* kSourceName = "<sandbox>";
constexpr const char* kTruncationMarker = "\n... (output truncated)";

const char* const kSafeBuiltinNames[] = {
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable", "chr",
    "classmethod", "complex", "dict", "dir", "divmod", "enumerate", "filter", "float",
    "format", "frozenset", "getattr", "hasattr", "hash", "hex", "id", "int", "isinstance",
    "issubclass", "iter", "len", "list", "map", "max", "min", "next", "object", "oct", "ord",
    "pow", "print", "property", "range", "repr", "reversed", "round", "set", "setattr",
    "slice", "sorted", "staticmethod", "str", "sum", "super", "tuple", "type", "vars", "zip",
    "__build_class__",
};

const char* const kSafeExceptionNames[] = {
    "BaseException", "Exception", "ArithmeticError", "AssertionError", "AttributeError",
    "EOFError", "FileExistsError", "FileNotFoundError", "ImportError", "IndexError",
    "IsADirectoryError", "KeyError", "LookupError", "ModuleNotFoundError", "NameError",
    "NotImplementedError", "OSError", "OverflowError", "PermissionError", "RecursionError",
    "RuntimeError", "StopIteration", "TimeoutError", "TypeError", "UnicodeDecodeError",
    "UnicodeEncodeError", "UnicodeError", "ValueError", "ZeroDivisionError",
};

// Globals a transferred pickle may reference: plain data types only. Anything
// else would let the worker choose a callable for the host to run.
const std::set<std::pair<std::string, std::string>> kTransferableGlobals = {
    {"builtins", "bool"}, {"builtins", "bytearray"}, {"builtins", "bytes"},
    {"builtins", "complex"}, {"builtins", "dict"}, {"builtins", "float"},
    {"builtins", "frozenset"}, {"builtins", "int"}, {"builtins", "list"},
    {"builtins", "object"}, {"builtins", "range"}, {"builtins", "set"},
    {"builtins", "slice"}, {"builtins", "str"}, {"builtins", "tuple"},
    {"copyreg", "_reconstructor"},
    {"collections", "OrderedDict"}, {"collections", "defaultdict"}, {"collections", "deque"},
    {"datetime", "date"}, {"datetime", "datetime"}, {"datetime", "time"},
    {"datetime", "timedelta"}, {"datetime", "timezone"},
    {"decimal", "Decimal"}, {"fractions", "Fraction"},
};

constexpr const char* kUnpicklerSource = R"(
import io
import pickle

class PolicyUnpickler(pickle.Unpickler):
    def __init__(self, data, resolve):
        super().__init__(io.BytesIO(data))
        self._resolve = resolve

    def find_class(self, module, name):
        if not self._resolve(module, name):
            raise pickle.UnpicklingError(f"global '{module}.{name}' is forbidden")
        return super().find_class(module, name)
)";

py::object CreateUnpicklerType() {
    py::dict scope;
    py::exec(kUnpicklerSource, scope);
    return scope["PolicyUnpickler"];
}

py::dict ShallowCopy(const py::dict& source) {
    return py::dict(source.attr("copy")());
}

py::object OptionalText(const std::optional<std::string>& text) {
    if (!text) {
        return py::none();
    }
    return py::str(*text);
}

std::optional<std::string> TextOrNull(py::handle value) {
    if (value.is_none()) {
        return std::nullopt;
    }
    return ToUtf8(value);
}

}  // namespace

SandboxExecutor::SandboxExecutor(SandboxSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.timeout_seconds <= 0) {
        throw std::invalid_argument("timeout_seconds must be positive");
    }
    if (settings_.max_output_chars <= 0) {
        throw std::invalid_argument("max_output_chars must be positive");
    }
    policy_ = std::make_shared<const CapabilityPolicy>(settings_.policy);
    unpickler_type_ = CreateUnpicklerType();
    globals_ = CreateSafeGlobals();
}

ExecutionResult SandboxExecutor::Execute(const std::string& code) {
    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result = settings_.isolate_in_subprocess ? ExecuteIsolated(code)
                                                             : ExecuteInProcess(code);
    history_.push_back(ExecutionRecord{code, result});

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    codeact::utils::Log(LogLevel::kDebug, "sandbox", "executed",
                        {{"success", result.success ? "true" : "false"},
                         {"isolated", settings_.isolate_in_subprocess ? "true" : "false"},
                         {"ms", std::to_string(elapsed.count())}});
    return result;
}

void SandboxExecutor::Reset() {
    globals_ = CreateSafeGlobals();
    locals_ = py::dict();
    history_.clear();
    for (const auto& [name, fn] : injected_) {
        globals_[py::str(name)] = fn;
    }
}

NamespaceSnapshot SandboxExecutor::GetNamespaceSnapshot() const {
    NamespaceSnapshot snapshot;
    for (const auto& item : globals_) {
        const std::string name = ToUtf8(item.first);
        if (name.rfind("__", 0) == 0) {
            continue;
        }
        snapshot.globals[item.first] = item.second;
    }
    snapshot.locals = ShallowCopy(locals_);
    return snapshot;
}

void SandboxExecutor::SetBinding(const std::string& name, py::object value) {
    globals_[py::str(name)] = std::move(value);
}

py::object SandboxExecutor::GetBinding(const std::string& name, py::object fallback) const {
    py::str key(name);
    if (locals_.contains(key)) {
        return locals_[key];
    }
    if (globals_.contains(key)) {
        return globals_[key];
    }
    return fallback;
}

void SandboxExecutor::InjectCallable(const std::string& name, py::cpp_function fn) {
    globals_[py::str(name)] = fn;
    for (auto& entry : injected_) {
        if (entry.first == name) {
            entry.second = std::move(fn);
            return;
        }
    }
    injected_.emplace_back(name, std::move(fn));
}

ExecutionResult SandboxExecutor::ExecuteInProcess(const std::string& code) {
    ExecutionResult result{};
    py::module_ builtins = py::module_::import("builtins");
    py::object compile = builtins.attr("compile");

    OutputCapture capture;
    try {
        // Syntax check against the statement grammar first.
        py::object compiled = compile(code, kSourceName, "exec");
        bool expression = false;
        try {
            compiled = compile(code, kSourceName, "eval");
            expression = true;
        } catch (py::error_already_set& ex) {
            if (!ex.matches(PyExc_SyntaxError)) {
                throw;
            }
        }

        py::object value = builtins.attr(expression ? "eval" : "exec")(compiled, globals_, locals_);
        if (expression && !value.is_none()) {
            result.value = ToUtf8(py::repr(value));
        }
        result.success = true;
        result.output = TruncateOutput(capture.Text());
    } catch (py::error_already_set& ex) {
        PythonError error = DescribeError(ex);
        result.success = false;
        result.output = TruncateOutput(capture.Text());
        result.error = error.message;
        result.traceback = error.traceback;
    }
    return result;
}

ExecutionResult SandboxExecutor::ExecuteIsolated(const std::string& code) {
    const NamespaceSnapshot baseline{ShallowCopy(globals_), ShallowCopy(locals_)};
    IsolatedWorker worker(InterpreterForkHooks());
    const WorkerOutcome outcome = worker.Run(
        [&]() { return EncodeWorkerMessage(ExecuteInProcess(code), baseline); },
        std::chrono::seconds(settings_.timeout_seconds));

    ExecutionResult result{};
    if (outcome.timed_out) {
        result.timed_out = true;
        result.error = "Execution timed out after " + std::to_string(settings_.timeout_seconds) +
            " seconds";
        return result;
    }
    if (!outcome.completed || outcome.payload.empty()) {
        result.error = "Failed to retrieve execution results";
        result.traceback = outcome.error.empty()
            ? "worker exited with status " + std::to_string(outcome.exit_code)
            : outcome.error;
        codeact::utils::Log(LogLevel::kWarn, "sandbox", "worker delivered no result",
                            {{"exit", std::to_string(outcome.exit_code)}});
        return result;
    }

    try {
        return DecodeWorkerMessage(outcome.payload);
    } catch (py::error_already_set& ex) {
        result.error = "Failed to retrieve execution results";
        result.traceback = DescribeError(ex).traceback;
    } catch (const py::cast_error& ex) {
        result.error = "Failed to retrieve execution results";
        result.traceback = ex.what();
    }
    return result;
}

py::dict SandboxExecutor::CreateSafeBuiltins() const {
    py::module_ builtins = py::module_::import("builtins");
    py::dict safe;
    for (const char* name : kSafeBuiltinNames) {
        safe[name] = builtins.attr(name);
    }
    for (const char* name : kSafeExceptionNames) {
        safe[name] = builtins.attr(name);
    }

    const auto policy = policy_;
    py::object real_import = builtins.attr("__import__");
    safe["__import__"] = py::cpp_function(
        [policy, real_import](const std::string& name,
                              py::object globals,
                              py::object locals,
                              py::object fromlist,
                              int level) -> py::object {
            policy->Enforce(ImportRequest{name, level});
            return real_import(name, globals, locals, fromlist, level);
        },
        py::name("__import__"),
        py::arg("name"),
        py::arg("globals") = py::none(),
        py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(),
        py::arg("level") = 0);

    py::object io_open = py::module_::import("io").attr("open");
    py::object fsdecode = py::module_::import("os").attr("fsdecode");
    safe["open"] = py::cpp_function(
        [policy, io_open, fsdecode](py::object file, py::args args, py::kwargs kwargs) -> py::object {
            std::string mode = "r";
            if (args.size() > 0) {
                mode = args[0].cast<std::string>();
            } else if (kwargs.contains("mode")) {
                mode = kwargs["mode"].cast<std::string>();
            }
            const std::string path = fsdecode(file).cast<std::string>();
            policy->Enforce(OpenFileRequest{path, mode});
            return io_open(file, *args, **kwargs);
        },
        py::name("open"));
    return safe;
}

py::dict SandboxExecutor::CreateSafeGlobals() const {
    py::dict globals;
    globals["__builtins__"] = CreateSafeBuiltins();
    globals["__name__"] = "__main__";
    globals["__doc__"] = py::none();
    return globals;
}

std::string SandboxExecutor::TruncateOutput(const std::string& output) const {
    const auto limit = static_cast<std::size_t>(settings_.max_output_chars);
    std::size_t chars = 0;
    for (std::size_t i = 0; i < output.size(); ++i) {
        // UTF-8 continuation bytes do not start a character.
        if ((static_cast<unsigned char>(output[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (chars == limit) {
            return output.substr(0, i) + kTruncationMarker;
        }
        ++chars;
    }
    return output;
}

std::string SandboxExecutor::EncodeWorkerMessage(const ExecutionResult& result,
                                                 const NamespaceSnapshot& baseline) const {
    py::dict envelope;
    envelope["success"] = result.success;
    envelope["output"] = result.output;
    envelope["value"] = OptionalText(result.value);
    envelope["error"] = OptionalText(result.error);
    envelope["traceback"] = OptionalText(result.traceback);

    std::size_t used = 0;
    py::list dropped;
    envelope["globals"] = EncodeScope(globals_, baseline.globals, used, dropped);
    envelope["locals"] = EncodeScope(locals_, baseline.locals, used, dropped);
    envelope["dropped"] = dropped;

    py::module_ pickle = py::module_::import("pickle");
    return pickle.attr("dumps")(envelope, pickle.attr("HIGHEST_PROTOCOL")).cast<std::string>();
}

py::list SandboxExecutor::EncodeScope(const py::dict& scope,
                                      const py::dict& baseline,
                                      std::size_t& used,
                                      py::list& dropped) const {
    py::module_ pickle = py::module_::import("pickle");
    py::module_ marshal = py::module_::import("marshal");
    py::module_ types = py::module_::import("types");
    py::object loaded_modules = py::module_::import("sys").attr("modules");

    py::list entries;
    for (const auto& item : scope) {
        const std::string name = ToUtf8(item.first);
        if (name == "__builtins__") {
            continue;
        }
        const bool rebound = !baseline.contains(item.first) ||
            baseline[item.first].ptr() != item.second.ptr();
        auto value = py::reinterpret_borrow<py::object>(item.second);

        py::tuple entry;
        std::size_t size = name.size();
        try {
            if (py::isinstance(value, types.attr("ModuleType"))) {
                const std::string module = ToUtf8(value.attr("__name__"));
                if (!loaded_modules.attr("get")(module).is(value)) {
                    // Hand-built module objects have no importable counterpart.
                    if (rebound) {
                        dropped.append(name);
                    }
                    continue;
                }
                size += module.size();
                entry = py::make_tuple(name, "module", module);
            } else if (py::isinstance(value, types.attr("FunctionType")) &&
                       value.attr("__closure__").is_none()) {
                py::object code = marshal.attr("dumps")(value.attr("__code__"));
                py::object defaults = pickle.attr("dumps")(
                    py::make_tuple(value.attr("__defaults__"), value.attr("__kwdefaults__")));
                size += py::len(code) + py::len(defaults);
                entry = py::make_tuple(name, "function",
                                       py::make_tuple(code, value.attr("__name__"), defaults));
            } else {
                py::object data = pickle.attr("dumps")(value, pickle.attr("HIGHEST_PROTOCOL"));
                size += py::len(data);
                entry = py::make_tuple(name, "pickle", data);
            }
        } catch (py::error_already_set&) {
            // Untouched host objects (injected callables) stay in the parent as they are.
            if (rebound) {
                dropped.append(name);
            }
            continue;
        }

        if (used + size > settings_.max_transfer_bytes) {
            dropped.append(name);
            continue;
        }
        used += size;
        entries.append(entry);
    }
    return entries;
}

ExecutionResult SandboxExecutor::DecodeWorkerMessage(const std::string& payload) {
    py::dict envelope = Unpickle(py::bytes(payload), false);

    ExecutionResult result{};
    result.success = envelope["success"].cast<bool>();
    result.output = envelope["output"].cast<std::string>();
    result.value = TextOrNull(envelope["value"]);
    result.error = TextOrNull(envelope["error"]);
    result.traceback = TextOrNull(envelope["traceback"]);
    result.dropped_bindings = envelope["dropped"].cast<std::vector<std::string>>();

    MergeScope(envelope["globals"].cast<py::list>(), globals_, result.dropped_bindings);
    MergeScope(envelope["locals"].cast<py::list>(), locals_, result.dropped_bindings);
    if (!result.dropped_bindings.empty()) {
        codeact::utils::Log(LogLevel::kInfo, "sandbox", "bindings not transferred from worker",
                            {{"names", std::to_string(result.dropped_bindings.size())}});
    }
    return result;
}

void SandboxExecutor::MergeScope(const py::list& entries,
                                 py::dict& scope,
                                 std::vector<std::string>& dropped) {
    for (const auto& item : entries) {
        auto entry = item.cast<py::tuple>();
        const std::string name = entry[0].cast<std::string>();
        const std::string kind = entry[1].cast<std::string>();
        try {
            if (kind == "module") {
                const std::string module = entry[2].cast<std::string>();
                policy_->Enforce(ImportRequest{module});
                scope[py::str(name)] = py::module_::import(module.c_str());
            } else if (kind == "function") {
                auto parts = entry[2].cast<py::tuple>();
                py::object code = py::module_::import("marshal").attr("loads")(parts[0]);
                auto defaults = Unpickle(parts[2], true).cast<py::tuple>();
                py::object fn = py::module_::import("types").attr("FunctionType")(
                    code, globals_, parts[1], defaults[0]);
                if (!defaults[1].is_none()) {
                    fn.attr("__kwdefaults__") = py::object(defaults[1]);
                }
                scope[py::str(name)] = fn;
            } else if (kind == "pickle") {
                scope[py::str(name)] = Unpickle(entry[2], true);
            } else {
                dropped.push_back(name);
            }
        } catch (py::error_already_set& ex) {
            codeact::utils::Log(LogLevel::kWarn, "sandbox", "failed to restore binding",
                                {{"name", name}, {"error", DescribeError(ex).message}});
            dropped.push_back(name);
        } catch (const CapabilityDenied& ex) {
            codeact::utils::Log(LogLevel::kWarn, "sandbox", "failed to restore binding",
                                {{"name", name}, {"error", ex.what()}});
            dropped.push_back(name);
        }
    }
}

py::object SandboxExecutor::Unpickle(py::handle data, bool allow_globals) const {
    py::cpp_function resolve(
        [allow_globals](const std::string& module, const std::string& name) {
            return allow_globals && kTransferableGlobals.count({module, name}) > 0;
        });
    return unpickler_type_(data, resolve).attr("load")();
}

}  // namespace codeact::sandbox
