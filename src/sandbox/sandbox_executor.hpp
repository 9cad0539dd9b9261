#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/capability_policy.hpp"
#include "sandbox/python_runtime.hpp"

namespace codeact::sandbox {

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::optional<std::string> value;
    std::optional<std::string> error;
    std::optional<std::string> traceback;
    bool timed_out = false;
    std::vector<std::string> dropped_bindings;
};

struct ExecutionRecord {
    std::string code;
    ExecutionResult result;
};

struct SandboxSettings {
    PolicyConfig policy;
    int timeout_seconds = 30;
    int max_output_chars = 10000;
    bool isolate_in_subprocess = false;
    std::size_t max_transfer_bytes = 16 * 1024 * 1024;
};

struct NamespaceSnapshot {
    py::dict globals;
    py::dict locals;
};

// Runs Python submissions against a persistent global/local namespace pair
// with capability-scoped builtins. Not thread-safe; use from the GIL thread.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxSettings settings);
    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    ExecutionResult Execute(const std::string& code);
    void Reset();

    NamespaceSnapshot GetNamespaceSnapshot() const;
    void SetBinding(const std::string& name, py::object value);
    py::object GetBinding(const std::string& name, py::object fallback = py::none()) const;

    // Host services stay registered across Reset().
    void InjectCallable(const std::string& name, py::cpp_function fn);
    template <typename Fn>
    void InjectCallable(const std::string& name, Fn&& fn) {
        InjectCallable(name, py::cpp_function(std::forward<Fn>(fn), py::name(name.c_str())));
    }

    std::vector<ExecutionRecord> GetHistory() const { return history_; }
    const SandboxSettings& Settings() const { return settings_; }
    const CapabilityPolicy& Policy() const { return *policy_; }

private:
    InterpreterHandle interpreter_;
    SandboxSettings settings_;
    std::shared_ptr<const CapabilityPolicy> policy_;
    py::dict globals_;
    py::dict locals_;
    std::vector<std::pair<std::string, py::cpp_function>> injected_;
    std::vector<ExecutionRecord> history_;
    py::object unpickler_type_;

    ExecutionResult ExecuteInProcess(const std::string& code);
    ExecutionResult ExecuteIsolated(const std::string& code);
    py::dict CreateSafeBuiltins() const;
    py::dict CreateSafeGlobals() const;
    std::string TruncateOutput(const std::string& output) const;

    // Worker message: the result plus every transferable binding.
    std::string EncodeWorkerMessage(const ExecutionResult& result,
                                    const NamespaceSnapshot& baseline) const;
    ExecutionResult DecodeWorkerMessage(const std::string& payload);
    py::list EncodeScope(const py::dict& scope,
                         const py::dict& baseline,
                         std::size_t& used,
                         py::list& dropped) const;
    void MergeScope(const py::list& entries, py::dict& scope, std::vector<std::string>& dropped);
    py::object Unpickle(py::handle data, bool allow_globals) const;
};

}  // namespace codeact::sandbox
