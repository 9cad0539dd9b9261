#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/sandbox_executor.hpp"

using namespace codeact::sandbox;
namespace fs = std::filesystem;

class SandboxExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnsureInterpreter();
    }

    static SandboxSettings IsolatedSettings() {
        SandboxSettings settings{};
        settings.isolate_in_subprocess = true;
        settings.timeout_seconds = 10;
        return settings;
    }

    static bool Contains(const std::vector<std::string>& names, const std::string& name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    }
};

TEST_F(SandboxExecutorTest, StatePersistsAcrossSubmissions) {
    SandboxExecutor executor(SandboxSettings{});
    const auto assign = executor.Execute("x = 5");
    EXPECT_TRUE(assign.success);
    EXPECT_FALSE(assign.value.has_value());

    const auto read = executor.Execute("x + 1");
    ASSERT_TRUE(read.success);
    ASSERT_TRUE(read.value.has_value());
    EXPECT_EQ(*read.value, "6");
}

TEST_F(SandboxExecutorTest, ResetDiscardsBindings) {
    SandboxExecutor executor(SandboxSettings{});
    ASSERT_TRUE(executor.Execute("x = 5").success);
    executor.Reset();

    const auto result = executor.Execute("x");
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "name 'x' is not defined");
    ASSERT_TRUE(result.traceback.has_value());
    EXPECT_NE(result.traceback->find("NameError"), std::string::npos);
    EXPECT_EQ(executor.GetHistory().size(), 1u);
}

TEST_F(SandboxExecutorTest, ExpressionValueUsesRepr) {
    SandboxExecutor executor(SandboxSettings{});
    EXPECT_EQ(executor.Execute("'hi'").value.value_or(""), "'hi'");
    EXPECT_FALSE(executor.Execute("None").value.has_value());
}

TEST_F(SandboxExecutorTest, CapturesPrintedOutputAndRestoresStreams) {
    SandboxExecutor executor(SandboxSettings{});
    py::object before = py::module_::import("sys").attr("stdout");

    const auto result = executor.Execute("print('hello')\nprint('world')");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.output, "hello\nworld\n");

    py::object after = py::module_::import("sys").attr("stdout");
    EXPECT_TRUE(before.is(after));
}

TEST_F(SandboxExecutorTest, OutputIsTruncatedWithMarker) {
    SandboxSettings settings{};
    settings.max_output_chars = 10;
    SandboxExecutor executor(settings);

    const auto result = executor.Execute("print('abcdefghijklmnop')");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.output, "abcdefghij\n... (output truncated)");
}

TEST_F(SandboxExecutorTest, SyntaxErrorIsReportedAsFailure) {
    SandboxExecutor executor(SandboxSettings{});
    const auto result = executor.Execute("def broken(:\n    pass");
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.traceback.has_value());
    EXPECT_NE(result.traceback->find("SyntaxError"), std::string::npos);
}

TEST_F(SandboxExecutorTest, FailureKeepsEarlierAssignments) {
    SandboxExecutor executor(SandboxSettings{});
    const auto result = executor.Execute("a = 1\nraise ValueError('boom')\nb = 2");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "boom");
    EXPECT_EQ(executor.GetBinding("a").cast<int>(), 1);
    EXPECT_TRUE(executor.GetBinding("b").is_none());
}

TEST_F(SandboxExecutorTest, DeniedImportRaisesImportError) {
    SandboxSettings settings{};
    settings.policy.allowed_imports = std::vector<std::string>{"math"};
    SandboxExecutor executor(settings);

    ASSERT_TRUE(executor.Execute("import math").success);
    EXPECT_EQ(executor.Execute("math.floor(2.5)").value.value_or(""), "2");

    const auto denied = executor.Execute("import os");
    EXPECT_FALSE(denied.success);
    EXPECT_EQ(denied.error.value_or(""), "Import of 'os' is not allowed");
    EXPECT_NE(denied.traceback.value_or("").find("ImportError"), std::string::npos);
}

TEST_F(SandboxExecutorTest, DeniedOpenRaisesPermissionError) {
    SandboxExecutor executor(SandboxSettings{});
    const auto result = executor.Execute("open('/etc/hostname')");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "File operations are not allowed in this environment");
    EXPECT_NE(result.traceback.value_or("").find("PermissionError"), std::string::npos);
}

TEST_F(SandboxExecutorTest, OpenInsideAllowedRootSucceeds) {
    const auto dir = fs::temp_directory_path() / ("codeact-sandbox-open-" + std::to_string(::getpid()));
    fs::create_directories(dir);

    SandboxSettings settings{};
    settings.policy.allowed_roots = std::vector<std::string>{dir.string()};
    settings.policy.allowed_modes = std::vector<std::string>{"r", "w"};
    SandboxExecutor executor(settings);

    const auto file = (dir / "note.txt").string();
    const auto write = executor.Execute("with open('" + file + "', 'w') as f:\n    f.write('saved')");
    ASSERT_TRUE(write.success) << write.error.value_or("");
    const auto read = executor.Execute("open('" + file + "', mode='rb').read()");
    EXPECT_EQ(read.value.value_or(""), "b'saved'");

    const auto append = executor.Execute("open('" + file + "', 'a')");
    EXPECT_FALSE(append.success);
    EXPECT_NE(append.error.value_or("").find("File mode 'a' is not allowed"), std::string::npos);

    fs::remove_all(dir);
}

TEST_F(SandboxExecutorTest, InjectedCallableSurvivesReset) {
    SandboxExecutor executor(SandboxSettings{});
    executor.InjectCallable("host_answer", []() { return 42; });
    EXPECT_EQ(executor.Execute("host_answer()").value.value_or(""), "42");

    executor.Reset();
    EXPECT_EQ(executor.Execute("host_answer() + 1").value.value_or(""), "43");
}

TEST_F(SandboxExecutorTest, LocalsShadowGlobals) {
    SandboxExecutor executor(SandboxSettings{});
    executor.SetBinding("z", py::int_(1));
    EXPECT_EQ(executor.GetBinding("z").cast<int>(), 1);

    ASSERT_TRUE(executor.Execute("z = 2").success);
    EXPECT_EQ(executor.GetBinding("z").cast<int>(), 2);
    EXPECT_EQ(executor.GetBinding("missing", py::int_(7)).cast<int>(), 7);

    const auto snapshot = executor.GetNamespaceSnapshot();
    EXPECT_TRUE(snapshot.globals.contains("z"));
    EXPECT_FALSE(snapshot.globals.contains("__builtins__"));
    EXPECT_TRUE(snapshot.locals.contains("z"));
}

TEST_F(SandboxExecutorTest, HistoryRecordsEverySubmission) {
    SandboxExecutor executor(SandboxSettings{});
    executor.Execute("1 + 1");
    executor.Execute("undefined_name");
    const auto history = executor.GetHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].code, "1 + 1");
    EXPECT_TRUE(history[0].result.success);
    EXPECT_FALSE(history[1].result.success);
}

TEST_F(SandboxExecutorTest, RejectsInvalidSettings) {
    SandboxSettings no_timeout{};
    no_timeout.timeout_seconds = 0;
    EXPECT_THROW(SandboxExecutor executor(no_timeout), std::invalid_argument);

    SandboxSettings no_output{};
    no_output.max_output_chars = 0;
    EXPECT_THROW(SandboxExecutor executor(no_output), std::invalid_argument);

    SandboxSettings relative_root{};
    relative_root.policy.allowed_roots = std::vector<std::string>{"data"};
    EXPECT_THROW(SandboxExecutor executor(relative_root), std::invalid_argument);
}

TEST_F(SandboxExecutorTest, IsolatedExecutionMergesBindings) {
    SandboxExecutor executor(IsolatedSettings());
    const auto assign = executor.Execute("x = 5\ndef square(n):\n    return n * n\nimport math");
    ASSERT_TRUE(assign.success) << assign.error.value_or("");
    EXPECT_TRUE(assign.dropped_bindings.empty());
    EXPECT_EQ(executor.GetBinding("x").cast<int>(), 5);

    EXPECT_EQ(executor.Execute("x + 1").value.value_or(""), "6");
    EXPECT_EQ(executor.Execute("square(4)").value.value_or(""), "16");
    EXPECT_EQ(executor.Execute("math.sqrt(16)").value.value_or(""), "4.0");
}

TEST_F(SandboxExecutorTest, IsolatedFailureStillMergesPartialState) {
    SandboxExecutor executor(IsolatedSettings());
    const auto result = executor.Execute("b = 2\n1 / 0");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "division by zero");
    EXPECT_EQ(executor.GetBinding("b").cast<int>(), 2);
}

TEST_F(SandboxExecutorTest, IsolatedUnpicklableBindingIsReported) {
    SandboxExecutor executor(IsolatedSettings());
    executor.InjectCallable("host_answer", []() { return 1; });

    const auto result = executor.Execute("gen = (i for i in range(3))\nkept = [1, 2]");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_TRUE(Contains(result.dropped_bindings, "gen"));
    EXPECT_FALSE(Contains(result.dropped_bindings, "host_answer"));
    EXPECT_FALSE(Contains(result.dropped_bindings, "kept"));
    EXPECT_EQ(executor.Execute("sum(kept)").value.value_or(""), "3");
    EXPECT_EQ(executor.Execute("host_answer()").value.value_or(""), "1");
}

TEST_F(SandboxExecutorTest, IsolatedTransferBudgetDropsLargeBindings) {
    auto settings = IsolatedSettings();
    settings.max_transfer_bytes = 1024;
    SandboxExecutor executor(settings);

    const auto result = executor.Execute("small = 1\nlarge = 'x' * 100000");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(Contains(result.dropped_bindings, "large"));
    EXPECT_EQ(executor.GetBinding("small").cast<int>(), 1);
    EXPECT_TRUE(executor.GetBinding("large").is_none());
}

TEST_F(SandboxExecutorTest, IsolatedTimeoutReclaimsWorker) {
    auto settings = IsolatedSettings();
    settings.timeout_seconds = 1;
    SandboxExecutor executor(settings);
    ASSERT_TRUE(executor.Execute("before = 1").success);

    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.Execute("after = 1\nwhile True:\n    pass");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error.value_or(""), "Execution timed out after 1 seconds");
    EXPECT_LT(elapsed, std::chrono::seconds(8));

    // The worker has been reaped; no child of this process is left.
    errno = 0;
    EXPECT_EQ(::waitpid(-1, nullptr, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);

    EXPECT_EQ(executor.GetBinding("before").cast<int>(), 1);
    EXPECT_TRUE(executor.GetBinding("after").is_none());
    EXPECT_EQ(executor.Execute("1 + 1").value.value_or(""), "2");
}

TEST_F(SandboxExecutorTest, IsolatedWorkerCannotTouchParentInterpreter) {
    SandboxExecutor executor(IsolatedSettings());
    const auto result = executor.Execute("import sys\nsys.modules['codeact_marker'] = sys");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    py::dict modules = py::module_::import("sys").attr("modules");
    EXPECT_FALSE(modules.contains("codeact_marker"));
}

TEST_F(SandboxExecutorTest, IsolatedBindingsCannotRunHostCallables) {
    SandboxExecutor executor(IsolatedSettings());
    const auto result = executor.Execute(
        "import builtins\n"
        "class Payload:\n"
        "    def __reduce__(self):\n"
        "        return (builtins.exec, ('import sys; sys.codeact_reduced = True',))\n"
        "payload = Payload()\n"
        "plain = [1, 2, 3]");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_TRUE(Contains(result.dropped_bindings, "payload"));
    EXPECT_FALSE(Contains(result.dropped_bindings, "plain"));
    EXPECT_TRUE(executor.GetBinding("payload").is_none());
    EXPECT_FALSE(py::hasattr(py::module_::import("sys"), "codeact_reduced"));
}

TEST_F(SandboxExecutorTest, IsolatedStandardDataTypesTransfer) {
    SandboxExecutor executor(IsolatedSettings());
    const auto result = executor.Execute(
        "from collections import OrderedDict\n"
        "from datetime import date\n"
        "from decimal import Decimal\n"
        "ordered = OrderedDict(a=1)\n"
        "day = date(2024, 1, 31)\n"
        "price = Decimal('1.25')");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_TRUE(result.dropped_bindings.empty());
    EXPECT_EQ(executor.Execute("ordered['a']").value.value_or(""), "1");
    EXPECT_EQ(executor.Execute("day.isoformat()").value.value_or(""), "'2024-01-31'");
    EXPECT_EQ(executor.Execute("str(price * 2)").value.value_or(""), "'2.50'");
}

TEST_F(SandboxExecutorTest, UnencodableOutputIsEscaped) {
    SandboxExecutor executor(SandboxSettings{});
    const auto printed = executor.Execute("print('bad \\ud800 char')");
    ASSERT_TRUE(printed.success);
    EXPECT_EQ(printed.output, "bad \\ud800 char\n");

    const auto raised = executor.Execute("raise ValueError('\\ud800')");
    EXPECT_FALSE(raised.success);
    EXPECT_EQ(raised.error.value_or(""), "\\ud800");
    EXPECT_NE(raised.traceback.value_or("").find("ValueError"), std::string::npos);

    ASSERT_TRUE(executor.Execute(
        "class Odd:\n"
        "    def __repr__(self):\n"
        "        return '\\ud800'").success);
    EXPECT_EQ(executor.Execute("Odd()").value.value_or(""), "\\ud800");
    EXPECT_EQ(executor.GetHistory().size(), 4u);
}

TEST_F(SandboxExecutorTest, IsolatedUnencodableOutputIsEscaped) {
    SandboxExecutor executor(IsolatedSettings());
    const auto result = executor.Execute("print('\\ud800')\nraise ValueError('\\udcff')");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "\\ud800\n");
    EXPECT_EQ(result.error.value_or(""), "\\udcff");
}
