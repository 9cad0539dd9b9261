#include "agent/context_builder.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "utils/logging.hpp"

namespace codeact::agent {

std::string DefaultSystemPrompt() {
    std::ostringstream oss;
    oss << "# codeact\n\n";
    oss << "You solve tasks by writing Python code that runs in a persistent sandbox.\n\n";
    oss << "## Protocol\n";
    oss << "Every reply must contain exactly one of the following:\n";
    oss << "- One or more <code>...</code> blocks. They run in order and stop at the first error. "
           "Variables persist between turns.\n";
    oss << "- One or more <response>...</response> blocks holding the final answer. "
           "This ends the task.\n";
    oss << "Never mix <code> and <response> in the same reply.\n\n";
    oss << "## Environment\n";
    oss << "Only some modules may be imported and only some directories may be opened. "
           "A denied import raises ImportError and a denied open raises PermissionError.\n";
    oss << "Use print() to observe values; the printed output is sent back to you.\n";
    oss << "workspace_path() returns the directory for files you produce. "
           "last_working_copy() returns the most recently modified file there, or None.\n\n";
    oss << "Each message from the user ends with the last working copy and the current run "
           "number out of the maximum. Finish before the runs are exhausted.\n";
    return oss.str();
}

std::string LoadSystemPrompt(const std::string& path) {
    if (path.empty()) {
        return DefaultSystemPrompt();
    }
    std::ifstream file(path);
    if (!file) {
        codeact::utils::Log(codeact::utils::LogLevel::kWarn, "agent",
                            "system prompt not readable, using built-in prompt", {{"path", path}});
        return DefaultSystemPrompt();
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

ContextBuilder::ContextBuilder(int max_turns)
    : max_turns_(max_turns) {}

std::string ContextBuilder::Decoration(const std::optional<std::filesystem::path>& artifact,
                                       int turn) const {
    std::ostringstream oss;
    oss << "- Last Working Copy: " << (artifact ? artifact->string() : std::string("None")) << "\n";
    oss << "- RUN " << (turn + 1) << "/" << max_turns_;
    return oss.str();
}

std::string ContextBuilder::InitialTurn(const std::string& query,
                                        const std::optional<std::filesystem::path>& artifact,
                                        int turn) const {
    return query + "\n" + Decoration(artifact, turn);
}

std::string ContextBuilder::ErrorTurn(const std::string& message,
                                      const std::optional<std::filesystem::path>& artifact,
                                      int turn) const {
    return "**ERROR**:\n" + message + "\n\n" + Decoration(artifact, turn);
}

std::string ContextBuilder::OutputTurn(const std::string& aggregated_output,
                                       const std::optional<std::filesystem::path>& artifact,
                                       int turn) const {
    return "Below is the output of your code:\n" + aggregated_output + "\n\n" +
        Decoration(artifact, turn);
}

std::string ContextBuilder::ExecutionErrorMessage(const codeact::sandbox::ExecutionResult& result) {
    return "Code Caused the following ERROR:\n" + result.error.value_or("None") +
        "\n\nTraceback:\n" + result.traceback.value_or("None");
}

std::string ContextBuilder::BlockOutput(std::size_t index, const std::string& output) {
    return "Output of Code Block " + std::to_string(index) + ":\n" + output + "\n\n";
}

}  // namespace codeact::agent
