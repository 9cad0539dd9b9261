#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "sandbox/sandbox_executor.hpp"

namespace codeact::agent {

// Built-in prompt describing the <code>/<response> protocol.
std::string DefaultSystemPrompt();

// Reads the prompt file, falling back to DefaultSystemPrompt() when the path
// is empty or unreadable.
std::string LoadSystemPrompt(const std::string& path);

// Renders every user turn the agent loop appends. All of them end with the
// same two decoration lines.
class ContextBuilder {
public:
    explicit ContextBuilder(int max_turns);

    std::string Decoration(const std::optional<std::filesystem::path>& artifact, int turn) const;

    std::string InitialTurn(const std::string& query,
                            const std::optional<std::filesystem::path>& artifact,
                            int turn) const;
    std::string ErrorTurn(const std::string& message,
                          const std::optional<std::filesystem::path>& artifact,
                          int turn) const;
    std::string OutputTurn(const std::string& aggregated_output,
                           const std::optional<std::filesystem::path>& artifact,
                           int turn) const;

    static std::string ExecutionErrorMessage(const codeact::sandbox::ExecutionResult& result);
    static std::string BlockOutput(std::size_t index, const std::string& output);

private:
    int max_turns_;
};

}  // namespace codeact::agent
