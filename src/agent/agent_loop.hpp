#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "agent/context_builder.hpp"
#include "agent/response_parser.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codeact::agent {

enum class LoopState {
    kAwaitingModel,
    kDispatching,
    kTerminal,
    kAborted
};

enum class RunStatus {
    kAnswered,
    kAborted
};

struct RunResult {
    RunStatus status = RunStatus::kAborted;
    std::string answer;
    int turns_used = 0;
};

struct AgentSettings {
    std::string model;
    int max_turns = 10;
    int max_tokens = 8192;
    double temperature = 0.7;
    std::filesystem::path workspace_root;
};

// Drives one conversation: asks the model for the next action, runs code
// blocks in the sandbox and folds the outcome back into the history until an
// answer arrives or the turn budget is spent. ProviderError propagates.
class AgentLoop {
public:
    AgentLoop(std::string conversation_id,
              std::string system_prompt,
              codeact::providers::LLMProvider& provider,
              codeact::sandbox::SandboxExecutor& sandbox,
              AgentSettings settings);

    RunResult Run(const std::string& query);

    // Resumes a persisted conversation. Rejected unless it starts with the
    // system turn.
    bool RestoreHistory(std::vector<codeact::providers::Message> turns);

    const std::vector<codeact::providers::Message>& History() const { return history_; }
    LoopState State() const { return state_; }
    int Turn() const { return turn_; }
    const std::string& ConversationId() const { return conversation_id_; }
    const std::filesystem::path& WorkspaceDir() const { return workspace_dir_; }

private:
    std::string conversation_id_;
    codeact::providers::LLMProvider& provider_;
    codeact::sandbox::SandboxExecutor& sandbox_;
    AgentSettings settings_;
    ContextBuilder context_;
    std::filesystem::path workspace_dir_;
    std::vector<codeact::providers::Message> history_;
    LoopState state_ = LoopState::kAwaitingModel;
    int turn_ = 0;

    std::optional<std::filesystem::path> LastWorkingCopy() const;
    void AppendUserTurn(const std::string& content);
    void DispatchBatch(const std::vector<std::string>& blocks);
};

}  // namespace codeact::agent
