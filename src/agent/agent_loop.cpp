#include "agent/agent_loop.hpp"

#include <stdexcept>
#include <utility>

#include "agent/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeact::agent {
namespace {

using codeact::utils::LogLevel;

}  // namespace

AgentLoop::AgentLoop(std::string conversation_id,
                     std::string system_prompt,
                     codeact::providers::LLMProvider& provider,
                     codeact::sandbox::SandboxExecutor& sandbox,
                     AgentSettings settings)
    : conversation_id_(std::move(conversation_id))
    , provider_(provider)
    , sandbox_(sandbox)
    , settings_(std::move(settings))
    , context_(settings_.max_turns) {
    if (conversation_id_.empty()) {
        throw std::invalid_argument("conversation_id must not be empty");
    }
    if (system_prompt.empty()) {
        throw std::invalid_argument("system_prompt must not be empty");
    }
    if (settings_.max_turns <= 0) {
        throw std::invalid_argument("max_turns must be positive");
    }
    workspace_dir_ = WorkspaceDirFor(settings_.workspace_root, conversation_id_);
    history_.push_back(codeact::providers::Message{"system", std::move(system_prompt)});
}

RunResult AgentLoop::Run(const std::string& query) {
    turn_ = 0;
    state_ = LoopState::kAwaitingModel;
    AppendUserTurn(context_.InitialTurn(query, LastWorkingCopy(), turn_));
    codeact::utils::Log(LogLevel::kInfo, "agent", "run started",
                        {{"conversation", conversation_id_},
                         {"query_chars", std::to_string(query.size())}});

    const auto model = settings_.model.empty() ? provider_.GetDefaultModel() : settings_.model;
    RunResult result{};
    while (true) {
        if (turn_ == settings_.max_turns) {
            state_ = LoopState::kAborted;
            break;
        }

        const auto response = provider_.Chat(history_, model, settings_.max_tokens,
                                             settings_.temperature);
        history_.push_back(codeact::providers::Message{"assistant", response.content});
        codeact::utils::Log(LogLevel::kDebug, "agent", "model replied",
                            {{"run", std::to_string(turn_ + 1) + "/" +
                                         std::to_string(settings_.max_turns)},
                             {"chars", std::to_string(response.content.size())}});

        ParsedAction action;
        try {
            action = ParseResponse(response.content);
        } catch (const ResponseFormatError& ex) {
            ++turn_;
            AppendUserTurn(context_.ErrorTurn(ex.what(), LastWorkingCopy(), turn_));
            codeact::utils::Log(LogLevel::kWarn, "agent", "malformed response",
                                {{"error", ex.what()}});
            continue;
        }

        if (action.kind == ActionKind::kAnswer) {
            result.answer = action.AnswerText();
            state_ = LoopState::kTerminal;
            break;
        }

        state_ = LoopState::kDispatching;
        DispatchBatch(action.blocks);
        state_ = LoopState::kAwaitingModel;
    }

    result.status = state_ == LoopState::kTerminal ? RunStatus::kAnswered : RunStatus::kAborted;
    result.turns_used = turn_;
    codeact::utils::Log(LogLevel::kInfo, "agent", "run finished",
                        {{"conversation", conversation_id_},
                         {"status", result.status == RunStatus::kAnswered ? "answered" : "aborted"},
                         {"turns", std::to_string(turn_)}});
    return result;
}

bool AgentLoop::RestoreHistory(std::vector<codeact::providers::Message> turns) {
    if (turns.empty() || turns.front().role != "system") {
        codeact::utils::Log(LogLevel::kWarn, "agent", "ignoring persisted history without system turn",
                            {{"conversation", conversation_id_}});
        return false;
    }
    history_ = std::move(turns);
    return true;
}

std::optional<std::filesystem::path> AgentLoop::LastWorkingCopy() const {
    return LastModifiedFile(workspace_dir_);
}

void AgentLoop::AppendUserTurn(const std::string& content) {
    history_.push_back(codeact::providers::Message{"user", content});
}

void AgentLoop::DispatchBatch(const std::vector<std::string>& blocks) {
    std::string aggregated;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        codeact::utils::Log(LogLevel::kDebug, "agent", "executing code block",
                            {{"block", std::to_string(i + 1)}});
        const auto outcome = sandbox_.Execute(blocks[i]);
        if (!outcome.success) {
            // Remaining blocks of the batch are discarded.
            ++turn_;
            AppendUserTurn(context_.ErrorTurn(ContextBuilder::ExecutionErrorMessage(outcome),
                                              LastWorkingCopy(), turn_));
            codeact::utils::Log(LogLevel::kWarn, "agent", "code block failed",
                                {{"block", std::to_string(i + 1)},
                                 {"error", outcome.error.value_or("")}});
            return;
        }
        aggregated += ContextBuilder::BlockOutput(i + 1, outcome.output);
    }
    ++turn_;
    AppendUserTurn(context_.OutputTurn(codeact::utils::Trim(aggregated), LastWorkingCopy(), turn_));
}

}  // namespace codeact::agent
