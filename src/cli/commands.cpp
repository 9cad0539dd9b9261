#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "agent/agent_loop.hpp"
#include "agent/context_builder.hpp"
#include "agent/workspace.hpp"
#include "cli/sandbox_settings.hpp"
#include "config/config_loader.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "session/conversation_store.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/uuid.hpp"

namespace {

using codeact::utils::LogLevel;
namespace py = pybind11;

struct CliOptions {
    std::string conversation_id;
    bool isolate = false;
    std::optional<int> max_turns;
};

void PrintUsage() {
    std::cout << "Usage: codeact_cli [--conversation <id>] [--isolate] [--max-turns N]" << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--conversation" && i + 1 < argc) {
            options.conversation_id = argv[++i];
        } else if (arg == "--isolate") {
            options.isolate = true;
        } else if (arg == "--max-turns" && i + 1 < argc) {
            try {
                options.max_turns = std::stoi(argv[++i]);
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }
    }
    return options;
}

std::string ReadQuery() {
    std::cout << "[+] Enter your query (paste and press Ctrl+D): " << std::endl;
    std::cin.clear();
    std::string content{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    return codeact::utils::Trim(content);
}

void InjectHostServices(codeact::sandbox::SandboxExecutor& sandbox,
                        const std::filesystem::path& workspace_dir) {
    sandbox.InjectCallable("workspace_path", [workspace_dir]() {
        return std::filesystem::absolute(workspace_dir).string();
    });
    sandbox.InjectCallable("last_working_copy", [workspace_dir]() -> py::object {
        const auto latest = codeact::agent::LastModifiedFile(workspace_dir);
        if (!latest) {
            return py::none();
        }
        return py::str(latest->string());
    });
}

void SaveHistory(codeact::session::ConversationStore* store,
                 const codeact::agent::AgentLoop& agent,
                 const std::string& model) {
    if (!store) {
        return;
    }
    if (!store->Save(agent.ConversationId(), agent.History(), {{"model", model}})) {
        codeact::utils::Log(LogLevel::kWarn, "cli", "conversation not persisted",
                            {{"conversation", agent.ConversationId()}});
    }
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }

    auto config = codeact::config::LoadConfig();
    codeact::utils::SetLogLevel(codeact::utils::ParseLogLevel(config.log.level, LogLevel::kInfo));
    if (options->max_turns) {
        config.agent.max_turns = *options->max_turns;
    }

    const std::string conversation_id = options->conversation_id.empty()
        ? codeact::utils::GenerateUuidV4()
        : options->conversation_id;
    const std::filesystem::path workspace_root = config.agent.workspace;

    auto provider = codeact::providers::CreateProvider(config);
    std::unique_ptr<codeact::sandbox::SandboxExecutor> sandbox;
    std::unique_ptr<codeact::agent::AgentLoop> agent;
    try {
        const auto workspace_dir = codeact::agent::EnsureWorkspace(workspace_root, conversation_id);
        sandbox = std::make_unique<codeact::sandbox::SandboxExecutor>(
            codeact::cli::BuildSandboxSettings(config.sandbox, workspace_dir, options->isolate));
        InjectHostServices(*sandbox, workspace_dir);

        codeact::agent::AgentSettings settings{};
        settings.model = config.agent.model;
        settings.max_turns = config.agent.max_turns;
        settings.max_tokens = config.agent.max_tokens;
        settings.temperature = config.agent.temperature;
        settings.workspace_root = workspace_root;
        agent = std::make_unique<codeact::agent::AgentLoop>(
            conversation_id,
            codeact::agent::LoadSystemPrompt(config.agent.system_prompt_path),
            *provider,
            *sandbox,
            settings);
    } catch (const std::invalid_argument& ex) {
        codeact::utils::Log(LogLevel::kError, "cli", "invalid configuration", {{"error", ex.what()}});
        return 1;
    } catch (const std::filesystem::filesystem_error& ex) {
        codeact::utils::Log(LogLevel::kError, "cli", "workspace unavailable", {{"error", ex.what()}});
        return 1;
    }

    std::unique_ptr<codeact::session::ConversationStore> store;
    if (config.persistence.enabled) {
        store = std::make_unique<codeact::session::ConversationStore>(
            workspace_root / config.persistence.db_file);
        auto persisted = store->Load(conversation_id);
        if (!persisted.empty() && agent->RestoreHistory(std::move(persisted))) {
            codeact::utils::Log(LogLevel::kInfo, "cli", "resumed conversation",
                                {{"conversation", conversation_id},
                                 {"turns", std::to_string(agent->History().size())}});
        }
    }

    codeact::utils::Log(LogLevel::kInfo, "cli", "conversation ready",
                        {{"conversation", conversation_id},
                         {"workspace", agent->WorkspaceDir().string()},
                         {"isolated", sandbox->Settings().isolate_in_subprocess ? "true" : "false"}});

    while (true) {
        const auto query = ReadQuery();
        if (query.empty()) {
            std::cout << "Empty query. Exiting..." << std::endl;
            break;
        }
        std::cout << "\nProcessing your query...\n" << std::endl;

        codeact::agent::RunResult result;
        try {
            result = agent->Run(query);
        } catch (const codeact::providers::ProviderError& ex) {
            codeact::utils::Log(LogLevel::kError, "cli", "model request failed", {{"error", ex.what()}});
            SaveHistory(store.get(), *agent, config.agent.model);
            return 1;
        }
        SaveHistory(store.get(), *agent, config.agent.model);

        if (result.status == codeact::agent::RunStatus::kAnswered) {
            std::cout << result.answer << std::endl;
        } else {
            std::cout << "[agent ran out of turns after " << result.turns_used << " runs]" << std::endl;
        }
    }
    return 0;
}
