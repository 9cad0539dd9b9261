#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

#include "agent/agent_loop.hpp"

using namespace codeact::agent;
using codeact::providers::LLMResponse;
using codeact::providers::Message;
using codeact::providers::ProviderError;
using codeact::sandbox::SandboxExecutor;
using codeact::sandbox::SandboxSettings;
namespace fs = std::filesystem;

namespace {

// Replays scripted replies; the last one repeats once the script runs out.
class ScriptedProvider : public codeact::providers::LLMProvider {
public:
    explicit ScriptedProvider(std::vector<std::string> replies)
        : replies_(std::move(replies)) {}

    LLMResponse Chat(const std::vector<Message>& messages,
                     const std::string& model,
                     int,
                     double) override {
        ++requests;
        last_model = model;
        last_messages = messages;
        if (fail) {
            throw ProviderError("Error calling LLM: HTTP 500");
        }
        LLMResponse response{};
        response.content = replies_.empty() ? std::string()
            : replies_[std::min(next_++, replies_.size() - 1)];
        return response;
    }

    std::string GetDefaultModel() const override { return "scripted-model"; }

    int requests = 0;
    bool fail = false;
    std::string last_model;
    std::vector<Message> last_messages;

private:
    std::vector<std::string> replies_;
    std::size_t next_ = 0;
};

}  // namespace

class AgentLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
            ("codeact-agent-" + std::string(info->name()) + "-" + std::to_string(::getpid()));
        fs::remove_all(root_);
        sandbox_ = std::make_unique<SandboxExecutor>(SandboxSettings{});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    AgentSettings Settings(int max_turns = 3) const {
        AgentSettings settings{};
        settings.max_turns = max_turns;
        settings.workspace_root = root_;
        return settings;
    }

    fs::path root_;
    std::unique_ptr<SandboxExecutor> sandbox_;
};

TEST_F(AgentLoopTest, AnswerEndsRunWithoutSpendingTurns) {
    ScriptedProvider provider({"<response>42</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    const auto result = agent.Run("What is 6*7?");
    EXPECT_EQ(result.status, RunStatus::kAnswered);
    EXPECT_EQ(result.answer, "42");
    EXPECT_EQ(result.turns_used, 0);
    EXPECT_EQ(provider.requests, 1);
    EXPECT_EQ(agent.State(), LoopState::kTerminal);

    const auto& history = agent.History();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].role, "system");
    EXPECT_EQ(history[1].content, "What is 6*7?\n- Last Working Copy: None\n- RUN 1/3");
    EXPECT_EQ(history[2].role, "assistant");
    EXPECT_EQ(provider.last_model, "scripted-model");
}

TEST_F(AgentLoopTest, CodeOutputIsFedBack) {
    ScriptedProvider provider({"<code>x = 6 * 7\nprint(x)</code>", "<response>done</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    const auto result = agent.Run("compute");
    EXPECT_EQ(result.status, RunStatus::kAnswered);
    EXPECT_EQ(result.turns_used, 1);
    ASSERT_EQ(agent.History().size(), 5u);
    EXPECT_EQ(agent.History()[3].role, "user");
    EXPECT_EQ(agent.History()[3].content,
              "Below is the output of your code:\nOutput of Code Block 1:\n42\n\n"
              "- Last Working Copy: None\n- RUN 2/3");
    EXPECT_EQ(sandbox_->GetBinding("x").cast<int>(), 42);
}

TEST_F(AgentLoopTest, BatchStopsAtFirstFailingBlock) {
    ScriptedProvider provider({"<code>a = 1</code><code>1 / 0</code><code>c = 3</code>",
                               "<response>gave up</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    const auto result = agent.Run("divide");
    EXPECT_EQ(result.turns_used, 1);
    EXPECT_EQ(sandbox_->GetBinding("a").cast<int>(), 1);
    EXPECT_TRUE(sandbox_->GetBinding("c").is_none());
    EXPECT_EQ(sandbox_->GetHistory().size(), 2u);

    const auto& feedback = agent.History()[3].content;
    EXPECT_EQ(feedback.rfind("**ERROR**:\nCode Caused the following ERROR:\ndivision by zero\n\nTraceback:\n", 0),
              0u);
    EXPECT_NE(feedback.find("ZeroDivisionError"), std::string::npos);
    EXPECT_NE(feedback.find("- Last Working Copy: None\n- RUN 2/3"), std::string::npos);
}

TEST_F(AgentLoopTest, TurnBudgetAbortsRun) {
    ScriptedProvider provider({"<code>print('again')</code>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings(3));

    const auto result = agent.Run("loop forever");
    EXPECT_EQ(result.status, RunStatus::kAborted);
    EXPECT_EQ(result.turns_used, 3);
    EXPECT_TRUE(result.answer.empty());
    EXPECT_EQ(provider.requests, 3);
    EXPECT_EQ(agent.State(), LoopState::kAborted);
    EXPECT_EQ(agent.History().size(), 8u);
}

TEST_F(AgentLoopTest, MalformedReplyCostsATurnAndIsReported) {
    ScriptedProvider provider({"I forgot the tags", "<response>ok</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    const auto result = agent.Run("hello");
    EXPECT_EQ(result.status, RunStatus::kAnswered);
    EXPECT_EQ(result.turns_used, 1);
    EXPECT_EQ(agent.History()[3].content,
              "**ERROR**:\nInvalid XML Response Format: expected <code>...</code> or "
              "<response>...</response>\n\n- Last Working Copy: None\n- RUN 2/3");
}

TEST_F(AgentLoopTest, MixedMarkersAreRejected) {
    ScriptedProvider provider({"<code>y = 1</code><response>y</response>", "<response>ok</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    agent.Run("hello");
    EXPECT_TRUE(sandbox_->GetBinding("y").is_none());
    EXPECT_NE(agent.History()[3].content.find("cannot both be present"), std::string::npos);
}

TEST_F(AgentLoopTest, ProviderErrorPropagates) {
    ScriptedProvider provider({"<response>unused</response>"});
    provider.fail = true;
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());
    EXPECT_THROW(agent.Run("hello"), ProviderError);
}

TEST_F(AgentLoopTest, DecorationNamesLatestArtifact) {
    const auto workspace = root_ / "conv";
    fs::create_directories(workspace);
    std::ofstream(workspace / "chart.png") << "png";

    ScriptedProvider provider({"<response>see file</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());
    agent.Run("draw");

    EXPECT_EQ(agent.WorkspaceDir(), workspace);
    EXPECT_EQ(agent.History()[1].content,
              "draw\n- Last Working Copy: " + fs::absolute(workspace / "chart.png").string() +
                  "\n- RUN 1/3");
}

TEST_F(AgentLoopTest, HistoryPersistsAcrossRunsAndTurnsReset) {
    ScriptedProvider provider({"<code>n = 1</code>", "<response>first</response>",
                               "<response>second</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    EXPECT_EQ(agent.Run("one").turns_used, 1);
    const auto second = agent.Run("two");
    EXPECT_EQ(second.answer, "second");
    EXPECT_EQ(second.turns_used, 0);
    EXPECT_EQ(agent.History().size(), 7u);
    EXPECT_EQ(agent.History()[5].content, "two\n- Last Working Copy: None\n- RUN 1/3");
    EXPECT_EQ(provider.last_messages.size(), 6u);
}

TEST_F(AgentLoopTest, ExplicitModelOverridesProviderDefault) {
    ScriptedProvider provider({"<response>ok</response>"});
    auto settings = Settings();
    settings.model = "openai/gpt-4o";
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, settings);
    agent.Run("hi");
    EXPECT_EQ(provider.last_model, "openai/gpt-4o");
}

TEST_F(AgentLoopTest, ConstructorValidatesArguments) {
    ScriptedProvider provider(std::vector<std::string>{});
    EXPECT_THROW(AgentLoop("", "prompt", provider, *sandbox_, Settings()), std::invalid_argument);
    EXPECT_THROW(AgentLoop("conv", "", provider, *sandbox_, Settings()), std::invalid_argument);
    EXPECT_THROW(AgentLoop("conv", "prompt", provider, *sandbox_, Settings(0)), std::invalid_argument);
}

TEST_F(AgentLoopTest, RestoreHistoryRequiresSystemTurn) {
    ScriptedProvider provider({"<response>resumed</response>"});
    AgentLoop agent("conv", "system prompt", provider, *sandbox_, Settings());

    EXPECT_FALSE(agent.RestoreHistory({{"user", "orphan"}}));
    EXPECT_EQ(agent.History().size(), 1u);

    EXPECT_TRUE(agent.RestoreHistory({{"system", "old prompt"}, {"user", "q"}, {"assistant", "a"}}));
    agent.Run("next");
    ASSERT_EQ(agent.History().size(), 5u);
    EXPECT_EQ(agent.History()[0].content, "old prompt");
    EXPECT_EQ(agent.History()[3].content, "next\n- Last Working Copy: None\n- RUN 1/3");
}
