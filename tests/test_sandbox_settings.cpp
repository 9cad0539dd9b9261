#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

#include "agent/workspace.hpp"
#include "cli/sandbox_settings.hpp"
#include "sandbox/capability_policy.hpp"

using codeact::cli::BuildSandboxSettings;
using codeact::config::SandboxConfig;
using namespace codeact::sandbox;
namespace fs = std::filesystem;

class SandboxSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
            ("codeact-settings-" + std::string(info->name()) + "-" + std::to_string(::getpid()));
        fs::remove_all(root_);
        conversation_dir_ = codeact::agent::EnsureWorkspace(root_, "conv");
        fs::create_directories(root_ / "other");
        std::ofstream(root_ / "conversations.db") << "db";
        std::ofstream(root_ / "other" / "notes.txt") << "notes";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    bool CanOpen(const CapabilityPolicy& policy, const fs::path& path, const std::string& mode) const {
        return policy.CheckOpen(OpenFileRequest{path.string(), mode}).allowed;
    }

    fs::path root_;
    fs::path conversation_dir_;
};

TEST_F(SandboxSettingsTest, DefaultRootIsTheConversationWorkspace) {
    const auto settings = BuildSandboxSettings(SandboxConfig{}, conversation_dir_, false);
    ASSERT_TRUE(settings.policy.allowed_roots.has_value());
    ASSERT_EQ(settings.policy.allowed_roots->size(), 1u);
    EXPECT_EQ(fs::path(settings.policy.allowed_roots->front()),
              fs::absolute(conversation_dir_).lexically_normal());

    const CapabilityPolicy policy(settings.policy);
    EXPECT_TRUE(CanOpen(policy, conversation_dir_ / "out.txt", "w"));
    EXPECT_FALSE(CanOpen(policy, root_ / "conversations.db", "r"));
    EXPECT_FALSE(CanOpen(policy, root_ / "conversations.db", "w"));
    EXPECT_FALSE(CanOpen(policy, root_ / "other" / "notes.txt", "r"));
    EXPECT_FALSE(CanOpen(policy, conversation_dir_ / ".." / "conversations.db", "r"));
}

TEST_F(SandboxSettingsTest, ConfiguredRootsAreKept) {
    SandboxConfig config;
    config.allowed_paths = std::vector<std::string>{(root_ / "other").string()};
    const auto settings = BuildSandboxSettings(config, conversation_dir_, false);
    const CapabilityPolicy policy(settings.policy);
    EXPECT_TRUE(CanOpen(policy, root_ / "other" / "notes.txt", "r"));
    EXPECT_FALSE(CanOpen(policy, conversation_dir_ / "out.txt", "w"));
}

TEST_F(SandboxSettingsTest, EmptyRootListStaysEmpty) {
    SandboxConfig config;
    config.allowed_paths = std::vector<std::string>{};
    const auto settings = BuildSandboxSettings(config, conversation_dir_, false);
    ASSERT_TRUE(settings.policy.allowed_roots.has_value());
    EXPECT_TRUE(settings.policy.allowed_roots->empty());
    EXPECT_FALSE(CanOpen(CapabilityPolicy(settings.policy), conversation_dir_ / "out.txt", "w"));
}

TEST_F(SandboxSettingsTest, CopiesLimitsAndCombinesIsolation) {
    SandboxConfig config;
    config.timeout_s = 7;
    config.max_output_chars = 123;
    config.max_transfer_bytes = 4096;
    config.allowed_imports = std::vector<std::string>{"math"};

    auto settings = BuildSandboxSettings(config, conversation_dir_, false);
    EXPECT_EQ(settings.timeout_seconds, 7);
    EXPECT_EQ(settings.max_output_chars, 123);
    EXPECT_EQ(settings.max_transfer_bytes, 4096u);
    EXPECT_FALSE(settings.isolate_in_subprocess);
    ASSERT_TRUE(settings.policy.allowed_imports.has_value());
    EXPECT_EQ(settings.policy.allowed_imports->front(), "math");

    EXPECT_TRUE(BuildSandboxSettings(config, conversation_dir_, true).isolate_in_subprocess);
    config.isolate = true;
    EXPECT_TRUE(BuildSandboxSettings(config, conversation_dir_, false).isolate_in_subprocess);
}
