#include <gtest/gtest.h>

#include <filesystem>
#include <unistd.h>

#include "session/conversation_store.hpp"

using codeact::providers::Message;
using codeact::session::ConversationStore;
namespace fs = std::filesystem;

class ConversationStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
            ("codeact-store-" + std::string(info->name()) + "-" + std::to_string(::getpid()));
        fs::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path DbPath() const { return dir_ / "nested" / "conversations.db"; }

    static std::vector<Message> History(std::size_t turns) {
        std::vector<Message> history{{"system", "You are a helpful assistant."}};
        for (std::size_t i = 1; i < turns; ++i) {
            history.push_back({i % 2 ? "user" : "assistant", "turn " + std::to_string(i)});
        }
        return history;
    }

    fs::path dir_;
};

TEST_F(ConversationStoreTest, CreatesParentDirectories) {
    ConversationStore store(DbPath());
    EXPECT_TRUE(store.IsOpen());
    EXPECT_TRUE(fs::exists(DbPath()));
}

TEST_F(ConversationStoreTest, SaveThenLoadPreservesOrder) {
    ConversationStore store(DbPath());
    const auto history = History(5);
    ASSERT_TRUE(store.Save("conv-a", history, {{"model", "test-model"}}));

    const auto loaded = store.Load("conv-a");
    ASSERT_EQ(loaded.size(), history.size());
    for (std::size_t i = 0; i < history.size(); ++i) {
        EXPECT_EQ(loaded[i].role, history[i].role);
        EXPECT_EQ(loaded[i].content, history[i].content);
    }
    EXPECT_TRUE(store.Load("unknown").empty());
}

TEST_F(ConversationStoreTest, SaveAppendsOnlyNewTurns) {
    ConversationStore store(DbPath());
    ASSERT_TRUE(store.Save("conv-a", History(3)));
    ASSERT_TRUE(store.Save("conv-a", History(6)));
    EXPECT_EQ(store.Load("conv-a").size(), 6u);

    // Saving the same history again is a no-op.
    ASSERT_TRUE(store.Save("conv-a", History(6)));
    EXPECT_EQ(store.Load("conv-a").size(), 6u);

    EXPECT_FALSE(store.Save("conv-a", History(2)));
    EXPECT_EQ(store.Load("conv-a").size(), 6u);
}

TEST_F(ConversationStoreTest, HistorySurvivesReopen) {
    {
        ConversationStore store(DbPath());
        ASSERT_TRUE(store.Save("conv-a", History(4)));
    }
    ConversationStore reopened(DbPath());
    EXPECT_EQ(reopened.Load("conv-a").size(), 4u);
}

TEST_F(ConversationStoreTest, ListReportsTurnCountsAndMetadata) {
    ConversationStore store(DbPath());
    ASSERT_TRUE(store.Save("conv-a", History(3), {{"model", "m1"}}));
    ASSERT_TRUE(store.Save("conv-b", History(5)));

    const auto listed = store.List();
    ASSERT_EQ(listed.size(), 2u);
    for (const auto& info : listed) {
        if (info.id == "conv-a") {
            EXPECT_EQ(info.turn_count, 3);
            EXPECT_EQ(info.metadata.value("model", ""), "m1");
        } else {
            EXPECT_EQ(info.id, "conv-b");
            EXPECT_EQ(info.turn_count, 5);
        }
        EXPECT_FALSE(info.created_at.empty());
    }
}

TEST_F(ConversationStoreTest, DeleteRemovesConversation) {
    ConversationStore store(DbPath());
    ASSERT_TRUE(store.Save("conv-a", History(3)));
    EXPECT_TRUE(store.Delete("conv-a"));
    EXPECT_TRUE(store.Load("conv-a").empty());
    EXPECT_TRUE(store.List().empty());
    EXPECT_FALSE(store.Delete("conv-a"));
}
