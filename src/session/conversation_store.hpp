#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"
#include "sqlite3.h"

namespace codeact::session {

struct ConversationInfo {
    std::string id;
    std::string created_at;
    std::string updated_at;
    int turn_count = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

// SQLite-backed conversation history. Turns are append-only: Save() writes
// only the turns past what is already stored.
class ConversationStore {
public:
    explicit ConversationStore(std::filesystem::path db_path);
    ~ConversationStore();
    ConversationStore(const ConversationStore&) = delete;
    ConversationStore& operator=(const ConversationStore&) = delete;

    bool IsOpen() const { return db_ != nullptr; }

    std::vector<codeact::providers::Message> Load(const std::string& id) const;
    bool Save(const std::string& id,
              const std::vector<codeact::providers::Message>& history,
              const nlohmann::json& metadata = nlohmann::json::object());
    bool Delete(const std::string& id);
    std::vector<ConversationInfo> List() const;

private:
    void EnsureSchema();
    int CountTurns(const std::string& id) const;
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace codeact::session
