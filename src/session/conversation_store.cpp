#include "session/conversation_store.hpp"

#include <system_error>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeact::session {
namespace {

using codeact::utils::LogLevel;

void LogSqliteError(sqlite3* db, const std::string& what) {
    codeact::utils::Log(LogLevel::kError, "session", what,
                        {{"sqlite", db ? sqlite3_errmsg(db) : "no connection"}});
}

}  // namespace

ConversationStore::ConversationStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

ConversationStore::~ConversationStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::vector<codeact::providers::Message> ConversationStore::Load(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<codeact::providers::Message> turns;
    if (!db_) {
        return turns;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT role, content FROM turns WHERE conversation_id = ? ORDER BY seq ASC;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        LogSqliteError(db_, "failed to prepare turn query");
        return turns;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        codeact::providers::Message msg{};
        msg.role = SafeText(sqlite3_column_text(stmt, 0));
        msg.content = SafeText(sqlite3_column_text(stmt, 1));
        turns.push_back(std::move(msg));
    }
    sqlite3_finalize(stmt);
    return turns;
}

bool ConversationStore::Save(const std::string& id,
                             const std::vector<codeact::providers::Message>& history,
                             const nlohmann::json& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    const int stored = CountTurns(id);
    if (stored < 0) {
        return false;
    }
    if (static_cast<std::size_t>(stored) > history.size()) {
        codeact::utils::Log(LogLevel::kWarn, "session", "history is shorter than stored turns",
                            {{"conversation", id},
                             {"stored", std::to_string(stored)},
                             {"history", std::to_string(history.size())}});
        return false;
    }

    const auto now = codeact::utils::NowIso();
    if (!Exec(db_, "BEGIN TRANSACTION;")) {
        return false;
    }
    bool ok = true;
    sqlite3_stmt* stmt = nullptr;
    const std::string upsert_sql =
        "INSERT INTO conversations(id, created_at, updated_at, metadata) VALUES(?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET updated_at=excluded.updated_at, metadata=excluded.metadata;";
    if (sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        const auto meta_text = metadata.dump();
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, meta_text.c_str(), -1, SQLITE_TRANSIENT);
        ok = sqlite3_step(stmt) == SQLITE_DONE;
    } else {
        ok = false;
    }
    sqlite3_finalize(stmt);
    stmt = nullptr;

    const std::string insert_sql =
        "INSERT INTO turns(conversation_id, seq, role, content, timestamp) VALUES(?, ?, ?, ?, ?);";
    if (ok && sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        for (std::size_t seq = static_cast<std::size_t>(stored); seq < history.size() && ok; ++seq) {
            const auto& msg = history[seq];
            sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(seq));
            sqlite3_bind_text(stmt, 3, msg.role.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, msg.content.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, now.c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
    } else {
        ok = false;
    }
    sqlite3_finalize(stmt);

    if (!ok) {
        LogSqliteError(db_, "failed to save conversation");
        Exec(db_, "ROLLBACK;");
        return false;
    }
    return Exec(db_, "COMMIT;");
}

bool ConversationStore::Delete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    bool ok = true;
    for (const char* sql : {"DELETE FROM turns WHERE conversation_id = ?;",
                            "DELETE FROM conversations WHERE id = ?;"}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt) == SQLITE_DONE && ok;
        } else {
            ok = false;
        }
        sqlite3_finalize(stmt);
    }
    return ok && sqlite3_changes(db_) > 0;
}

std::vector<ConversationInfo> ConversationStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConversationInfo> conversations;
    if (!db_) {
        return conversations;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT c.id, c.created_at, c.updated_at, c.metadata, "
        "(SELECT COUNT(*) FROM turns t WHERE t.conversation_id = c.id) "
        "FROM conversations c ORDER BY c.updated_at DESC;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        LogSqliteError(db_, "failed to prepare conversation listing");
        return conversations;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ConversationInfo info{};
        info.id = SafeText(sqlite3_column_text(stmt, 0));
        info.created_at = SafeText(sqlite3_column_text(stmt, 1));
        info.updated_at = SafeText(sqlite3_column_text(stmt, 2));
        auto parsed = nlohmann::json::parse(SafeText(sqlite3_column_text(stmt, 3)), nullptr, false);
        if (parsed.is_object()) {
            info.metadata = std::move(parsed);
        }
        info.turn_count = sqlite3_column_int(stmt, 4);
        conversations.push_back(std::move(info));
    }
    sqlite3_finalize(stmt);
    return conversations;
}

void ConversationStore::EnsureSchema() {
    if (db_) {
        return;
    }
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        codeact::utils::Log(LogLevel::kError, "session", "failed to open sqlite db",
                            {{"path", db_path_.string()}});
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS conversations ("
             "id TEXT PRIMARY KEY,"
             "created_at TEXT,"
             "updated_at TEXT,"
             "metadata TEXT"
             ");");
    Exec(db_, "CREATE TABLE IF NOT EXISTS turns ("
             "id INTEGER PRIMARY KEY AUTOINCREMENT,"
             "conversation_id TEXT NOT NULL,"
             "seq INTEGER NOT NULL,"
             "role TEXT,"
             "content TEXT,"
             "timestamp TEXT,"
             "UNIQUE(conversation_id, seq)"
             ");");
    Exec(db_, "CREATE INDEX IF NOT EXISTS idx_turns_conversation ON turns(conversation_id);");
}

int ConversationStore::CountTurns(const std::string& id) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM turns WHERE conversation_id = ?;", -1, &stmt,
                           nullptr) != SQLITE_OK) {
        LogSqliteError(db_, "failed to count turns");
        return -1;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool ConversationStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            codeact::utils::Log(LogLevel::kError, "session", "sqlite exec error", {{"error", err}});
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

std::string ConversationStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace codeact::session
