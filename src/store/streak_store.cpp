#include "store/streak_store.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/config.hpp"

namespace streakguard {

namespace {

constexpr const char *kCreateEventsTable =
    "CREATE TABLE IF NOT EXISTS events ("
    "    chat_id INTEGER NOT NULL,"
    "    id INTEGER NOT NULL,"
    "    kind TEXT NOT NULL,"
    "    actor_id INTEGER NOT NULL,"
    "    actor_name TEXT,"
    "    message_id INTEGER,"
    "    timestamp INTEGER NOT NULL,"
    "    details TEXT NOT NULL,"
    "    snapshot TEXT NOT NULL,"
    "    PRIMARY KEY (chat_id, id),"
    "    CONSTRAINT valid_kind CHECK (kind IN ('TRIGGER', 'MANUAL_RESET', 'UNDO'))"
    ");";

constexpr const char *kCreateChatStateTable =
    "CREATE TABLE IF NOT EXISTS chat_state ("
    "    chat_id INTEGER PRIMARY KEY,"
    "    state TEXT NOT NULL,"
    "    best_streak_seconds INTEGER NOT NULL DEFAULT 0,"
    "    total_resets INTEGER NOT NULL DEFAULT 0,"
    "    streak_start INTEGER"
    ");";

constexpr const char *kCreateTriggerRulesTable =
    "CREATE TABLE IF NOT EXISTS trigger_rules ("
    "    position INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    chat_id INTEGER NOT NULL,"
    "    kind TEXT NOT NULL,"
    "    value TEXT NOT NULL,"
    "    source_word TEXT NOT NULL,"
    "    variant TEXT,"
    "    pattern_source TEXT,"
    "    enabled INTEGER NOT NULL DEFAULT 1,"
    "    created_by_id INTEGER,"
    "    created_by_name TEXT,"
    "    created_at INTEGER NOT NULL,"
    "    UNIQUE (chat_id, kind, value),"
    "    CONSTRAINT valid_rule_kind CHECK (kind IN ('lemma', 'pattern'))"
    ");";

constexpr const char *kCreateTriggerRulesIndex =
    "CREATE INDEX IF NOT EXISTS idx_trigger_rules_source "
    "ON trigger_rules(chat_id, source_word);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    void stepDone(const char *what)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            throw StoreError(std::string(what) + ": " + sqlite3_errmsg(m_db));
        }
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

// Rolls back on destruction unless commit() ran.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_committed = false;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value)
{
    bindText(stmt, index, value.dump());
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json::object();
    }
}

constexpr const char *kEventColumns =
    "chat_id, id, kind, actor_id, actor_name, message_id, timestamp, details, snapshot";

Event readEvent(sqlite3_stmt *stmt)
{
    Event event;
    event.chatId = sqlite3_column_int64(stmt, 0);
    event.id = sqlite3_column_int64(stmt, 1);
    event.actor.userId = sqlite3_column_int64(stmt, 3);
    event.actor.displayName = columnText(stmt, 4);
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        event.messageId = sqlite3_column_int64(stmt, 5);
    }
    event.timestamp = fromEpochMillis(sqlite3_column_int64(stmt, 6));
    try {
        event.details = columnJson(stmt, 7).get<EventDetails>();
        event.snapshotBefore = columnJson(stmt, 8).get<ChatState>();
    } catch (const std::exception &ex) {
        throw StoreError("corrupt event row " + std::to_string(event.id) + ": " + ex.what());
    }
    if (toEventKindString(event.kind()) != columnText(stmt, 2)) {
        throw StoreError("event row " + std::to_string(event.id)
                         + " kind does not match its details");
    }
    return event;
}

TriggerRule readRule(sqlite3_stmt *stmt)
{
    TriggerRule rule;
    rule.position = sqlite3_column_int64(stmt, 0);
    rule.chatId = sqlite3_column_int64(stmt, 1);
    rule.kind = parseRuleKindString(columnText(stmt, 2));
    rule.value = columnText(stmt, 3);
    rule.sourceWord = columnText(stmt, 4);
    rule.variant = parseVariantKindString(columnText(stmt, 5));
    rule.patternSource = columnText(stmt, 6);
    rule.enabled = sqlite3_column_int(stmt, 7) != 0;
    rule.createdBy.userId = sqlite3_column_int64(stmt, 8);
    rule.createdBy.displayName = columnText(stmt, 9);
    rule.createdAt = fromEpochMillis(sqlite3_column_int64(stmt, 10));
    return rule;
}

void upsertChatState(sqlite3 *db, ChatId chatId, const ChatState &state)
{
    Statement stmt(db,
                   "INSERT OR REPLACE INTO chat_state (chat_id, state, "
                   "best_streak_seconds, total_resets, streak_start) "
                   "VALUES (?, ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, chatId);
    bindJson(stmt.get(), 2, nlohmann::json(state));
    sqlite3_bind_int64(stmt.get(), 3, state.bestStreakSeconds);
    sqlite3_bind_int64(stmt.get(), 4, state.totalResetCount);
    if (state.streakStart.has_value()) {
        sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(*state.streakStart));
    } else {
        sqlite3_bind_null(stmt.get(), 5);
    }
    stmt.stepDone("failed to store chat state");
}

} // namespace

struct StreakStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    mutable std::mutex mutex;

    void open(const std::string &dbPath)
    {
        path = dbPath;
        if (dbPath != ":memory:") {
            const std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
        }

        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(dbPath.c_str(), &db, flags, nullptr) != SQLITE_OK) {
            const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
            throw StoreError("failed to open streakguard database: " + message);
        }

        sqlite3_busy_timeout(db, 5000);
        execOrThrow(db, "PRAGMA journal_mode=WAL;");
        execOrThrow(db, "PRAGMA synchronous=FULL;");
        execOrThrow(db, kCreateEventsTable);
        execOrThrow(db, kCreateChatStateTable);
        execOrThrow(db, kCreateTriggerRulesTable);
        execOrThrow(db, kCreateTriggerRulesIndex);
        execOrThrow(db, kCreateMetaTable);
    }
};

StreakStore::StreakStore()
    : StreakStore(defaultDatabasePath())
{
}

StreakStore::StreakStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->open(dbPath);
}

StreakStore::~StreakStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string StreakStore::path() const
{
    return impl->path;
}

void StreakStore::commitEvent(const Event &event, const ChatState &stateAfter)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db);

    const std::string sql = std::string("INSERT INTO events (") + kEventColumns
        + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, event.chatId);
    sqlite3_bind_int64(stmt.get(), 2, event.id);
    bindText(stmt.get(), 3, toEventKindString(event.kind()));
    sqlite3_bind_int64(stmt.get(), 4, event.actor.userId);
    bindOptionalText(stmt.get(), 5, event.actor.displayName);
    if (event.messageId.has_value()) {
        sqlite3_bind_int64(stmt.get(), 6, *event.messageId);
    } else {
        sqlite3_bind_null(stmt.get(), 6);
    }
    sqlite3_bind_int64(stmt.get(), 7, toEpochMillis(event.timestamp));
    bindJson(stmt.get(), 8, nlohmann::json(event.details));
    bindJson(stmt.get(), 9, nlohmann::json(event.snapshotBefore));
    stmt.stepDone("failed to insert event");

    upsertChatState(impl->db, event.chatId, stateAfter);
    tx.commit();
}

std::vector<Event> StreakStore::listEvents(ChatId chatId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string("SELECT ") + kEventColumns
        + " FROM events WHERE chat_id = ? ORDER BY id ASC;";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, chatId);

    std::vector<Event> events;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        events.push_back(readEvent(stmt.get()));
    }
    return events;
}

std::optional<Event> StreakStore::getEvent(ChatId chatId, EventId id) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string("SELECT ") + kEventColumns
        + " FROM events WHERE chat_id = ? AND id = ? LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, chatId);
    sqlite3_bind_int64(stmt.get(), 2, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readEvent(stmt.get());
}

std::optional<ChatState> StreakStore::getChatState(ChatId chatId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT state FROM chat_state WHERE chat_id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, chatId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnJson(stmt.get(), 0).get<ChatState>();
}

void StreakStore::saveChatState(ChatId chatId, const ChatState &state)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    upsertChatState(impl->db, chatId, state);
}

std::vector<ChatRanking> StreakStore::topChatsByBestStreak(int limit) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT chat_id, best_streak_seconds, total_resets, streak_start "
                   "FROM chat_state ORDER BY best_streak_seconds DESC, chat_id ASC "
                   "LIMIT ?;");
    sqlite3_bind_int(stmt.get(), 1, limit);

    std::vector<ChatRanking> rankings;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ChatRanking ranking;
        ranking.chatId = sqlite3_column_int64(stmt.get(), 0);
        ranking.bestStreakSeconds = sqlite3_column_int64(stmt.get(), 1);
        ranking.totalResetCount = sqlite3_column_int64(stmt.get(), 2);
        if (sqlite3_column_type(stmt.get(), 3) != SQLITE_NULL) {
            ranking.streakStart = fromEpochMillis(sqlite3_column_int64(stmt.get(), 3));
        }
        rankings.push_back(std::move(ranking));
    }
    return rankings;
}

std::vector<TriggerRule> StreakStore::listTriggerRules(ChatId chatId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT position, chat_id, kind, value, source_word, variant, "
                   "pattern_source, enabled, created_by_id, created_by_name, created_at "
                   "FROM trigger_rules WHERE chat_id = ? ORDER BY position ASC;");
    sqlite3_bind_int64(stmt.get(), 1, chatId);

    std::vector<TriggerRule> rules;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rules.push_back(readRule(stmt.get()));
    }
    return rules;
}

void StreakStore::insertTriggerRules(const std::vector<TriggerRule> &rules)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db);

    for (const auto &rule : rules) {
        Statement stmt(impl->db,
                       "INSERT INTO trigger_rules (chat_id, kind, value, source_word, "
                       "variant, pattern_source, enabled, created_by_id, "
                       "created_by_name, created_at) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, rule.chatId);
        bindText(stmt.get(), 2, toRuleKindString(rule.kind));
        bindText(stmt.get(), 3, rule.value);
        bindText(stmt.get(), 4, rule.sourceWord);
        bindOptionalText(stmt.get(), 5,
                         rule.variant.has_value() ? toVariantKindString(*rule.variant)
                                                  : std::string());
        bindOptionalText(stmt.get(), 6, rule.patternSource);
        sqlite3_bind_int(stmt.get(), 7, rule.enabled ? 1 : 0);
        sqlite3_bind_int64(stmt.get(), 8, rule.createdBy.userId);
        bindOptionalText(stmt.get(), 9, rule.createdBy.displayName);
        sqlite3_bind_int64(stmt.get(), 10, toEpochMillis(rule.createdAt));

        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_CONSTRAINT) {
            throw ValidationError("trigger rule already exists: " + rule.value);
        }
        if (rc != SQLITE_DONE) {
            throw StoreError(std::string("failed to insert trigger rule: ")
                             + sqlite3_errmsg(impl->db));
        }
    }

    tx.commit();
}

int StreakStore::deleteTriggerRulesForWord(ChatId chatId, const std::string &sourceWord)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db);

    Statement stmt(impl->db,
                   "DELETE FROM trigger_rules WHERE chat_id = ? AND source_word = ?;");
    sqlite3_bind_int64(stmt.get(), 1, chatId);
    bindText(stmt.get(), 2, sourceWord);
    stmt.stepDone("failed to delete trigger rules");
    const int removed = sqlite3_changes(impl->db);

    tx.commit();
    return removed;
}

bool StreakStore::setTriggerRuleEnabled(ChatId chatId, const std::string &value, bool enabled)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "UPDATE trigger_rules SET enabled = ? WHERE chat_id = ? AND value = ?;");
    sqlite3_bind_int(stmt.get(), 1, enabled ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 2, chatId);
    bindText(stmt.get(), 3, value);
    stmt.stepDone("failed to toggle trigger rule");
    return sqlite3_changes(impl->db) > 0;
}

std::optional<std::string> StreakStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void StreakStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.stepDone("failed to set meta value");
}

bool StreakStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace streakguard
