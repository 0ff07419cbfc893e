#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace streakguard {

// StreakStore is the SQLite access layer for all persistent data: the per-chat
// append-only event log, the cached chat projections, trigger rules and meta.
// All methods are safe to call from several threads; multi-row writes run in a
// single transaction and either fully apply or throw StoreError.
class StreakStore {
public:
    // Opens $HOME/.local/share/streakguard/streakguard.db.
    StreakStore();
    explicit StreakStore(const std::string &dbPath);
    ~StreakStore();

    StreakStore(const StreakStore &) = delete;
    StreakStore &operator=(const StreakStore &) = delete;

    // Event log. commitEvent stores the event together with the projection that
    // results from it.
    void commitEvent(const Event &event, const ChatState &stateAfter);
    std::vector<Event> listEvents(ChatId chatId) const;
    std::optional<Event> getEvent(ChatId chatId, EventId id) const;

    std::optional<ChatState> getChatState(ChatId chatId) const;
    void saveChatState(ChatId chatId, const ChatState &state);
    std::vector<ChatRanking> topChatsByBestStreak(int limit) const;

    // Trigger rules, ordered by insertion. insertTriggerRules is all-or-nothing
    // and throws ValidationError when any rule already exists.
    std::vector<TriggerRule> listTriggerRules(ChatId chatId) const;
    void insertTriggerRules(const std::vector<TriggerRule> &rules);
    int deleteTriggerRulesForWord(ChatId chatId, const std::string &sourceWord);
    bool setTriggerRuleEnabled(ChatId chatId, const std::string &value, bool enabled);

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;
    std::string path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace streakguard
