#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "detect/detection_engine.hpp"
#include "detect/trigger_registry.hpp"
#include "store/event_log.hpp"
#include "store/streak_store.hpp"

namespace streakguard {

// StreakService turns detections and user commands into event log appends and
// answers the read-side queries.
class StreakService {
public:
    static constexpr int kDefaultLeaderboardLimit = 10;

    StreakService(EventLog &eventLog,
                  TriggerRegistry &registry,
                  DetectionEngine &detector,
                  StreakStore &store);

    // Detects and, on a match, appends a TRIGGER event for the message.
    MessageOutcome onMessage(ChatId chatId,
                             const std::string &text,
                             const Actor &actor,
                             const MessageMeta &meta);

    Event reset(ChatId chatId, const Actor &actor, const std::string &reason);
    UndoResult undo(ChatId chatId, int n, const Actor &actor);
    UndoResult undoEvent(ChatId chatId, EventId eventId, const Actor &actor);

    StreakCounter getCounter(ChatId chatId);
    std::vector<LeaderboardEntry> getLeaderboard(ChatId chatId,
                                                 int limit = kDefaultLeaderboardLimit);
    std::vector<Event> history(ChatId chatId, int limit);
    std::vector<ChatRanking> topChats(int limit);

    EventLog &eventLog();
    TriggerRegistry &registry();
    DetectionEngine &detector();

private:
    EventLog &m_eventLog;
    TriggerRegistry &m_registry;
    DetectionEngine &m_detector;
    StreakStore &m_store;
};

// Whole seconds from start to now, zero when there is no running streak.
std::int64_t streakSeconds(const std::optional<TimePoint> &start, TimePoint now);

} // namespace streakguard
