#include "service/streak_service.hpp"

#include <algorithm>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace streakguard {

std::int64_t streakSeconds(const std::optional<TimePoint> &start, TimePoint now)
{
    if (!start.has_value()) {
        return 0;
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now - *start).count();
    return std::max<std::int64_t>(0, seconds);
}

StreakService::StreakService(EventLog &eventLog,
                             TriggerRegistry &registry,
                             DetectionEngine &detector,
                             StreakStore &store)
    : m_eventLog(eventLog)
    , m_registry(registry)
    , m_detector(detector)
    , m_store(store)
{
}

MessageOutcome StreakService::onMessage(ChatId chatId,
                                        const std::string &text,
                                        const Actor &actor,
                                        const MessageMeta &meta)
{
    MessageOutcome outcome;
    outcome.detection = m_detector.detect(chatId, text, DetectionMeta{meta.languageHint});
    if (!outcome.detection.matched) {
        if (outcome.detection.suppressedBy.has_value()) {
            SGLOG_DEBUG(QStringLiteral("StreakService"),
                        QStringLiteral("onMessage"),
                        QStringLiteral("candidate_suppressed"),
                        QStringLiteral("excluded_span"),
                        QStringLiteral("exclusion_filter"),
                        logging::actorWho(actor),
                        QString(),
                        nlohmann::json{{"chatId", chatId},
                                       {"kind", toExclusionKindString(
                                                    *outcome.detection.suppressedBy)}});
        }
        return outcome;
    }

    TriggerDetails details;
    details.layer = outcome.detection.layer;
    details.matchedWord = outcome.detection.matchedWord;
    details.canonical = outcome.detection.canonical;
    details.ruleName = outcome.detection.ruleName.value_or(std::string());
    details.span = outcome.detection.span;

    const Event event = m_eventLog.appendEvent(chatId, actor, details, meta.messageId);
    outcome.previousStreakSeconds = streakSeconds(event.snapshotBefore.streakStart, event.timestamp);
    outcome.event = event;
    return outcome;
}

Event StreakService::reset(ChatId chatId, const Actor &actor, const std::string &reason)
{
    return m_eventLog.appendEvent(chatId, actor, ManualResetDetails{reason});
}

UndoResult StreakService::undo(ChatId chatId, int n, const Actor &actor)
{
    return m_eventLog.undo(chatId, n, actor);
}

UndoResult StreakService::undoEvent(ChatId chatId, EventId eventId, const Actor &actor)
{
    return m_eventLog.undoEvent(chatId, eventId, actor);
}

StreakCounter StreakService::getCounter(ChatId chatId)
{
    StreakCounter counter;
    counter.state = m_eventLog.getState(chatId);
    counter.currentStreakSeconds = streakSeconds(counter.state.streakStart, m_eventLog.now());
    return counter;
}

std::vector<LeaderboardEntry> StreakService::getLeaderboard(ChatId chatId, int limit)
{
    return m_eventLog.leaderboard(chatId, limit);
}

std::vector<Event> StreakService::history(ChatId chatId, int limit)
{
    return m_eventLog.history(chatId, limit);
}

std::vector<ChatRanking> StreakService::topChats(int limit)
{
    if (limit < 1) {
        throw ValidationError("top chats limit must be positive");
    }
    return m_store.topChatsByBestStreak(limit);
}

EventLog &StreakService::eventLog()
{
    return m_eventLog;
}

TriggerRegistry &StreakService::registry()
{
    return m_registry;
}

DetectionEngine &StreakService::detector()
{
    return m_detector;
}

} // namespace streakguard
