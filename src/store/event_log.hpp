#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "common/chat_locks.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "store/streak_store.hpp"

namespace streakguard {

// EventLog is the append-only per-chat history plus its cached projection.
// Each chat is held in memory as an arena of events ordered by id and the set of
// ids nullified by UNDO events; state is always StateProjector::fold over that
// arena. Every write commits the event and the resulting projection to the store
// in one transaction under the chat's lock.
class EventLog {
public:
    using Clock = std::function<TimePoint()>;

    EventLog(StreakStore &store, ChatLocks &locks, const StreakConfig &config);

    void setClock(Clock clock);
    TimePoint now() const;

    Event appendEvent(ChatId chatId,
                      const Actor &actor,
                      const EventDetails &details,
                      std::optional<std::int64_t> messageId = std::nullopt);

    // Nullifies up to n of the newest live TRIGGER/MANUAL_RESET events.
    // Throws ValidationError when n is outside [1, maxUndo]. When nothing is
    // eligible the result has count 0 and no UNDO event is written.
    UndoResult undo(ChatId chatId, int n, const Actor &actor);

    // Nullifies exactly one event. Unknown ids, UNDO events and events that are
    // already nullified are rejected with ValidationError.
    UndoResult undoEvent(ChatId chatId, EventId eventId, const Actor &actor);

    ChatState getState(ChatId chatId);

    // Compares the cached and persisted projections with a fresh fold and
    // repairs both on divergence. Returns false when a repair happened.
    bool verifyProjection(ChatId chatId);

    // Newest first.
    std::vector<Event> history(ChatId chatId, int limit);
    std::optional<Event> event(ChatId chatId, EventId eventId);
    std::unordered_set<EventId> nullifiedIds(ChatId chatId);

    // Breaks per actor over live events, most breaks first.
    std::vector<LeaderboardEntry> leaderboard(ChatId chatId, int limit);

    std::uint64_t consistencyFaults() const;

private:
    struct ChatArena {
        std::vector<Event> events;
        std::unordered_set<EventId> nullified;
        ChatState state;
    };

    StreakStore &m_store;
    ChatLocks &m_locks;
    int m_maxUndo = 10;
    bool m_verifyOnRead = false;
    Clock m_clock;

    std::mutex m_arenasMutex;
    std::unordered_map<ChatId, std::shared_ptr<ChatArena>> m_arenas;
    std::atomic<std::uint64_t> m_consistencyFaults{0};

    // Caller holds the chat lock.
    ChatArena &arenaLocked(ChatId chatId);
    bool repairIfDiverged(ChatId chatId, ChatArena &arena, const char *where);
    UndoResult nullifyLocked(ChatId chatId,
                             ChatArena &arena,
                             const std::vector<EventId> &targets,
                             const Actor &actor);
    TimePoint nextTimestamp(const ChatArena &arena) const;
};

} // namespace streakguard
