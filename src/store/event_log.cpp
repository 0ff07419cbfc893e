#include "store/event_log.hpp"

#include <algorithm>
#include <map>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/state_projector.hpp"

namespace streakguard {

namespace {

const Event *findEvent(const std::vector<Event> &events, EventId eventId)
{
    auto it = std::lower_bound(events.begin(), events.end(), eventId,
                               [](const Event &event, EventId id) {
                                   return event.id < id;
                               });
    if (it == events.end() || it->id != eventId) {
        return nullptr;
    }
    return &*it;
}

// A stored history must be strictly ordered and every UNDO must name earlier
// TRIGGER or MANUAL_RESET events. Anything else cannot be folded.
void validateHistory(ChatId chatId, const std::vector<Event> &events)
{
    EventId previous = 0;
    for (const auto &event : events) {
        if (event.id <= previous) {
            throw ConsistencyFault("chat " + std::to_string(chatId)
                                   + " has out-of-order event id " + std::to_string(event.id));
        }
        previous = event.id;

        const auto *undo = std::get_if<UndoDetails>(&event.details);
        if (!undo) {
            continue;
        }
        for (EventId target : undo->targetIds) {
            const Event *targetEvent = findEvent(events, target);
            if (!targetEvent || target >= event.id || targetEvent->kind() == EventKind::Undo) {
                throw ConsistencyFault("undo event " + std::to_string(event.id)
                                       + " names invalid target " + std::to_string(target));
            }
        }
    }
}

bool isBreak(const Event &event)
{
    return event.kind() == EventKind::Trigger || event.kind() == EventKind::ManualReset;
}

} // namespace

EventLog::EventLog(StreakStore &store, ChatLocks &locks, const StreakConfig &config)
    : m_store(store)
    , m_locks(locks)
    , m_maxUndo(config.maxUndo)
    , m_verifyOnRead(config.verifyProjectionOnRead)
    , m_clock([] { return std::chrono::system_clock::now(); })
{
}

void EventLog::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

TimePoint EventLog::now() const
{
    return m_clock();
}

EventLog::ChatArena &EventLog::arenaLocked(ChatId chatId)
{
    {
        std::lock_guard<std::mutex> lock(m_arenasMutex);
        auto it = m_arenas.find(chatId);
        if (it != m_arenas.end()) {
            return *it->second;
        }
    }

    auto arena = std::make_shared<ChatArena>();
    arena->events = m_store.listEvents(chatId);
    validateHistory(chatId, arena->events);
    arena->nullified = StateProjector::nullifiedIds(arena->events);
    arena->state = m_store.getChatState(chatId).value_or(ChatState{});
    repairIfDiverged(chatId, *arena, "load");

    SGLOG_DEBUG(QStringLiteral("EventLog"),
                QStringLiteral("arenaLocked"),
                QStringLiteral("chat_history_loaded"),
                QStringLiteral("first_access"),
                QStringLiteral("sqlite_query"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"chatId", chatId},
                               {"events", arena->events.size()},
                               {"nullified", arena->nullified.size()}});

    std::lock_guard<std::mutex> lock(m_arenasMutex);
    auto &slot = m_arenas[chatId];
    slot = std::move(arena);
    return *slot;
}

bool EventLog::repairIfDiverged(ChatId chatId, ChatArena &arena, const char *where)
{
    const ChatState fresh = StateProjector::fold(arena.events, arena.nullified);
    const ChatState persisted = m_store.getChatState(chatId).value_or(ChatState{});
    if (arena.state == fresh && persisted == fresh) {
        return true;
    }

    const auto faults = ++m_consistencyFaults;
    SGLOG_ERROR(QStringLiteral("EventLog"),
                QString::fromLatin1(where),
                QStringLiteral("projection_diverged"),
                QStringLiteral("cached_state_differs_from_fold"),
                QStringLiteral("recompute_from_log"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"chatId", chatId},
                               {"cached", arena.state},
                               {"persisted", persisted},
                               {"fresh", fresh},
                               {"faults", faults}});

    m_store.saveChatState(chatId, fresh);
    arena.state = fresh;
    return false;
}

TimePoint EventLog::nextTimestamp(const ChatArena &arena) const
{
    TimePoint timestamp = truncateToMillis(m_clock());
    // Keeps streak durations non-negative if the wall clock steps back.
    if (!arena.events.empty() && timestamp < arena.events.back().timestamp) {
        timestamp = arena.events.back().timestamp;
    }
    return timestamp;
}

Event EventLog::appendEvent(ChatId chatId,
                            const Actor &actor,
                            const EventDetails &details,
                            std::optional<std::int64_t> messageId)
{
    if (std::holds_alternative<UndoDetails>(details)) {
        throw ValidationError("undo events are appended through undo()");
    }

    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    ChatArena &arena = arenaLocked(chatId);

    Event event;
    event.id = arena.events.empty() ? 1 : arena.events.back().id + 1;
    event.chatId = chatId;
    event.actor = actor;
    event.messageId = messageId;
    event.timestamp = nextTimestamp(arena);
    event.details = details;
    event.snapshotBefore = arena.state;

    const ChatState after = StateProjector::apply(arena.state, event);
    m_store.commitEvent(event, after);
    arena.events.push_back(event);
    arena.state = after;

    SGLOG_INFO(QStringLiteral("EventLog"),
               QStringLiteral("appendEvent"),
               QStringLiteral("event_appended"),
               QString::fromStdString(toEventKindString(event.kind())),
               QStringLiteral("sqlite_transaction"),
               logging::actorWho(actor),
               QString(),
               nlohmann::json{{"chatId", chatId},
                              {"eventId", event.id},
                              {"details", event.details}});
    return event;
}

UndoResult EventLog::nullifyLocked(ChatId chatId,
                                   ChatArena &arena,
                                   const std::vector<EventId> &targets,
                                   const Actor &actor)
{
    Event undoEvent;
    undoEvent.id = arena.events.empty() ? 1 : arena.events.back().id + 1;
    undoEvent.chatId = chatId;
    undoEvent.actor = actor;
    undoEvent.timestamp = nextTimestamp(arena);
    undoEvent.details = UndoDetails{targets};
    undoEvent.snapshotBefore = arena.state;

    std::unordered_set<EventId> nullified = arena.nullified;
    nullified.insert(targets.begin(), targets.end());

    // The UNDO event itself never changes state, so folding the current arena
    // with the widened nullified set gives the post-undo projection.
    const ChatState after = StateProjector::fold(arena.events, nullified);
    m_store.commitEvent(undoEvent, after);

    UndoResult result;
    for (EventId target : targets) {
        result.undone.push_back(*findEvent(arena.events, target));
    }
    arena.events.push_back(undoEvent);
    arena.nullified = std::move(nullified);
    arena.state = after;

    result.undoEvent = undoEvent;
    result.state = after;
    result.count = static_cast<int>(targets.size());

    SGLOG_INFO(QStringLiteral("EventLog"),
               QStringLiteral("nullify"),
               QStringLiteral("events_undone"),
               QStringLiteral("undo_request"),
               QStringLiteral("full_refold"),
               logging::actorWho(actor),
               QString(),
               nlohmann::json{{"chatId", chatId},
                              {"undoEventId", undoEvent.id},
                              {"targetIds", targets},
                              {"bestStreakSeconds", after.bestStreakSeconds}});
    return result;
}

UndoResult EventLog::undo(ChatId chatId, int n, const Actor &actor)
{
    if (n < 1 || n > m_maxUndo) {
        throw ValidationError("undo count must be between 1 and " + std::to_string(m_maxUndo));
    }

    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    ChatArena &arena = arenaLocked(chatId);

    std::vector<EventId> targets;
    for (auto it = arena.events.rbegin(); it != arena.events.rend(); ++it) {
        if (static_cast<int>(targets.size()) >= n) {
            break;
        }
        if (!isBreak(*it) || arena.nullified.count(it->id) > 0) {
            continue;
        }
        targets.push_back(it->id);
    }

    if (targets.empty()) {
        UndoResult result;
        result.state = arena.state;
        return result;
    }
    return nullifyLocked(chatId, arena, targets, actor);
}

UndoResult EventLog::undoEvent(ChatId chatId, EventId eventId, const Actor &actor)
{
    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    ChatArena &arena = arenaLocked(chatId);

    const Event *target = findEvent(arena.events, eventId);
    if (!target) {
        throw ValidationError("no event " + std::to_string(eventId) + " in this chat");
    }
    if (target->kind() == EventKind::Undo) {
        throw ValidationError("undo events cannot be undone");
    }
    if (arena.nullified.count(eventId) > 0) {
        throw ValidationError("event " + std::to_string(eventId) + " is already undone");
    }
    return nullifyLocked(chatId, arena, {eventId}, actor);
}

ChatState EventLog::getState(ChatId chatId)
{
    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    ChatArena &arena = arenaLocked(chatId);
    if (m_verifyOnRead) {
        repairIfDiverged(chatId, arena, "getState");
    }
    return arena.state;
}

bool EventLog::verifyProjection(ChatId chatId)
{
    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    return repairIfDiverged(chatId, arenaLocked(chatId), "verifyProjection");
}

std::vector<Event> EventLog::history(ChatId chatId, int limit)
{
    if (limit < 1) {
        throw ValidationError("history limit must be positive");
    }

    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    const ChatArena &arena = arenaLocked(chatId);

    std::vector<Event> page;
    for (auto it = arena.events.rbegin();
         it != arena.events.rend() && static_cast<int>(page.size()) < limit;
         ++it) {
        page.push_back(*it);
    }
    return page;
}

std::optional<Event> EventLog::event(ChatId chatId, EventId eventId)
{
    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    const Event *found = findEvent(arenaLocked(chatId).events, eventId);
    if (!found) {
        return std::nullopt;
    }
    return *found;
}

std::unordered_set<EventId> EventLog::nullifiedIds(ChatId chatId)
{
    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    return arenaLocked(chatId).nullified;
}

std::vector<LeaderboardEntry> EventLog::leaderboard(ChatId chatId, int limit)
{
    if (limit < 1) {
        throw ValidationError("leaderboard limit must be positive");
    }

    auto chatMutex = m_locks.forChat(chatId);
    std::lock_guard<std::mutex> lock(*chatMutex);
    const ChatArena &arena = arenaLocked(chatId);

    std::map<std::int64_t, LeaderboardEntry> byActor;
    for (const auto &event : arena.events) {
        if (!isBreak(event) || arena.nullified.count(event.id) > 0) {
            continue;
        }
        LeaderboardEntry &entry = byActor[event.actor.userId];
        entry.actor = event.actor;
        if (event.kind() == EventKind::Trigger) {
            ++entry.triggerCount;
        } else {
            ++entry.manualResetCount;
        }
        ++entry.totalBreaks;
    }

    std::vector<LeaderboardEntry> entries;
    entries.reserve(byActor.size());
    for (auto &pair : byActor) {
        entries.push_back(std::move(pair.second));
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const LeaderboardEntry &a, const LeaderboardEntry &b) {
                         return a.totalBreaks > b.totalBreaks;
                     });
    if (static_cast<int>(entries.size()) > limit) {
        entries.resize(static_cast<std::size_t>(limit));
    }
    return entries;
}

std::uint64_t EventLog::consistencyFaults() const
{
    return m_consistencyFaults.load();
}

} // namespace streakguard
