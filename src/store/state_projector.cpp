#include "store/state_projector.hpp"

#include "common/json_utils.hpp"

namespace streakguard {

namespace {

// The streak that ends at `at` replaces the best one only when strictly longer.
void closeStreak(ChatState &state, TimePoint at)
{
    if (!state.streakStart.has_value()) {
        return;
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             at - *state.streakStart)
                             .count();
    if (seconds > state.bestStreakSeconds) {
        state.bestStreakSeconds = seconds;
        state.bestStreakStart = state.streakStart;
        state.bestStreakEnd = at;
    }
}

void recordReset(ChatState &state, const Event &event)
{
    closeStreak(state, event.timestamp);
    state.streakStart = event.timestamp;
    state.lastResetEventId = event.id;
    state.lastResetActor = event.actor;
    state.lastResetTimestamp = event.timestamp;
    state.lastResetDetails = nlohmann::json(event.details);
}

} // namespace

ChatState StateProjector::apply(const ChatState &before, const Event &event)
{
    struct Visitor {
        ChatState &state;
        const Event &event;

        void operator()(const TriggerDetails &) const
        {
            recordReset(state, event);
        }
        void operator()(const ManualResetDetails &) const
        {
            recordReset(state, event);
            ++state.totalResetCount;
        }
        void operator()(const UndoDetails &) const
        {
            // Meta event: its effect is the nullified set used by fold().
        }
    };

    ChatState after = before;
    std::visit(Visitor{after, event}, event.details);
    return after;
}

std::unordered_set<EventId> StateProjector::nullifiedIds(const std::vector<Event> &events)
{
    std::unordered_set<EventId> nullified;
    for (const auto &event : events) {
        if (const auto *undo = std::get_if<UndoDetails>(&event.details)) {
            nullified.insert(undo->targetIds.begin(), undo->targetIds.end());
        }
    }
    return nullified;
}

ChatState StateProjector::fold(const std::vector<Event> &events,
                               const std::unordered_set<EventId> &nullified,
                               std::optional<EventId> upperBound)
{
    ChatState state;
    for (const auto &event : events) {
        if (upperBound.has_value() && event.id > *upperBound) {
            break;
        }
        if (nullified.count(event.id) > 0) {
            continue;
        }
        state = apply(state, event);
    }
    return state;
}

ChatState StateProjector::fold(const std::vector<Event> &events)
{
    return fold(events, nullifiedIds(events));
}

} // namespace streakguard
