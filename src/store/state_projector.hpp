#pragma once

#include <optional>
#include <unordered_set>
#include <vector>

#include "common/models.hpp"

namespace streakguard {

// Pure fold of chat events into ChatState. StateProjector never touches storage;
// EventLog feeds it the arena and persists whatever it returns.
class StateProjector {
public:
    // Applies one event onto the state that preceded it.
    static ChatState apply(const ChatState &before, const Event &event);

    // Ids named by UNDO events in the arena.
    static std::unordered_set<EventId> nullifiedIds(const std::vector<Event> &events);

    // Folds every non-nullified TRIGGER and MANUAL_RESET event with an id up to
    // upperBound (inclusive, all events when unset), starting from the empty
    // state. Events must be ordered by id.
    static ChatState fold(const std::vector<Event> &events,
                          const std::unordered_set<EventId> &nullified,
                          std::optional<EventId> upperBound = std::nullopt);

    static ChatState fold(const std::vector<Event> &events);
};

} // namespace streakguard
