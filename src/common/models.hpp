#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace streakguard {

using ChatId = std::int64_t;
using EventId = std::int64_t;
using TimePoint = std::chrono::system_clock::time_point;

struct Actor {
    std::int64_t userId = 0;
    std::string displayName;

    bool operator==(const Actor &other) const
    {
        return userId == other.userId && displayName == other.displayName;
    }
    bool operator!=(const Actor &other) const { return !(*this == other); }
};

// Half-open range of UTF-16 code units in the original message text.
struct TextSpan {
    int start = 0;
    int end = 0;

    bool contains(const TextSpan &other) const
    {
        return start <= other.start && other.end <= end;
    }
    bool operator==(const TextSpan &other) const
    {
        return start == other.start && end == other.end;
    }
};

struct TriggerDetails {
    MatchLayer layer = MatchLayer::Lemma;
    std::string matchedWord;
    std::string canonical;
    std::string ruleName;
    TextSpan span;
};

struct ManualResetDetails {
    std::string reason;
};

struct UndoDetails {
    std::vector<EventId> targetIds;
};

// Closed set of event payloads. The alternative held decides the event kind.
using EventDetails = std::variant<TriggerDetails, ManualResetDetails, UndoDetails>;

inline EventKind kindOf(const EventDetails &details)
{
    struct Visitor {
        EventKind operator()(const TriggerDetails &) const { return EventKind::Trigger; }
        EventKind operator()(const ManualResetDetails &) const { return EventKind::ManualReset; }
        EventKind operator()(const UndoDetails &) const { return EventKind::Undo; }
    };
    return std::visit(Visitor{}, details);
}

struct ChatState {
    std::optional<TimePoint> streakStart;
    std::int64_t bestStreakSeconds = 0;
    std::optional<TimePoint> bestStreakStart;
    std::optional<TimePoint> bestStreakEnd;
    std::optional<EventId> lastResetEventId;
    std::optional<Actor> lastResetActor;
    std::optional<TimePoint> lastResetTimestamp;
    nlohmann::json lastResetDetails;
    std::int64_t totalResetCount = 0;

    bool operator==(const ChatState &other) const
    {
        return streakStart == other.streakStart
            && bestStreakSeconds == other.bestStreakSeconds
            && bestStreakStart == other.bestStreakStart
            && bestStreakEnd == other.bestStreakEnd
            && lastResetEventId == other.lastResetEventId
            && lastResetActor == other.lastResetActor
            && lastResetTimestamp == other.lastResetTimestamp
            && lastResetDetails == other.lastResetDetails
            && totalResetCount == other.totalResetCount;
    }
    bool operator!=(const ChatState &other) const { return !(*this == other); }
};

struct Event {
    EventId id = 0;
    ChatId chatId = 0;
    Actor actor;
    std::optional<std::int64_t> messageId;
    TimePoint timestamp;
    EventDetails details;
    ChatState snapshotBefore;

    EventKind kind() const { return kindOf(details); }
};

struct TriggerRule {
    ChatId chatId = 0;
    RuleKind kind = RuleKind::Lemma;
    // Lemma rules hold the canonical lemma, pattern rules their rule name.
    std::string value;
    // Canonical word the rule was created for; drives cascading removal.
    std::string sourceWord;
    std::optional<VariantKind> variant;
    std::string patternSource;
    bool enabled = true;
    Actor createdBy;
    TimePoint createdAt;
    std::int64_t position = 0;
};

struct PatternVariant {
    std::string ruleName;
    std::string patternSource;
    VariantKind kind = VariantKind::Spaced;

    bool operator==(const PatternVariant &other) const
    {
        return ruleName == other.ruleName && patternSource == other.patternSource
            && kind == other.kind;
    }
};

// Enabled rules of one chat, each list in insertion order.
struct ActiveRules {
    std::vector<TriggerRule> lemmas;
    std::vector<TriggerRule> patterns;
};

struct ExclusionSpan {
    TextSpan span;
    ExclusionKind kind = ExclusionKind::Quote;
};

struct DetectionMeta {
    std::string languageHint;
};

struct DetectionResult {
    bool matched = false;
    MatchLayer layer = MatchLayer::Lemma;
    std::string matchedWord;
    std::string canonical;
    std::optional<std::string> ruleName;
    TextSpan span;
    // Set when nothing matched but a candidate was discarded by an exclusion.
    std::optional<ExclusionKind> suppressedBy;
};

struct MessageMeta {
    std::optional<std::int64_t> messageId;
    std::string languageHint;
};

struct MessageOutcome {
    DetectionResult detection;
    std::optional<Event> event;
    std::int64_t previousStreakSeconds = 0;
};

struct UndoResult {
    std::vector<Event> undone;
    std::optional<Event> undoEvent;
    ChatState state;
    int count = 0;
};

struct StreakCounter {
    ChatState state;
    std::int64_t currentStreakSeconds = 0;
};

struct LeaderboardEntry {
    Actor actor;
    std::int64_t triggerCount = 0;
    std::int64_t manualResetCount = 0;
    std::int64_t totalBreaks = 0;
};

struct ChatRanking {
    ChatId chatId = 0;
    std::int64_t bestStreakSeconds = 0;
    std::int64_t totalResetCount = 0;
    std::optional<TimePoint> streakStart;
};

} // namespace streakguard
