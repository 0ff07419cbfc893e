#pragma once

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace streakguard {

inline std::int64_t toEpochMillis(TimePoint timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline TimePoint fromEpochMillis(std::int64_t value)
{
    return TimePoint{std::chrono::milliseconds{value}};
}

// Millisecond precision; event timestamps are truncated to this on append so a
// round trip through storage is exact.
inline TimePoint truncateToMillis(TimePoint timestamp)
{
    return fromEpochMillis(toEpochMillis(timestamp));
}

inline std::string toIso8601Utc(TimePoint timestamp)
{
    const std::int64_t millis = toEpochMillis(timestamp);
    std::int64_t seconds = millis / 1000;
    std::int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }
    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char fractionText[8];
    std::snprintf(fractionText, sizeof(fractionText), ".%03d", static_cast<int>(fraction));
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << fractionText << 'Z';
    return out.str();
}

inline TimePoint fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return TimePoint{};
    }
    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits.push_back(static_cast<char>(in.get()));
        }
        digits = (digits + "000").substr(0, 3);
        millis = std::stoi(digits);
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return TimePoint{};
    }
    return std::chrono::system_clock::from_time_t(time) + std::chrono::milliseconds(millis);
}

inline std::string toEventKindString(EventKind kind)
{
    switch (kind) {
    case EventKind::Trigger:
        return "TRIGGER";
    case EventKind::ManualReset:
        return "MANUAL_RESET";
    case EventKind::Undo:
        return "UNDO";
    }
    return "TRIGGER";
}

inline std::optional<EventKind> parseEventKindString(const std::string &value)
{
    if (value == "TRIGGER") {
        return EventKind::Trigger;
    }
    if (value == "MANUAL_RESET") {
        return EventKind::ManualReset;
    }
    if (value == "UNDO") {
        return EventKind::Undo;
    }
    return std::nullopt;
}

inline std::string toRuleKindString(RuleKind kind)
{
    return kind == RuleKind::Lemma ? "lemma" : "pattern";
}

inline RuleKind parseRuleKindString(const std::string &value)
{
    return value == "pattern" ? RuleKind::Pattern : RuleKind::Lemma;
}

// Also the suffix of generated rule names ("test_spaced").
inline std::string toVariantKindString(VariantKind kind)
{
    switch (kind) {
    case VariantKind::Transliteration:
        return "transliteration";
    case VariantKind::Lookalike:
        return "lookalike";
    case VariantKind::Spaced:
        return "spaced";
    case VariantKind::ZeroWidth:
        return "zero_width";
    case VariantKind::Diacritic:
        return "diacritic";
    case VariantKind::Multimodal:
        return "multimodal";
    }
    return "spaced";
}

inline std::optional<VariantKind> parseVariantKindString(const std::string &value)
{
    if (value == "transliteration") {
        return VariantKind::Transliteration;
    }
    if (value == "lookalike") {
        return VariantKind::Lookalike;
    }
    if (value == "spaced") {
        return VariantKind::Spaced;
    }
    if (value == "zero_width") {
        return VariantKind::ZeroWidth;
    }
    if (value == "diacritic") {
        return VariantKind::Diacritic;
    }
    if (value == "multimodal") {
        return VariantKind::Multimodal;
    }
    return std::nullopt;
}

inline std::string toMatchLayerString(MatchLayer layer)
{
    return layer == MatchLayer::Lemma ? "lemma" : "pattern";
}

inline MatchLayer parseMatchLayerString(const std::string &value)
{
    return value == "pattern" ? MatchLayer::Pattern : MatchLayer::Lemma;
}

inline std::string toExclusionKindString(ExclusionKind kind)
{
    switch (kind) {
    case ExclusionKind::Quote:
        return "quote";
    case ExclusionKind::Url:
        return "url";
    case ExclusionKind::Command:
        return "command";
    }
    return "quote";
}

inline nlohmann::json optionalTimeToJson(const std::optional<TimePoint> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

inline std::optional<TimePoint> optionalTimeFromJson(const nlohmann::json &j,
                                                     const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return fromIso8601Utc(j.at(key).get<std::string>());
}

inline void to_json(nlohmann::json &j, const Actor &actor)
{
    j = nlohmann::json{{"userId", actor.userId}, {"displayName", actor.displayName}};
}

inline void from_json(const nlohmann::json &j, Actor &actor)
{
    actor.userId = j.value("userId", static_cast<std::int64_t>(0));
    actor.displayName = j.value("displayName", "");
}

inline void to_json(nlohmann::json &j, const TextSpan &span)
{
    j = nlohmann::json{{"start", span.start}, {"end", span.end}};
}

inline void from_json(const nlohmann::json &j, TextSpan &span)
{
    span.start = j.value("start", 0);
    span.end = j.value("end", 0);
}

inline void to_json(nlohmann::json &j, const EventDetails &details)
{
    struct Visitor {
        nlohmann::json operator()(const TriggerDetails &d) const
        {
            nlohmann::json out{
                {"kind", "TRIGGER"},
                {"layer", toMatchLayerString(d.layer)},
                {"matchedWord", d.matchedWord},
                {"canonical", d.canonical},
                {"span", d.span}
            };
            if (!d.ruleName.empty()) {
                out["ruleName"] = d.ruleName;
            }
            return out;
        }
        nlohmann::json operator()(const ManualResetDetails &d) const
        {
            return nlohmann::json{{"kind", "MANUAL_RESET"}, {"reason", d.reason}};
        }
        nlohmann::json operator()(const UndoDetails &d) const
        {
            return nlohmann::json{{"kind", "UNDO"}, {"targetIds", d.targetIds}};
        }
    };
    j = std::visit(Visitor{}, details);
}

inline void from_json(const nlohmann::json &j, EventDetails &details)
{
    const auto kind = parseEventKindString(j.value("kind", ""));
    if (!kind.has_value()) {
        throw ValidationError("event details carry no valid kind");
    }
    switch (*kind) {
    case EventKind::Trigger: {
        TriggerDetails d;
        d.layer = parseMatchLayerString(j.value("layer", "lemma"));
        d.matchedWord = j.value("matchedWord", "");
        d.canonical = j.value("canonical", "");
        d.ruleName = j.value("ruleName", "");
        if (j.contains("span")) {
            d.span = j.at("span").get<TextSpan>();
        }
        details = d;
        return;
    }
    case EventKind::ManualReset:
        details = ManualResetDetails{j.value("reason", "")};
        return;
    case EventKind::Undo: {
        UndoDetails d;
        if (j.contains("targetIds") && j.at("targetIds").is_array()) {
            d.targetIds = j.at("targetIds").get<std::vector<EventId>>();
        }
        details = d;
        return;
    }
    }
}

inline void to_json(nlohmann::json &j, const ChatState &state)
{
    j = nlohmann::json{
        {"streakStart", optionalTimeToJson(state.streakStart)},
        {"bestStreakSeconds", state.bestStreakSeconds},
        {"bestStreakStart", optionalTimeToJson(state.bestStreakStart)},
        {"bestStreakEnd", optionalTimeToJson(state.bestStreakEnd)},
        {"lastResetEventId", state.lastResetEventId.has_value()
             ? nlohmann::json(*state.lastResetEventId)
             : nlohmann::json()},
        {"lastResetActor", state.lastResetActor.has_value()
             ? nlohmann::json(*state.lastResetActor)
             : nlohmann::json()},
        {"lastResetTimestamp", optionalTimeToJson(state.lastResetTimestamp)},
        {"lastResetDetails", state.lastResetDetails},
        {"totalResetCount", state.totalResetCount}
    };
}

inline void from_json(const nlohmann::json &j, ChatState &state)
{
    state = ChatState{};
    state.streakStart = optionalTimeFromJson(j, "streakStart");
    state.bestStreakSeconds = j.value("bestStreakSeconds", static_cast<std::int64_t>(0));
    state.bestStreakStart = optionalTimeFromJson(j, "bestStreakStart");
    state.bestStreakEnd = optionalTimeFromJson(j, "bestStreakEnd");
    if (j.contains("lastResetEventId") && j.at("lastResetEventId").is_number_integer()) {
        state.lastResetEventId = j.at("lastResetEventId").get<EventId>();
    }
    if (j.contains("lastResetActor") && j.at("lastResetActor").is_object()) {
        state.lastResetActor = j.at("lastResetActor").get<Actor>();
    }
    state.lastResetTimestamp = optionalTimeFromJson(j, "lastResetTimestamp");
    if (j.contains("lastResetDetails")) {
        state.lastResetDetails = j.at("lastResetDetails");
    }
    state.totalResetCount = j.value("totalResetCount", static_cast<std::int64_t>(0));
}

inline void to_json(nlohmann::json &j, const Event &event)
{
    j = nlohmann::json{
        {"id", event.id},
        {"chatId", event.chatId},
        {"kind", toEventKindString(event.kind())},
        {"actor", event.actor},
        {"messageId", event.messageId.has_value()
             ? nlohmann::json(*event.messageId)
             : nlohmann::json()},
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"details", event.details},
        {"snapshotBefore", event.snapshotBefore}
    };
}

inline void from_json(const nlohmann::json &j, Event &event)
{
    event.id = j.value("id", static_cast<EventId>(0));
    event.chatId = j.value("chatId", static_cast<ChatId>(0));
    if (j.contains("actor") && j.at("actor").is_object()) {
        event.actor = j.at("actor").get<Actor>();
    }
    if (j.contains("messageId") && j.at("messageId").is_number_integer()) {
        event.messageId = j.at("messageId").get<std::int64_t>();
    } else {
        event.messageId.reset();
    }
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    event.details = j.at("details").get<EventDetails>();
    if (j.contains("snapshotBefore") && j.at("snapshotBefore").is_object()) {
        event.snapshotBefore = j.at("snapshotBefore").get<ChatState>();
    } else {
        event.snapshotBefore = ChatState{};
    }
}

inline void to_json(nlohmann::json &j, const TriggerRule &rule)
{
    j = nlohmann::json{
        {"kind", toRuleKindString(rule.kind)},
        {"value", rule.value},
        {"sourceWord", rule.sourceWord},
        {"variant", rule.variant.has_value()
             ? nlohmann::json(toVariantKindString(*rule.variant))
             : nlohmann::json()},
        {"patternSource", rule.patternSource},
        {"enabled", rule.enabled},
        {"createdBy", rule.createdBy},
        {"createdAt", toIso8601Utc(rule.createdAt)}
    };
}

inline void to_json(nlohmann::json &j, const PatternVariant &variant)
{
    j = nlohmann::json{
        {"ruleName", variant.ruleName},
        {"patternSource", variant.patternSource},
        {"kind", toVariantKindString(variant.kind)}
    };
}

inline void to_json(nlohmann::json &j, const DetectionResult &result)
{
    j = nlohmann::json{{"matched", result.matched}};
    if (result.matched) {
        j["layer"] = toMatchLayerString(result.layer);
        j["matchedWord"] = result.matchedWord;
        j["canonical"] = result.canonical;
        j["ruleName"] = result.ruleName.has_value()
            ? nlohmann::json(*result.ruleName)
            : nlohmann::json();
        j["span"] = result.span;
    } else if (result.suppressedBy.has_value()) {
        j["suppressedBy"] = toExclusionKindString(*result.suppressedBy);
    }
}

inline void to_json(nlohmann::json &j, const LeaderboardEntry &entry)
{
    j = nlohmann::json{
        {"actor", entry.actor},
        {"triggerCount", entry.triggerCount},
        {"manualResetCount", entry.manualResetCount},
        {"totalBreaks", entry.totalBreaks}
    };
}

inline void to_json(nlohmann::json &j, const StreakCounter &counter)
{
    j = nlohmann::json{
        {"state", counter.state},
        {"currentStreakSeconds", counter.currentStreakSeconds}
    };
}

inline void to_json(nlohmann::json &j, const ChatRanking &ranking)
{
    j = nlohmann::json{
        {"chatId", ranking.chatId},
        {"bestStreakSeconds", ranking.bestStreakSeconds},
        {"totalResetCount", ranking.totalResetCount},
        {"streakStart", optionalTimeToJson(ranking.streakStart)}
    };
}

inline void to_json(nlohmann::json &j, const UndoResult &result)
{
    nlohmann::json undoneIds = nlohmann::json::array();
    for (const auto &event : result.undone) {
        undoneIds.push_back(event.id);
    }
    j = nlohmann::json{
        {"count", result.count},
        {"undoneIds", undoneIds},
        {"undoEventId", result.undoEvent.has_value()
             ? nlohmann::json(result.undoEvent->id)
             : nlohmann::json()},
        {"state", result.state}
    };
}

} // namespace streakguard
