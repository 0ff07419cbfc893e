#include "daemon/command_handler.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <set>

#include <QString>
#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace streakguard {

namespace {

constexpr int kDefaultHistoryLimit = 20;
constexpr int kDefaultTopChatsLimit = 10;

ChatId requireChatId(const nlohmann::json &params)
{
    if (!params.contains("chatId") || !params["chatId"].is_number_integer()) {
        throw ValidationError("params.chatId must be an integer");
    }
    return params["chatId"].get<ChatId>();
}

std::string requireString(const nlohmann::json &params, const char *key)
{
    if (!params.contains(key) || !params[key].is_string()) {
        throw ValidationError(std::string("params.") + key + " must be a string");
    }
    return params[key].get<std::string>();
}

int optionalInt(const nlohmann::json &params, const char *key, int fallback)
{
    if (!params.contains(key)) {
        return fallback;
    }
    if (!params[key].is_number_integer()) {
        throw ValidationError(std::string("params.") + key + " must be an integer");
    }
    const auto value = params[key].get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ValidationError(std::string("params.") + key + " is out of range");
    }
    return static_cast<int>(value);
}

Actor requireActor(const nlohmann::json &params)
{
    if (!params.contains("actor") || !params["actor"].is_object()
        || !params["actor"].contains("userId") || !params["actor"]["userId"].is_number_integer()) {
        throw ValidationError("params.actor.userId must be an integer");
    }
    return params["actor"].get<Actor>();
}

nlohmann::json rulesToJson(const std::vector<TriggerRule> &rules)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &rule : rules) {
        out.push_back(rule);
    }
    return out;
}

} // namespace

CommandHandler::CommandHandler(StreakService &service)
    : m_service(service)
{
}

void CommandHandler::setReadOnly(bool readOnly)
{
    m_readOnly = readOnly;
}

bool CommandHandler::isReadOnly() const
{
    return m_readOnly;
}

bool CommandHandler::isMutating(const std::string &method)
{
    static const std::set<std::string> mutating{
        "message", "reset", "undo", "undo_event", "add_word",
        "add_lemma", "remove_word", "enable_rule", "disable_rule",
    };
    return mutating.count(method) > 0;
}

QByteArray CommandHandler::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        SGLOG_WARN(QStringLiteral("CommandHandler"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("validation", "Invalid JSON payload", nullptr);
    }

    const nlohmann::json id = parsed.contains("id") ? parsed["id"] : nlohmann::json();

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        return makeErrorResponse("validation", "Missing method", id);
    }
    const std::string method = parsed["method"].get<std::string>();

    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("validation", "Invalid params", id);
        }
        params = parsed["params"];
    }

    SGLOG_INFO(QStringLiteral("CommandHandler"),
               QStringLiteral("handleRequest"),
               QStringLiteral("request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_lines"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method}}));

    if (m_readOnly && isMutating(method)) {
        return makeErrorResponse("store", "Database failed its integrity check; read-only mode", id);
    }

    const auto start = std::chrono::steady_clock::now();
    std::string code;
    std::string message;
    try {
        const nlohmann::json result = dispatch(method, params);
        SGLOG_DEBUG(QStringLiteral("CommandHandler"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("request_completed"),
                    QStringLiteral("client_call"),
                    QStringLiteral("json_lines"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"method", method},
                                    {"durationMs",
                                     std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const ValidationError &ex) {
        code = "validation";
        message = ex.what();
    } catch (const ConsistencyFault &ex) {
        code = "consistency";
        message = ex.what();
    } catch (const PatternError &ex) {
        code = "pattern";
        message = ex.what();
    } catch (const StoreError &ex) {
        code = "store";
        message = ex.what();
    } catch (const nlohmann::json::exception &ex) {
        code = "validation";
        message = ex.what();
    } catch (const std::exception &ex) {
        code = "internal";
        message = ex.what();
    }

    const bool clientError = code == "validation";
    logging::logEvent(clientError ? logging::LogLevel::Warn : logging::LogLevel::Error,
                      logging::defaultProcessName(),
                      QStringLiteral("CommandHandler"),
                      QStringLiteral("handleRequest"),
                      QStringLiteral("request_error"),
                      QString::fromStdString(code),
                      QStringLiteral("json_lines"),
                      logging::defaultWho(),
                      corrId,
                      nlohmann::json{{"method", method}, {"what", message}});
    return makeErrorResponse(code, message, id);
}

nlohmann::json CommandHandler::dispatch(const std::string &method, const nlohmann::json &params)
{
    if (method == "message") {
        MessageMeta meta;
        if (params.contains("messageId") && params["messageId"].is_number_integer()) {
            meta.messageId = params["messageId"].get<std::int64_t>();
        }
        meta.languageHint = params.value("languageHint", "");
        const auto outcome = m_service.onMessage(requireChatId(params),
                                                 requireString(params, "text"),
                                                 requireActor(params),
                                                 meta);
        nlohmann::json result{{"detection", outcome.detection},
                              {"event", nullptr},
                              {"previousStreakSeconds", outcome.previousStreakSeconds}};
        if (outcome.event.has_value()) {
            result["event"] = *outcome.event;
        }
        return result;
    }

    if (method == "detect") {
        return m_service.detector().detect(requireChatId(params),
                                           requireString(params, "text"),
                                           DetectionMeta{params.value("languageHint", "")});
    }

    if (method == "reset") {
        const ChatId chatId = requireChatId(params);
        const Event event = m_service.reset(chatId, requireActor(params),
                                            params.value("reason", ""));
        return nlohmann::json{{"event", event},
                              {"state", m_service.eventLog().getState(chatId)}};
    }

    if (method == "undo") {
        return m_service.undo(requireChatId(params), optionalInt(params, "count", 1),
                              requireActor(params));
    }

    if (method == "undo_event") {
        if (!params.contains("eventId") || !params["eventId"].is_number_integer()) {
            throw ValidationError("params.eventId must be an integer");
        }
        return m_service.undoEvent(requireChatId(params), params["eventId"].get<EventId>(),
                                   requireActor(params));
    }

    if (method == "counter") {
        return m_service.getCounter(requireChatId(params));
    }

    if (method == "leaderboard") {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto &entry : m_service.getLeaderboard(
                 requireChatId(params),
                 optionalInt(params, "limit", StreakService::kDefaultLeaderboardLimit))) {
            entries.push_back(entry);
        }
        return nlohmann::json{{"entries", entries}};
    }

    if (method == "history") {
        const ChatId chatId = requireChatId(params);
        const auto events = m_service.history(chatId,
                                              optionalInt(params, "limit", kDefaultHistoryLimit));
        const auto nullified = m_service.eventLog().nullifiedIds(chatId);
        nlohmann::json out = nlohmann::json::array();
        for (const auto &event : events) {
            nlohmann::json item = event;
            item["nullified"] = nullified.count(event.id) > 0;
            out.push_back(std::move(item));
        }
        return nlohmann::json{{"events", out}};
    }

    if (method == "top_chats") {
        nlohmann::json chats = nlohmann::json::array();
        for (const auto &ranking : m_service.topChats(
                 optionalInt(params, "limit", kDefaultTopChatsLimit))) {
            chats.push_back(ranking);
        }
        return nlohmann::json{{"chats", chats}};
    }

    if (method == "add_word") {
        return nlohmann::json{{"rules", rulesToJson(m_service.registry().addWord(
                                            requireChatId(params),
                                            requireString(params, "word"),
                                            requireActor(params)))}};
    }

    if (method == "add_lemma") {
        const TriggerRule rule = m_service.registry().addLemma(requireChatId(params),
                                                               requireString(params, "word"),
                                                               requireActor(params));
        return nlohmann::json{{"rules", rulesToJson({rule})}};
    }

    if (method == "remove_word") {
        return nlohmann::json{{"removed", m_service.registry().removeWord(
                                              requireChatId(params),
                                              requireString(params, "word"),
                                              requireActor(params))}};
    }

    if (method == "enable_rule" || method == "disable_rule") {
        const bool enable = method == "enable_rule";
        const std::string rule = requireString(params, "rule");
        if (enable) {
            m_service.registry().enable(requireChatId(params), rule, requireActor(params));
        } else {
            m_service.registry().disable(requireChatId(params), rule, requireActor(params));
        }
        return nlohmann::json{{"rule", rule}, {"enabled", enable}};
    }

    if (method == "rules") {
        return nlohmann::json{{"rules", rulesToJson(m_service.registry().allRules(
                                            requireChatId(params)))}};
    }

    throw ValidationError("Unknown method: " + method);
}

QByteArray CommandHandler::makeErrorResponse(const std::string &code,
                                             const std::string &message,
                                             const nlohmann::json &id) const
{
    nlohmann::json response;
    response["error"] = {{"code", code}, {"message", message}};
    response["id"] = id;
    return QByteArray::fromStdString(response.dump(-1, ' ', false,
                                                   nlohmann::json::error_handler_t::replace));
}

QByteArray CommandHandler::makeResultResponse(const nlohmann::json &result,
                                              const nlohmann::json &id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump(-1, ' ', false,
                                                   nlohmann::json::error_handler_t::replace));
}

} // namespace streakguard
