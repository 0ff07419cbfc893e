#pragma once

#include <string>

#include <QByteArray>

#include <nlohmann/json.hpp>

#include "service/streak_service.hpp"

namespace streakguard {

/**
 * CommandHandler serves the streak service over a line-oriented JSON protocol.
 * A request is {"id", "method", "params"}; the response is {"id", "result"} or
 * {"id", "error": {"code", "message"}}. Error codes: validation, consistency,
 * pattern, store, internal.
 */
class CommandHandler {
public:
    explicit CommandHandler(StreakService &service);

    // Process one request payload and return the serialized response (no newline).
    QByteArray handleRequestPayload(const QByteArray &payload);

    // Rejects every mutating method with a store error, e.g. after a failed
    // integrity check.
    void setReadOnly(bool readOnly);
    bool isReadOnly() const;

    static bool isMutating(const std::string &method);

private:
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const std::string &code,
                                 const std::string &message,
                                 const nlohmann::json &id) const;
    QByteArray makeResultResponse(const nlohmann::json &result, const nlohmann::json &id) const;

    StreakService &m_service;
    bool m_readOnly = false;
};

} // namespace streakguard
