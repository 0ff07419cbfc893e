#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QRegularExpression>
#include <QString>

#include "common/models.hpp"

namespace streakguard {

// ExclusionFilter finds the parts of a message that never trigger: quoted
// passages, URL-like spans and the command context of a message that starts with
// a command prefix. Spans are UTF-16 offsets into the text as given.
class ExclusionFilter {
public:
    explicit ExclusionFilter(std::vector<std::string> commandPrefixes = {"/"});

    std::vector<ExclusionSpan> findExcluded(const QString &text) const;

    // Kind of the first span that fully contains candidate, if any.
    static std::optional<ExclusionKind> coveringKind(const std::vector<ExclusionSpan> &excluded,
                                                     const TextSpan &candidate);

private:
    struct Rule {
        QRegularExpression expression;
        ExclusionKind kind;
    };

    std::vector<QString> m_commandPrefixes;
    std::vector<Rule> m_rules;

    std::optional<ExclusionSpan> commandSpan(const QString &text) const;
};

} // namespace streakguard
