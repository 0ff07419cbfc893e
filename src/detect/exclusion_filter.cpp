#include "detect/exclusion_filter.hpp"

#include <algorithm>

#include <QStringList>

namespace streakguard {

namespace {

QRegularExpression makeExpression(const QString &pattern)
{
    QRegularExpression expression(pattern,
                                  QRegularExpression::CaseInsensitiveOption
                                      | QRegularExpression::UseUnicodePropertiesOption);
    expression.optimize();
    return expression;
}

} // namespace

ExclusionFilter::ExclusionFilter(std::vector<std::string> commandPrefixes)
{
    for (const auto &prefix : commandPrefixes) {
        if (!prefix.empty()) {
            m_commandPrefixes.push_back(QString::fromStdString(prefix));
        }
    }

    // Paired quotes. Single quotes only open and close outside words so that
    // apostrophes ("don't") are not mistaken for quotation marks.
    const QStringList quotePatterns{
        QStringLiteral("\"[^\"]*\""),
        QStringLiteral("\\x{201C}[^\\x{201C}\\x{201D}]*\\x{201D}"),
        QStringLiteral("\\x{201E}[^\\x{201C}\\x{201D}\\x{201E}]*[\\x{201C}\\x{201D}]"),
        QStringLiteral("\\x{00AB}[^\\x{00BB}]*\\x{00BB}"),
        QStringLiteral("\\x{2018}[^\\x{2019}]*\\x{2019}"),
        QStringLiteral("(?<!\\p{L})'[^']*'(?!\\p{L})"),
        QStringLiteral("`[^`]*`"),
    };
    for (const auto &pattern : quotePatterns) {
        m_rules.push_back(Rule{makeExpression(pattern), ExclusionKind::Quote});
    }

    m_rules.push_back(Rule{
        makeExpression(QStringLiteral("(?:\\b[a-z][a-z0-9+.\\-]*://|\\bwww\\.)\\S+")),
        ExclusionKind::Url});
}

std::optional<ExclusionSpan> ExclusionFilter::commandSpan(const QString &text) const
{
    int start = 0;
    while (start < text.size() && text.at(start).isSpace()) {
        ++start;
    }

    for (const auto &prefix : m_commandPrefixes) {
        if (!text.mid(start).startsWith(prefix)) {
            continue;
        }
        const int afterPrefix = start + prefix.size();
        if (afterPrefix >= text.size() || !text.at(afterPrefix).isLetter()) {
            continue;
        }
        int end = text.indexOf(QLatin1Char('\n'), afterPrefix);
        if (end < 0) {
            end = text.size();
        }
        return ExclusionSpan{TextSpan{start, end}, ExclusionKind::Command};
    }
    return std::nullopt;
}

std::vector<ExclusionSpan> ExclusionFilter::findExcluded(const QString &text) const
{
    std::vector<ExclusionSpan> spans;
    if (auto command = commandSpan(text)) {
        spans.push_back(*command);
    }

    for (const auto &rule : m_rules) {
        auto it = rule.expression.globalMatch(text);
        while (it.hasNext()) {
            const QRegularExpressionMatch match = it.next();
            spans.push_back(ExclusionSpan{
                TextSpan{static_cast<int>(match.capturedStart()),
                         static_cast<int>(match.capturedEnd())},
                rule.kind});
        }
    }

    std::sort(spans.begin(), spans.end(), [](const ExclusionSpan &a, const ExclusionSpan &b) {
        if (a.span.start != b.span.start) {
            return a.span.start < b.span.start;
        }
        return a.span.end > b.span.end;
    });
    return spans;
}

std::optional<ExclusionKind> ExclusionFilter::coveringKind(
    const std::vector<ExclusionSpan> &excluded, const TextSpan &candidate)
{
    for (const auto &span : excluded) {
        if (span.span.contains(candidate)) {
            return span.kind;
        }
    }
    return std::nullopt;
}

} // namespace streakguard
