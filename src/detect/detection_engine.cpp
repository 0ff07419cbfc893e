#include "detect/detection_engine.hpp"

#include <optional>

#include <QRegularExpression>

#include "common/errors.hpp"
#include "detect/text_utils.hpp"

namespace streakguard {

namespace {

const QRegularExpression &tokenExpression()
{
    static const QRegularExpression expression(
        QStringLiteral("\\p{L}[\\p{L}\\p{M}]*"),
        QRegularExpression::UseUnicodePropertiesOption);
    return expression;
}

std::string comparable(const QString &word)
{
    return word.toCaseFolded().normalized(QString::NormalizationForm_C).toStdString();
}

} // namespace

DetectionEngine::DetectionEngine(TriggerRegistry &registry,
                                 PatternCompiler &compiler,
                                 const LemmaNormalizer &normalizer,
                                 const ExclusionFilter &exclusions)
    : m_registry(registry)
    , m_compiler(compiler)
    , m_normalizer(normalizer)
    , m_exclusions(exclusions)
{
}

DetectionResult DetectionEngine::detect(ChatId chatId,
                                        const std::string &text,
                                        const DetectionMeta &meta)
{
    const auto rules = m_registry.activeRules(chatId);
    return detect(*rules, QString::fromStdString(text), meta);
}

DetectionResult DetectionEngine::detect(const ActiveRules &rules,
                                        const QString &text,
                                        const DetectionMeta &meta) const
{
    const std::vector<ExclusionSpan> excluded = m_exclusions.findExcluded(text);
    std::optional<ExclusionKind> suppressedBy;

    auto admit = [&](const TextSpan &span) {
        const auto kind = ExclusionFilter::coveringKind(excluded, span);
        if (kind.has_value() && !suppressedBy.has_value()) {
            suppressedBy = kind;
        }
        return !kind.has_value();
    };

    if (!rules.lemmas.empty()) {
        auto tokens = tokenExpression().globalMatch(text);
        while (tokens.hasNext()) {
            const QRegularExpressionMatch token = tokens.next();
            const QString word = token.captured(0);
            const std::string form = comparable(word);
            const std::string lemma =
                comparable(QString::fromStdString(m_normalizer.normalize(form, meta.languageHint)));

            for (const auto &rule : rules.lemmas) {
                if (rule.value != lemma && rule.value != form) {
                    continue;
                }
                const TextSpan span{static_cast<int>(token.capturedStart()),
                                    static_cast<int>(token.capturedEnd())};
                if (!admit(span)) {
                    break;
                }
                DetectionResult result;
                result.matched = true;
                result.layer = MatchLayer::Lemma;
                result.matchedWord = word.toStdString();
                result.canonical = rule.value;
                result.span = span;
                return result;
            }
        }
    }

    if (!rules.patterns.empty()) {
        const DecomposedText subject = decompose(text);
        for (const auto &rule : rules.patterns) {
            std::shared_ptr<const QRegularExpression> matcher;
            try {
                matcher = m_compiler.compile(rule.patternSource);
            } catch (const PatternError &) {
                // Logged by the compiler; the remaining rules still apply.
                continue;
            }

            auto matches = matcher->globalMatch(subject.text);
            while (matches.hasNext()) {
                const QRegularExpressionMatch match = matches.next();
                if (match.capturedLength() == 0) {
                    continue;
                }
                const TextSpan span = subject.toOriginal(static_cast<int>(match.capturedStart()),
                                                         static_cast<int>(match.capturedEnd()));
                if (!admit(span)) {
                    continue;
                }
                DetectionResult result;
                result.matched = true;
                result.layer = MatchLayer::Pattern;
                result.matchedWord = text.mid(span.start, span.end - span.start).toStdString();
                result.canonical = rule.sourceWord;
                result.ruleName = rule.value;
                result.span = span;
                return result;
            }
        }
    }

    DetectionResult result;
    result.suppressedBy = suppressedBy;
    return result;
}

} // namespace streakguard
