#include "detect/pattern_compiler.hpp"

#include <QChar>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "detect/text_utils.hpp"

namespace streakguard {

namespace {

const QString kWordStart = QStringLiteral("(?<![\\p{L}\\p{N}\\p{M}])");
const QString kWordEnd = QStringLiteral("(?![\\p{L}\\p{N}\\p{M}])");
const QString kInvisible =
    QStringLiteral("[\\x{200B}\\x{200C}\\x{200D}\\x{2060}\\x{FEFF}\\x{00AD}]*");
const QString kMarks = QStringLiteral("\\p{M}*");

QString fromCodePoint(uint codePoint)
{
    const char32_t ucs4 = codePoint;
    return QString::fromUcs4(&ucs4, 1);
}

// Letters and digits are never regex syntax; everything else is written as a
// hex escape so arbitrary table entries stay valid inside and outside classes.
QString escapeCodePoint(uint codePoint)
{
    if (QChar::isLetterOrNumber(codePoint)) {
        return fromCodePoint(codePoint);
    }
    return QStringLiteral("\\x{%1}").arg(codePoint, 4, 16, QLatin1Char('0'));
}

QString escapeText(const QString &text)
{
    QString out;
    for (const uint codePoint : text.toUcs4()) {
        out += escapeCodePoint(codePoint);
    }
    return out;
}

uint singleCodePoint(const std::string &key)
{
    const auto codePoints = QString::fromStdString(key)
                                .toCaseFolded()
                                .normalized(QString::NormalizationForm_C)
                                .toUcs4();
    return codePoints.size() == 1 ? codePoints.first() : 0;
}

QString wrapWord(const QString &body)
{
    return kWordStart + body + kWordEnd;
}

QString decomposed(uint codePoint)
{
    return fromCodePoint(codePoint).normalized(QString::NormalizationForm_D);
}

uint baseOf(uint codePoint)
{
    return decomposed(codePoint).toUcs4().first();
}

} // namespace

PatternCompiler::PatternCompiler(const StreakConfig &config)
    : m_variants(config.variants)
    , m_capacity(config.patternCacheCapacity == 0 ? 1 : config.patternCacheCapacity)
{
    for (const auto &pair : config.confusables) {
        const uint letter = singleCodePoint(pair.first);
        if (letter != 0) {
            m_confusables[letter] += QString::fromStdString(pair.second);
        }
    }
    for (const auto &pair : config.transliteration) {
        const uint letter = singleCodePoint(pair.first);
        if (letter == 0) {
            continue;
        }
        auto &alternatives = m_transliteration[letter];
        for (const auto &alternative : pair.second) {
            alternatives.push_back(QString::fromStdString(alternative)
                                       .toCaseFolded()
                                       .normalized(QString::NormalizationForm_D));
        }
    }
}

std::string PatternCompiler::ruleName(const std::string &word, VariantKind kind)
{
    return word + "_" + toVariantKindString(kind);
}

// Base letters only: the subject is decomposed, so a precomposed confusable can
// never appear in it.
QString PatternCompiler::lookalikeClass(uint letter) const
{
    const uint base = baseOf(letter);
    QString members = escapeCodePoint(base);
    QList<uint> seen{base};
    auto it = m_confusables.find(letter);
    if (it != m_confusables.end()) {
        for (const uint codePoint : it->second.toUcs4()) {
            const uint similar = baseOf(codePoint);
            if (seen.contains(similar)) {
                continue;
            }
            seen.push_back(similar);
            members += escapeCodePoint(similar);
        }
    }
    if (seen.size() == 1) {
        return members;
    }
    return QStringLiteral("[") + members + QStringLiteral("]");
}

QString PatternCompiler::transliterationGroup(uint letter) const
{
    const QString plain = escapeText(decomposed(letter));
    auto it = m_transliteration.find(letter);
    if (it == m_transliteration.end() || it->second.empty()) {
        return plain;
    }
    QStringList alternatives{plain};
    for (const auto &alternative : it->second) {
        const QString escaped = escapeText(alternative);
        if (!alternatives.contains(escaped)) {
            alternatives.push_back(escaped);
        }
    }
    return QStringLiteral("(?:") + alternatives.join(QLatin1Char('|')) + QStringLiteral(")");
}

QString PatternCompiler::spacedSeparator() const
{
    return QStringLiteral("[^\\p{L}]{0,%1}").arg(m_variants.spacedMaxGap);
}

std::vector<PatternVariant> PatternCompiler::generateVariants(const std::string &word) const
{
    const std::string canonical = canonicalWord(word);
    const QList<uint> letters = QString::fromStdString(canonical)
                                    .normalized(QString::NormalizationForm_C)
                                    .toUcs4();
    if (letters.size() < m_variants.minWordLength) {
        return {};
    }

    QString transliterated;
    QString lookalike;
    QString spaced;
    QString zeroWidth;
    QString diacritic;
    QString multimodal;
    bool anyTransliteration = false;
    bool anyLookalike = false;

    for (int i = 0; i < letters.size(); ++i) {
        const uint letter = letters.at(i);
        const QString parts = decomposed(letter);
        const QString plain = escapeText(parts);
        const QString marks = escapeText(parts.mid(fromCodePoint(baseOf(letter)).size()));
        const QString translit = transliterationGroup(letter);
        const QString similar = lookalikeClass(letter);
        anyTransliteration = anyTransliteration || translit != plain;
        anyLookalike = anyLookalike || similar != escapeCodePoint(baseOf(letter));

        if (i > 0) {
            spaced += spacedSeparator();
            zeroWidth += kInvisible;
            multimodal += spacedSeparator();
        }
        transliterated += translit;
        lookalike += similar + marks;
        spaced += plain;
        zeroWidth += plain;
        diacritic += escapeCodePoint(baseOf(letter)) + kMarks;
        multimodal += QStringLiteral("(?:") + similar + QLatin1Char('|') + translit
            + QStringLiteral(")") + kMarks;
    }

    std::vector<PatternVariant> variants;
    auto add = [&](VariantKind kind, const QString &body) {
        variants.push_back(PatternVariant{ruleName(canonical, kind),
                                          wrapWord(body).toStdString(),
                                          kind});
    };

    if (anyTransliteration) {
        add(VariantKind::Transliteration, transliterated);
    }
    if (anyLookalike) {
        add(VariantKind::Lookalike, lookalike);
    }
    if (m_variants.spacedMaxGap > 0) {
        add(VariantKind::Spaced, spaced);
    }
    add(VariantKind::ZeroWidth, zeroWidth);
    add(VariantKind::Diacritic, diacritic);
    add(VariantKind::Multimodal, multimodal);
    return variants;
}

std::shared_ptr<const QRegularExpression> PatternCompiler::compile(const std::string &source)
{
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_cache.find(source);
        if (it != m_cache.end()) {
            m_lru.splice(m_lru.begin(), m_lru, it->second.order);
            return it->second.matcher;
        }
    }

    auto matcher = std::make_shared<QRegularExpression>(
        QString::fromStdString(source),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::UseUnicodePropertiesOption);
    if (!matcher->isValid()) {
        SGLOG_ERROR(QStringLiteral("PatternCompiler"),
                    QStringLiteral("compile"),
                    QStringLiteral("pattern_compile_failed"),
                    QStringLiteral("generated_source_invalid"),
                    QStringLiteral("pcre2"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"source", source},
                                   {"error", matcher->errorString().toStdString()},
                                   {"offset", matcher->patternErrorOffset()}});
        throw PatternError("pattern failed to compile: " + matcher->errorString().toStdString());
    }
    matcher->optimize();

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    auto it = m_cache.find(source);
    if (it != m_cache.end()) {
        // Another reader compiled the same source meanwhile.
        m_lru.splice(m_lru.begin(), m_lru, it->second.order);
        return it->second.matcher;
    }

    ++m_compileCount;
    m_lru.push_front(source);
    m_cache.emplace(source, CacheEntry{matcher, m_lru.begin()});
    while (m_cache.size() > m_capacity) {
        m_cache.erase(m_lru.back());
        m_lru.pop_back();
    }
    return matcher;
}

std::size_t PatternCompiler::cacheSize() const
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    return m_cache.size();
}

std::size_t PatternCompiler::cacheCapacity() const
{
    return m_capacity;
}

std::uint64_t PatternCompiler::compileCount() const
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    return m_compileCount;
}

} // namespace streakguard
