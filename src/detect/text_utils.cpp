#include "detect/text_utils.hpp"

#include "common/errors.hpp"

namespace streakguard {

std::string foldCase(const std::string &word)
{
    return QString::fromStdString(word)
        .toCaseFolded()
        .normalized(QString::NormalizationForm_C)
        .toStdString();
}

std::string canonicalWord(const std::string &word)
{
    const QString folded = QString::fromStdString(word)
                               .trimmed()
                               .toCaseFolded()
                               .normalized(QString::NormalizationForm_C);
    if (folded.isEmpty()) {
        throw ValidationError("trigger word is empty");
    }

    bool hasLetter = false;
    for (const uint codePoint : folded.toUcs4()) {
        const auto category = QChar::category(codePoint);
        if (QChar::isLetter(codePoint)) {
            hasLetter = true;
            continue;
        }
        if (category == QChar::Mark_NonSpacing || category == QChar::Mark_SpacingCombining
            || category == QChar::Mark_Enclosing) {
            continue;
        }
        throw ValidationError("trigger word must consist of letters only: " + word);
    }
    if (!hasLetter) {
        throw ValidationError("trigger word must contain a letter: " + word);
    }
    return folded.toStdString();
}

TextSpan DecomposedText::toOriginal(int start, int end) const
{
    if (start >= end || start < 0 || end > text.size()) {
        return TextSpan{};
    }
    return TextSpan{sourceStart[static_cast<std::size_t>(start)],
                    sourceEnd[static_cast<std::size_t>(end - 1)]};
}

DecomposedText decompose(const QString &original)
{
    DecomposedText out;
    out.text.reserve(original.size());
    out.sourceStart.reserve(static_cast<std::size_t>(original.size()));
    out.sourceEnd.reserve(static_cast<std::size_t>(original.size()));

    int i = 0;
    while (i < original.size()) {
        int width = 1;
        if (original.at(i).isHighSurrogate() && i + 1 < original.size()
            && original.at(i + 1).isLowSurrogate()) {
            width = 2;
        }
        const QString piece = original.mid(i, width).normalized(QString::NormalizationForm_D);
        for (int k = 0; k < piece.size(); ++k) {
            out.sourceStart.push_back(i);
            out.sourceEnd.push_back(i + width);
        }
        out.text += piece;
        i += width;
    }
    return out;
}

} // namespace streakguard
