#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace streakguard {

// Unicode case folding followed by NFC; the comparison key for lemmas and words.
std::string foldCase(const std::string &word);

// Trims, case-folds and composes (NFC) a vocabulary word. Throws ValidationError unless the
// result is non-empty and made of letters and combining marks only.
std::string canonicalWord(const std::string &word);

// Canonically decomposed (NFD) copy of a message with a map back to the
// UTF-16 offsets of the original text.
struct DecomposedText {
    QString text;
    // Per unit of `text`: start and end of the original code point it came from.
    std::vector<int> sourceStart;
    std::vector<int> sourceEnd;

    TextSpan toOriginal(int start, int end) const;
};

DecomposedText decompose(const QString &original);

} // namespace streakguard
