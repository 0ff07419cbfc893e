#pragma once

#include <map>
#include <string>

namespace streakguard {

// Morphological normalizer collaborator: maps a word form to its lemma.
// Implementations must be deterministic; unknown words may come back unchanged.
class LemmaNormalizer {
public:
    virtual ~LemmaNormalizer() = default;

    virtual std::string normalize(const std::string &word,
                                  const std::string &languageHint) const = 0;
};

// Lower-cases the word and nothing else.
class IdentityNormalizer : public LemmaNormalizer {
public:
    std::string normalize(const std::string &word,
                          const std::string &languageHint) const override;
};

// Looks the lower-cased form up in a form -> lemma table and falls back to the
// lower-cased form itself.
class DictionaryNormalizer : public LemmaNormalizer {
public:
    explicit DictionaryNormalizer(const std::map<std::string, std::string> &forms);

    std::string normalize(const std::string &word,
                          const std::string &languageHint) const override;

private:
    std::map<std::string, std::string> m_forms;
};

} // namespace streakguard
